/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include <poll.h>
#include <errno.h>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"
#include "kc1fsz-tools/StdPollTimer.h"

#include "Runnable2.h"
#include "EventLoop.h"

namespace sipwire {

void EventLoop::run(kc1fsz::Log& log, kc1fsz::Clock& clock,
    Runnable2** tasks, unsigned taskCount,
    std::function<bool(kc1fsz::Log& log, kc1fsz::Clock& clock)> cb, bool trace) {

    kc1fsz::StdPollTimer timer1s(clock, 1000000);
    kc1fsz::StdPollTimer timer10s(clock, 10000000);

    timer1s.reset();
    timer10s.reset();

    unsigned long slowestLoopUs = 0;
    unsigned long totalWorkUs = 0;
    unsigned long loopCount = 0;
    unsigned long busyCount = 0;
    bool busy = false;

    while (true) {

        // Gather the FDs that we care about
        const unsigned fdsCapacity = 32;
        unsigned fdsSize = 0;
        pollfd fds[fdsCapacity];

        for (unsigned i = 0; i < taskCount; i++) {
            int used = tasks[i]->getPolls(fds + fdsSize, fdsCapacity - fdsSize);
            if (used < 0) {
                log.error("Not enough poll fds");
                break;
            }
            fdsSize += used;
        }

        // If a task said it had more to do then don't sleep at all,
        // otherwise sleep until there's activity but never past the
        // next one-second tick.
        uint32_t sleepMs = 0;
        if (!busy) {
            sleepMs = timer1s.usLeftInInterval() / 1000;
            if (sleepMs > MAX_SLEEP_MS)
                sleepMs = MAX_SLEEP_MS;
        }

        // Block waiting for activity or timeout
        int rc = poll(fds, fdsSize, sleepMs);
        if (rc < 0 && errno != EINTR) {
            log.error("Poll error %d", errno);
        }

        uint64_t workStartUs = clock.timeUs();

        busy = false;
        for (unsigned i = 0; i < taskCount; i++)
            if (tasks[i]->run2())
                busy = true;
        if (busy)
            busyCount++;

        if (timer1s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->oneSecTick();
        }

        bool showStats = false;

        if (timer10s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->tenSecTick();
            showStats = true;
        }

        if (cb) {
            if (cb(log, clock) == false)
                break;
        }

        unsigned long workTimeUs = clock.timeUs() - workStartUs;
        totalWorkUs += workTimeUs;
        if (workTimeUs > slowestLoopUs)
            slowestLoopUs = workTimeUs;

        loopCount++;

        if (trace && showStats) {
            log.info("Loops: %6lu, Busy: %6lu, AvgWork: %6lu, MaxWork: %6lu",
                loopCount, busyCount, totalWorkUs / loopCount, slowestLoopUs);
            totalWorkUs = 0;
            slowestLoopUs = 0;
            loopCount = 0;
            busyCount = 0;
        }
    }
}

}
