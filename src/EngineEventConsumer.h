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
#pragma once

#include "kc1fsz-tools/threadsafequeue2.h"

#include "EngineEvent.h"

namespace sipwire {

/**
 * The single place where the engine sends its notifications. Called
 * on the engine thread.
 */
class EngineEventConsumer {
public:

    virtual void consume(const EngineEvent& ev) = 0;
};

/**
 * A consumer that just pushes the event on a queue, for an application
 * that handles notifications on its own thread.
 */
class QueueEventConsumer : public EngineEventConsumer {
public:

    QueueEventConsumer(kc1fsz::threadsafequeue2<EngineEvent>& q) : _q(q) { }

    void consume(const EngineEvent& ev) {
        _q.push(ev);
    }

private:

    kc1fsz::threadsafequeue2<EngineEvent>& _q;
};

}
