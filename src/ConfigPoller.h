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

#include <filesystem>
#include <functional>
#include <string>

#include "Runnable2.h"
#include "Config.h"

namespace kc1fsz {
    class Log;
}

namespace sipwire {

/**
 * Polls the configuration file and fires a callback any time the
 * configuration is changed. This should be the only thing that reads
 * the configuration file.
 *
 * A file that can't be read or parsed is reported once and the last good
 * configuration stays in effect.
 */
class ConfigPoller : public Runnable2 {
public:

    /**
     * @param configChangeCb Called every time the configuration document
     * changes, with the defaults filled in for anything missing.
     */
    ConfigPoller(kc1fsz::Log& log, const char* cfgFileName,
        std::function<void(const Config& cfg)> configChangeCb);

    /**
     * Reads the file right now, regardless of the timestamp.
     *
     * @returns 0 if a good configuration was loaded.
     */
    int load();

    const Config& getConfig() const { return _config; }

    // ----- Runnable2 --------------------------------------------------------

    bool run2() { return false; }
    void oneSecTick();

private:

    int _read(Config& cfg);

    kc1fsz::Log& _log;
    std::string _fn;
    std::function<void(const Config& cfg)> _cb;
    Config _config;
    // Initialize at the epoch
    std::filesystem::file_time_type _lastUpdate;
    bool _startup = true;
    bool _loadErrorDisplayed = false;
};

}
