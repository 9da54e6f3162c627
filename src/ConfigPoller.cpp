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
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "ConfigPoller.h"

using namespace std;
using json = nlohmann::json;

namespace sipwire {

ConfigPoller::ConfigPoller(kc1fsz::Log& log, const char* cfgFileName,
    std::function<void(const Config& cfg)> cb)
:   _log(log),
    _fn(cfgFileName),
    _cb(cb) {
    _config.setDefaults();
}

int ConfigPoller::load() {
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(_fn, ec);
    if (!ec) {
        _lastUpdate = ftime;
        _startup = false;
    }
    Config cfg;
    if (_read(cfg) != 0)
        return -1;
    _config = cfg;
    if (_cb)
        _cb(_config);
    return 0;
}

void ConfigPoller::oneSecTick() {
    try {
        auto ftime = std::filesystem::last_write_time(_fn);
        if (_startup || ftime > _lastUpdate) {
            load();
        }
    } catch (std::filesystem::filesystem_error& ex) {
        if (!_loadErrorDisplayed) {
            _log.error("Unable to load config file %s %s", _fn.c_str(), ex.what());
            _loadErrorDisplayed = true;
        }
    }
}

int ConfigPoller::_read(Config& cfg) {

    ifstream str(_fn);
    if (!str.good()) {
        if (!_loadErrorDisplayed)
            _log.error("Unable to open config file %s", _fn.c_str());
        _loadErrorDisplayed = true;
        return -1;
    }
    std::stringstream buffer;
    buffer << str.rdbuf();
    str.close();

    cfg.setDefaults();
    try {
        json j = json::parse(buffer.str());
        if (cfg.fromJson(j) != 0) {
            _log.error("Invalid config file content %s", _fn.c_str());
            return -1;
        }
    } catch (json::exception& ex) {
        _log.error("Invalid config file format %s", ex.what());
        return -1;
    }

    _loadErrorDisplayed = false;
    return 0;
}

}
