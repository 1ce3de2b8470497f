/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "log.h"
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <boost/filesystem.hpp>

namespace geopool {

    /**
     * Owns the log file. Messages go to stderr until a LogManager is
     * started, and back to stderr once it is destroyed.
     */
    class LogManager {
    public:
        static constexpr const char* kLogFileName = "geopool.log";

        explicit LogManager(const std::string& logdir = "", bool append = true)
            : _enabled(false), _append(append), _file(nullptr) {
            std::string dir = logdir;
            if (dir.empty()) {
                const char* home = std::getenv("GEOPOOL_HOME");
                dir = home ? std::string(home) + "/logs" : ".";
            }
            boost::filesystem::path p(dir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(p, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + dir + "]: " + ec.message());
            }
            start((p / kLogFileName).string());
        }

        ~LogManager() {
            if (_file) {
                Logger::setLogFile(nullptr);
                fclose(_file);
                _file = nullptr;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        std::string terseCurrentTime(bool colonsOk=true) const {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            strftime(buf, sizeof(buf), fmt, &t);
            return buf;
        }

        /**
         * Rename the current file to a timestamped name and reopen the
         * original path. Returns the rotated file name.
         */
        std::string rotate() {
            if (!_enabled) {
                throw std::logic_error("LogManager not enabled");
            }

            std::string rotated;
            if (_file) {
                rotated = _path + "." + terseCurrentTime(false);
                boost::system::error_code ec;
                boost::filesystem::rename(_path, rotated, ec);
                if (ec) {
                    std::cerr << "can't rotate log file [" << _path << "]: " << ec.message() << std::endl;
                    rotated.clear();
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if (!tmp) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }

            // after this point no thread will be using the old file
            Logger::setLogFile(tmp);
            if (_file)
                fclose(_file);
            _file = tmp;
            return rotated;
        }

    private:
        void start(const std::string& lp) {
            if (boost::filesystem::is_directory(lp)) {
                throw std::invalid_argument("logpath [" + lp + "] should be a file name not a directory");
            }
            bool exists = boost::filesystem::exists(lp);
            _path = lp;
            _enabled = true;
            open_file();
            if (_append && exists) {
                const std::string msg = "\n\n***** LOG REOPENED *****\n\n";
                fwrite(msg.data(), 1, msg.size(), _file);
                fflush(_file);
            }
        }

        void open_file() {
            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if (!tmp) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }
            Logger::setLogFile(tmp);
            _file = tmp;
        }

        bool _enabled;
        bool _append;
        std::string _path;
        FILE *_file;
    };
}
