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
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace chunkstore {

    /**
     * Owns the process log file. While a LogManager is alive every
     * Logger flush goes to its file instead of stderr.
     */
    class LogManager {
    public:

        explicit LogManager(const std::string& logpath, bool append = true)
            : _file(0) {
            std::string lp = logpath;
            if (boost::filesystem::is_directory(lp)) {
                lp = (boost::filesystem::path(lp) / "chunkstore.log").string();
            }
            start(lp, append);
        }

        ~LogManager() {
            if (_file) {
                Logger::setLogFile(nullptr);
                fclose(_file);
                _file = 0;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        std::string terseCurrentTime(bool colonsOk = true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0)
                return "unknown-time";
            return buf;
        }

        /**
         * Renames the current log file to a timestamped name and
         * reopens the original path.
         */
        void rotate() {
            if (_file) {
                std::stringstream ss;
                ss << _path << "." << terseCurrentTime(false);
                boost::system::error_code ec;
                boost::filesystem::rename(_path, ss.str(), ec);
                if (ec) {
                    std::cerr << "can't rotate [" << _path << "]: " << ec.message() << std::endl;
                }
            }
            open(false);
        }

    private:
        void start(const std::string& lp, bool append) {
            _path = lp;
            bool exists = boost::filesystem::exists(lp);
            open(append);

            if (append && exists) {
                const std::string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), _file) != msg.size()) {
                    std::cerr << "can't write to [" << _path << "]: " << errnoWithDescription() << std::endl;
                }
                fflush(_file);
            }
        }

        void open(bool append) {
            FILE* tmp = fopen(_path.c_str(), append ? "a" : "w");
            if (!tmp) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if (_file)
                fclose(_file);
            _file = tmp;
        }

        std::string _path;
        FILE* _file;
    };
}
