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
#include "logmanager.h"
#include <memory>
#include <string>

namespace geopool {

/**
 * LogRuntime - owns logging configuration for a process or test.
 *
 * Usage:
 *   - Tests: use LogRuntimeGuard so the level is restored afterwards
 *   - Hosts: create at startup (fromEnv()), destroy at shutdown
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;  // Empty = GEOPOOL_HOME/logs or the working directory
        bool append;
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , append(true)
            , initial_level(LOG_WARNING) {}
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {
        logLevel.store(config_.initial_level, std::memory_order_relaxed);

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir, config_.append);
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Close the log file and route output back to stderr.
     * Safe to call multiple times.
     */
    void shutdown() {
        log_manager_.reset();
        Logger::setLogFile(nullptr);
    }

    LogManager* log_manager() { return log_manager_.get(); }
    const Config& config() const { return config_; }

    /**
     * Build a config from GEOPOOL_LOG_* environment variables
     */
    static Config configFromEnv() {
        Config config;
        if (const char* enable = std::getenv("GEOPOOL_LOG_ENABLE_FILE")) {
            config.enable_file_logging = (std::string(enable) != "0");
        }
        if (const char* dir = std::getenv("GEOPOOL_LOG_DIR")) {
            config.log_dir = dir;
        }
        // Level is applied on top of the default so an invalid value keeps WARNING
        int saved = logLevel.load(std::memory_order_relaxed);
        logLevel.store(config.initial_level, std::memory_order_relaxed);
        initLoggingFromEnv();
        config.initial_level = static_cast<LogLevel>(logLevel.load(std::memory_order_relaxed));
        logLevel.store(saved, std::memory_order_relaxed);
        return config;
    }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
};

/**
 * Test helper: RAII guard that restores the previous level
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace geopool
