// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <string>

#include <spdlog/common.h>

namespace valid_pipe {

/// Configuration for the library's diagnostic logging.
struct LogConfig {
    std::string logger_name = "valid_pipe";              ///< spdlog registry name
    spdlog::level::level_enum level = spdlog::level::warn;  ///< Minimum level emitted
    bool log_rejections = true;                          ///< Log each rejected element at debug

    /// Preset for production use: warnings and errors only.
    static LogConfig Defaults() {
        return LogConfig{};
    }

    /// Preset for debugging pipelines: every rejection, relay and cancellation.
    static LogConfig Verbose() {
        return LogConfig{
            .logger_name = "valid_pipe",
            .level = spdlog::level::trace,
            .log_rejections = true,
        };
    }

    /// Preset that silences the library.
    static LogConfig Quiet() {
        return LogConfig{
            .logger_name = "valid_pipe",
            .level = spdlog::level::off,
            .log_rejections = false,
        };
    }
};

/// Apply `config`: (re)bind the library logger and set its level.
/// Call from the thread driving the streams, before building pipelines.
void ConfigureLogging(const LogConfig& config);

/// Currently applied configuration.
const LogConfig& CurrentLogConfig();

}  // namespace valid_pipe
