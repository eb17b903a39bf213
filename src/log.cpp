// SPDX-License-Identifier: MIT

// src/log.cpp
#include "src/log.hpp"

#include <memory>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "src/config.hpp"

namespace valid_pipe {

namespace {

struct LogState {
    LogConfig config;
    std::shared_ptr<spdlog::logger> logger;
};

// Reuse a logger already registered under the name (e.g. by the host
// application) so its sinks are respected.
std::shared_ptr<spdlog::logger> BindLogger(const LogConfig& config) {
    auto logger = spdlog::get(config.logger_name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(config.logger_name);
    }
    logger->set_level(config.level);
    return logger;
}

LogState& State() {
    static LogState state = [] {
        LogState s;
        s.config = LogConfig::Defaults();
        s.logger = BindLogger(s.config);
        return s;
    }();
    return state;
}

}  // namespace

void ConfigureLogging(const LogConfig& config) {
    auto& state = State();
    state.logger = BindLogger(config);
    state.config = config;
}

const LogConfig& CurrentLogConfig() {
    return State().config;
}

spdlog::logger& Logger() {
    return *State().logger;
}

bool LogRejections() {
    return State().config.log_rejections;
}

}  // namespace valid_pipe
