// SPDX-License-Identifier: MIT

// src/log.hpp
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

#include "src/config.hpp"

namespace valid_pipe {

/// Library logger, created on first use from LogConfig::Defaults() unless
/// ConfigureLogging() ran first.
spdlog::logger& Logger();

/// True if rejected elements should be logged.
bool LogRejections();

}  // namespace valid_pipe
