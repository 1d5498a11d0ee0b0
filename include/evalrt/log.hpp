// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace evalrt {

typedef std::shared_ptr<spdlog::logger> logger_t;

/// Process-wide "evalrt" logger writing to stderr. Created on first use with
/// the level named by EVALRT_LOG_LEVEL (default: warn). If a logger named
/// "evalrt" is already registered with spdlog, that one is returned.
logger_t default_logger();

}  // namespace evalrt
