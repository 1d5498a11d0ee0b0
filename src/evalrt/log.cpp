// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/log.hpp"

#include "evalrt/env.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace evalrt {

logger_t default_logger() {
    static const logger_t logger = [] {
        if (auto existing = spdlog::get("evalrt")) return existing;
        auto created = spdlog::stderr_color_mt("evalrt");
        created->set_level(spdlog::level::from_str(env_string("EVALRT_LOG_LEVEL").value_or("warn")));
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return logger;
}

}  // namespace evalrt
