// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/options.hpp"

#include "evalrt/env.hpp"

#include <stdexcept>

namespace evalrt {

EvalOptions EvalOptions::from_env() {
    EvalOptions options;
    if (auto p = env_string("EVALRT_TMPDIR")) {
        options.temp_root = *p;
    }
    if (auto p = env_string("EVALRT_CXX")) {
        options.cxx = *p;
    }
    if (auto ms = env_int("EVALRT_COMPILE_TIMEOUT_MS")) {
        if (*ms <= 0) {
            throw std::runtime_error("EVALRT_COMPILE_TIMEOUT_MS must be positive");
        }
        options.compile_timeout = std::chrono::milliseconds(*ms);
    }
    options.keep_artifacts(env_flag("EVALRT_KEEP_ARTIFACTS"));
    return options;
}

void EvalOptions::keep_artifacts(std::optional<bool> keep) {
    if (keep) {
        retention = *keep ? RetentionPolicy::Retain : RetentionPolicy::DeleteOnCompletion;
    }
}

}  // namespace evalrt
