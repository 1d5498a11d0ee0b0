// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "evalrt/log.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace evalrt {

// ============================================================
// Artifact Retention
// ============================================================

/// What happens to a call's artifact directory (compiled output and compile
/// log) once the call finishes. The generated source file is always
/// registered for removal at process exit.
enum class RetentionPolicy {
    Retain,              // Leave the directory in place
    DeleteOnCompletion,  // Remove the directory when the call returns or throws
};

// ============================================================
// Evaluation Options
// ============================================================

struct EvalOptions {
    // Where artifact directories are created. Empty = EVALRT_TMPDIR, then the
    // platform temp directory.
    std::filesystem::path temp_root;

    // C++ compiler driver. Empty = EVALRT_CXX, then clang++/g++/c++ on PATH.
    std::string cxx;

    // Header search directories for evaluated code, in addition to the
    // evalrt include directory.
    std::vector<std::filesystem::path> include_dirs;

    // Appended verbatim to the compiler command line.
    std::vector<std::string> extra_flags;

    // Upper bound for one compiler run; the compiler is killed on expiry.
    std::chrono::milliseconds compile_timeout{120000};

    RetentionPolicy retention = RetentionPolicy::Retain;

    // Fixed unit name for every call. Empty (the default) generates a fresh
    // process-unique name per call; a fixed name collides on its second use.
    std::string unit_name;

    // Empty = default_logger().
    logger_t logger;

    /// Defaults with environment overrides applied:
    ///   EVALRT_TMPDIR, EVALRT_CXX, EVALRT_COMPILE_TIMEOUT_MS,
    ///   EVALRT_KEEP_ARTIFACTS (0 selects DeleteOnCompletion).
    static EvalOptions from_env();

    /// true selects Retain, false DeleteOnCompletion; nullopt leaves the
    /// current policy alone.
    void keep_artifacts(std::optional<bool> keep);
};

}  // namespace evalrt
