// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "evalrt/errors.hpp"
#include "evalrt/log.hpp"
#include "evalrt/runtime/classpath.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace evalrt::codegen {

/// Everything needed to turn one generated source file into a shared object.
struct CompileRequest {
    std::string unit_name;
    std::filesystem::path source;
    std::filesystem::path output;
    std::filesystem::path log;  // Receives the compiler's stdout and stderr
    runtime::Classpath classpath;
    std::vector<std::filesystem::path> include_dirs;
    std::vector<std::string> extra_flags;
    std::chrono::milliseconds timeout{120000};
};

/// Outcome of one compiler run. `success` is false when the compiler exited
/// non-zero, was killed on timeout, or reported an error; `diagnostics` then
/// holds at least one error.
struct CompileResult {
    bool success = false;
    bool timed_out = false;
    int exit_code = -1;
    std::filesystem::path output;
    std::vector<Diagnostic> diagnostics;
    size_t error_count = 0;
    size_t warning_count = 0;
    std::vector<std::string> command;
    std::filesystem::path log;
    double elapsed_ms = 0;
};

/// Parse `file:line:col: severity: message` lines (and the location-less
/// `tool: severity: message` form used by the driver and linker).
std::vector<Diagnostic> parse_diagnostics(std::string_view log);

/// EVALRT_CXX if set, else the first of clang++, g++, c++ found on PATH.
std::string pick_cxx();

bool executable_in_path(const std::string& exe);

/// evalrt's own header directory, baked in at build time.
std::filesystem::path engine_include_dir();

class CompilerInvoker {
public:
    /// Empty `cxx` selects pick_cxx().
    explicit CompilerInvoker(std::string cxx = {}, logger_t logger = {});

    const std::string& cxx() const { return cxx_; }

    /// Full argv for `request`: shared-object output, evalrt and caller
    /// include dirs, deprecation warnings, and the classpath applied as
    /// library search directories (directories) and link inputs (archives).
    std::vector<std::string> command_line(const CompileRequest& request) const;

    /// Run the compiler once over `request.source`. Never throws for
    /// compiler failures; they are reported in the result.
    CompileResult compile(const CompileRequest& request) const;

private:
    std::string cxx_;
    logger_t logger_;
};

/// Throw CompilationError when `result` is a failure.
void check(const CompileResult& result, const std::string& unit_name);

}  // namespace evalrt::codegen
