// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "evalrt/runtime/artifact_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace evalrt::codegen {

/// Source text to evaluate plus where it came from. `origin` names the file
/// in compiler diagnostics ("<string>" for in-memory text).
struct SourceUnit {
    std::string text;
    std::string origin;

    static SourceUnit from_string(std::string text);

    /// Throws WrapError if the file cannot be read.
    static SourceUnit from_file(const std::filesystem::path& path);
};

/// True if `body` contains a `return` statement outside any braces, ignoring
/// comments and string/character literals. Such a body is used verbatim as a
/// function body; any other body is treated as a single expression.
bool has_top_level_return(std::string_view body);

/// Generate the translation unit for `unit`.
///
/// Leading preprocessor lines (includes, defines) are kept at file scope; the
/// remainder becomes the body of `std::any <unit_name>::apply()`. `#line`
/// directives map every line back to its position in `unit.origin`.
std::string wrap_source(const SourceUnit& unit, const std::string& unit_name);

/// Write the wrapped source to `artifact.source_path` and register the file
/// for removal at process exit. Throws WrapError on I/O failure.
void write_wrapped(const SourceUnit& unit, const runtime::GeneratedArtifact& artifact);

}  // namespace evalrt::codegen
