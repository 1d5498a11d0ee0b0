// EvalRT - Compiler Invoker Unit Tests
// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/codegen/compiler.hpp"
#include "evalrt/errors.hpp"
#include "evalrt/runtime/artifact_store.hpp"
#include "evalrt/runtime/classpath.hpp"

#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace evalrt;
using namespace evalrt::codegen;
namespace fs = std::filesystem;

// Test helper
#define TEST(name) void test_##name(); \
    static bool registered_##name = (tests.push_back({#name, test_##name}), true); \
    void test_##name()

std::vector<std::pair<const char*, void(*)()>> tests;

static const runtime::ArtifactStore& store() {
    static const runtime::ArtifactStore s(fs::temp_directory_path() /
                                          ("evalrt_test_compiler_" + std::to_string(::getpid())));
    return s;
}

static CompileRequest request_for(const std::string& source) {
    runtime::GeneratedArtifact a = store().create(runtime::ArtifactStore::next_unit_name());
    std::ofstream(a.source_path) << source;
    CompileRequest r;
    r.unit_name = a.unit_name;
    r.source = a.source_path;
    r.output = a.output_path;
    r.log = a.log_path;
    return r;
}

static bool has_arg(const std::vector<std::string>& cmd, const std::string& arg) {
    return std::find(cmd.begin(), cmd.end(), arg) != cmd.end();
}

// ============================================================
// Diagnostic Parsing
// ============================================================

TEST(parse_located_diagnostics) {
    const std::string log =
        "unit.cpp: In member function 'virtual std::any U::apply()':\n"
        "<string>:3:14: error: 'nope' was not declared in this scope\n"
        "   3 | return nope;\n"
        "config.cpp:7:1: warning: unused variable 'x' [-Wunused-variable]\n"
        "config.cpp:2: note: previous declaration here\n"
        "x.cpp:1:10: fatal error: missing.hpp: No such file or directory\n";
    const auto ds = parse_diagnostics(log);

    assert(ds.size() == 4);
    assert(ds[0].severity == Severity::Error);
    assert(ds[0].file == "<string>");
    assert(ds[0].line == 3 && ds[0].column == 14);
    assert(ds[0].message == "'nope' was not declared in this scope");
    assert(ds[1].severity == Severity::Warning);
    assert(ds[2].severity == Severity::Note && ds[2].line == 2 && ds[2].column == 0);
    assert(ds[3].severity == Severity::Error);
    assert(ds[3].message == "missing.hpp: No such file or directory");

    std::cout << "  Located diagnostic tests passed\n";
}

TEST(parse_tool_diagnostics) {
    const auto ds = parse_diagnostics("collect2: error: ld returned 1 exit status\n");
    assert(ds.size() == 1);
    assert(ds[0].file == "collect2");
    assert(ds[0].line == 0);
    assert(ds[0].to_string() == "collect2: error: ld returned 1 exit status");

    assert(parse_diagnostics("just some output\n").empty());

    std::cout << "  Tool diagnostic tests passed\n";
}

// ============================================================
// Command Line
// ============================================================

TEST(command_line_layout) {
    const fs::path dir = fs::temp_directory_path();
    CompileRequest r;
    r.source = "/work/U.cpp";
    r.output = "/work/U.so";
    r.include_dirs = {"/work/include"};
    r.extra_flags = {"-O1"};
    r.classpath = {
        {dir, runtime::EntryOrigin::Boot},
        {runtime::install_paths().runtime_library, runtime::EntryOrigin::Install},
        {"/definitely/missing/libgone.so", runtime::EntryOrigin::Manifest},
    };

    CompilerInvoker compiler("c++");
    const auto cmd = compiler.command_line(r);
    assert(cmd.front() == "c++");
    assert(has_arg(cmd, "-shared"));
    assert(has_arg(cmd, "-fPIC"));
    assert(has_arg(cmd, "-Wdeprecated"));
    assert(has_arg(cmd, "-I/work/include"));
    assert(has_arg(cmd, "-I" + engine_include_dir().string()));
    assert(has_arg(cmd, "-L" + dir.string()));
    assert(has_arg(cmd, runtime::install_paths().runtime_library.string()));
    assert(!has_arg(cmd, "/definitely/missing/libgone.so"));
    assert(cmd.back() == "-O1");

    const auto out = std::find(cmd.begin(), cmd.end(), "-o");
    assert(out != cmd.end() && *(out + 1) == "/work/U.so");
    assert(has_arg(cmd, "/work/U.cpp"));

    std::cout << "  Command line tests passed\n";
}

// ============================================================
// Compilation
// ============================================================

TEST(compile_success) {
    CompileRequest r = request_for("extern \"C\" int answer() { return 42; }\n");
    const CompileResult result = CompilerInvoker().compile(r);

    assert(result.success);
    assert(result.exit_code == 0);
    assert(!result.timed_out);
    assert(result.error_count == 0);
    assert(fs::exists(result.output));
    check(result, r.unit_name);

    std::cout << "  Successful compilation tests passed\n";
}

TEST(compile_counts_warnings) {
    CompileRequest r = request_for("extern \"C\" int answer() { int unused = 1; return 42; }\n");
    const CompileResult result = CompilerInvoker().compile(r);

    assert(result.success);
    assert(result.warning_count >= 1);

    std::cout << "  Warning count tests passed\n";
}

TEST(compile_failure_reports_errors) {
    CompileRequest r = request_for("extern \"C\" int answer() { return nope; }\n");
    const CompileResult result = CompilerInvoker().compile(r);

    assert(!result.success);
    assert(result.error_count >= 1);
    const auto err = std::find_if(result.diagnostics.begin(), result.diagnostics.end(),
                                  [](const Diagnostic& d) { return d.severity == Severity::Error; });
    assert(err != result.diagnostics.end());
    assert(err->line == 1);

    bool threw = false;
    try {
        check(result, r.unit_name);
    } catch (const CompilationError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::Compilation);
        assert(e.unit_name() == r.unit_name);
        assert(e.error_count() >= 1);
        assert(!e.timed_out());
    }
    assert(threw);

    std::cout << "  Failed compilation tests passed\n";
}

TEST(compile_timeout_cancels) {
    CompileRequest r = request_for("#include <map>\n#include <regex>\n#include <string>\n"
                                   "extern \"C\" int answer() { return 42; }\n");
    r.timeout = std::chrono::milliseconds(1);
    const CompileResult result = CompilerInvoker().compile(r);

    assert(!result.success);
    assert(result.timed_out);
    assert(result.error_count == 1);

    bool threw = false;
    try {
        check(result, r.unit_name);
    } catch (const CompilationError& e) {
        threw = true;
        assert(e.timed_out());
    }
    assert(threw);

    std::cout << "  Compile timeout tests passed\n";
}

TEST(missing_compiler_reports_error) {
    CompileRequest r = request_for("int x;\n");
    const CompileResult result = CompilerInvoker("evalrt-no-such-compiler").compile(r);

    assert(!result.success);
    assert(result.exit_code == 127);
    assert(!result.diagnostics.empty());

    std::cout << "  Missing compiler tests passed\n";
}

// ============================================================
// Main
// ============================================================

int main() {
    std::cout << "\n=== EvalRT Compiler Tests ===\n\n";

    int passed = 0;
    int failed = 0;

    for (const auto& [name, func] : tests) {
        std::cout << "Running " << name << "...\n";
        try {
            func();
            passed++;
        } catch (const std::exception& e) {
            std::cout << "  FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    fs::remove_all(store().root());
    std::cout << "\n=== Results: " << passed << " passed, " << failed << " failed ===\n";
    return failed > 0 ? 1 : 0;
}
