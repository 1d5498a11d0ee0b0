// EvalRT - Evaluator Integration Tests
// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/evaluator.hpp"
#include "evalrt/errors.hpp"

#include "app_config.hpp"

#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace evalrt;
namespace fs = std::filesystem;

#ifndef EVALRT_TEST_ASSETS_DIR
#define EVALRT_TEST_ASSETS_DIR "tests/assets"
#endif

// Test helper
#define TEST(name) void test_##name(); \
    static bool registered_##name = (tests.push_back({#name, test_##name}), true); \
    void test_##name()

std::vector<std::pair<const char*, void(*)()>> tests;

static fs::path test_root() {
    return fs::temp_directory_path() / ("evalrt_test_evaluator_" + std::to_string(::getpid()));
}

/// Options rooted in a fresh directory per test.
static EvalOptions options_for(const std::string& test) {
    EvalOptions o = EvalOptions::from_env();
    o.temp_root = test_root() / test;
    o.retention = RetentionPolicy::Retain;
    fs::remove_all(o.temp_root);
    return o;
}

static size_t entries_in(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        (void)e;
        ++n;
    }
    return n;
}

static std::string read_text(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// ============================================================
// Values
// ============================================================

TEST(eval_arithmetic) {
    Evaluator ev(options_for("arithmetic"));
    assert(ev.eval<int>("1 + 2 * 3") == 7);

    std::cout << "  Arithmetic evaluation tests passed\n";
}

TEST(eval_statements) {
    Evaluator ev(options_for("statements"));
    assert(ev.eval<int>("int a = 40;\nint b = 2;\nreturn a + b;") == 42);

    std::cout << "  Statement evaluation tests passed\n";
}

TEST(eval_string_with_directive) {
    Evaluator ev(options_for("string"));
    const std::string s = ev.eval<std::string>("#include <string>\nstd::string(\"eval\") + \"rt\"");
    assert(s == "evalrt");

    std::cout << "  String evaluation tests passed\n";
}

TEST(eval_declarations_then_return) {
    Evaluator ev(options_for("chrono"));
    const auto timeout = ev.eval<std::chrono::seconds>(
        "#include <chrono>\nusing namespace std::chrono_literals;\nreturn 30s;");
    assert(timeout == std::chrono::seconds(30));

    std::cout << "  Declarations-then-return tests passed\n";
}

TEST(eval_file_matches_eval_of_contents) {
    const fs::path asset = fs::path(EVALRT_TEST_ASSETS_DIR) / "answer.cpp";
    Evaluator ev(options_for("file"));

    const int from_file = ev.eval_file<int>(asset);
    const int from_text = ev.eval<int>(read_text(asset));
    assert(from_file == 42);
    assert(from_file == from_text);

    std::cout << "  File evaluation tests passed\n";
}

TEST(eval_file_configuration) {
    EvalOptions o = options_for("config");
    o.include_dirs.push_back(EVALRT_TEST_ASSETS_DIR);
    Evaluator ev(o);

    const AppConfig config =
        ev.eval_file<AppConfig>(fs::path(EVALRT_TEST_ASSETS_DIR) / "development_config.cpp");
    assert(config.port == 8080);
    assert(config.host == "localhost");
    assert(config.features.size() == 2);
    assert(config.features[0] == "reload");
    assert(config.features[1] == "verbose");

    std::cout << "  Configuration file tests passed\n";
}

// ============================================================
// Artifacts
// ============================================================

TEST(sequential_calls_use_distinct_artifacts) {
    EvalOptions o = options_for("sequential");
    Evaluator ev(o);

    assert(ev.eval<int>("1") == 1);
    assert(entries_in(o.temp_root) == 1);
    const fs::path first = fs::directory_iterator(o.temp_root)->path();

    // Removing an earlier artifact does not affect later calls.
    fs::remove_all(first);
    assert(ev.eval<int>("2") == 2);
    assert(entries_in(o.temp_root) == 1);
    assert(fs::directory_iterator(o.temp_root)->path() != first);

    std::cout << "  Sequential artifact tests passed\n";
}

TEST(retained_artifact_layout) {
    EvalOptions o = options_for("layout");
    Evaluator ev(o);
    assert(ev.eval<int>("5") == 5);

    const fs::path dir = fs::directory_iterator(o.temp_root)->path();
    const std::string unit = dir.filename().string();
    assert(fs::exists(dir / (unit + ".so")));
    assert(fs::exists(dir / "compile.log"));

    std::cout << "  Artifact layout tests passed\n";
}

TEST(delete_on_completion_leaves_nothing) {
    EvalOptions o = options_for("delete");
    o.retention = RetentionPolicy::DeleteOnCompletion;
    Evaluator ev(o);
    const size_t pending = runtime::ArtifactStore::pending_exit_deletions();

    assert(ev.eval<int>("3") == 3);
    assert(entries_in(o.temp_root) == 0);
    assert(runtime::ArtifactStore::pending_exit_deletions() == pending);

    // Also on failure.
    try {
        ev.eval<int>("1 +");
    } catch (const CompilationError&) {
    }
    assert(entries_in(o.temp_root) == 0);

    std::cout << "  Delete-on-completion tests passed\n";
}

TEST(fixed_unit_name_collides) {
    EvalOptions o = options_for("fixed");
    o.unit_name = "FixedUnit";
    Evaluator ev(o);

    assert(ev.eval<int>("10") == 10);
    bool threw = false;
    try {
        ev.eval<int>("11");
    } catch (const ArtifactError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::Artifact);
        assert(e.path() == o.temp_root / "FixedUnit");
    }
    assert(threw);

    std::cout << "  Fixed unit name collision tests passed\n";
}

TEST(fixed_unit_name_collides_after_deletion) {
    EvalOptions o = options_for("fixed_deleted");
    o.unit_name = "FixedDeletedUnit";
    o.retention = RetentionPolicy::DeleteOnCompletion;
    Evaluator ev(o);

    assert(ev.eval<int>("10") == 10);
    assert(entries_in(o.temp_root) == 0);

    // The directory is gone, but the unit of that name is still mapped.
    bool threw = false;
    try {
        ev.eval<int>("11");
    } catch (const ArtifactError& e) {
        threw = true;
        assert(e.path() == o.temp_root / "FixedDeletedUnit");
    }
    assert(threw);

    std::cout << "  Fixed unit name after deletion tests passed\n";
}

// ============================================================
// Concurrency
// ============================================================

TEST(concurrent_calls_are_isolated) {
    EvalOptions o = options_for("concurrent");
    Evaluator ev(o);

    std::vector<int> results(4, -1);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&ev, &results, i] {
            results[i] = ev.eval<int>(std::to_string(i) + " * 10");
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < results.size(); ++i) {
        assert(results[i] == static_cast<int>(i) * 10);
    }
    assert(entries_in(o.temp_root) == results.size());

    std::cout << "  Concurrent isolation tests passed\n";
}

TEST(concurrent_fixed_name_one_wins) {
    EvalOptions o = options_for("race");
    o.unit_name = "RaceUnit";

    std::atomic<int> succeeded{0};
    std::atomic<int> collided{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&o, &succeeded, &collided] {
            try {
                Evaluator ev(o);
                if (ev.eval<int>("7") == 7) ++succeeded;
            } catch (const ArtifactError&) {
                ++collided;
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(succeeded == 1);
    assert(collided == 1);

    std::cout << "  Concurrent fixed name tests passed\n";
}

// ============================================================
// Failures
// ============================================================

TEST(syntax_error_is_compilation_error) {
    Evaluator ev(options_for("syntax"));
    bool threw = false;
    try {
        ev.eval<int>("1 +");
    } catch (const CompilationError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::Compilation);
        assert(e.error_count() >= 1);
        assert(!e.diagnostics().empty());
        assert(!e.timed_out());
    }
    assert(threw);

    std::cout << "  Compilation error tests passed\n";
}

TEST(diagnostics_point_at_source) {
    const fs::path dir = test_root() / "diag_src";
    fs::create_directories(dir);
    const fs::path src = dir / "broken.cpp";
    std::ofstream(src) << "#include <string>\n\nint a = 1;\nreturn a + missing_name;\n";

    Evaluator ev(options_for("diag"));
    bool threw = false;
    try {
        ev.eval_file<int>(src);
    } catch (const CompilationError& e) {
        threw = true;
        bool located = false;
        for (const auto& d : e.diagnostics()) {
            if (d.severity == Severity::Error && d.file == src.string() && d.line == 4) {
                located = true;
            }
        }
        assert(located);
    }
    assert(threw);

    std::cout << "  Diagnostic location tests passed\n";
}

TEST(wrong_type_is_cast_error) {
    Evaluator ev(options_for("cast"));
    bool threw = false;
    try {
        ev.eval<std::string>("42");
    } catch (const CastError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::Cast);
        assert(e.actual() == "int");
        assert(e.requested().find("basic_string") != std::string::npos);
    }
    assert(threw);

    std::cout << "  Cast error tests passed\n";
}

TEST(user_exception_propagates) {
    Evaluator ev(options_for("throws"));
    bool threw = false;
    try {
        ev.eval<int>("#include <stdexcept>\nif (true) throw std::out_of_range(\"boom\");\nreturn 0;");
    } catch (const std::out_of_range& e) {
        threw = true;
        assert(std::string(e.what()) == "boom");
    }
    assert(threw);

    std::cout << "  User exception tests passed\n";
}

TEST(missing_file_is_wrap_error) {
    Evaluator ev(options_for("missing"));
    bool threw = false;
    try {
        ev.eval_file<int>(test_root() / "no_such_config.cpp");
    } catch (const WrapError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Missing file tests passed\n";
}

// ============================================================
// Main
// ============================================================

int main() {
    std::cout << "\n=== EvalRT Evaluator Tests ===\n\n";

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

    fs::remove_all(test_root());
    std::cout << "\n=== Results: " << passed << " passed, " << failed << " failed ===\n";
    return failed > 0 ? 1 : 0;
}
