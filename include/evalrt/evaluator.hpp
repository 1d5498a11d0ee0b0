// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

// Evaluate C++ source at run time and return its value.
//
// The intended use is configuration written as code. Given a header that
// declares the configuration type
//
//     struct ServerConfig {
//         int port;
//         std::chrono::seconds timeout;
//     };
//
// and a file config/development.cpp containing
//
//     #include "server_config.hpp"
//     using namespace std::chrono_literals;
//     return ServerConfig{8080, 30s};
//
// Source that is a single expression may leave out the return; as soon as a
// declaration precedes the result, the result needs an explicit return.
//
// the application loads it with
//
//     evalrt::EvalOptions options = evalrt::EvalOptions::from_env();
//     options.include_dirs.push_back(config_include_dir);
//     auto config = evalrt::Evaluator(options).eval_file<ServerConfig>("config/development.cpp");
//
// Each call wraps the source into a class implementing abi::Evaluable, writes
// it to a fresh artifact directory, compiles it into a shared object with the
// process's own libraries on the link line, opens it, calls apply(), and casts
// the result. Nothing is cached: every call recompiles.

#include "evalrt/codegen/source_wrapper.hpp"
#include "evalrt/errors.hpp"
#include "evalrt/options.hpp"
#include "evalrt/runtime/artifact_store.hpp"

#include <any>
#include <filesystem>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>

namespace evalrt {

using codegen::SourceUnit;

class Evaluator {
public:
    explicit Evaluator(EvalOptions options = EvalOptions::from_env());

    /// Evaluate `source` and return its value as T.
    ///
    /// Throws ArtifactError, WrapError, ClasspathResolutionError,
    /// CompilationError, LoadError or CastError. An exception thrown by the
    /// evaluated code itself propagates unchanged.
    template <typename T>
    T eval(std::string_view source) {
        return cast<T>(eval_any(SourceUnit::from_string(std::string(source))));
    }

    /// Evaluate the contents of `path`; diagnostics refer to that file.
    template <typename T>
    T eval_file(const std::filesystem::path& path) {
        return cast<T>(eval_any(SourceUnit::from_file(path)));
    }

    /// Untyped evaluation. The returned value may reference code in the
    /// generated unit, which stays mapped for the life of the process.
    std::any eval_any(const SourceUnit& unit);

    const EvalOptions& options() const { return options_; }
    const runtime::ArtifactStore& store() const { return store_; }

    /// Exact-type extraction; no conversions are attempted.
    template <typename T>
    static T cast(std::any value) {
        if (auto* p = std::any_cast<T>(&value)) {
            return std::move(*p);
        }
        throw CastError(demangle(typeid(T).name()), demangle(value.type().name()));
    }

private:
    EvalOptions options_;
    runtime::ArtifactStore store_;
};

/// One-shot evaluation with options from the environment.
template <typename T>
T eval(std::string_view source) {
    return Evaluator().eval<T>(source);
}

template <typename T>
T eval_file(const std::filesystem::path& path) {
    return Evaluator().eval_file<T>(path);
}

}  // namespace evalrt
