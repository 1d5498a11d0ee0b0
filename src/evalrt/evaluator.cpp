// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/evaluator.hpp"

#include "evalrt/codegen/compiler.hpp"
#include "evalrt/runtime/classpath.hpp"
#include "evalrt/runtime/loader.hpp"

#include <chrono>

namespace evalrt {

Evaluator::Evaluator(EvalOptions options)
    : options_(std::move(options)), store_(options_.temp_root) {
    if (!options_.logger) {
        options_.logger = default_logger();
    }
    if (options_.cxx.empty()) {
        options_.cxx = codegen::pick_cxx();
    }
}

std::any Evaluator::eval_any(const SourceUnit& unit) {
    const auto& log = options_.logger;
    const auto start = std::chrono::steady_clock::now();

    const std::string name =
        options_.unit_name.empty() ? runtime::ArtifactStore::next_unit_name() : options_.unit_name;
    runtime::ArtifactLease lease(store_, store_.create(name), options_.retention, log);
    const runtime::GeneratedArtifact& artifact = lease.artifact();
    log->debug("evaluating {} as {} in {}", unit.origin, name, artifact.dir.string());

    codegen::write_wrapped(unit, artifact);

    codegen::CompileRequest request;
    request.unit_name = name;
    request.source = artifact.source_path;
    request.output = artifact.output_path;
    request.log = artifact.log_path;
    request.classpath = runtime::ClasspathResolver(options_.cxx).resolve();
    request.include_dirs = options_.include_dirs;
    request.extra_flags = options_.extra_flags;
    request.timeout = options_.compile_timeout;

    const codegen::CompilerInvoker compiler(options_.cxx, log);
    const codegen::CompileResult result = compiler.compile(request);
    for (const auto& d : result.diagnostics) {
        if (d.severity == Severity::Warning) {
            log->warn("{}", d.to_string());
        }
    }
    codegen::check(result, name);

    runtime::LoadedUnit loaded(artifact.output_path, name);
    std::any value = loaded.instance().apply();

    log->debug("evaluated {} in {:.1f} ms (compile {:.1f} ms)", name,
               std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count(),
               result.elapsed_ms);
    return value;
}

}  // namespace evalrt
