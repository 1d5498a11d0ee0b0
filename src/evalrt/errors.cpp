// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/errors.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <sstream>

namespace evalrt {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Artifact: return "artifact";
        case ErrorKind::Wrap: return "wrap";
        case ErrorKind::ClasspathResolution: return "classpath";
        case ErrorKind::Compilation: return "compilation";
        case ErrorKind::Load: return "load";
        case ErrorKind::Cast: return "cast";
    }
    return "unknown";
}

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status != 0 || !out) return mangled;
    return out.get();
}

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Note: return "note";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "unknown";
}

std::string Diagnostic::to_string() const {
    std::ostringstream oss;
    if (!file.empty()) {
        oss << file;
        if (line > 0) oss << ":" << line;
        if (column > 0) oss << ":" << column;
        oss << ": ";
    }
    oss << severity_name(severity) << ": " << message;
    return oss.str();
}

ClasspathResolutionError::ClasspathResolutionError(std::filesystem::path entry,
                                                   const std::string& reason)
    : EvalError(ErrorKind::ClasspathResolution,
                "cannot read class-path manifest of '" + entry.string() + "': " + reason),
      entry_(std::move(entry)) {}

namespace {

std::string compilation_message(const std::string& unit_name,
                                const std::vector<Diagnostic>& diagnostics,
                                bool timed_out) {
    std::ostringstream oss;
    if (timed_out) {
        oss << "compilation of " << unit_name << " timed out and was cancelled";
    } else {
        oss << "compilation of " << unit_name << " failed";
    }
    for (const auto& d : diagnostics) {
        if (d.severity == Severity::Error) {
            oss << "\n  " << d.to_string();
        }
    }
    return oss.str();
}

const char* load_reason_text(LoadError::Reason reason) {
    switch (reason) {
        case LoadError::Reason::ClassNotFound: return "unit not found";
        case LoadError::Reason::ConstructionFailed: return "unit construction failed";
    }
    return "load failed";
}

}  // namespace

CompilationError::CompilationError(std::string unit_name,
                                   std::vector<Diagnostic> diagnostics,
                                   bool timed_out)
    : EvalError(ErrorKind::Compilation,
                compilation_message(unit_name, diagnostics, timed_out)),
      unit_name_(std::move(unit_name)),
      diagnostics_(std::move(diagnostics)),
      timed_out_(timed_out) {}

size_t CompilationError::error_count() const {
    size_t n = 0;
    for (const auto& d : diagnostics_) {
        if (d.severity == Severity::Error) ++n;
    }
    return n;
}

LoadError::LoadError(Reason reason, std::string unit_name, const std::string& detail)
    : EvalError(ErrorKind::Load,
                std::string(load_reason_text(reason)) + " (" + unit_name + "): " + detail),
      reason_(reason),
      unit_name_(std::move(unit_name)) {}

CastError::CastError(std::string requested, std::string actual)
    : EvalError(ErrorKind::Cast,
                "evaluated value has type '" + actual + "', requested '" + requested + "'"),
      requested_(std::move(requested)),
      actual_(std::move(actual)) {}

}  // namespace evalrt
