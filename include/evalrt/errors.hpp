// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace evalrt {

// ============================================================
// Error Kinds
// ============================================================

/// Distinct failure classes surfaced by an evaluation.
///
/// Exceptions raised by the evaluated code itself are not wrapped: they reach
/// the caller unchanged, so there is no kind for them here.
enum class ErrorKind {
    Artifact,             // Artifact directory could not be created or collides
    Wrap,                 // Source could not be read or embedded
    ClasspathResolution,  // An archive on the search path is unreadable
    Compilation,          // The compiler reported errors (or was cancelled)
    Load,                 // The unit could not be found or instantiated
    Cast,                 // Result type differs from the requested type
};

const char* error_kind_name(ErrorKind kind);

/// Demangle a type name as reported by std::type_info::name().
std::string demangle(const char* mangled);

// ============================================================
// Diagnostics
// ============================================================

enum class Severity { Note, Warning, Error };

const char* severity_name(Severity severity);

/// One compiler message. Line and column are 0 when the compiler did not
/// report a location (driver and linker messages).
struct Diagnostic {
    Severity severity = Severity::Error;
    std::string file;
    int line = 0;
    int column = 0;
    std::string message;

    std::string to_string() const;
};

// ============================================================
// Exceptions
// ============================================================

class EvalError : public std::runtime_error {
public:
    EvalError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ArtifactError : public EvalError {
public:
    ArtifactError(std::filesystem::path path, const std::string& what)
        : EvalError(ErrorKind::Artifact, what), path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class WrapError : public EvalError {
public:
    explicit WrapError(const std::string& what)
        : EvalError(ErrorKind::Wrap, what) {}
};

class ClasspathResolutionError : public EvalError {
public:
    ClasspathResolutionError(std::filesystem::path entry, const std::string& reason);

    /// The archive that could not be read.
    const std::filesystem::path& entry() const { return entry_; }

private:
    std::filesystem::path entry_;
};

class CompilationError : public EvalError {
public:
    CompilationError(std::string unit_name,
                     std::vector<Diagnostic> diagnostics,
                     bool timed_out);

    const std::string& unit_name() const { return unit_name_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    [[nodiscard]] bool timed_out() const { return timed_out_; }
    [[nodiscard]] size_t error_count() const;

private:
    std::string unit_name_;
    std::vector<Diagnostic> diagnostics_;
    bool timed_out_;
};

class LoadError : public EvalError {
public:
    enum class Reason {
        ClassNotFound,       // Library or factory symbol missing
        ConstructionFailed,  // Factory threw or returned null
    };

    LoadError(Reason reason, std::string unit_name, const std::string& detail);

    [[nodiscard]] Reason reason() const { return reason_; }
    const std::string& unit_name() const { return unit_name_; }

private:
    Reason reason_;
    std::string unit_name_;
};

class CastError : public EvalError {
public:
    CastError(std::string requested, std::string actual);

    const std::string& requested() const { return requested_; }
    const std::string& actual() const { return actual_; }

private:
    std::string requested_;
    std::string actual_;
};

}  // namespace evalrt
