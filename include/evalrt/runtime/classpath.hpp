// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evalrt::runtime {

// ============================================================
// Classpath Entries
// ============================================================

/// Where an entry came from. Kept for logging and tests; the compiler only
/// sees the path.
enum class EntryOrigin {
    Boot,      // Compiler's default library search directories
    Process,   // An object mapped into the running process
    Manifest,  // Declared by an archive's runpath (one level)
    Install,   // evalrt library or the C++ runtime library
};

const char* entry_origin_name(EntryOrigin origin);

struct ClasspathEntry {
    std::filesystem::path path;
    EntryOrigin origin = EntryOrigin::Process;
};

using Classpath = std::vector<ClasspathEntry>;

// ============================================================
// Install Paths (process-wide, computed once)
// ============================================================

/// Locations of the shared objects that hold the evalrt engine and the C++
/// runtime support library, found by asking the dynamic loader which object
/// contains a well-known symbol of each.
struct InstallPaths {
    std::filesystem::path engine_library;
    std::filesystem::path runtime_library;
};

/// Computed on first call (thread-safe) and immutable afterwards.
const InstallPaths& install_paths();

// ============================================================
// Archives and Manifests
// ============================================================

/// True for `*.so` and versioned `*.so.N[.M...]` file names. Decided by
/// name only; the file is not touched.
bool is_archive(const std::filesystem::path& path);

/// Remove a leading URL-style scheme ("file:" or "file://").
std::string strip_scheme(std::string_view entry);

/// Paths declared by an ELF shared object's DT_RUNPATH (DT_RPATH when no
/// runpath is present), in declared order. `$ORIGIN` is replaced by the
/// archive's directory. Returns an empty list when the object has no dynamic
/// section or declares no search path.
/// Throws ClasspathResolutionError when the file cannot be opened or is not
/// a readable ELF object.
std::vector<std::filesystem::path> read_manifest_classpath(const std::filesystem::path& archive);

// ============================================================
// Resolver
// ============================================================

/// Library search directories the compiler driver uses by default
/// (`<cxx> -print-search-dirs`). Empty when the driver cannot be queried.
std::vector<std::filesystem::path> boot_search_path(const std::string& cxx);

/// Paths of every shared object currently mapped into the process, in load
/// order. The unnamed main program and objects without a backing file
/// (the vDSO) are skipped.
std::vector<std::string> process_load_path();

class ClasspathResolver {
public:
    explicit ClasspathResolver(std::string cxx) : cxx_(std::move(cxx)) {}

    /// Boot search path + process load path (each archive followed by its
    /// manifest entries) + install paths.
    Classpath resolve() const;

    /// Same composition over explicit inputs. Manifest expansion is applied
    /// to `entries` only, one level deep.
    static Classpath resolve(const std::vector<std::filesystem::path>& boot,
                             const std::vector<std::string>& entries,
                             const InstallPaths& install);

private:
    std::string cxx_;
};

/// Entries joined with the platform path separator (':').
std::string join_classpath(const Classpath& classpath);

}  // namespace evalrt::runtime
