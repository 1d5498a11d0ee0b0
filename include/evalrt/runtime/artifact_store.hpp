// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "evalrt/options.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace evalrt::runtime {

/// Files belonging to one evaluation call. All paths live under `dir`, which
/// is named after the unit so concurrent calls never share a directory.
struct GeneratedArtifact {
    std::string unit_name;
    std::filesystem::path dir;
    std::filesystem::path source_path;  // <dir>/<unit>.cpp
    std::filesystem::path output_path;  // <dir>/<unit>.so
    std::filesystem::path log_path;     // <dir>/compile.log
};

class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    /// EVALRT_TMPDIR if set, else std::filesystem::temp_directory_path().
    static std::filesystem::path default_root();

    /// Fresh unit name of the form EvalUnit_<pid>_<seq>_<random>. Never
    /// returns the same name twice within a process.
    static std::string next_unit_name();

    /// Create the artifact directory for `unit_name`.
    /// Throws ArtifactError if the name is not a valid identifier, if any
    /// store in this process already created a unit of that name, or if the
    /// directory already exists (another process owns or owned the name).
    GeneratedArtifact create(const std::string& unit_name) const;

    /// Apply the retention policy to a finished artifact. A removed
    /// directory's files leave the exit-deletion registry. Never throws;
    /// removal failures are logged.
    void release(const GeneratedArtifact& artifact, RetentionPolicy policy,
                 const logger_t& logger) const noexcept;

    /// Register a file for best-effort removal at process exit.
    static void delete_on_exit(const std::filesystem::path& path);

    /// Number of files currently registered for removal at exit.
    static size_t pending_exit_deletions();

private:
    std::filesystem::path root_;
};

/// Releases an artifact when leaving scope, whether the call succeeded or not.
class ArtifactLease {
public:
    ArtifactLease(const ArtifactStore& store, GeneratedArtifact artifact,
                  RetentionPolicy policy, logger_t logger)
        : store_(store), artifact_(std::move(artifact)), policy_(policy), logger_(std::move(logger)) {}

    ~ArtifactLease() { store_.release(artifact_, policy_, logger_); }

    ArtifactLease(const ArtifactLease&) = delete;
    ArtifactLease& operator=(const ArtifactLease&) = delete;

    const GeneratedArtifact& artifact() const { return artifact_; }

private:
    const ArtifactStore& store_;
    GeneratedArtifact artifact_;
    RetentionPolicy policy_;
    logger_t logger_;
};

}  // namespace evalrt::runtime
