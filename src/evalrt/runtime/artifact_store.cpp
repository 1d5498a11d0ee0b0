// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/runtime/artifact_store.hpp"

#include "evalrt/env.hpp"
#include "evalrt/errors.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <random>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace evalrt::runtime {
namespace {

// Files scheduled for removal when the process exits. Destroyed (and the
// files removed) during static destruction.
class ExitDeletions {
public:
    static ExitDeletions& instance() {
        static ExitDeletions deletions;
        return deletions;
    }

    void add(const fs::path& path) {
        std::lock_guard lock(mutex_);
        paths_.push_back(path);
    }

    /// Forget every registered path inside `dir`.
    void remove_under(const fs::path& dir) {
        std::lock_guard lock(mutex_);
        paths_.erase(std::remove_if(paths_.begin(), paths_.end(),
                                    [&](const fs::path& p) {
                                        return std::mismatch(dir.begin(), dir.end(), p.begin(), p.end())
                                                   .first == dir.end();
                                    }),
                     paths_.end());
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return paths_.size();
    }

    ~ExitDeletions() {
        for (const auto& p : paths_) {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

private:
    ExitDeletions() = default;

    mutable std::mutex mutex_;
    std::vector<fs::path> paths_;
};

// Unit names handed out by create() in this process. A name is never
// released: a unit stays mapped after its directory is gone, and opening the
// same path again would return the resident unit.
class ClaimedNames {
public:
    static ClaimedNames& instance() {
        static ClaimedNames names;
        return names;
    }

    bool claim(const std::string& name) {
        std::lock_guard lock(mutex_);
        return names_.insert(name).second;
    }

private:
    ClaimedNames() = default;

    std::mutex mutex_;
    std::unordered_set<std::string> names_;
};

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') return false;
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_') return false;
    }
    return true;
}

uint32_t process_nonce() {
    static const uint32_t nonce = [] {
        std::random_device rd;
        return static_cast<uint32_t>(rd());
    }();
    return nonce;
}

}  // namespace

ArtifactStore::ArtifactStore(fs::path root) : root_(std::move(root)) {
    if (root_.empty()) {
        root_ = default_root();
    }
}

fs::path ArtifactStore::default_root() {
    if (auto p = env_string("EVALRT_TMPDIR")) {
        return fs::path(*p);
    }
    return fs::temp_directory_path();
}

std::string ArtifactStore::next_unit_name() {
    static std::atomic<uint64_t> seq{0};
    std::ostringstream oss;
    oss << "EvalUnit_" << ::getpid() << "_" << seq.fetch_add(1, std::memory_order_relaxed)
        << "_" << std::hex << process_nonce();
    return oss.str();
}

GeneratedArtifact ArtifactStore::create(const std::string& unit_name) const {
    if (!is_identifier(unit_name)) {
        throw ArtifactError(root_ / unit_name,
                            "unit name '" + unit_name + "' is not a valid C++ identifier");
    }

    if (!ClaimedNames::instance().claim(unit_name)) {
        throw ArtifactError(root_ / unit_name,
                            "unit name '" + unit_name + "' was already used in this process; "
                            "unit names must not be reused");
    }

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw ArtifactError(root_, "cannot create artifact root " + root_.string() + ": " + ec.message());
    }

    GeneratedArtifact artifact;
    artifact.unit_name = unit_name;
    artifact.dir = root_ / unit_name;
    // create_directory is the atomic claim on the name: it reports false when
    // the directory is already there.
    if (!fs::create_directory(artifact.dir, ec)) {
        if (ec) {
            throw ArtifactError(artifact.dir,
                                "cannot create artifact directory " + artifact.dir.string() + ": " + ec.message());
        }
        throw ArtifactError(artifact.dir,
                            "artifact directory already exists for unit '" + unit_name +
                                "'; unit names must not be reused");
    }
    artifact.source_path = artifact.dir / (unit_name + ".cpp");
    artifact.output_path = artifact.dir / (unit_name + ".so");
    artifact.log_path = artifact.dir / "compile.log";
    return artifact;
}

void ArtifactStore::release(const GeneratedArtifact& artifact, RetentionPolicy policy,
                            const logger_t& logger) const noexcept {
    if (policy == RetentionPolicy::Retain) return;
    std::error_code ec;
    fs::remove_all(artifact.dir, ec);
    if (ec) {
        if (logger) {
            logger->warn("failed to remove artifact directory {}: {}", artifact.dir.string(), ec.message());
        }
        return;
    }
    ExitDeletions::instance().remove_under(artifact.dir);
}

void ArtifactStore::delete_on_exit(const fs::path& path) {
    ExitDeletions::instance().add(path);
}

size_t ArtifactStore::pending_exit_deletions() {
    return ExitDeletions::instance().size();
}

}  // namespace evalrt::runtime
