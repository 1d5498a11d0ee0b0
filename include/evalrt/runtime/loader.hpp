// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "evalrt/abi/evaluable.hpp"

#include <filesystem>
#include <string>

namespace evalrt::runtime {

/// A generated unit opened from its own artifact directory and instantiated.
///
/// The library is opened by absolute path with RTLD_LOCAL, so symbol lookup
/// for the unit's entrypoints only searches this library (and what it links
/// against); the unit itself still resolves its undefined symbols against the
/// process. RTLD_NODELETE keeps the code mapped after the handle is closed:
/// values returned by apply() may carry type-erasure tables and vtables that
/// live in the unit.
class LoadedUnit {
public:
    /// Throws LoadError(ClassNotFound) if the library or `<unit>_create` /
    /// `<unit>_destroy` cannot be found, LoadError(ConstructionFailed) if the
    /// factory throws or returns null.
    LoadedUnit(std::filesystem::path library, std::string unit_name);
    ~LoadedUnit();

    LoadedUnit(const LoadedUnit&) = delete;
    LoadedUnit& operator=(const LoadedUnit&) = delete;

    abi::Evaluable& instance() { return *instance_; }
    const std::string& unit_name() const { return unit_name_; }
    const std::filesystem::path& library() const { return library_; }

private:
    std::filesystem::path library_;
    std::string unit_name_;
    void* handle_ = nullptr;
    abi::Evaluable* instance_ = nullptr;
    abi::DestroyFn destroy_ = nullptr;
};

}  // namespace evalrt::runtime
