// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/runtime/loader.hpp"

#include "evalrt/errors.hpp"

#include <dlfcn.h>

#include <exception>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace evalrt::runtime {
namespace {

void* lookup(void* handle, const std::string& symbol, std::string& error) {
    ::dlerror();  // clear
    void* sym = ::dlsym(handle, symbol.c_str());
    const char* err = ::dlerror();
    if (err || !sym) {
        error = err ? err : ("symbol '" + symbol + "' is null");
        return nullptr;
    }
    return sym;
}

}  // namespace

LoadedUnit::LoadedUnit(fs::path library, std::string unit_name)
    : library_(std::move(library)), unit_name_(std::move(unit_name)) {
    std::error_code ec;
    if (!fs::is_regular_file(library_, ec)) {
        throw LoadError(LoadError::Reason::ClassNotFound, unit_name_,
                        "no compiled unit at " + library_.string());
    }

    const fs::path absolute = fs::absolute(library_);
    handle_ = ::dlopen(absolute.c_str(), RTLD_NOW | RTLD_LOCAL | RTLD_NODELETE);
    if (!handle_) {
        const char* err = ::dlerror();
        throw LoadError(LoadError::Reason::ClassNotFound, unit_name_,
                        std::string("dlopen failed: ") + (err ? err : "unknown"));
    }

    std::string error;
    auto create = reinterpret_cast<abi::CreateFn>(
        lookup(handle_, unit_name_ + abi::kCreateSuffix, error));
    if (create) {
        destroy_ = reinterpret_cast<abi::DestroyFn>(
            lookup(handle_, unit_name_ + abi::kDestroySuffix, error));
    }
    if (!create || !destroy_) {
        ::dlclose(handle_);
        handle_ = nullptr;
        throw LoadError(LoadError::Reason::ClassNotFound, unit_name_, "dlsym failed: " + error);
    }

    try {
        instance_ = create();
    } catch (const std::exception& e) {
        ::dlclose(handle_);
        handle_ = nullptr;
        throw LoadError(LoadError::Reason::ConstructionFailed, unit_name_, e.what());
    } catch (...) {
        ::dlclose(handle_);
        handle_ = nullptr;
        throw LoadError(LoadError::Reason::ConstructionFailed, unit_name_, "unknown exception");
    }
    if (!instance_) {
        ::dlclose(handle_);
        handle_ = nullptr;
        throw LoadError(LoadError::Reason::ConstructionFailed, unit_name_, "factory returned null");
    }
}

LoadedUnit::~LoadedUnit() {
    if (instance_ && destroy_) {
        destroy_(instance_);
        instance_ = nullptr;
    }
    if (handle_) {
        ::dlclose(handle_);
        handle_ = nullptr;
    }
}

}  // namespace evalrt::runtime
