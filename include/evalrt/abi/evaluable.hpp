// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

// Binary interface between the evaluator and generated units.
//
// Every generated unit `U` is a shared object that defines a class deriving
// from Evaluable and two C entrypoints:
//
//   extern "C" evalrt::abi::Evaluable* U_create();
//   extern "C" void U_destroy(evalrt::abi::Evaluable*);
//
// Objects created by U_create must be released with U_destroy so allocation
// and deallocation happen on the same side of the library boundary.

#include <any>

namespace evalrt::abi {

class Evaluable {
public:
    virtual ~Evaluable() = default;

    /// Run the wrapped code and return its value.
    virtual std::any apply() = 0;
};

using CreateFn = Evaluable* (*)();
using DestroyFn = void (*)(Evaluable*);

inline constexpr const char kCreateSuffix[] = "_create";
inline constexpr const char kDestroySuffix[] = "_destroy";

}  // namespace evalrt::abi
