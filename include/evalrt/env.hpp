// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <string>

namespace evalrt {

// Environment lookups used for configuration. Unset and empty variables are
// both reported as std::nullopt.

std::optional<std::string> env_string(const char* name);

/// Throws std::runtime_error when the variable is set but not an integer.
std::optional<long long> env_int(const char* name);

/// Accepts 1/0, true/false, on/off, yes/no (case-insensitive).
/// Throws std::runtime_error for any other non-empty value.
std::optional<bool> env_flag(const char* name);

}  // namespace evalrt
