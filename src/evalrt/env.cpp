// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace evalrt {

std::optional<std::string> env_string(const char* name) {
    if (const char* p = std::getenv(name); p && *p) {
        return std::string(p);
    }
    return std::nullopt;
}

std::optional<long long> env_int(const char* name) {
    const auto value = env_string(name);
    if (!value) return std::nullopt;
    size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(*value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value->size()) {
        throw std::runtime_error(std::string(name) + " is not an integer: '" + *value + "'");
    }
    return parsed;
}

std::optional<bool> env_flag(const char* name) {
    auto value = env_string(name);
    if (!value) return std::nullopt;
    std::string v = *value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no") return false;
    throw std::runtime_error(std::string(name) + " is not a boolean: '" + *value + "'");
}

}  // namespace evalrt
