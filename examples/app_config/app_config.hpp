// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace app {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 80;
    std::chrono::seconds timeout{10};
    std::vector<std::string> plugins;
};

}  // namespace app
