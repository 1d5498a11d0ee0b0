// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT
//
// Load a configuration written as C++ and print it.
//
//   app_config_example [config.cpp]
//
// The default is config/development.cpp next to this file.

#include "app_config.hpp"

#include "evalrt/evaluator.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

#ifndef APP_CONFIG_DIR
#define APP_CONFIG_DIR "."
#endif

int main(int argc, char** argv) {
    const std::filesystem::path dir(APP_CONFIG_DIR);
    const std::filesystem::path file = argc > 1 ? std::filesystem::path(argv[1])
                                                : dir / "config" / "development.cpp";

    evalrt::EvalOptions options = evalrt::EvalOptions::from_env();
    options.include_dirs.push_back(dir);

    try {
        const auto config = evalrt::Evaluator(options).eval_file<app::ServerConfig>(file);
        std::cout << "host:    " << config.host << "\n"
                  << "port:    " << config.port << "\n"
                  << "timeout: " << config.timeout.count() << "s\n"
                  << "plugins:";
        for (const auto& p : config.plugins) std::cout << " " << p;
        std::cout << "\n";
    } catch (const evalrt::CompilationError& e) {
        std::cerr << e.what() << "\n";
        for (const auto& d : e.diagnostics()) std::cerr << "  " << d.to_string() << "\n";
        return EXIT_FAILURE;
    } catch (const evalrt::EvalError& e) {
        std::cerr << "[" << evalrt::error_kind_name(e.kind()) << "] " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
