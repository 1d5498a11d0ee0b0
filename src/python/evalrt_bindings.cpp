// EvalRT - Python Bindings
// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "evalrt/evaluator.hpp"

#include <any>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace evalrt;

namespace {

EvalOptions make_options(const std::vector<std::string>& include_dirs,
                         const std::optional<std::string>& temp_root,
                         std::optional<bool> keep_artifacts) {
    EvalOptions options = EvalOptions::from_env();
    for (const auto& dir : include_dirs) {
        options.include_dirs.emplace_back(dir);
    }
    if (temp_root) {
        options.temp_root = *temp_root;
    }
    // Unset keeps EVALRT_KEEP_ARTIFACTS (or the default) from from_env().
    options.keep_artifacts(keep_artifacts);
    return options;
}

template <typename T>
bool try_convert(const std::any& value, py::object& out) {
    if (const auto* p = std::any_cast<T>(&value)) {
        out = py::cast(*p);
        return true;
    }
    return false;
}

/// Scalars and strings map to the matching Python type; anything else is a
/// CastError naming the C++ type.
py::object to_python(const std::any& value) {
    py::object out;
    if (try_convert<bool>(value, out) ||
        try_convert<int>(value, out) ||
        try_convert<unsigned>(value, out) ||
        try_convert<long>(value, out) ||
        try_convert<unsigned long>(value, out) ||
        try_convert<long long>(value, out) ||
        try_convert<unsigned long long>(value, out) ||
        try_convert<float>(value, out) ||
        try_convert<double>(value, out) ||
        try_convert<std::string>(value, out) ||
        try_convert<const char*>(value, out)) {
        return out;
    }
    throw CastError("bool, int, float or str", demangle(value.type().name()));
}

py::object eval_unit(const SourceUnit& unit, const std::vector<std::string>& include_dirs,
                     const std::optional<std::string>& temp_root, std::optional<bool> keep_artifacts) {
    Evaluator evaluator(make_options(include_dirs, temp_root, keep_artifacts));
    std::any value;
    {
        py::gil_scoped_release release;
        value = evaluator.eval_any(unit);
    }
    return to_python(value);
}

}  // namespace

PYBIND11_MODULE(evalrt_py, m) {
    m.doc() = "EvalRT: evaluate C++ source at run time";

    // Subclasses are registered after the base so their translators are
    // tried first.
    auto& eval_error = py::register_exception<EvalError>(m, "EvalError");
    py::register_exception<ArtifactError>(m, "ArtifactError", eval_error.ptr());
    py::register_exception<WrapError>(m, "WrapError", eval_error.ptr());
    py::register_exception<ClasspathResolutionError>(m, "ClasspathResolutionError", eval_error.ptr());
    py::register_exception<CompilationError>(m, "CompilationError", eval_error.ptr());
    py::register_exception<LoadError>(m, "LoadError", eval_error.ptr());
    py::register_exception<CastError>(m, "CastError", eval_error.ptr());

    m.def("eval",
          [](const std::string& source, const std::vector<std::string>& include_dirs,
             const std::optional<std::string>& temp_root, std::optional<bool> keep_artifacts) {
              return eval_unit(SourceUnit::from_string(source), include_dirs, temp_root, keep_artifacts);
          },
          py::arg("source"), py::arg("include_dirs") = std::vector<std::string>{},
          py::arg("temp_root") = std::nullopt, py::arg("keep_artifacts") = std::nullopt,
          "Evaluate C++ source text and return its value");

    m.def("eval_file",
          [](const std::filesystem::path& path, const std::vector<std::string>& include_dirs,
             const std::optional<std::string>& temp_root, std::optional<bool> keep_artifacts) {
              return eval_unit(SourceUnit::from_file(path), include_dirs, temp_root, keep_artifacts);
          },
          py::arg("path"), py::arg("include_dirs") = std::vector<std::string>{},
          py::arg("temp_root") = std::nullopt, py::arg("keep_artifacts") = std::nullopt,
          "Evaluate a C++ source file and return its value");

    m.attr("__version__") = "0.1.0";
}
