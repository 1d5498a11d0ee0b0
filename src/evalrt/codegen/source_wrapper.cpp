// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/codegen/source_wrapper.hpp"

#include "evalrt/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace evalrt::codegen {
namespace {

// ============================================================
// Emitter
// ============================================================

/// Line-counting emitter. Every emit() writes exactly one line so #line
/// directives can point back into the generated file.
struct UnitEmitter {
    std::ostringstream output;
    int indent_level = 0;
    int line = 0;  // Lines written so far
    std::string indent_str = "    ";

    void emit(const std::string& code) {
        for (int i = 0; i < indent_level; ++i) output << indent_str;
        output << code << "\n";
        ++line;
    }

    /// Copy user lines unchanged (no indentation).
    void emit_verbatim(const std::vector<std::string>& lines) {
        for (const auto& l : lines) {
            output << l << "\n";
            line += 1 + static_cast<int>(std::count(l.begin(), l.end(), '\n'));
        }
    }

    void emit_line_directive(int next_line, const std::string& file) {
        output << "#line " << next_line << " \"" << file << "\"\n";
        ++line;
    }

    /// Resume numbering of the generated file itself.
    void resync(const std::string& file) { emit_line_directive(line + 2, file); }

    void push_indent() { indent_level++; }
    void pop_indent() { if (indent_level > 0) indent_level--; }

    std::string get_output() const { return output.str(); }
};

std::string escape_literal(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n') {
            lines.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

std::string_view trim_left(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    return s;
}

/// Number of leading lines that belong at file scope: preprocessor
/// directives (with their continuations), blank lines and line comments.
size_t header_line_count(const std::vector<std::string>& lines) {
    size_t n = 0;
    bool continuation = false;
    while (n < lines.size()) {
        const std::string& l = lines[n];
        const std::string_view t = trim_left(l);
        if (continuation) {
            // Part of the previous directive.
        } else if (t.empty() || t.substr(0, 2) == "//") {
            // Blank or comment: only kept in the header when a directive follows.
            size_t next = n + 1;
            while (next < lines.size()) {
                const std::string_view nt = trim_left(lines[next]);
                if (!nt.empty() && nt.substr(0, 2) != "//") break;
                ++next;
            }
            if (next >= lines.size() || trim_left(lines[next]).front() != '#') break;
        } else if (t.front() != '#') {
            break;
        }
        continuation = !l.empty() && l.back() == '\\';
        ++n;
    }
    // Blank lines between the directives and the body stay with the header.
    while (n < lines.size() && trim_left(lines[n]).empty()) ++n;
    return n;
}

std::string join_lines(const std::vector<std::string>& lines, size_t first) {
    std::string out;
    for (size_t i = first; i < lines.size(); ++i) {
        if (i > first) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

/// Drop trailing whitespace and statement terminators from an expression.
std::string trim_expression(std::string body) {
    while (!body.empty() &&
           (std::isspace(static_cast<unsigned char>(body.back())) || body.back() == ';')) {
        body.pop_back();
    }
    return body;
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

SourceUnit SourceUnit::from_string(std::string text) {
    return SourceUnit{std::move(text), "<string>"};
}

SourceUnit SourceUnit::from_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw WrapError("cannot read source file: " + path.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        throw WrapError("error while reading source file: " + path.string());
    }
    return SourceUnit{oss.str(), path.string()};
}

bool has_top_level_return(std::string_view body) {
    int depth = 0;
    size_t i = 0;
    const size_t n = body.size();
    while (i < n) {
        const char c = body[i];
        if (c == '/' && i + 1 < n && body[i + 1] == '/') {
            while (i < n && body[i] != '\n') ++i;
        } else if (c == '/' && i + 1 < n && body[i + 1] == '*') {
            const auto end = body.find("*/", i + 2);
            i = (end == std::string_view::npos) ? n : end + 2;
        } else if (c == '"' || c == '\'') {
            ++i;
            while (i < n && body[i] != c) {
                if (body[i] == '\\') ++i;
                ++i;
            }
            ++i;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            // Numbers may contain digit separators (1'000).
            while (i < n && (is_ident_char(body[i]) || body[i] == '\'' || body[i] == '.')) ++i;
        } else if (is_ident_char(c)) {
            const size_t start = i;
            while (i < n && is_ident_char(body[i])) ++i;
            const std::string_view word = body.substr(start, i - start);
            if (i < n && body[i] == '"' && !word.empty() && word.back() == 'R') {
                // Raw string literal: R"delim( ... )delim"
                const auto open = body.find('(', i);
                if (open == std::string_view::npos) return false;
                const std::string close = ")" + std::string(body.substr(i + 1, open - i - 1)) + "\"";
                const auto end = body.find(close, open);
                i = (end == std::string_view::npos) ? n : end + close.size();
            } else if (depth == 0 && word == "return") {
                return true;
            }
        } else {
            if (c == '{') ++depth;
            if (c == '}' && depth > 0) --depth;
            ++i;
        }
    }
    return false;
}

std::string wrap_source(const SourceUnit& unit, const std::string& unit_name) {
    const std::string origin = escape_literal(unit.origin);
    const std::string self = unit_name + ".cpp";
    const std::vector<std::string> lines = split_lines(unit.text);
    const size_t header_lines = header_line_count(lines);
    const std::string body = join_lines(lines, header_lines);
    const bool statements = has_top_level_return(body);

    UnitEmitter ctx;
    ctx.emit("// Generated by evalrt for unit " + unit_name + ". Do not edit.");
    ctx.emit("#include \"evalrt/abi/evaluable.hpp\"");
    ctx.emit("");
    ctx.emit("#include <any>");
    if (header_lines > 0) {
        ctx.emit_line_directive(1, origin);
        ctx.emit_verbatim(std::vector<std::string>(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(header_lines)));
        ctx.resync(self);
    }
    ctx.emit("");
    ctx.emit("namespace {");
    ctx.emit("");
    ctx.emit("class " + unit_name + " final : public evalrt::abi::Evaluable {");
    ctx.emit("public:");
    ctx.push_indent();
    ctx.emit("std::any apply() override {");
    ctx.emit_line_directive(static_cast<int>(header_lines) + 1, origin);
    if (statements) {
        ctx.emit_verbatim({body});
    } else {
        // The expression's value is the result.
        ctx.emit_verbatim({"return (" + trim_expression(body)});
        ctx.emit_verbatim({");"});
    }
    ctx.resync(self);
    ctx.emit("}");
    ctx.pop_indent();
    ctx.emit("};");
    ctx.emit("");
    ctx.emit("}  // namespace");
    ctx.emit("");
    ctx.emit("extern \"C\" evalrt::abi::Evaluable* " + unit_name + "_create() {");
    ctx.emit("    return new " + unit_name + "();");
    ctx.emit("}");
    ctx.emit("");
    ctx.emit("extern \"C\" void " + unit_name + "_destroy(evalrt::abi::Evaluable* unit) {");
    ctx.emit("    delete unit;");
    ctx.emit("}");
    return ctx.get_output();
}

void write_wrapped(const SourceUnit& unit, const runtime::GeneratedArtifact& artifact) {
    const std::string text = wrap_source(unit, artifact.unit_name);
    std::ofstream out(artifact.source_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WrapError("cannot create generated source: " + artifact.source_path.string());
    }
    runtime::ArtifactStore::delete_on_exit(artifact.source_path);
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.close();
    if (!out) {
        throw WrapError("failed to write generated source: " + artifact.source_path.string());
    }
}

}  // namespace evalrt::codegen
