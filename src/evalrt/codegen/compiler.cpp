// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/codegen/compiler.hpp"

#include "evalrt/env.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace evalrt::codegen {
namespace {

// Defined by the top-level CMake build for the evalrt library.
#ifndef EVALRT_INCLUDE_DIR
#define EVALRT_INCLUDE_DIR ""
#endif

constexpr size_t kLogTailLines = 20;

struct ProcessOutcome {
    int exit_code = -1;
    bool timed_out = false;
};

/// Run argv[0] (PATH lookup) with stdout and stderr redirected to `log`.
/// The child gets its own process group so a timeout also kills the
/// compiler's sub-processes.
ProcessOutcome run_process(const std::vector<std::string>& argv,
                           const fs::path& log,
                           std::chrono::milliseconds timeout) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const int fd = ::open(log.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("cannot open compile log " + log.string() + ": " + std::strerror(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fd, STDOUT_FILENO);
        ::dup2(fd, STDERR_FILENO);
        ::execvp(args[0], args.data());
        static const char kExecFailed[] = "evalrt: failed to execute compiler\n";
        ssize_t ignored = ::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        (void)ignored;
        ::_exit(127);
    }
    ::setpgid(pid, pid);
    ::close(fd);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto delay = std::chrono::milliseconds(1);
    int status = 0;
    while (true) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            return ProcessOutcome{-1, true};
        }
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, std::chrono::milliseconds(50));
    }

    if (WIFEXITED(status)) return ProcessOutcome{WEXITSTATUS(status), false};
    if (WIFSIGNALED(status)) return ProcessOutcome{128 + WTERMSIG(status), false};
    return ProcessOutcome{-1, false};
}

std::string read_text(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return {};
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string tail_lines(const std::string& text, size_t count) {
    size_t pos = text.size();
    while (pos > 0 && (text[pos - 1] == '\n')) --pos;
    size_t seen = 0;
    while (pos > 0) {
        if (text[pos - 1] == '\n' && ++seen == count) break;
        --pos;
    }
    return text.substr(pos);
}

Severity parse_severity(const std::string& s) {
    if (s == "warning") return Severity::Warning;
    if (s == "note") return Severity::Note;
    return Severity::Error;  // "error" and "fatal error"
}

}  // namespace

std::vector<Diagnostic> parse_diagnostics(std::string_view log) {
    static const std::regex kWithColumn(R"(^(.+?):(\d+):(\d+): (fatal error|error|warning|note): (.*)$)");
    static const std::regex kWithLine(R"(^(.+?):(\d+): (fatal error|error|warning|note): (.*)$)");
    static const std::regex kToolOnly(R"(^([^:\s]+): (fatal error|error|warning): (.*)$)");

    std::vector<Diagnostic> out;
    std::istringstream lines{std::string(log)};
    std::string line;
    std::smatch m;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        Diagnostic d;
        if (std::regex_match(line, m, kWithColumn)) {
            d.file = m[1];
            d.line = std::stoi(m[2]);
            d.column = std::stoi(m[3]);
            d.severity = parse_severity(m[4]);
            d.message = m[5];
        } else if (std::regex_match(line, m, kWithLine)) {
            d.file = m[1];
            d.line = std::stoi(m[2]);
            d.severity = parse_severity(m[3]);
            d.message = m[4];
        } else if (std::regex_match(line, m, kToolOnly)) {
            d.file = m[1];
            d.severity = parse_severity(m[2]);
            d.message = m[3];
        } else {
            continue;
        }
        out.push_back(std::move(d));
    }
    return out;
}

bool executable_in_path(const std::string& exe) {
    const auto path = env_string("PATH");
    if (!path) return false;
    std::string_view paths(*path);
    while (!paths.empty()) {
        const auto pos = paths.find(':');
        std::string_view dir = (pos == std::string_view::npos) ? paths : paths.substr(0, pos);
        if (!dir.empty()) {
            fs::path p = fs::path(std::string(dir)) / exe;
            std::error_code ec;
            if (fs::exists(p, ec) && !fs::is_directory(p, ec)) return true;
        }
        if (pos == std::string_view::npos) break;
        paths.remove_prefix(pos + 1);
    }
    return false;
}

std::string pick_cxx() {
    if (auto p = env_string("EVALRT_CXX")) {
        return *p;
    }
    if (executable_in_path("clang++")) return "clang++";
    if (executable_in_path("g++")) return "g++";
    return "c++";
}

fs::path engine_include_dir() {
    return fs::path(EVALRT_INCLUDE_DIR);
}

CompilerInvoker::CompilerInvoker(std::string cxx, logger_t logger)
    : cxx_(cxx.empty() ? pick_cxx() : std::move(cxx)),
      logger_(logger ? std::move(logger) : default_logger()) {}

std::vector<std::string> CompilerInvoker::command_line(const CompileRequest& request) const {
    std::vector<std::string> cmd = {
        cxx_,
        "-std=c++20",
        "-shared",
        "-fPIC",
        "-fdiagnostics-color=never",
        "-Wall",
        "-Wextra",
        // Detailed deprecation warnings.
        "-Wdeprecated",
        "-Wdeprecated-declarations",
    };
    const fs::path engine_include = engine_include_dir();
    if (!engine_include.empty()) {
        cmd.push_back("-I" + engine_include.string());
    }
    for (const auto& dir : request.include_dirs) {
        cmd.push_back("-I" + dir.string());
    }
    cmd.push_back(request.source.string());
    cmd.push_back("-o");
    cmd.push_back(request.output.string());

    // Archives only become DT_NEEDED entries of the unit if it uses them.
    cmd.push_back("-Wl,--as-needed");
    for (const auto& entry : request.classpath) {
        std::error_code ec;
        const auto status = fs::status(entry.path, ec);
        if (fs::is_directory(status)) {
            cmd.push_back("-L" + entry.path.string());
        } else if (fs::is_regular_file(status) && runtime::is_archive(entry.path)) {
            cmd.push_back(entry.path.string());
        }
        // Missing entries are skipped, as a search path would.
    }
    for (const auto& flag : request.extra_flags) {
        cmd.push_back(flag);
    }
    return cmd;
}

CompileResult CompilerInvoker::compile(const CompileRequest& request) const {
    CompileResult result;
    result.output = request.output;
    result.log = request.log;
    result.command = command_line(request);

    logger_->debug("compiling {} with {} classpath entries", request.unit_name, request.classpath.size());
    const auto start = std::chrono::steady_clock::now();
    const ProcessOutcome outcome = run_process(result.command, request.log, request.timeout);
    result.elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    result.exit_code = outcome.exit_code;
    result.timed_out = outcome.timed_out;

    const std::string log_text = read_text(request.log);
    result.diagnostics = parse_diagnostics(log_text);
    for (const auto& d : result.diagnostics) {
        if (d.severity == Severity::Error) ++result.error_count;
        if (d.severity == Severity::Warning) ++result.warning_count;
    }

    std::error_code ec;
    result.success = !outcome.timed_out && outcome.exit_code == 0 && result.error_count == 0 &&
                     fs::exists(request.output, ec);

    if (!result.success && result.error_count == 0) {
        Diagnostic d;
        d.severity = Severity::Error;
        d.file = cxx_;
        if (outcome.timed_out) {
            d.message = "compilation cancelled after " + std::to_string(request.timeout.count()) + " ms";
        } else if (outcome.exit_code != 0) {
            d.message = "compiler exited with status " + std::to_string(outcome.exit_code);
            const std::string tail = tail_lines(log_text, kLogTailLines);
            if (!tail.empty()) d.message += "\n" + tail;
        } else {
            d.message = "compiler produced no output at " + request.output.string();
        }
        result.diagnostics.push_back(std::move(d));
        result.error_count = 1;
    }

    logger_->debug("compiled {} in {:.1f} ms: {} error(s), {} warning(s)",
                   request.unit_name, result.elapsed_ms, result.error_count, result.warning_count);
    return result;
}

void check(const CompileResult& result, const std::string& unit_name) {
    if (!result.success) {
        throw CompilationError(unit_name, result.diagnostics, result.timed_out);
    }
}

}  // namespace evalrt::codegen
