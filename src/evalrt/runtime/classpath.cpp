// Copyright 2026 EvalRT Authors
// SPDX-License-Identifier: MIT

#include "evalrt/runtime/classpath.hpp"

#include "evalrt/errors.hpp"

#include <dlfcn.h>
#include <elf.h>
#include <link.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace evalrt::runtime {
namespace {

constexpr char kPathSeparator = ':';

#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
constexpr unsigned char kNativeElfData = ELFDATA2LSB;
#else
constexpr unsigned char kNativeElfData = ELFDATA2MSB;
#endif

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> out;
    while (!s.empty()) {
        const auto pos = s.find(sep);
        std::string_view part = (pos == std::string_view::npos) ? s : s.substr(0, pos);
        if (!part.empty()) out.emplace_back(part);
        if (pos == std::string_view::npos) break;
        s.remove_prefix(pos + 1);
    }
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string capture_cmd(const std::string& cmd) {
    std::string out;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return out;
    char buf[256];
    while (true) {
        size_t n = fread(buf, 1, sizeof(buf), pipe);
        if (n == 0) break;
        out.append(buf, buf + n);
    }
    (void)pclose(pipe);
    return out;
}

fs::path object_containing(const void* addr) {
    Dl_info info{};
    if (::dladdr(addr, &info) == 0 || !info.dli_fname || !*info.dli_fname) {
        return {};
    }
    std::error_code ec;
    fs::path p = fs::canonical(info.dli_fname, ec);
    return ec ? fs::path(info.dli_fname) : p;
}

void read_at(std::ifstream& in, const fs::path& archive, uint64_t offset, void* dst, size_t size) {
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
    if (!in) {
        throw ClasspathResolutionError(archive, "truncated ELF object");
    }
}

std::string substitute_origin(const std::string& entry, const fs::path& archive) {
    const std::string origin = archive.parent_path().string();
    std::string out = entry;
    for (const char* token : {"${ORIGIN}", "$ORIGIN"}) {
        const size_t len = std::strlen(token);
        size_t pos = 0;
        while ((pos = out.find(token, pos)) != std::string::npos) {
            out.replace(pos, len, origin);
            pos += origin.size();
        }
    }
    return out;
}

template <typename Ehdr, typename Shdr, typename Dyn>
std::string read_runpath(std::ifstream& in, const fs::path& archive) {
    Ehdr eh{};
    read_at(in, archive, 0, &eh, sizeof(eh));
    if (eh.e_shoff == 0 || eh.e_shnum == 0) return {};
    if (eh.e_shentsize != sizeof(Shdr)) {
        throw ClasspathResolutionError(archive, "unexpected section header size");
    }

    std::vector<Shdr> sections(eh.e_shnum);
    read_at(in, archive, eh.e_shoff, sections.data(), sections.size() * sizeof(Shdr));

    for (const auto& sh : sections) {
        if (sh.sh_type != SHT_DYNAMIC) continue;
        if (sh.sh_link >= sections.size()) {
            throw ClasspathResolutionError(archive, "dynamic section has no string table");
        }
        const Shdr& strtab = sections[sh.sh_link];

        std::vector<Dyn> dynamic(sh.sh_size / sizeof(Dyn));
        read_at(in, archive, sh.sh_offset, dynamic.data(), dynamic.size() * sizeof(Dyn));
        std::string strings(strtab.sh_size, '\0');
        read_at(in, archive, strtab.sh_offset, strings.data(), strings.size());

        // DT_RUNPATH takes precedence over the legacy DT_RPATH.
        int64_t runpath = -1;
        int64_t rpath = -1;
        for (const auto& d : dynamic) {
            if (d.d_tag == DT_NULL) break;
            if (d.d_tag == DT_RUNPATH) runpath = static_cast<int64_t>(d.d_un.d_val);
            if (d.d_tag == DT_RPATH) rpath = static_cast<int64_t>(d.d_un.d_val);
        }
        const int64_t offset = runpath >= 0 ? runpath : rpath;
        if (offset < 0) return {};
        if (static_cast<uint64_t>(offset) >= strings.size()) {
            throw ClasspathResolutionError(archive, "search path string out of range");
        }
        return std::string(strings.c_str() + offset);
    }
    return {};
}

int collect_object(struct dl_phdr_info* info, size_t /*size*/, void* data) {
    auto* out = static_cast<std::vector<std::string>*>(data);
    if (info->dlpi_name && *info->dlpi_name) {
        out->emplace_back(info->dlpi_name);
    }
    return 0;
}

void append_expanded(Classpath& out, const std::string& raw) {
    const fs::path entry(strip_scheme(raw));
    out.push_back({entry, EntryOrigin::Process});
    if (!is_archive(entry)) return;
    // One level only: entries found here are not scanned for further
    // manifests.
    for (auto& nested : read_manifest_classpath(entry)) {
        out.push_back({std::move(nested), EntryOrigin::Manifest});
    }
}

}  // namespace

const char* entry_origin_name(EntryOrigin origin) {
    switch (origin) {
        case EntryOrigin::Boot: return "boot";
        case EntryOrigin::Process: return "process";
        case EntryOrigin::Manifest: return "manifest";
        case EntryOrigin::Install: return "install";
    }
    return "unknown";
}

const InstallPaths& install_paths() {
    static const InstallPaths paths = [] {
        InstallPaths p;
        p.engine_library = object_containing(reinterpret_cast<const void*>(&install_paths));
        p.runtime_library = object_containing(reinterpret_cast<const void*>(&std::get_terminate));
        return p;
    }();
    return paths;
}

bool is_archive(const fs::path& path) {
    static const std::regex kSharedObject(R"(\.so(\.[0-9]+)*$)");
    return std::regex_search(path.filename().string(), kSharedObject);
}

std::string strip_scheme(std::string_view entry) {
    constexpr std::string_view kFileUrl = "file://";
    constexpr std::string_view kFile = "file:";
    if (entry.substr(0, kFileUrl.size()) == kFileUrl) {
        entry.remove_prefix(kFileUrl.size());
    } else if (entry.substr(0, kFile.size()) == kFile) {
        entry.remove_prefix(kFile.size());
    }
    return std::string(entry);
}

std::vector<fs::path> read_manifest_classpath(const fs::path& archive) {
    std::ifstream in(archive, std::ios::binary);
    if (!in) {
        throw ClasspathResolutionError(archive, "cannot open file");
    }

    unsigned char ident[EI_NIDENT] = {};
    in.read(reinterpret_cast<char*>(ident), sizeof(ident));
    if (!in || std::memcmp(ident, ELFMAG, SELFMAG) != 0) {
        throw ClasspathResolutionError(archive, "not an ELF object");
    }
    if (ident[EI_DATA] != kNativeElfData) {
        throw ClasspathResolutionError(archive, "unsupported ELF byte order");
    }

    std::string runpath;
    if (ident[EI_CLASS] == ELFCLASS64) {
        runpath = read_runpath<Elf64_Ehdr, Elf64_Shdr, Elf64_Dyn>(in, archive);
    } else if (ident[EI_CLASS] == ELFCLASS32) {
        runpath = read_runpath<Elf32_Ehdr, Elf32_Shdr, Elf32_Dyn>(in, archive);
    } else {
        throw ClasspathResolutionError(archive, "unknown ELF class");
    }

    std::vector<fs::path> out;
    for (const auto& entry : split(runpath, kPathSeparator)) {
        out.emplace_back(substitute_origin(entry, archive));
    }
    return out;
}

std::vector<fs::path> boot_search_path(const std::string& cxx) {
    const std::string output = capture_cmd(shell_quote(cxx) + " -print-search-dirs 2>/dev/null");
    std::istringstream lines(output);
    std::string line;
    constexpr std::string_view kPrefix = "libraries: =";
    std::vector<fs::path> out;
    while (std::getline(lines, line)) {
        if (line.compare(0, kPrefix.size(), kPrefix) != 0) continue;
        for (const auto& dir : split(std::string_view(line).substr(kPrefix.size()), kPathSeparator)) {
            out.push_back(fs::path(dir).lexically_normal());
        }
        break;
    }
    return out;
}

std::vector<std::string> process_load_path() {
    std::vector<std::string> objects;
    ::dl_iterate_phdr(&collect_object, &objects);

    std::vector<std::string> out;
    out.reserve(objects.size());
    for (auto& o : objects) {
        std::error_code ec;
        if (fs::is_regular_file(strip_scheme(o), ec)) {
            out.push_back(std::move(o));
        }
    }
    return out;
}

Classpath ClasspathResolver::resolve() const {
    return resolve(boot_search_path(cxx_), process_load_path(), install_paths());
}

Classpath ClasspathResolver::resolve(const std::vector<fs::path>& boot,
                                     const std::vector<std::string>& entries,
                                     const InstallPaths& install) {
    Classpath out;
    for (const auto& b : boot) {
        out.push_back({b, EntryOrigin::Boot});
    }
    for (const auto& e : entries) {
        append_expanded(out, e);
    }
    if (!install.engine_library.empty()) {
        out.push_back({install.engine_library, EntryOrigin::Install});
    }
    if (!install.runtime_library.empty()) {
        out.push_back({install.runtime_library, EntryOrigin::Install});
    }
    return out;
}

std::string join_classpath(const Classpath& classpath) {
    std::string out;
    for (const auto& entry : classpath) {
        if (!out.empty()) out.push_back(kPathSeparator);
        out += entry.path.string();
    }
    return out;
}

}  // namespace evalrt::runtime
