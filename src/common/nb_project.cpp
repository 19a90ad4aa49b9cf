// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_project.cpp
 * @brief Project file loader implementation.
 *
 * Implements LoadNBProject() to parse .nbproject XML files and extract the
 * entry point, import roots and log level.
 */

#include "pch.h"
#include "nb_project.hpp"

namespace nbimport {

static bool ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) { err = "cannot open: " + p.string(); return false; }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

static std::string Trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

static bool ExtractTag(const std::string& xml, const std::string& tag, std::string& out) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    auto a = xml.find(open);
    if (a == std::string::npos) return false;
    a += open.size();
    auto b = xml.find(close, a);
    if (b == std::string::npos) return false;
    out = Trim(xml.substr(a, b - a));
    return true;
}

static std::vector<std::string> ExtractRepeatedTags(const std::string& xml, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        auto a = xml.find(open, pos);
        if (a == std::string::npos) break;
        a += open.size();
        auto b = xml.find(close, a);
        if (b == std::string::npos) break;
        out.push_back(Trim(xml.substr(a, b - a)));
        pos = b + close.size();
    }
    return out;
}

bool LoadNBProject(const std::filesystem::path& nbproject, NBProject& out, std::string& err) {
    std::string xml;
    if (!ReadAllText(nbproject, xml, err)) return false;

    out.project_file = nbproject;
    out.project_dir = nbproject.parent_path();

    std::string entry;
    if (!ExtractTag(xml, "Entry", entry) || entry.empty()) {
        err = "missing <Entry>...</Entry>";
        return false;
    }
    out.entry_file = out.project_dir / std::filesystem::path(entry);

    out.import_roots.clear();
    std::string roots_block;
    if (ExtractTag(xml, "ImportRoots", roots_block)) {
        for (const auto& r : ExtractRepeatedTags(roots_block, "Root")) {
            if (!r.empty()) out.import_roots.push_back(out.project_dir / std::filesystem::path(r));
        }
    }
    if (out.import_roots.empty()) {
        // Default: directory of the entry file
        out.import_roots.push_back(out.entry_file.parent_path());
    }

    std::string level;
    if (ExtractTag(xml, "LogLevel", level)) {
        out.log_level = Log::ParseLevel(level);
        if (!out.log_level) {
            err = "unknown <LogLevel>: " + level;
            return false;
        }
    }

    return true;
}

} // namespace nbimport
