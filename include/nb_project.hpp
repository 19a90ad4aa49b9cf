// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_project.hpp
 * @brief Project file (.nbproject) structure.
 *
 * A project names an entry notebook or script, the directories imports
 * are searched in, and optionally a log level.
 */

#pragma once

#include "nb_log.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nbimport {

struct NBProject {
    std::filesystem::path project_file;
    std::filesystem::path project_dir;

    std::filesystem::path entry_file;                 // e.g. notebooks/main.ipynb
    std::vector<std::filesystem::path> import_roots;  // e.g. notebooks, lib
    std::optional<LogLevel> log_level;
};

bool LoadNBProject(const std::filesystem::path& nbproject, NBProject& out, std::string& err);

} // namespace nbimport
