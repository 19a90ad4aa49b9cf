// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nbrun_cli.cpp
 * @brief nbimport command-line interface.
 *
 * Runs notebooks, scripts and projects, imports modules through the
 * resolver chain, lists notebook cells and hosts a small REPL. Entry point
 * for the nbrun executable.
 */

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "nb_errors.hpp"
#include "nb_import_system.hpp"
#include "nb_log.hpp"
#include "nb_module.hpp"
#include "nb_notebook.hpp"
#include "nb_project.hpp"
#include "nb_runner.hpp"
#include "nb_shell.hpp"

using namespace nbimport;

namespace {

constexpr const char* VERSION = "0.1.0";

void print_usage() {
    std::cerr << R"(
nbrun - notebook import runner v)" << VERSION << R"(

Usage: nbrun <command> [options]

Commands:
  run <file.ipynb|file.nbs>   Execute a notebook or script
      -I, --include <dir>     Add a module search directory (repeatable)
      -v, --verbose           Log imports (-vv for debug output)

  exec <project.nbproject>    Run the entry file of a project
      -v, --verbose           Log imports (-vv for debug output)

  import <module>             Import a module and list its names
      -I, --include <dir>     Add a module search directory (repeatable)
      -v, --verbose           Log imports (-vv for debug output)

  cells <file.ipynb>          Print the cells of a notebook
  repl                        Interactive session
      -I, --include <dir>     Add a module search directory (repeatable)

  version                     Show version information
  help                        Show this help message

Environment:
  NBIMPORT_LOG=<level>        error | warn | info | debug

Examples:
  nbrun run analysis.ipynb -I notebooks
  nbrun import helpers -I notebooks -v
  nbrun exec MyProject.nbproject
)";
}

void print_version() {
    std::cout << "nbrun version " << VERSION << "\n";
    std::cout << "nbimport notebook runner\n";
}

struct Options {
    std::vector<std::string> positional;
    SearchPath search_path;
    std::optional<LogLevel> log_level;
};

bool parse_options(int argc, char* argv[], Options& out) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-I" || arg == "--include") && i + 1 < argc) {
            out.search_path.push_back(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            out.log_level = LogLevel::Info;
        } else if (arg == "-vv") {
            out.log_level = LogLevel::Debug;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else {
            out.positional.push_back(std::move(arg));
        }
    }
    return true;
}

ImportSystem& configure(const Options& opts) {
    ImportConfig config;
    config.search_path = opts.search_path;
    if (config.search_path.empty()) {
        config.search_path.push_back("");
    }
    config.log_level = opts.log_level;

    ImportSystem& imports = ImportSystem::instance();
    imports.Configure(config);
    return imports;
}

// ============== Run ==============
int cmd_run(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) return 1;
    if (opts.positional.empty()) {
        std::cerr << "Error: Missing file\n";
        std::cerr << "Usage: nbrun run <file.ipynb|file.nbs> [options]\n";
        return 1;
    }

    std::filesystem::path file = opts.positional[0];
    if (!std::filesystem::exists(file)) {
        std::cerr << "Error: File not found: " << file.string() << "\n";
        return 1;
    }

    // Modules next to the file are importable by default
    opts.search_path.push_back(file.parent_path().string());

    try {
        RunFile(configure(opts), file);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Exec ==============
int cmd_exec(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) return 1;
    if (opts.positional.empty()) {
        std::cerr << "Error: Missing project file\n";
        std::cerr << "Usage: nbrun exec <project.nbproject> [options]\n";
        return 1;
    }

    std::filesystem::path project_path = opts.positional[0];
    if (!std::filesystem::exists(project_path)) {
        std::cerr << "Error: Project file not found: " << project_path.string() << "\n";
        return 1;
    }
    if (project_path.extension() != ".nbproject") {
        std::cerr << "Error: Expected .nbproject file\n";
        return 1;
    }

    NBProject project;
    std::string err;
    if (!LoadNBProject(project_path, project, err)) {
        std::cerr << "Error: Failed to load project: " << err << "\n";
        return 1;
    }

    // -v on the command line wins over the project file
    if (opts.log_level) project.log_level = opts.log_level;

    try {
        ImportSystem& imports = configure(opts);
        imports.set_search_path({});
        RunProject(imports, project);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Import ==============
int cmd_import(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) return 1;
    if (opts.positional.empty()) {
        std::cerr << "Error: Missing module name\n";
        std::cerr << "Usage: nbrun import <module> [options]\n";
        return 1;
    }

    try {
        ImportSystem& imports = configure(opts);
        ModulePtr module = imports.Import(opts.positional[0]);

        std::cout << module->to_string() << "\n";
        for (const auto& name : module->bindings()->names()) {
            const Value* value = module->bindings()->find(name);
            std::cout << "  " << name << " = " << value->repr() << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Cells ==============
int cmd_cells(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Error: Missing notebook file\n";
        std::cerr << "Usage: nbrun cells <file.ipynb>\n";
        return 1;
    }

    std::filesystem::path file = argv[0];
    try {
        Notebook nb = ReadNotebookFile(file);
        std::cout << file.string() << ": nbformat " << nb.nbformat << "." << nb.nbformat_minor;
        if (!nb.language.empty()) std::cout << ", language " << nb.language;
        std::cout << ", " << nb.cells.size() << " cell(s)\n";

        size_t index = 0;
        for (const auto& cell : nb.cells) {
            std::cout << "\n--- [" << ++index << "] " << cell_kind_name(cell.kind) << " ---\n";
            std::cout << cell.source;
            if (!cell.source.empty() && cell.source.back() != '\n') std::cout << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== REPL ==============
int brace_balance(const std::string& text) {
    int depth = 0;
    bool in_string = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') ++i;
            else if (c == '"') in_string = false;
        } else if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
        }
    }
    return depth;
}

int cmd_repl(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) return 1;

    ImportSystem& imports = configure(opts);
    Shell& shell = imports.shell();

    std::cout << "nbrun " << VERSION << " (Ctrl-D to exit)\n";

    std::string buffer;
    std::string line;
    size_t counter = 0;
    while (true) {
        std::cout << (buffer.empty() ? ">>> " : "... ") << std::flush;
        if (!std::getline(std::cin, line)) break;

        buffer += line;
        buffer += '\n';
        if (brace_balance(buffer) > 0) continue;

        try {
            shell.RunCell(buffer, "<stdin [" + std::to_string(++counter) + "]>");
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
        buffer.clear();
    }
    std::cout << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Log::ConfigureFromEnvironment();

    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    if (command == "run") {
        return cmd_run(argc - 2, argv + 2);
    } else if (command == "exec") {
        return cmd_exec(argc - 2, argv + 2);
    } else if (command == "import") {
        return cmd_import(argc - 2, argv + 2);
    } else if (command == "cells") {
        return cmd_cells(argc - 2, argv + 2);
    } else if (command == "repl") {
        return cmd_repl(argc - 2, argv + 2);
    } else if (command == "version" || command == "--version") {
        print_version();
        return 0;
    } else if (command == "help" || command == "-h" || command == "--help") {
        print_usage();
        return 0;
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
