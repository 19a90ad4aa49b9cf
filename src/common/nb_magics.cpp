#include "pch.h"
#include "nb_errors.hpp"
#include "nb_runner.hpp"
#include "nb_shell.hpp"

namespace nbimport {

namespace {

bool IsDunder(const std::string& name) {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

std::vector<std::string> UserNames(const Namespace& ns) {
    std::vector<std::string> names;
    for (auto& name : ns.names()) {
        if (!IsDunder(name)) names.push_back(std::move(name));
    }
    return names;
}

void MagicWho(Shell& shell, const std::string&) {
    auto names = UserNames(*shell.ambient_namespace());
    std::ostream& out = shell.output();
    if (names.empty()) {
        out << "Interactive namespace is empty.\n";
        return;
    }
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out << "\t";
        out << names[i];
    }
    out << "\n";
}

void MagicReset(Shell& shell, const std::string&) {
    Namespace& ns = *shell.ambient_namespace();
    for (const auto& name : UserNames(ns)) {
        ns.erase(name);
    }
}

void MagicRun(Shell& shell, const std::string& args) {
    if (args.empty()) {
        throw RuntimeError("%run: missing file name");
    }
    RunFile(shell.imports(), std::filesystem::path(args));
}

void MagicWriteFile(Shell& shell, const std::string& args, const std::string& body) {
    if (args.empty()) {
        throw RuntimeError("%%writefile: missing file name");
    }
    const std::filesystem::path file(args);
    std::error_code ec;
    const bool exists = std::filesystem::exists(file, ec);
    if (ec) {
        throw RuntimeError("%%writefile: cannot inspect " + file.string() + ": " + ec.message());
    }

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        throw RuntimeError("%%writefile: cannot open " + file.string());
    }
    f << body;
    if (!body.empty() && body.back() != '\n') f << '\n';
    if (!f) {
        throw RuntimeError("%%writefile: failed writing " + file.string());
    }
    shell.output() << (exists ? "Overwriting " : "Writing ") << file.string() << "\n";
}

} // anonymous namespace

void RegisterCoreMagics(Shell& shell) {
    shell.register_line_magic("who", MagicWho);
    shell.register_line_magic("reset", MagicReset);

    shell.register_line_magic("echo", [](Shell& sh, const std::string& args) {
        sh.output() << args << "\n";
    });

    shell.register_line_magic("pwd", [](Shell& sh, const std::string&) {
        std::error_code ec;
        const std::filesystem::path cwd = std::filesystem::current_path(ec);
        if (ec) {
            throw RuntimeError("%pwd: " + ec.message());
        }
        sh.output() << cwd.string() << "\n";
    });

    shell.register_line_magic("run", MagicRun);
    shell.register_cell_magic("writefile", MagicWriteFile);
}

} // namespace nbimport
