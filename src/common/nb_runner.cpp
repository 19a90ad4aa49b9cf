#include "pch.h"
#include "nb_runner.hpp"
#include "nb_errors.hpp"
#include "nb_import_system.hpp"
#include "nb_log.hpp"
#include "nb_notebook.hpp"
#include "nb_path_resolver.hpp"
#include "nb_shell.hpp"

namespace nbimport {

namespace {

const char* const kMainModule = "__main__";
const char* const kFileBinding = "__file__";

// Binds `__file__` in `ns` while a file runs. The previous binding, or its
// absence, is restored on exit so `%run` inside a module leaves the module's
// own `__file__` alone.
class FileBindingScope {
public:
    FileBindingScope(NamespacePtr ns, const std::filesystem::path& file)
        : ns_(std::move(ns)) {
        if (const Value* current = ns_->find(kFileBinding)) {
            saved_ = *current;
        }
        ns_->set(kFileBinding, Value::from_string(file.string()));
    }

    ~FileBindingScope() {
        if (saved_) {
            ns_->set(kFileBinding, std::move(*saved_));
        } else {
            ns_->erase(kFileBinding);
        }
    }

    FileBindingScope(const FileBindingScope&) = delete;
    FileBindingScope& operator=(const FileBindingScope&) = delete;

private:
    NamespacePtr ns_;
    std::optional<Value> saved_;
};

} // anonymous namespace

void RunNotebookFile(ImportSystem& imports, const std::filesystem::path& notebook) {
    std::vector<NotebookCell> cells;
    try {
        cells = imports.document_reader().Read(notebook);
    } catch (const FormatError& e) {
        throw ReadError(kMainModule, notebook, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        throw ReadError(kMainModule, notebook, e.what());
    }

    NB_LOG_INFO("running notebook " << notebook.string());

    Shell& shell = imports.shell();
    FileBindingScope file_binding(shell.ambient_namespace(), notebook);

    size_t index = 0;
    for (const auto& cell : cells) {
        ++index;
        if (cell.kind != CellKind::Code) continue;
        const std::string origin = notebook.string() + " [cell " + std::to_string(index) + "]";
        try {
            shell.RunCell(cell.source, origin);
        } catch (const ScriptError& e) {
            throw ExecutionError(kMainModule, notebook, index, e.what());
        }
    }
}

void RunScriptFile(ImportSystem& imports, const std::filesystem::path& script) {
    std::ifstream f(script, std::ios::binary);
    if (!f.is_open()) {
        throw ReadError(kMainModule, script, "cannot open file");
    }
    std::string source((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    NB_LOG_INFO("running script " << script.string());

    Shell& shell = imports.shell();
    NamespacePtr ns = shell.ambient_namespace();
    FileBindingScope file_binding(ns, script);
    try {
        shell.evaluator().Execute(source, script.string(), ns);
    } catch (const ScriptError& e) {
        throw ExecutionError(kMainModule, script, 0, e.what());
    }
}

void RunFile(ImportSystem& imports, const std::filesystem::path& file) {
    if (file.extension() == kNotebookExtension) {
        RunNotebookFile(imports, file);
    } else {
        RunScriptFile(imports, file);
    }
}

void RunProject(ImportSystem& imports, const NBProject& project) {
    for (const auto& root : project.import_roots) {
        imports.AddSearchDirectory(root.string());
    }
    if (project.log_level) {
        Log::set_level(*project.log_level);
    }
    RunFile(imports, project.entry_file);
}

} // namespace nbimport
