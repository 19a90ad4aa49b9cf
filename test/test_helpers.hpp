#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "nb_evaluator.hpp"
#include "nb_import_system.hpp"
#include "nb_notebook.hpp"
#include "nb_shell.hpp"

namespace nbimport {
namespace test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("nbimport_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Changes the working directory for the lifetime of the guard.
class CurrentDirGuard {
public:
    explicit CurrentDirGuard(const std::filesystem::path& dir)
        : saved_(std::filesystem::current_path()) {
        std::filesystem::current_path(dir);
    }

    ~CurrentDirGuard() {
        std::error_code ec;
        std::filesystem::current_path(saved_, ec);
    }

    CurrentDirGuard(const CurrentDirGuard&) = delete;
    CurrentDirGuard& operator=(const CurrentDirGuard&) = delete;

private:
    std::filesystem::path saved_;
};

struct CellSpec {
    std::string cell_type;  // "code", "markdown", "raw"
    std::string source;
};

inline CellSpec Code(std::string source) { return {"code", std::move(source)}; }
inline CellSpec Markdown(std::string source) { return {"markdown", std::move(source)}; }

// nbformat 4 document with the given cells. Sources are stored as line lists
// the way notebook front ends save them.
inline std::string MakeNotebookJson(const std::vector<CellSpec>& cells) {
    using json = nlohmann::json;

    json doc;
    doc["nbformat"] = 4;
    doc["nbformat_minor"] = 5;
    doc["metadata"] = {{"kernelspec", {{"name", "nbscript"}, {"language", "nbscript"}}}};
    doc["cells"] = json::array();

    for (const auto& cell : cells) {
        json lines = json::array();
        size_t start = 0;
        while (start < cell.source.size()) {
            size_t end = cell.source.find('\n', start);
            if (end == std::string::npos) {
                lines.push_back(cell.source.substr(start));
                break;
            }
            lines.push_back(cell.source.substr(start, end - start + 1));
            start = end + 1;
        }

        json c = {{"cell_type", cell.cell_type}, {"metadata", json::object()}, {"source", lines}};
        if (cell.cell_type == "code") {
            c["execution_count"] = nullptr;
            c["outputs"] = json::array();
        }
        doc["cells"].push_back(std::move(c));
    }
    return doc.dump(1);
}

inline void WriteText(const std::filesystem::path& file, const std::string& text) {
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path());
    }
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write " + file.string());
    }
    out << text;
}

inline void WriteNotebook(const std::filesystem::path& file, const std::vector<CellSpec>& cells) {
    WriteText(file, MakeNotebookJson(cells));
}

// Records every Execute call, then forwards to `inner` when one is given.
class RecordingEvaluator : public IEvaluator {
public:
    struct Call {
        std::string source;
        std::string origin;
        NamespacePtr ns;
        NamespacePtr ambient;  // Shell's ambient namespace at call time
    };

    RecordingEvaluator(Shell& shell, std::unique_ptr<IEvaluator> inner = nullptr)
        : shell_(shell), inner_(std::move(inner)) {}

    void Execute(const std::string& source, const std::string& origin, const NamespacePtr& ns) override {
        calls_.push_back({source, origin, ns, shell_.ambient_namespace()});
        if (inner_) inner_->Execute(source, origin, ns);
    }

    const std::vector<Call>& calls() const { return calls_; }

private:
    Shell& shell_;
    std::unique_ptr<IEvaluator> inner_;
    std::vector<Call> calls_;
};

// Counts reads, then parses with the real reader.
class CountingReader : public IDocumentReader {
public:
    explicit CountingReader(int& reads) : reads_(reads) {}

    std::vector<NotebookCell> Read(const std::filesystem::path& path) override {
        ++reads_;
        return inner_.Read(path);
    }

private:
    int& reads_;
    NotebookReader inner_;
};

// ImportSystem searching one temp directory, with shell output captured.
class ImportFixtureBase {
protected:
    TempDir dir_;
    std::ostringstream out_;
    ImportSystem imports_;

    ImportFixtureBase() {
        ImportConfig config;
        config.search_path = {dir_.str()};
        config.install_script_finder = false;
        imports_.Configure(config);
        imports_.shell().set_output(out_);
    }

    // Installs a RecordingEvaluator that still runs the code.
    RecordingEvaluator& Record() {
        auto rec = std::make_unique<RecordingEvaluator>(
            imports_.shell(), std::make_unique<ScriptEvaluator>(imports_));
        RecordingEvaluator& ref = *rec;
        imports_.shell().set_evaluator(std::move(rec));
        return ref;
    }

    std::string Output() const { return out_.str(); }
};

} // namespace test
} // namespace nbimport
