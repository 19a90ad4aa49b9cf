#include "pch.h"
#include "nb_path_resolver.hpp"
#include "nb_log.hpp"

namespace nbimport {

namespace {

bool IsRegularFile(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

} // anonymous namespace

std::string LastSegment(const std::string& fullname) {
    auto dot = fullname.rfind('.');
    if (dot == std::string::npos) return fullname;
    return fullname.substr(dot + 1);
}

std::optional<std::filesystem::path> FindNotebook(const std::string& fullname, const SearchPath& path) {
    const std::string segment = LastSegment(fullname);
    if (segment.empty()) {
        return std::nullopt;
    }

    std::string spaced = segment;
    std::replace(spaced.begin(), spaced.end(), '_', ' ');

    static const SearchPath kCurrentDirectory{""};
    const SearchPath& dirs = path.empty() ? kCurrentDirectory : path;

    for (const auto& dir : dirs) {
        // (a) <dir>/<segment>.ipynb
        auto cand = std::filesystem::path(dir) / (segment + kNotebookExtension);
        if (IsRegularFile(cand)) {
            NB_DEBUG_IMPORT("resolved %s -> %s", fullname.c_str(), cand.string().c_str());
            return cand;
        }
        // (b) <dir>/<segment with spaces>.ipynb
        if (spaced != segment) {
            cand = std::filesystem::path(dir) / (spaced + kNotebookExtension);
            if (IsRegularFile(cand)) {
                NB_DEBUG_IMPORT("resolved %s -> %s", fullname.c_str(), cand.string().c_str());
                return cand;
            }
        }
    }
    return std::nullopt;
}

std::string SearchPathKey(const SearchPath& path) {
    static const SearchPath kCurrentDirectory{""};
    const SearchPath& dirs = path.empty() ? kCurrentDirectory : path;

    // Each entry as <length>:<bytes>, so no entry content can mimic a boundary
    std::string key;
    for (const auto& dir : dirs) {
        key += std::to_string(dir.size());
        key += ':';
        key += dir;
    }
    return key;
}

} // namespace nbimport
