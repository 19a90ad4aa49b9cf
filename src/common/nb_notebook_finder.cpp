#include "pch.h"
#include "nb_notebook_finder.hpp"
#include "nb_path_resolver.hpp"

namespace nbimport {

std::shared_ptr<IModuleLoader> NotebookFinder::FindModule(const std::string& fullname,
                                                          const SearchPath& path) {
    if (!FindNotebook(fullname, path)) {
        return nullptr;
    }

    const std::string key = SearchPathKey(path);
    return loaders_.GetOrCreate(key, [&] {
        return std::make_shared<NotebookLoader>(imports_, path);
    });
}

} // namespace nbimport
