#include "pch.h"
#include "nb_import_hook.hpp"
#include "nb_import_system.hpp"
#include "nb_log.hpp"

namespace nbimport {

std::shared_ptr<NotebookFinder> NotebookImportHook::Find(const ImportSystem& imports) {
    for (const auto& finder : imports.finders()) {
        if (auto nb = std::dynamic_pointer_cast<NotebookFinder>(finder)) {
            return nb;
        }
    }
    return nullptr;
}

HookHandle NotebookImportHook::Install(ImportSystem& imports) {
    auto finder = Find(imports);
    if (finder) {
        NB_LOG_DEBUG("notebook finder already installed");
    } else {
        finder = std::make_shared<NotebookFinder>(imports);
        imports.AppendFinder(finder);
        NB_LOG_DEBUG("notebook finder installed");
    }
    return HookHandle{finder, &imports};
}

bool NotebookImportHook::Uninstall(HookHandle& handle) {
    auto finder = handle.lock();
    ImportSystem* imports = handle.imports;
    handle = HookHandle{};

    if (!finder || !imports) {
        return false;
    }
    return imports->RemoveFinder(finder);
}

} // namespace nbimport
