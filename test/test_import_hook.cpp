#include <gtest/gtest.h>
#include "nb_errors.hpp"
#include "nb_import_hook.hpp"
#include "test_helpers.hpp"

using namespace nbimport;
using namespace nbimport::test;

namespace {

size_t CountNotebookFinders(const ImportSystem& imports) {
    size_t count = 0;
    for (const auto& finder : imports.finders()) {
        if (std::dynamic_pointer_cast<NotebookFinder>(finder)) ++count;
    }
    return count;
}

} // anonymous namespace

class ImportHookTest : public ::testing::Test {
protected:
    TempDir dir_;
    std::ostringstream out_;
    ImportSystem imports_;

    void SetUp() override {
        imports_.set_search_path({dir_.str()});
        imports_.shell().set_output(out_);
    }
};

TEST_F(ImportHookTest, FreshSystemHasNoHook) {
    EXPECT_FALSE(NotebookImportHook::IsInstalled(imports_));
    EXPECT_EQ(NotebookImportHook::Find(imports_), nullptr);
}

TEST_F(ImportHookTest, InstallIsIdempotent) {
    HookHandle first = NotebookImportHook::Install(imports_);
    HookHandle second = NotebookImportHook::Install(imports_);

    EXPECT_TRUE(first.valid());
    EXPECT_TRUE(second.valid());
    EXPECT_EQ(first.lock(), second.lock());
    EXPECT_EQ(CountNotebookFinders(imports_), 1u);
    EXPECT_EQ(imports_.finders().size(), 1u);
    EXPECT_EQ(NotebookImportHook::Find(imports_), first.lock());
}

TEST_F(ImportHookTest, NotebookBecomesImportable) {
    WriteNotebook(dir_ / "lib.ipynb", {Code("answer = 42")});
    NotebookImportHook::Install(imports_);

    ModulePtr module = imports_.Import("lib");
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(module->bindings()->find("answer")->as_int(), 42);

    imports_.shell().RunCell("import lib\nprint(lib.answer)");
    EXPECT_EQ(out_.str(), "42\n");
}

TEST_F(ImportHookTest, SecondImportReusesRegisteredModule) {
    int reads = 0;
    imports_.set_document_reader(std::make_unique<CountingReader>(reads));
    WriteNotebook(dir_ / "once.ipynb", {Code("print(\"ran\")")});
    NotebookImportHook::Install(imports_);

    ModulePtr first = imports_.Import("once");
    ModulePtr second = imports_.Import("once");

    EXPECT_EQ(first, second);
    EXPECT_EQ(imports_.modules().Lookup("once"), first);
    EXPECT_EQ(reads, 1);
    EXPECT_EQ(out_.str(), "ran\n");
}

TEST_F(ImportHookTest, UninstallRemovesFinder) {
    WriteNotebook(dir_ / "later.ipynb", {Code("x = 1")});
    HookHandle handle = NotebookImportHook::Install(imports_);

    EXPECT_TRUE(NotebookImportHook::Uninstall(handle));
    EXPECT_FALSE(handle.valid());
    EXPECT_FALSE(NotebookImportHook::IsInstalled(imports_));
    EXPECT_TRUE(imports_.finders().empty());
    EXPECT_THROW(imports_.Import("later"), ModuleNotFoundError);
}

TEST_F(ImportHookTest, UninstallTwiceReportsFalse) {
    HookHandle handle = NotebookImportHook::Install(imports_);
    HookHandle copy = handle;

    EXPECT_TRUE(NotebookImportHook::Uninstall(handle));
    EXPECT_FALSE(NotebookImportHook::Uninstall(handle));
    EXPECT_FALSE(NotebookImportHook::Uninstall(copy));
}

TEST_F(ImportHookTest, EmptyHandleUninstallsNothing) {
    NotebookImportHook::Install(imports_);
    HookHandle empty;
    EXPECT_FALSE(empty.valid());
    EXPECT_FALSE(NotebookImportHook::Uninstall(empty));
    EXPECT_TRUE(NotebookImportHook::IsInstalled(imports_));
}

TEST_F(ImportHookTest, ModulesSurviveUninstall) {
    WriteNotebook(dir_ / "kept.ipynb", {Code("x = 1")});
    HookHandle handle = NotebookImportHook::Install(imports_);
    ModulePtr module = imports_.Import("kept");

    NotebookImportHook::Uninstall(handle);
    EXPECT_EQ(imports_.Import("kept"), module);
}

TEST_F(ImportHookTest, ReinstallAfterUninstall) {
    HookHandle handle = NotebookImportHook::Install(imports_);
    auto old_finder = handle.lock();
    NotebookImportHook::Uninstall(handle);

    HookHandle again = NotebookImportHook::Install(imports_);
    EXPECT_TRUE(again.valid());
    EXPECT_NE(again.lock(), old_finder);
    EXPECT_EQ(CountNotebookFinders(imports_), 1u);
}
