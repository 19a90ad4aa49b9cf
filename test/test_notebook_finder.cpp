#include <gtest/gtest.h>
#include "nb_notebook_finder.hpp"
#include "nb_path_resolver.hpp"
#include "test_helpers.hpp"

using namespace nbimport;
using namespace nbimport::test;

class NotebookFinderTest : public ::testing::Test {
protected:
    TempDir dir_;
    TempDir other_;
    ImportSystem imports_;
    NotebookFinder finder_{imports_};

    void SetUp() override {
        WriteNotebook(dir_ / "shared.ipynb", {Code("x = 1")});
        WriteNotebook(other_ / "shared.ipynb", {Code("x = 2")});
    }
};

TEST_F(NotebookFinderTest, Name) {
    EXPECT_EQ(finder_.Name(), "notebook");
}

TEST_F(NotebookFinderTest, EqualPathsShareOneLoader) {
    SearchPath first{dir_.str()};
    SearchPath second{dir_.str()};

    auto a = finder_.FindModule("shared", first);
    auto b = finder_.FindModule("shared", second);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(finder_.loaders().size(), 1u);
    EXPECT_EQ(finder_.loaders().Find(SearchPathKey(first)), a);
}

TEST_F(NotebookFinderTest, DistinctPathsGetDistinctLoaders) {
    auto a = finder_.FindModule("shared", {dir_.str()});
    auto b = finder_.FindModule("shared", {other_.str()});
    auto c = finder_.FindModule("shared", {dir_.str(), other_.str()});
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    ASSERT_NE(c, nullptr);
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(finder_.loaders().size(), 3u);
}

TEST_F(NotebookFinderTest, LoaderIsSharedAcrossModuleNames) {
    WriteNotebook(dir_ / "another.ipynb", {});
    auto a = finder_.FindModule("shared", {dir_.str()});
    auto b = finder_.FindModule("another", {dir_.str()});
    EXPECT_EQ(a, b);
}

TEST_F(NotebookFinderTest, DeclinesMissingNameWithoutCaching) {
    EXPECT_EQ(finder_.FindModule("absent", {dir_.str()}), nullptr);
    EXPECT_TRUE(finder_.loaders().empty());
}

TEST_F(NotebookFinderTest, LoaderKeepsItsOwnPath) {
    auto loader = std::dynamic_pointer_cast<NotebookLoader>(finder_.FindModule("shared", {other_.str()}));
    ASSERT_NE(loader, nullptr);
    EXPECT_EQ(loader->path(), SearchPath{other_.str()});

    ModulePtr module = loader->LoadModule("shared");
    EXPECT_EQ(module->bindings()->find("x")->as_int(), 2);
}
