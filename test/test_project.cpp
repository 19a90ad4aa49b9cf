#include <gtest/gtest.h>
#include "nb_errors.hpp"
#include "nb_project.hpp"
#include "nb_runner.hpp"
#include "test_helpers.hpp"

using namespace nbimport;
using namespace nbimport::test;

class ProjectTest : public ::testing::Test {
protected:
    TempDir dir_;

    std::filesystem::path WriteProject(const std::string& body) {
        const auto file = dir_ / "demo.nbproject";
        WriteText(file, "<Project>\n" + body + "\n</Project>\n");
        return file;
    }
};

TEST_F(ProjectTest, LoadsEntryRootsAndLevel) {
    auto file = WriteProject(
        "  <Entry> notebooks/main.ipynb </Entry>\n"
        "  <ImportRoots>\n"
        "    <Root>notebooks</Root>\n"
        "    <Root>lib</Root>\n"
        "  </ImportRoots>\n"
        "  <LogLevel>Debug</LogLevel>");

    NBProject project;
    std::string err;
    ASSERT_TRUE(LoadNBProject(file, project, err)) << err;

    EXPECT_EQ(project.project_file, file);
    EXPECT_EQ(project.project_dir, dir_.path());
    EXPECT_EQ(project.entry_file, dir_.path() / "notebooks" / "main.ipynb");
    ASSERT_EQ(project.import_roots.size(), 2u);
    EXPECT_EQ(project.import_roots[0], dir_.path() / "notebooks");
    EXPECT_EQ(project.import_roots[1], dir_.path() / "lib");
    ASSERT_TRUE(project.log_level.has_value());
    EXPECT_EQ(*project.log_level, LogLevel::Debug);
}

TEST_F(ProjectTest, RootsDefaultToEntryDirectory) {
    auto file = WriteProject("<Entry>src/run.nbs</Entry>");

    NBProject project;
    std::string err;
    ASSERT_TRUE(LoadNBProject(file, project, err)) << err;
    ASSERT_EQ(project.import_roots.size(), 1u);
    EXPECT_EQ(project.import_roots[0], dir_.path() / "src");
    EXPECT_FALSE(project.log_level.has_value());
}

TEST_F(ProjectTest, MissingEntryIsRejected) {
    auto file = WriteProject("<ImportRoots><Root>lib</Root></ImportRoots>");

    NBProject project;
    std::string err;
    EXPECT_FALSE(LoadNBProject(file, project, err));
    EXPECT_EQ(err, "missing <Entry>...</Entry>");
}

TEST_F(ProjectTest, UnknownLogLevelIsRejected) {
    auto file = WriteProject("<Entry>main.ipynb</Entry><LogLevel>chatty</LogLevel>");

    NBProject project;
    std::string err;
    EXPECT_FALSE(LoadNBProject(file, project, err));
    EXPECT_EQ(err, "unknown <LogLevel>: chatty");
}

TEST_F(ProjectTest, MissingFileIsReported) {
    NBProject project;
    std::string err;
    EXPECT_FALSE(LoadNBProject(dir_ / "absent.nbproject", project, err));
    EXPECT_NE(err.find("cannot open"), std::string::npos);
}

TEST_F(ProjectTest, RunProjectImportsFromRoots) {
    WriteNotebook(dir_ / "app" / "main.ipynb", {
        Markdown("# entry"),
        Code("import shapes\nimport units\nprint(shapes.area(3) * units.scale)"),
    });
    WriteNotebook(dir_ / "lib" / "shapes.ipynb", {Code("func area(side) {\n  return side * side\n}")});
    WriteText(dir_ / "app" / "units.nbs", "let scale = 10\n");

    auto file = WriteProject(
        "<Entry>app/main.ipynb</Entry>\n"
        "<ImportRoots><Root>app</Root><Root>lib</Root></ImportRoots>");

    NBProject project;
    std::string err;
    ASSERT_TRUE(LoadNBProject(file, project, err)) << err;

    std::ostringstream out;
    ImportConfig config;
    config.search_path = {};
    ImportSystem imports(config);
    imports.shell().set_output(out);

    RunProject(imports, project);

    EXPECT_EQ(out.str(), "90\n");
    EXPECT_EQ(imports.search_path(), (SearchPath{(dir_ / "app").string(), (dir_ / "lib").string()}));
    EXPECT_TRUE(imports.modules().Contains("shapes"));
    EXPECT_TRUE(imports.modules().Contains("units"));
    EXPECT_FALSE(imports.modules().Contains("main"));
}

TEST_F(ProjectTest, RunNotebookReportsFailingCell) {
    const auto nb = dir_ / "run_fail.ipynb";
    WriteNotebook(nb, {Code("a = 1"), Code("missing_function()")});

    ImportSystem imports;
    try {
        RunNotebookFile(imports, nb);
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.module_name(), "__main__");
        EXPECT_EQ(e.cell_index(), 2u);
    }
    EXPECT_EQ(imports.shell().user_namespace()->find("a")->as_int(), 1);
}

TEST_F(ProjectTest, RunMissingFilesRaiseReadError) {
    ImportSystem imports;
    EXPECT_THROW(RunFile(imports, dir_ / "nothing.ipynb"), ReadError);
    EXPECT_THROW(RunFile(imports, dir_ / "nothing.nbs"), ReadError);
}
