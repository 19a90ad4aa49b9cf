#include <gtest/gtest.h>
#include <sstream>
#include "nb_errors.hpp"
#include "nb_notebook.hpp"
#include "test_helpers.hpp"

using namespace nbimport;
using namespace nbimport::test;

TEST(NotebookReaderTest, ReadsCellsInOrder) {
    Notebook nb = ParseNotebook(MakeNotebookJson({
        Code("x = 1\n"),
        Markdown("# Title\nsome prose"),
        Code("y = x + 1"),
    }));

    ASSERT_EQ(nb.cells.size(), 3u);
    EXPECT_EQ(nb.cells[0].kind, CellKind::Code);
    EXPECT_EQ(nb.cells[0].source, "x = 1\n");
    EXPECT_EQ(nb.cells[1].kind, CellKind::Markdown);
    EXPECT_EQ(nb.cells[1].source, "# Title\nsome prose");
    EXPECT_EQ(nb.cells[2].kind, CellKind::Code);
    EXPECT_EQ(nb.cells[2].source, "y = x + 1");
    EXPECT_EQ(nb.nbformat, 4);
    EXPECT_EQ(nb.nbformat_minor, 5);
    EXPECT_EQ(nb.language, "nbscript");
}

TEST(NotebookReaderTest, SourceMayBeAString) {
    Notebook nb = ParseNotebook(R"({
        "nbformat": 4, "nbformat_minor": 2, "metadata": {},
        "cells": [{"cell_type": "code", "source": "a = 1\nb = 2"}]
    })");
    ASSERT_EQ(nb.cells.size(), 1u);
    EXPECT_EQ(nb.cells[0].source, "a = 1\nb = 2");
    EXPECT_TRUE(nb.language.empty());
}

TEST(NotebookReaderTest, LanguageFromLanguageInfo) {
    Notebook nb = ParseNotebook(R"({"metadata": {"language_info": {"name": "nbscript"}}, "cells": []})");
    EXPECT_EQ(nb.language, "nbscript");
    EXPECT_TRUE(nb.cells.empty());
}

TEST(NotebookReaderTest, UnknownCellTypesAreRaw) {
    Notebook nb = ParseNotebook(R"({"cells": [
        {"cell_type": "raw", "source": "r"},
        {"cell_type": "heading", "source": "h"}
    ]})");
    ASSERT_EQ(nb.cells.size(), 2u);
    EXPECT_EQ(nb.cells[0].kind, CellKind::Raw);
    EXPECT_EQ(nb.cells[1].kind, CellKind::Raw);
}

TEST(NotebookReaderTest, VersionIsNotValidated) {
    Notebook nb = ParseNotebook(R"({"nbformat": 99, "cells": [{"cell_type": "code", "source": []}]})");
    EXPECT_EQ(nb.nbformat, 99);
    ASSERT_EQ(nb.cells.size(), 1u);
    EXPECT_TRUE(nb.cells[0].source.empty());
}

TEST(NotebookReaderTest, MalformedDocumentsRaiseFormatError) {
    EXPECT_THROW(ParseNotebook("{not json"), FormatError);
    EXPECT_THROW(ParseNotebook("[]"), FormatError);
    EXPECT_THROW(ParseNotebook(R"({"nbformat": 4})"), FormatError);
    EXPECT_THROW(ParseNotebook(R"({"cells": {}})"), FormatError);
    EXPECT_THROW(ParseNotebook(R"({"cells": [{"source": "x"}]})"), FormatError);
    EXPECT_THROW(ParseNotebook(R"({"cells": [{"cell_type": "code", "source": 3}]})"), FormatError);
    EXPECT_THROW(ParseNotebook(R"({"cells": [{"cell_type": "code", "source": ["a", 1]}]})"), FormatError);
    EXPECT_THROW(ParseNotebook(R"({"cells": [42]})"), FormatError);
}

TEST(NotebookReaderTest, ReadsFromStream) {
    std::istringstream in(MakeNotebookJson({Code("print(1)")}));
    Notebook nb = ReadNotebook(in);
    ASSERT_EQ(nb.cells.size(), 1u);
    EXPECT_EQ(nb.cells[0].source, "print(1)");
}

TEST(NotebookReaderTest, ReadsFromFile) {
    TempDir dir;
    WriteNotebook(dir / "doc.ipynb", {Markdown("m"), Code("c")});

    NotebookReader reader;
    auto cells = reader.Read(dir / "doc.ipynb");
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[1].source, "c");
}

TEST(NotebookReaderTest, MissingFileRaisesFormatError) {
    TempDir dir;
    EXPECT_THROW(ReadNotebookFile(dir / "absent.ipynb"), FormatError);
}

TEST(NotebookReaderTest, CellKindNames) {
    EXPECT_STREQ(cell_kind_name(CellKind::Code), "code");
    EXPECT_STREQ(cell_kind_name(CellKind::Markdown), "markdown");
    EXPECT_STREQ(cell_kind_name(CellKind::Raw), "raw");
}
