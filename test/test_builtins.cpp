#include <gtest/gtest.h>
#include <sstream>
#include "nb_builtins.hpp"
#include "nb_errors.hpp"
#include "nb_import_system.hpp"
#include "nb_interpreter.hpp"
#include "nb_shell.hpp"

using namespace nbimport;

TEST(BuiltinRegistryTest, RegisterFindAndRemove) {
    BuiltinRegistry registry;
    registry.register_function("answer", [](Interpreter&, std::span<Value>) {
        return Value::from_int(42);
    }, 0);

    EXPECT_TRUE(registry.has_function("answer"));
    auto fn = registry.find_function("answer");
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->name, "answer");
    EXPECT_EQ(fn->param_count, 0);

    registry.unregister_function("answer");
    EXPECT_FALSE(registry.has_function("answer"));
    EXPECT_EQ(registry.find_function("answer"), nullptr);
}

TEST(BuiltinRegistryTest, CoreSetIsSorted) {
    BuiltinRegistry registry;
    RegisterCoreBuiltins(registry);
    std::vector<std::string> expected{"__cell_magic__", "__magic__", "len", "print", "str", "type"};
    EXPECT_EQ(registry.get_function_names(), expected);
    EXPECT_EQ(registry.function_count(), expected.size());
}

class CoreBuiltinsTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    ImportSystem imports_;

    void SetUp() override { imports_.shell().set_output(out_); }

    std::string Run(const std::string& source) {
        imports_.shell().evaluator().Execute(source, "<test>", imports_.shell().user_namespace());
        return out_.str();
    }
};

TEST_F(CoreBuiltinsTest, StrLenType) {
    EXPECT_EQ(Run("print(str(12) + \"!\", len(\"four\"), type(1.5), type(nil), type(print))"),
              "12! 4 Float Nil Builtin\n");
}

TEST_F(CoreBuiltinsTest, LenRejectsNonStrings) {
    EXPECT_THROW(Run("len(3)"), RuntimeError);
}

TEST_F(CoreBuiltinsTest, PrintWithoutArgumentsPrintsNewline) {
    EXPECT_EQ(Run("print()"), "\n");
}

TEST_F(CoreBuiltinsTest, HostFunctionsAreCallable) {
    imports_.shell().builtins().register_function("add", [](Interpreter&, std::span<Value> args) {
        return Value::from_int(args[0].as_int() + args[1].as_int());
    }, 2);
    EXPECT_EQ(Run("print(add(2, 3))"), "5\n");
}

TEST_F(CoreBuiltinsTest, ScriptDefinitionsShadowBuiltins) {
    EXPECT_EQ(Run("func len(s) { return 0 }\nprint(len(\"abc\"))"), "0\n");
}
