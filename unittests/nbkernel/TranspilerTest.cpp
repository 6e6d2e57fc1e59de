#include "nbkernel/Transpiler.h"

#include "gtest/gtest.h"

using namespace nbkernel;

namespace {

TEST(TranspilerTest, JavaScriptPassesThrough) {
  auto transpiler = Transpiler::createDefault("");
  for (const char *language : {"js", "javascript", ""}) {
    auto result = transpiler->transpile(language, "var x = 1;");
    ASSERT_TRUE(static_cast<bool>(result))
        << llvm::toString(result.takeError());
    EXPECT_EQ("var x = 1;", *result);
  }
}

TEST(TranspilerTest, JavaScriptIsDownlevelled) {
  auto transpiler = Transpiler::createDefault("");
  auto result = transpiler->transpile("js", "let x = 1;");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ("var x = 1;", *result);

  result = transpiler->transpile("js", "var y = a?.b;");
  ASSERT_FALSE(static_cast<bool>(result));
  EXPECT_EQ("Optional chaining (?.) is not supported (line 1)",
            llvm::toString(result.takeError()));
}

TEST(TranspilerTest, TypeScriptNeedsCommand) {
  auto transpiler = Transpiler::createDefault("");
  auto result = transpiler->transpile("ts", "let x: number = 1;");
  ASSERT_FALSE(static_cast<bool>(result));
  EXPECT_NE(std::string::npos,
            llvm::toString(result.takeError()).find("transpiler"));
}

TEST(TranspilerTest, UnsupportedLanguage) {
  auto transpiler = Transpiler::createDefault("cat");
  auto result = transpiler->transpile("python", "print(1)");
  ASSERT_FALSE(static_cast<bool>(result));
  EXPECT_EQ("Unsupported cell language: python",
            llvm::toString(result.takeError()));
}

TEST(TranspilerTest, RunsCommand) {
  auto transpiler = Transpiler::createDefault("sed 's/: number//'");
  auto result = transpiler->transpile("ts", "var x: number = 1;\n");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ("var x = 1;\n", *result);
}

TEST(TranspilerTest, CommandOutputIsDownlevelled) {
  auto transpiler = Transpiler::createDefault("sed 's/: number//'");
  auto result = transpiler->transpile("ts", "let x: number = 1;\n");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ("var x = 1;\n", *result);
}

TEST(TranspilerTest, CommandFails) {
  auto transpiler = Transpiler::createDefault("echo 'syntax error' >&2; exit 3");
  auto result = transpiler->transpile("typescript", "let");
  ASSERT_FALSE(static_cast<bool>(result));
  std::string message = llvm::toString(result.takeError());
  EXPECT_NE(std::string::npos, message.find("Transpiler failed"));
  EXPECT_NE(std::string::npos, message.find("syntax error"));
}

} // end anonymous namespace
