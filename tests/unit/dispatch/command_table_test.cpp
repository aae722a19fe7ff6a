#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

#include "fwr/dispatch/command_table.hpp"

using namespace fwr::dispatch;
using fwr::foundation::ErrorCode;

namespace {

CommandTable tableFrom(const std::string& yaml) {
    auto table = CommandTable::fromYaml(YAML::Load(yaml));
    EXPECT_TRUE(table.hasValue());
    return table.hasValue() ? std::move(table).value() : CommandTable{};
}

} // namespace

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

TEST(CommandTableTest, MatchByExtension) {
    auto table = tableFrom(R"(
- ext: .py
  run: python "{{file}}"
- ext: .rb
  run: ruby "{{file}}"
)");
    ASSERT_EQ(table.size(), 2u);

    const auto* rule = table.match("src/app.rb");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->run, "ruby \"{{file}}\"");
    EXPECT_EQ(table.match("src/app.go"), nullptr);
}

TEST(CommandTableTest, ExtensionMustMatchExactly) {
    auto table = tableFrom("- {ext: .c, run: cc}\n");
    EXPECT_NE(table.match("main.c"), nullptr);
    EXPECT_EQ(table.match("main.cc"), nullptr);
    EXPECT_EQ(table.match("c"), nullptr);
}

TEST(CommandTableTest, MatchByRegularExpression) {
    auto table = tableFrom(R"(
- re: ^Makefile$
  run: make
- re: _test\.go$
  run: go test ./...
)");
    ASSERT_NE(table.match("Makefile"), nullptr);
    EXPECT_EQ(table.match("Makefile")->run, "make");
    ASSERT_NE(table.match("pkg/foo_test.go"), nullptr);
    EXPECT_EQ(table.match("pkg/foo_test.go")->run, "go test ./...");
    EXPECT_EQ(table.match("pkg/foo.go"), nullptr);
}

TEST(CommandTableTest, FirstMatchWins) {
    auto table = tableFrom(R"(
- re: _test\.go$
  run: go test
- ext: .go
  run: go run "{{file}}"
)");
    EXPECT_EQ(table.match("a_test.go")->run, "go test");
    EXPECT_EQ(table.match("a.go")->run, "go run \"{{file}}\"");
}

TEST(CommandTableTest, RulesWithoutRunOrPredicateNeverMatch) {
    auto table = tableFrom(R"(
- ext: .py
- run: echo everything
- ext: .py
  run: python "{{file}}"
)");
    ASSERT_EQ(table.size(), 3u);
    const auto* rule = table.match("x.py");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->run, "python \"{{file}}\"");
    EXPECT_EQ(table.match("x.txt"), nullptr);
}

TEST(CommandTableTest, SingleCommandMatchesEverything) {
    auto table = CommandTable::singleCommand("make test");
    ASSERT_EQ(table.size(), 1u);
    ASSERT_NE(table.match("a/b/c.txt"), nullptr);
    EXPECT_EQ(table.match("Makefile")->run, "make test");
}

TEST(CommandTableTest, AddCompilesExpression) {
    CommandTable table;
    CommandRule rule;
    rule.re = "\\.md$";
    rule.run = "markdownlint";
    ASSERT_TRUE(table.add(rule).hasValue());
    EXPECT_NE(table.match("README.md"), nullptr);
}

// ---------------------------------------------------------------------------
// YAML loading errors
// ---------------------------------------------------------------------------

TEST(CommandTableYamlTest, NullNodeIsEmptyTable) {
    auto table = CommandTable::fromYaml(YAML::Node());
    ASSERT_TRUE(table.hasValue());
    EXPECT_TRUE(table.value().empty());
}

TEST(CommandTableYamlTest, NonSequenceIsTypeMismatch) {
    auto table = CommandTable::fromYaml(YAML::Load("ext: .py"));
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(CommandTableYamlTest, NonMappingEntryIsTypeMismatch) {
    auto table = CommandTable::fromYaml(YAML::Load("- make\n"));
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(CommandTableYamlTest, NonScalarFieldIsTypeMismatch) {
    auto table = CommandTable::fromYaml(YAML::Load("- {ext: [.c, .h], run: cc}\n"));
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(CommandTableYamlTest, InvalidRegexIsInvalidValue) {
    auto table = CommandTable::fromYaml(YAML::Load("- {re: \"([unclosed\", run: x}\n"));
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(CommandTableYamlTest, BuiltInTableLoads) {
    auto doc = YAML::Load(std::string(defaultCommandYaml()));
    auto table = CommandTable::fromYaml(doc["commands"]);
    ASSERT_TRUE(table.hasValue());
    EXPECT_FALSE(table.value().empty());
    ASSERT_NE(table.value().match("main.go"), nullptr);
    EXPECT_EQ(table.value().match("main.go")->run, "go run \"{{file}}\"");
    ASSERT_NE(table.value().match("Makefile"), nullptr);
    EXPECT_EQ(table.value().match("notes.txt"), nullptr);
}

// ---------------------------------------------------------------------------
// Template rendering
// ---------------------------------------------------------------------------

TEST(RenderCommandTest, DoubleBracePlaceholders) {
    const std::string path = "src/app/main.go";
    EXPECT_EQ(renderCommand("go run {{file}}", path), "go run src/app/main.go");
    EXPECT_EQ(renderCommand("{{ext}}", path), ".go");
    EXPECT_EQ(renderCommand("{{base}}", path), "main.go");
    EXPECT_EQ(renderCommand("{{base0}}", path), "main");
    EXPECT_EQ(renderCommand("{{dir}}", path), "src/app");
}

TEST(RenderCommandTest, SingleBracePlaceholders) {
    EXPECT_EQ(renderCommand("cc {file} -o {dir}/{base0}", "src/x.c"), "cc src/x.c -o src/x");
}

TEST(RenderCommandTest, AbsolutePath) {
    auto expected = (std::filesystem::current_path() / "src" / "x.c").lexically_normal().string();
    EXPECT_EQ(renderCommand("{{abs}}", "src/x.c"), expected);
    EXPECT_EQ(renderCommand("{{abs}}", "/tmp/y.c"), "/tmp/y.c");
}

TEST(RenderCommandTest, TopLevelFileDirIsDot) {
    EXPECT_EQ(renderCommand("{{dir}}/{{base0}}", "main.c"), "./main");
}

TEST(RenderCommandTest, UnknownPlaceholdersAreKept) {
    EXPECT_EQ(renderCommand("echo ${HOME} {{file}}", "a.sh"), "echo ${HOME} a.sh");
    EXPECT_EQ(renderCommand("awk '{print $1}' {{file}}", "a.txt"), "awk '{print $1}' a.txt");
    EXPECT_EQ(renderCommand("{{nope}}", "a.txt"), "{{nope}}");
}

TEST(RenderCommandTest, UnterminatedBraceIsLiteral) {
    EXPECT_EQ(renderCommand("echo {{file", "a.txt"), "echo {{file");
    EXPECT_EQ(renderCommand("no placeholders", "a.txt"), "no placeholders");
}

TEST(RenderCommandTest, EveryOccurrenceIsReplaced) {
    EXPECT_EQ(renderCommand("{{base}} {{base}}", "d/x.y"), "x.y x.y");
}

TEST(RenderCommandTest, PlaceholdersInsideLiteralBracesAreRendered) {
    EXPECT_EQ(renderCommand("{ cat {file}; }", "a.txt"), "{ cat a.txt; }");
    EXPECT_EQ(renderCommand("{ echo {{base}}; } > log", "d/x.y"), "{ echo x.y; } > log");
    EXPECT_EQ(renderCommand("{{{base}}}", "d/x.y"), "{x.y}");
}
