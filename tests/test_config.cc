#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "cli_commands.hpp"

namespace fs = std::filesystem;
using namespace mica::cli;

class ProjectConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("mica_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;

    void createTestFile(const fs::path& relative, const std::string& content) {
        fs::path filepath = test_dir / relative;
        fs::create_directories(filepath.parent_path());
        std::ofstream file(filepath);
        file << content;
        file.close();
    }
};

TEST_F(ProjectConfigTest, ParsesAllFields) {
    createTestFile("mica.json", R"({
        "name": "demo",
        "version": "0.1.0",
        "entry": "main.mica",
        "limits": { "max_call_depth": 64, "max_nesting_depth": 32 },
        "repl": { "history": false, "echo_ast": true }
    })");

    auto config = parse_mica_json((test_dir / "mica.json").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->is_valid);
    EXPECT_EQ(config->name, "demo");
    EXPECT_EQ(config->version, "0.1.0");
    EXPECT_EQ(config->entry, "main.mica");
    EXPECT_EQ(config->limits.max_call_depth, 64u);
    EXPECT_EQ(config->limits.max_nesting_depth, 32u);
    EXPECT_FALSE(config->repl.history);
    EXPECT_TRUE(config->repl.echo_ast);
}

TEST_F(ProjectConfigTest, MissingFieldsKeepDefaults) {
    createTestFile("mica.json", R"({ "name": "bare" })");

    auto config = parse_mica_json((test_dir / "mica.json").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->entry, "");
    EXPECT_EQ(config->limits.max_call_depth, DEFAULT_MAX_CALL_DEPTH);
    EXPECT_EQ(config->limits.max_nesting_depth, DEFAULT_MAX_NESTING_DEPTH);
    EXPECT_TRUE(config->repl.history);
    EXPECT_FALSE(config->repl.echo_ast);
}

TEST_F(ProjectConfigTest, InvalidLimitFallsBackToDefault) {
    createTestFile("mica.json", R"({ "limits": { "max_call_depth": -3, "max_nesting_depth": 0 } })");

    auto config = parse_mica_json((test_dir / "mica.json").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->limits.max_call_depth, DEFAULT_MAX_CALL_DEPTH);
    EXPECT_EQ(config->limits.max_nesting_depth, DEFAULT_MAX_NESTING_DEPTH);
}

TEST_F(ProjectConfigTest, MalformedJsonIsIgnored) {
    createTestFile("mica.json", "{ \"name\": ");
    EXPECT_FALSE(parse_mica_json((test_dir / "mica.json").string()).has_value());

    createTestFile("mica.json", "[1, 2]");
    EXPECT_FALSE(parse_mica_json((test_dir / "mica.json").string()).has_value());

    createTestFile("mica.json", R"({ "repl": { "history": "yes" } })");
    EXPECT_FALSE(parse_mica_json((test_dir / "mica.json").string()).has_value());
}

TEST_F(ProjectConfigTest, MissingFile) {
    EXPECT_FALSE(parse_mica_json((test_dir / "absent.json").string()).has_value());
}

TEST_F(ProjectConfigTest, FoundByWalkingUp) {
    createTestFile("mica.json", R"({ "name": "walker" })");
    fs::create_directories(test_dir / "src" / "deep");

    std::string root = get_project_root((test_dir / "src" / "deep").string());
    EXPECT_EQ(fs::canonical(root), fs::canonical(test_dir));

    auto config = find_and_parse_mica_json((test_dir / "src" / "deep").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->name, "walker");
    EXPECT_EQ(fs::canonical(config->root), fs::canonical(test_dir));
}

TEST_F(ProjectConfigTest, RunSourceReportsStatus) {
    ProjectConfig config;
    std::ostringstream out, err;

    EXPECT_EQ(run_source("let a = 2; print(a * 21);", "ok.mica", config, {}, out, err), 0);
    EXPECT_EQ(out.str(), "42\n");
    EXPECT_TRUE(err.str().empty());

    EXPECT_EQ(run_source("print(1); 1 / 0; print(2);", "bad.mica", config, {}, out, err), 1);
    EXPECT_EQ(out.str(), "42\n1\n");
    EXPECT_NE(err.str().find("EvalError at bad.mica:1:13"), std::string::npos);
}

TEST_F(ProjectConfigTest, RunSourceDumps) {
    ProjectConfig config;
    DumpOptions dumps;
    dumps.tokens = true;
    dumps.ast = true;
    std::ostringstream out, err;

    EXPECT_EQ(run_source("let x = 1;", "dump.mica", config, dumps, out, err), 0);
    EXPECT_NE(err.str().find("TOKEN DUMP"), std::string::npos);
    EXPECT_NE(err.str().find("VariableDeclaration let x"), std::string::npos);
}

TEST_F(ProjectConfigTest, RunCommandUsesConfigEntry) {
    createTestFile("mica.json", R"({ "entry": "app/main.mica" })");
    createTestFile("app/main.mica", "let ok = 1;\n");

    auto config = find_and_parse_mica_json(test_dir.string());
    ASSERT_TRUE(config.has_value());

    CommandResult result = execute_command({"run"}, *config);
    EXPECT_EQ(result.exit_code, 0);

    ProjectConfig no_entry;
    result = execute_command({"run"}, no_entry);
    EXPECT_EQ(result.exit_code, 1);

    result = execute_command({"deploy"}, no_entry);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.message, "Unknown command: deploy");
}

TEST_F(ProjectConfigTest, RunCommandHonorsDumpFlags) {
    createTestFile("app.mica", "let y = 2;\n");

    DumpOptions dumps;
    dumps.tokens = true;
    dumps.ast = true;

    std::ostringstream captured;
    std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
    CommandResult result = execute_command({"run", (test_dir / "app.mica").string()}, ProjectConfig{}, dumps);
    std::cerr.rdbuf(old);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(captured.str().find("TOKEN DUMP"), std::string::npos);
    EXPECT_NE(captured.str().find("VariableDeclaration let y"), std::string::npos);
}
