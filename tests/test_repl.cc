#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "repl.hpp"

class ReplSessionTest : public ::testing::Test {
   protected:
    std::ostringstream out;
    std::ostringstream err;
    mica::cli::ProjectConfig config;
};

TEST_F(ReplSessionTest, EchoesNonNullResults) {
    ReplSession session(config, out, err);

    EXPECT_EQ(session.feed_line("2 + 3"), ReplStatus::Continue);
    EXPECT_EQ(out.str(), "5\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(ReplSessionTest, NullResultsAreNotEchoed) {
    ReplSession session(config, out, err);

    session.feed_line("let x;");
    session.feed_line("null");
    EXPECT_EQ(out.str(), "");
}

TEST_F(ReplSessionTest, StatePersistsAcrossLines) {
    ReplSession session(config, out, err);

    session.feed_line("let x = 10;");
    out.str("");
    session.feed_line("x * 2");
    EXPECT_EQ(out.str(), "20\n");
}

TEST_F(ReplSessionTest, ErrorsAreReportedAndSessionContinues) {
    ReplSession session(config, out, err);

    EXPECT_EQ(session.feed_line("undefined_name"), ReplStatus::Continue);
    EXPECT_NE(err.str().find("Error: EnvError"), std::string::npos);
    EXPECT_FALSE(session.is_buffering());

    EXPECT_EQ(session.feed_line("1 / 0"), ReplStatus::Continue);
    EXPECT_NE(err.str().find("Division by zero"), std::string::npos);

    session.feed_line("7");
    EXPECT_EQ(out.str(), "7\n");
}

TEST_F(ReplSessionTest, LexAndParseErrorsAreReported) {
    ReplSession session(config, out, err);

    session.feed_line("let a = #;");
    EXPECT_NE(err.str().find("LexError"), std::string::npos);
    session.feed_line("const c;");
    EXPECT_NE(err.str().find("A value is required for const assignment"), std::string::npos);
    EXPECT_FALSE(session.is_buffering());
}

TEST_F(ReplSessionTest, ExitConditions) {
    ReplSession a(config, out, err);
    EXPECT_EQ(a.feed_line(""), ReplStatus::Exit);

    ReplSession b(config, out, err);
    EXPECT_EQ(b.feed_line("exit"), ReplStatus::Exit);
}

TEST_F(ReplSessionTest, IncompleteInputContinuesOnNextLine) {
    ReplSession session(config, out, err);

    EXPECT_STREQ(session.prompt(), ">>> ");
    EXPECT_EQ(session.feed_line("fn add(a, b) {"), ReplStatus::Continue);
    EXPECT_TRUE(session.is_buffering());
    EXPECT_STREQ(session.prompt(), "... ");
    EXPECT_TRUE(err.str().empty());

    session.feed_line("  a + b");
    session.feed_line("}");
    EXPECT_FALSE(session.is_buffering());

    out.str("");
    session.feed_line("add(2, 40)");
    EXPECT_EQ(out.str(), "42\n");
}

TEST_F(ReplSessionTest, BlankLineAbandonsIncompleteInput) {
    ReplSession session(config, out, err);

    session.feed_line("let o = { a: 1,");
    ASSERT_TRUE(session.is_buffering());

    EXPECT_EQ(session.feed_line(""), ReplStatus::Continue);
    EXPECT_FALSE(session.is_buffering());
    EXPECT_NE(err.str().find("ParseError"), std::string::npos);

    // a later blank line with nothing pending ends the session
    EXPECT_EQ(session.feed_line(""), ReplStatus::Exit);
}

TEST_F(ReplSessionTest, PrintGoesToSessionOutput) {
    ReplSession session(config, out, err);

    session.feed_line("print(1, 2);");
    EXPECT_EQ(out.str(), "1\n2\n");
}

TEST_F(ReplSessionTest, FunctionsSurviveTheirLine) {
    ReplSession session(config, out, err);

    session.feed_line("fn triple(n) { n * 3 }");
    out.str("");
    session.feed_line("triple(5)");
    EXPECT_EQ(out.str(), "15\n");
}

TEST_F(ReplSessionTest, EchoAstDumpsTree) {
    config.repl.echo_ast = true;
    ReplSession session(config, out, err);

    session.feed_line("1 + 2");
    EXPECT_NE(out.str().find("BinaryExpression '+'"), std::string::npos);
    EXPECT_NE(out.str().find("3\n"), std::string::npos);
}

TEST_F(ReplSessionTest, CallDepthLimitComesFromConfig) {
    config.limits.max_call_depth = 8;
    ReplSession session(config, out, err);

    session.feed_line("fn down(n) { down(n) }");
    session.feed_line("down(1)");
    EXPECT_NE(err.str().find("Maximum call depth of 8 exceeded"), std::string::npos);
}
