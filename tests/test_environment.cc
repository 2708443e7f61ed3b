#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "MicaError.hpp"
#include "builtins.hpp"
#include "evaluator.hpp"

class EnvironmentTest : public ::testing::Test {
   protected:
    EnvPtr global = std::make_shared<Environment>();
    EnvPtr child = std::make_shared<Environment>(global);
    EnvPtr grandchild = std::make_shared<Environment>(child);

    static EnvError::Kind envErrorKind(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const EnvError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected EnvError";
        return EnvError::Kind::VariableNotFound;
    }
};

TEST_F(EnvironmentTest, DeclareAndLookup) {
    Value v = global->declare("x", std::int64_t{5}, false);
    EXPECT_TRUE(values_equal(v, Value(std::int64_t{5})));
    EXPECT_TRUE(values_equal(global->lookup("x"), Value(std::int64_t{5})));
    EXPECT_TRUE(global->has("x"));
    EXPECT_FALSE(global->has("y"));
}

TEST_F(EnvironmentTest, RedeclareInSameScopeFails) {
    const std::vector<std::string> names = {"a", "counter", "snake_case", "Ünïcode"};
    for (const auto& name : names) {
        global->declare(name, std::monostate{}, false);
        EXPECT_EQ(envErrorKind([&] { global->declare(name, true, false); }),
            EnvError::Kind::RedeclareVariable)
            << name;
    }
}

TEST_F(EnvironmentTest, ShadowingInChildScope) {
    global->declare("n", std::int64_t{1}, false);
    EXPECT_NO_THROW(child->declare("n", std::int64_t{2}, false));

    EXPECT_TRUE(values_equal(child->lookup("n"), Value(std::int64_t{2})));
    EXPECT_TRUE(values_equal(grandchild->lookup("n"), Value(std::int64_t{2})));
    EXPECT_TRUE(values_equal(global->lookup("n"), Value(std::int64_t{1})));
    EXPECT_EQ(grandchild->resolve("n"), child.get());
}

TEST_F(EnvironmentTest, AssignUpdatesNearestBinding) {
    global->declare("count", std::int64_t{0}, false);
    grandchild->assign("count", std::int64_t{3});
    EXPECT_TRUE(values_equal(global->lookup("count"), Value(std::int64_t{3})));
    EXPECT_EQ(child->values.count("count"), 0u);
}

TEST_F(EnvironmentTest, ConstantCannotBeReassignedAtAnyDepth) {
    global->declare("limit", std::int64_t{10}, true);
    EXPECT_EQ(envErrorKind([&] { global->assign("limit", std::int64_t{1}); }),
        EnvError::Kind::ReassignVariable);
    EXPECT_EQ(envErrorKind([&] { child->assign("limit", std::int64_t{1}); }),
        EnvError::Kind::ReassignVariable);
    EXPECT_EQ(envErrorKind([&] { grandchild->assign("limit", std::int64_t{1}); }),
        EnvError::Kind::ReassignVariable);
    EXPECT_TRUE(values_equal(global->lookup("limit"), Value(std::int64_t{10})));
}

TEST_F(EnvironmentTest, MissingNames) {
    EXPECT_EQ(envErrorKind([&] { grandchild->lookup("ghost"); }), EnvError::Kind::VariableNotFound);
    EXPECT_EQ(envErrorKind([&] { grandchild->assign("ghost", true); }), EnvError::Kind::VariableNotFound);
    EXPECT_EQ(grandchild->resolve("ghost"), nullptr);
}

TEST_F(EnvironmentTest, ErrorMessages) {
    try {
        global->lookup("nope");
        FAIL() << "expected EnvError";
    } catch (const EnvError& e) {
        EXPECT_EQ(e.name(), "nope");
        EXPECT_EQ(std::string(e.what()), "EnvError: Cannot resolve 'nope' since it doesn't exist");
    }
}

TEST(GlobalScopeTest, SeededConstants) {
    Evaluator evaluator(BuiltinRegistry{});
    EnvPtr g = evaluator.global_environment();

    EXPECT_TRUE(values_equal(g->lookup("true"), Value(true)));
    EXPECT_TRUE(values_equal(g->lookup("false"), Value(false)));
    EXPECT_TRUE(Evaluator::is_void(g->lookup("null")));
    EXPECT_THROW(g->assign("true", false), EnvError);
    EXPECT_FALSE(g->has("print"));
}

TEST(GlobalScopeTest, RegistryEntriesBecomeConstants) {
    BuiltinRegistry registry;
    registry.add("answer", [](const std::vector<Value>&, EnvPtr) -> Value { return std::int64_t{42}; });
    Evaluator evaluator(registry);
    EnvPtr g = evaluator.global_environment();

    Value fn = g->lookup("answer");
    ASSERT_TRUE(std::holds_alternative<FunctionPtr>(fn));
    EXPECT_TRUE(std::get<FunctionPtr>(fn)->is_native);
    EXPECT_THROW(g->assign("answer", std::int64_t{0}), EnvError);
}
