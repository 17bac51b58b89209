//! # Value Tests
//!
//! Truthiness, display, copying and the operator table.

#include "kite/interp/value.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <string>

using namespace kite;
using namespace kite::interp;
using parser::BinaryOp;
using parser::UnaryOp;

class ValueOpsTest : public ::testing::Test {
protected:
    ContextPtr context_ = make_program_context();

    auto apply(BinaryOp op, const ValuePtr& left, const ValuePtr& right) -> ValuePtr {
        auto result = binary_op(op, *left, *right, context_);
        EXPECT_TRUE(is_ok(result)) << unwrap_err(result).message;
        return is_ok(result) ? unwrap(result) : make_null();
    }

    auto apply_error(BinaryOp op, const ValuePtr& left, const ValuePtr& right) -> Error {
        auto result = binary_op(op, *left, *right, context_);
        EXPECT_TRUE(is_err(result));
        return is_err(result) ? unwrap_err(result) : Error::invalid_syntax("", {});
    }
};

// ============================================================================
// Truthiness and Display
// ============================================================================

TEST(ValueTest, Truthiness) {
    EXPECT_FALSE(make_null()->is_true());
    EXPECT_FALSE(make_int(0)->is_true());
    EXPECT_FALSE(make_float(0.0)->is_true());
    EXPECT_FALSE(make_bool(false)->is_true());
    EXPECT_FALSE(make_string("")->is_true());

    EXPECT_TRUE(make_int(-1)->is_true());
    EXPECT_TRUE(make_float(0.5)->is_true());
    EXPECT_TRUE(make_string("0")->is_true());
    EXPECT_TRUE(make_list({})->is_true());
}

TEST(ValueTest, TypeNames) {
    EXPECT_EQ(make_null()->type_name(), "Null");
    EXPECT_EQ(make_int(1)->type_name(), "Number");
    EXPECT_EQ(make_bool(true)->type_name(), "Boolean");
    EXPECT_EQ(make_string("")->type_name(), "String");
    EXPECT_EQ(make_list({})->type_name(), "List");
}

TEST(ValueTest, NumberDisplay) {
    EXPECT_EQ(make_int(42)->repr(), "42");
    EXPECT_EQ(make_int(-7)->repr(), "-7");
    EXPECT_EQ(make_float(2.5)->repr(), "2.5");
    EXPECT_EQ(make_float(0.1)->repr(), "0.1");
    EXPECT_EQ(make_float(2.0)->repr(), "2");
}

TEST(ValueTest, StringReprIsQuoted) {
    auto value = make_string("hi");
    EXPECT_EQ(value->repr(), "\"hi\"");
    EXPECT_EQ(value->to_display(), "hi");
}

TEST(ValueTest, ListDisplayUsesElementRepr) {
    auto list = make_list({make_int(1), make_string("a"), make_list({})});
    EXPECT_EQ(list->repr(), "[1, \"a\", []]");
    EXPECT_EQ(list->to_display(), "[1, \"a\", []]");
}

TEST(ValueTest, FunctionDisplay) {
    auto function = make_function("add", {"a", "b"}, nullptr, nullptr);
    EXPECT_EQ(function->repr(), "<function add(a, b)>");
    EXPECT_EQ(function->type_name(), "Function");

    auto builtin = make_builtin("print", {"value"}, nullptr);
    EXPECT_EQ(builtin->repr(), "<built-in function print>");
    EXPECT_TRUE(builtin->is_callable());
}

TEST(ValueTest, NullAndBooleanDisplay) {
    EXPECT_EQ(make_null()->repr(), "null");
    EXPECT_EQ(make_bool(true)->repr(), "true");
    EXPECT_EQ(make_bool(false)->repr(), "false");
}

TEST(ValueTest, CopyIsShallowForLists) {
    auto inner = make_list({make_int(1)});
    auto outer = make_list({inner});
    auto copy = outer->copy();

    EXPECT_NE(copy.get(), outer.get());
    EXPECT_EQ(copy->as<ListValue>().elements[0].get(), inner.get());
}

TEST(ValueTest, RetaggedKeepsOriginalUntouched) {
    auto source = make_rc<const lexer::Source>("<test>", "abc");
    lexer::Position pos{.index = 1, .row = 0, .col = 1, .source = source};

    auto value = make_int(3);
    auto tagged = value->retagged(SourceSpan{pos, pos}, nullptr);
    EXPECT_EQ(tagged->span.start.col, 1u);
    EXPECT_EQ(value->span.start.col, 0u);
}

// ============================================================================
// Numbers
// ============================================================================

TEST_F(ValueOpsTest, IntegerArithmetic) {
    EXPECT_EQ(apply(BinaryOp::Add, make_int(2), make_int(3))->repr(), "5");
    EXPECT_EQ(apply(BinaryOp::Sub, make_int(2), make_int(3))->repr(), "-1");
    EXPECT_EQ(apply(BinaryOp::Mul, make_int(4), make_int(3))->repr(), "12");
    EXPECT_EQ(apply(BinaryOp::Pow, make_int(2), make_int(10))->repr(), "1024");
}

TEST_F(ValueOpsTest, DivisionKeepsIntegersWhenExact) {
    auto exact = apply(BinaryOp::Div, make_int(6), make_int(3));
    EXPECT_TRUE(exact->as<NumberValue>().is_int());
    EXPECT_EQ(exact->repr(), "2");

    EXPECT_EQ(apply(BinaryOp::Div, make_int(7), make_int(2))->repr(), "3.5");
}

TEST_F(ValueOpsTest, MixedArithmeticIsFloat) {
    auto sum = apply(BinaryOp::Add, make_int(1), make_float(0.5));
    EXPECT_FALSE(sum->as<NumberValue>().is_int());
    EXPECT_EQ(sum->repr(), "1.5");
}

TEST_F(ValueOpsTest, NegativeExponentIsFloat) {
    EXPECT_EQ(apply(BinaryOp::Pow, make_int(2), make_int(-1))->repr(), "0.5");
}

TEST_F(ValueOpsTest, OverflowPromotesToFloat) {
    auto big = make_int(std::numeric_limits<int64_t>::max());
    auto small = make_int(std::numeric_limits<int64_t>::min());

    EXPECT_FALSE(apply(BinaryOp::Add, big, make_int(1))->as<NumberValue>().is_int());
    EXPECT_FALSE(apply(BinaryOp::Sub, small, make_int(1))->as<NumberValue>().is_int());
    EXPECT_FALSE(apply(BinaryOp::Mul, big, make_int(-2))->as<NumberValue>().is_int());
    EXPECT_FALSE(apply(BinaryOp::Mul, small, make_int(-1))->as<NumberValue>().is_int());
    EXPECT_FALSE(apply(BinaryOp::Pow, make_int(3), make_int(40))->as<NumberValue>().is_int());

    EXPECT_EQ(apply(BinaryOp::Mul, small, make_int(1))->as<NumberValue>().as_int(),
              std::numeric_limits<int64_t>::min());
    EXPECT_EQ(apply(BinaryOp::Pow, make_int(-2), make_int(63))->as<NumberValue>().as_int(),
              std::numeric_limits<int64_t>::min());
}

TEST_F(ValueOpsTest, DivisionByZero) {
    auto error = apply_error(BinaryOp::Div, make_int(1), make_int(0));
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::DivisionByZero);
    EXPECT_EQ(error.message, "Division by zero");

    auto float_error = apply_error(BinaryOp::Div, make_float(1.5), make_float(0.0));
    EXPECT_EQ(float_error.runtime_kind, RuntimeErrorKind::DivisionByZero);
}

TEST_F(ValueOpsTest, NumberComparisons) {
    EXPECT_EQ(apply(BinaryOp::Eq, make_int(1), make_float(1.0))->repr(), "true");
    EXPECT_EQ(apply(BinaryOp::Lt, make_int(1), make_int(2))->repr(), "true");
    EXPECT_EQ(apply(BinaryOp::Ge, make_int(1), make_int(2))->repr(), "false");
    EXPECT_TRUE(apply(BinaryOp::Ne, make_int(1), make_int(2))->is<BooleanValue>());
}

TEST_F(ValueOpsTest, NumberWithStringIsIllegal) {
    auto error = apply_error(BinaryOp::Add, make_int(1), make_string("a"));
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(error.message, "Illegal operation: Number + String");
}

// ============================================================================
// Strings
// ============================================================================

TEST_F(ValueOpsTest, StringConcatenation) {
    EXPECT_EQ(apply(BinaryOp::Add, make_string("ab"), make_string("cd"))->repr(), "\"abcd\"");
    EXPECT_EQ(apply(BinaryOp::Add, make_string("n="), make_int(5))->repr(), "\"n=5\"");
    EXPECT_EQ(apply(BinaryOp::Add, make_string("x"), make_float(1.5))->repr(), "\"x1.5\"");
}

TEST_F(ValueOpsTest, StringRepeat) {
    EXPECT_EQ(apply(BinaryOp::Mul, make_string("ab"), make_int(3))->repr(), "\"ababab\"");
    EXPECT_EQ(apply(BinaryOp::Mul, make_string("ab"), make_int(0))->repr(), "\"\"");

    auto error = apply_error(BinaryOp::Mul, make_string("ab"), make_int(-1));
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::IllegalOperation);
}

TEST_F(ValueOpsTest, StringRepeatBeyondMaximumLength) {
    auto text = make_string("ab");
    auto count = make_int(100000000000000);
    text->span.start.col = 0;
    count->span.end.col = 21;

    auto error = apply_error(BinaryOp::Mul, text, count);
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(error.message, "String result exceeds the maximum length of 268435456 bytes");
    EXPECT_EQ(error.span.start.col, 0u);
    EXPECT_EQ(error.span.end.col, 21u);

    auto max_count = make_int(std::numeric_limits<int64_t>::max());
    EXPECT_EQ(apply_error(BinaryOp::Mul, text, max_count).runtime_kind,
              RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(apply_error(BinaryOp::Mul, make_string("abcd"),
                          make_int(static_cast<int64_t>(MAX_STRING_LENGTH / 2)))
                  .runtime_kind,
              RuntimeErrorKind::IllegalOperation);
}

TEST_F(ValueOpsTest, EmptyStringRepeatsInstantly) {
    auto result = apply(BinaryOp::Mul, make_string(""), make_int(1000000000000000000));
    EXPECT_EQ(result->repr(), "\"\"");
}

TEST_F(ValueOpsTest, StringComparison) {
    EXPECT_EQ(apply(BinaryOp::Eq, make_string("a"), make_string("a"))->repr(), "true");
    EXPECT_EQ(apply(BinaryOp::Lt, make_string("abc"), make_string("abd"))->repr(), "true");
    EXPECT_EQ(apply(BinaryOp::Eq, make_string("5"), make_int(5))->repr(), "true");
}

TEST_F(ValueOpsTest, StringSubtractionIsIllegal) {
    auto error = apply_error(BinaryOp::Sub, make_string("a"), make_string("b"));
    EXPECT_EQ(error.message, "Illegal operation: String - String");
}

// ============================================================================
// Lists
// ============================================================================

TEST_F(ValueOpsTest, ListAppendReturnsNewList) {
    auto list = make_list({make_int(1)});
    auto result = apply(BinaryOp::Add, list, make_int(2));

    EXPECT_EQ(result->repr(), "[1, 2]");
    EXPECT_EQ(list->repr(), "[1]");
}

TEST_F(ValueOpsTest, ListRemoveAtIndex) {
    auto list = make_list({make_int(1), make_int(2), make_int(3)});
    EXPECT_EQ(apply(BinaryOp::Sub, list, make_int(1))->repr(), "[1, 3]");
    EXPECT_EQ(list->repr(), "[1, 2, 3]");
}

TEST_F(ValueOpsTest, ListElementAtIndex) {
    auto list = make_list({make_string("a"), make_string("b")});
    EXPECT_EQ(apply(BinaryOp::Div, list, make_int(1))->repr(), "\"b\"");
}

TEST_F(ValueOpsTest, ListIndexOutOfRange) {
    auto list = make_list({make_int(1)});
    EXPECT_EQ(apply_error(BinaryOp::Div, list, make_int(1)).runtime_kind,
              RuntimeErrorKind::IndexOutOfRange);
    EXPECT_EQ(apply_error(BinaryOp::Sub, list, make_int(-1)).runtime_kind,
              RuntimeErrorKind::IndexOutOfRange);
}

TEST_F(ValueOpsTest, ListFractionalIndexIsIllegal) {
    auto list = make_list({make_int(1)});
    EXPECT_EQ(apply_error(BinaryOp::Div, list, make_float(0.5)).runtime_kind,
              RuntimeErrorKind::IllegalOperation);
}

TEST_F(ValueOpsTest, ListMultiplyIsIllegal) {
    auto error = apply_error(BinaryOp::Mul, make_list({make_int(1)}), make_list({}));
    EXPECT_EQ(error.message, "Illegal operation: List * List");
}

TEST_F(ValueOpsTest, ListGreaterEqualIsAlwaysTrue) {
    EXPECT_EQ(apply(BinaryOp::Ge, make_list({}), make_int(5))->repr(), "true");
}

// ============================================================================
// Functions, Booleans and Null
// ============================================================================

TEST_F(ValueOpsTest, FunctionGreaterEqualIsSyntaxError) {
    auto function = make_function("f", {}, nullptr, nullptr);
    auto error = apply_error(BinaryOp::Ge, function, make_int(1));
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(error.message, "Uncaught SyntaxError: Unexpected token '>='");
}

TEST_F(ValueOpsTest, FunctionArithmeticIsIllegal) {
    auto function = make_function("f", {}, nullptr, nullptr);
    EXPECT_EQ(apply_error(BinaryOp::Add, function, make_int(1)).message,
              "Illegal operation: Function + Number");
}

TEST_F(ValueOpsTest, BooleanEquality) {
    EXPECT_EQ(apply(BinaryOp::Eq, make_bool(true), make_bool(true))->repr(), "true");
    EXPECT_EQ(apply(BinaryOp::Ne, make_bool(true), make_bool(false))->repr(), "true");
    EXPECT_EQ(apply_error(BinaryOp::Lt, make_bool(true), make_bool(false)).runtime_kind,
              RuntimeErrorKind::IllegalOperation);
}

TEST_F(ValueOpsTest, NullEquality) {
    EXPECT_EQ(apply(BinaryOp::Eq, make_null(), make_null())->repr(), "true");
    EXPECT_EQ(apply(BinaryOp::Eq, make_int(0), make_null())->repr(), "false");
    EXPECT_EQ(apply(BinaryOp::Ne, make_null(), make_string(""))->repr(), "true");
}

TEST_F(ValueOpsTest, LogicalOperatorsReturnDecidingOperand) {
    EXPECT_EQ(apply(BinaryOp::And, make_int(0), make_int(5))->repr(), "0");
    EXPECT_EQ(apply(BinaryOp::And, make_int(1), make_string("x"))->repr(), "\"x\"");
    EXPECT_EQ(apply(BinaryOp::Or, make_int(0), make_int(5))->repr(), "5");
    EXPECT_EQ(apply(BinaryOp::Or, make_string("a"), make_int(5))->repr(), "\"a\"");
}

// ============================================================================
// Unary
// ============================================================================

TEST_F(ValueOpsTest, UnaryOperators) {
    auto neg = unary_op(UnaryOp::Neg, *make_int(3), context_);
    ASSERT_TRUE(is_ok(neg));
    EXPECT_EQ(unwrap(neg)->repr(), "-3");

    auto pos = unary_op(UnaryOp::Pos, *make_string("s"), context_);
    ASSERT_TRUE(is_ok(pos));
    EXPECT_EQ(unwrap(pos)->repr(), "\"s\"");

    auto not_zero = unary_op(UnaryOp::Not, *make_int(0), context_);
    ASSERT_TRUE(is_ok(not_zero));
    EXPECT_EQ(unwrap(not_zero)->repr(), "true");
}

TEST_F(ValueOpsTest, NegatingStringIsIllegal) {
    auto result = unary_op(UnaryOp::Neg, *make_string("s"), context_);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Illegal operation: -String");
}
