//! # Interpreter Tests
//!
//! End-to-end evaluation through a `Session`: literals, variables, operators,
//! control flow, functions, builtins and runtime errors.

#include "kite/interp/interpreter.hpp"
#include "kite/lexer/lexer.hpp"
#include "kite/parser/parser.hpp"
#include "kite/runtime/session.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace kite;
using namespace kite::interp;

class InterpreterTest : public ::testing::Test {
protected:
    std::ostringstream output_;
    runtime::Session session_{runtime::SessionOptions{.output = &output_}};

    auto eval(const std::string& code) -> ValuePtr {
        auto result = session_.run("<test>", code);
        EXPECT_TRUE(is_ok(result)) << "evaluation failed for: " << code << "\n"
                                   << (is_err(result) ? unwrap_err(result).to_string() : "");
        return is_ok(result) ? unwrap(result) : make_null();
    }

    auto repr(const std::string& code) -> std::string {
        return eval(code)->repr();
    }

    auto eval_error(const std::string& code) -> Error {
        auto result = session_.run("<test>", code);
        EXPECT_TRUE(is_err(result)) << "expected an error for: " << code;
        return is_err(result) ? unwrap_err(result) : Error::invalid_syntax("", {});
    }

    auto global(const std::string& name) -> ValuePtr {
        return session_.globals()->get(name);
    }
};

// ============================================================================
// Literals
// ============================================================================

TEST_F(InterpreterTest, IntegerLiteral) {
    auto value = eval("42");
    ASSERT_TRUE(value->is<NumberValue>());
    EXPECT_TRUE(value->as<NumberValue>().is_int());
    EXPECT_EQ(value->as<NumberValue>().as_int(), 42);
}

TEST_F(InterpreterTest, FloatLiterals) {
    for (const char* code : {"3.25", ".5", "2."}) {
        auto value = eval(code);
        ASSERT_TRUE(value->is<NumberValue>()) << code;
        EXPECT_FALSE(value->as<NumberValue>().is_int()) << code;
    }
    EXPECT_DOUBLE_EQ(eval("3.25")->as<NumberValue>().as_double(), 3.25);
    EXPECT_DOUBLE_EQ(eval(".5")->as<NumberValue>().as_double(), 0.5);
}

TEST_F(InterpreterTest, HugeIntegerLiteralBecomesFloat) {
    auto value = eval("99999999999999999999");
    ASSERT_TRUE(value->is<NumberValue>());
    EXPECT_FALSE(value->as<NumberValue>().is_int());
}

TEST_F(InterpreterTest, StringAndListLiterals) {
    EXPECT_EQ(repr("\"a\\tb\""), "\"a\tb\"");
    EXPECT_EQ(repr("[1, \"two\", [3]]"), "[1, \"two\", [3]]");
}

TEST_F(InterpreterTest, ValueIsTaggedWithSpan) {
    auto value = eval("  7");
    EXPECT_EQ(value->span.start.col, 2u);
    ASSERT_TRUE(value->context);
    EXPECT_EQ(value->context->name, "<program>");
}

// ============================================================================
// Variables
// ============================================================================

TEST_F(InterpreterTest, AssignAndRead) {
    EXPECT_EQ(repr("var x = 5"), "5");
    EXPECT_EQ(repr("x"), "5");
}

TEST_F(InterpreterTest, ReassignmentUpdatesSameBinding) {
    eval("var x = 5");
    eval("var x = x + 1");
    EXPECT_EQ(repr("x"), "6");
    EXPECT_EQ(session_.globals()->symbols().count("x"), 1u);
}

TEST_F(InterpreterTest, ReadReturnsRetaggedCopy) {
    eval("var x = 5");
    auto read = eval("   x");
    EXPECT_NE(read.get(), global("x").get());
    EXPECT_EQ(read->span.start.col, 3u);
}

TEST_F(InterpreterTest, AssignmentIsAnExpression) {
    EXPECT_EQ(repr("var a = var b = 3"), "3");
    EXPECT_EQ(repr("a + b"), "6");
}

TEST_F(InterpreterTest, UndefinedVariable) {
    auto error = eval_error("nope + 1");
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::UndefinedVariable);
    EXPECT_EQ(error.message, "\"nope\" is not defined");
    EXPECT_EQ(error.span.start.col, 0u);
    EXPECT_EQ(error.span.end.col, 4u);
}

TEST_F(InterpreterTest, BuiltinConstants) {
    EXPECT_EQ(repr("null"), "null");
    EXPECT_EQ(repr("true"), "true");
    EXPECT_EQ(repr("false"), "false");
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(InterpreterTest, ArithmeticPrecedence) {
    EXPECT_EQ(repr("1 + 2 * 3"), "7");
    EXPECT_EQ(repr("(1 + 2) * 3"), "9");
    EXPECT_EQ(repr("2 ** 3 ** 2"), "512");
    EXPECT_EQ(repr("-2 ** 2"), "-4");
    EXPECT_EQ(repr("10 / 4"), "2.5");
    EXPECT_EQ(repr("10 / 5"), "2");
}

TEST_F(InterpreterTest, UnaryOperators) {
    EXPECT_EQ(repr("-(3 - 5)"), "2");
    EXPECT_EQ(repr("+4"), "4");
    EXPECT_EQ(repr("!0"), "true");
    EXPECT_EQ(repr("![1]"), "false");
}

TEST_F(InterpreterTest, ComparisonsYieldBooleans) {
    EXPECT_EQ(repr("1 == 1"), "true");
    EXPECT_EQ(repr("1 < 2 && 3 > 4"), "false");
    EXPECT_EQ(repr("\"abc\" < \"abd\""), "true");
}

TEST_F(InterpreterTest, LogicalOperatorsReturnOperands) {
    EXPECT_EQ(repr("0 || \"fallback\""), "\"fallback\"");
    EXPECT_EQ(repr("\"\" && 5"), "\"\"");
    EXPECT_EQ(repr("1 && 2"), "2");
}

TEST_F(InterpreterTest, DivisionByZeroUsesDivisorSpan) {
    auto error = eval_error("1/0");
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::DivisionByZero);
    EXPECT_EQ(error.span.start.col, 2u);
    EXPECT_EQ(error.span.end.col, 3u);
}

TEST_F(InterpreterTest, DivisionByComputedZero) {
    auto error = eval_error("1/(2-2)");
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::DivisionByZero);
    EXPECT_EQ(error.span.start.col, 3u);
    EXPECT_EQ(error.span.end.col, 6u);
}

TEST_F(InterpreterTest, IllegalOperations) {
    EXPECT_EQ(eval_error("\"a\" - \"b\"").runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(eval_error("[1, 2] * [3]").runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(eval_error("-\"a\"").runtime_kind, RuntimeErrorKind::IllegalOperation);
}

TEST_F(InterpreterTest, FunctionGreaterEqual) {
    eval("fun f() -> 1");
    auto error = eval_error("f >= 1");
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(error.message, "Uncaught SyntaxError: Unexpected token '>='");
    EXPECT_EQ(error.span.start.col, 5u);
}

TEST_F(InterpreterTest, ListOperators) {
    eval("var xs = [10, 20, 30]");
    EXPECT_EQ(repr("xs + 40"), "[10, 20, 30, 40]");
    EXPECT_EQ(repr("xs - 0"), "[20, 30]");
    EXPECT_EQ(repr("xs / 2"), "30");
    EXPECT_EQ(repr("xs"), "[10, 20, 30]");
    EXPECT_EQ(eval_error("xs / 3").runtime_kind, RuntimeErrorKind::IndexOutOfRange);
}

TEST_F(InterpreterTest, StringOperators) {
    EXPECT_EQ(repr("\"ab\" * 2"), "\"abab\"");
    EXPECT_EQ(repr("\"n\" + 1.5"), "\"n1.5\"");
}

// ============================================================================
// Conditionals
// ============================================================================

TEST_F(InterpreterTest, IfElifElse) {
    EXPECT_EQ(repr("if 1==2 then 1 elif 2==2 then 2 else 3"), "2");
    EXPECT_EQ(repr("if 0 then 1 else 3"), "3");
}

TEST_F(InterpreterTest, IfResultIsTaggedWithWholeExpression) {
    eval("var seven = 7");
    auto value = eval(" if 1 then seven else 8");
    EXPECT_EQ(value->span.start.col, 1u);
    EXPECT_EQ(value->span.end.index, 23u);
    EXPECT_NE(value.get(), global("seven").get());

    auto other = eval("if 0 then 1 else 8");
    EXPECT_EQ(other->span.start.col, 0u);
    EXPECT_EQ(other->span.end.index, 18u);
}

TEST_F(InterpreterTest, IfWithoutMatchIsNull) {
    EXPECT_TRUE(eval("if 0 then 1")->is<NullValue>());
}

TEST_F(InterpreterTest, OnlyMatchingBranchRuns) {
    eval("var a = 0");
    eval("var b = 0");
    eval("var c = 0");
    eval("if 1==2 then var a = 1 elif 2==2 then var b = 1 else var c = 1");

    EXPECT_EQ(repr("a"), "0");
    EXPECT_EQ(repr("b"), "1");
    EXPECT_EQ(repr("c"), "0");
}

TEST_F(InterpreterTest, LaterConditionsAreNotEvaluated) {
    eval("var hits = 0");
    eval("if (var hits = hits + 1) then 1 elif (var hits = hits + 10) then 2");
    EXPECT_EQ(repr("hits"), "1");
}

// ============================================================================
// Loops
// ============================================================================

TEST_F(InterpreterTest, ForLoopCollectsBodies) {
    EXPECT_EQ(repr("for i = 0 to 3 then i"), "[0, 1, 2]");
}

TEST_F(InterpreterTest, ForLoopLeavesCounterBound) {
    eval("for i = 0 to 3 then i");
    auto i = global("i");
    ASSERT_TRUE(i);
    EXPECT_EQ(i->repr(), "3");
    EXPECT_TRUE(i->as<NumberValue>().is_int());
}

TEST_F(InterpreterTest, DescendingForLoop) {
    EXPECT_EQ(repr("for i = 3 to 0 step -1 then i"), "[3, 2, 1]");
}

TEST_F(InterpreterTest, ForLoopWithFloatStep) {
    EXPECT_EQ(repr("for i = 0 to 1 step 0.5 then i"), "[0, 0.5]");
}

TEST_F(InterpreterTest, ForLoopThatNeverRuns) {
    EXPECT_EQ(repr("for i = 5 to 0 then i"), "[]");
    EXPECT_EQ(repr("i"), "5");
}

TEST_F(InterpreterTest, ForLoopBoundsMustBeNumbers) {
    EXPECT_EQ(eval_error("for i = \"a\" to 3 then i").runtime_kind,
              RuntimeErrorKind::IllegalOperation);
}

TEST_F(InterpreterTest, WhileLoop) {
    eval("var n = 0");
    EXPECT_EQ(repr("while n < 3 then var n = n + 1"), "[1, 2, 3]");
    EXPECT_EQ(repr("n"), "3");
    EXPECT_EQ(repr("while 0 then 1"), "[]");
}

// ============================================================================
// Functions
// ============================================================================

TEST_F(InterpreterTest, NamedFunction) {
    auto function = eval("fun add(a, b) -> a + b");
    EXPECT_TRUE(function->is<FunctionValue>());
    EXPECT_EQ(function->repr(), "<function add(a, b)>");
    EXPECT_EQ(repr("add(2, 3)"), "5");
}

TEST_F(InterpreterTest, AnonymousFunction) {
    EXPECT_EQ(repr("var sq = fun (x) -> x * x"), "<function <anonymous>(x)>");
    EXPECT_EQ(repr("sq(4)"), "16");
    EXPECT_EQ(repr("(fun (x) -> x + 1)(1)"), "2");
}

TEST_F(InterpreterTest, ArityMismatch) {
    eval("fun add(a, b) -> a + b");

    auto too_few = eval_error("add(1)");
    EXPECT_EQ(too_few.runtime_kind, RuntimeErrorKind::ArityMismatch);
    EXPECT_EQ(too_few.message, "too few args passed into 'add' (expected 2, got 1)");

    auto too_many = eval_error("add(1, 2, 3)");
    EXPECT_EQ(too_many.runtime_kind, RuntimeErrorKind::ArityMismatch);
    EXPECT_EQ(too_many.message, "too many args passed into 'add' (expected 2, got 3)");
    EXPECT_EQ(too_many.span.start.col, 0u);
    EXPECT_EQ(too_many.span.end.col, 12u);
}

TEST_F(InterpreterTest, ParametersDoNotLeak) {
    eval("fun f(p) -> p");
    eval("f(1)");
    EXPECT_EQ(global("p"), nullptr);
}

TEST_F(InterpreterTest, FunctionSeesGlobalsAtCallTime) {
    eval("fun g() -> late");
    eval("var late = 9");
    EXPECT_EQ(repr("g()"), "9");
}

TEST_F(InterpreterTest, Recursion) {
    eval("fun fact(n) -> if n <= 1 then 1 else n * fact(n - 1)");
    EXPECT_EQ(repr("fact(10)"), "3628800");
}

TEST_F(InterpreterTest, ClosuresOutliveDefiningCall) {
    eval("fun adder(n) -> fun (x) -> x + n");
    eval("var add5 = adder(5)");
    EXPECT_EQ(repr("add5(2)"), "7");
}

TEST_F(InterpreterTest, CallingNonFunction) {
    auto error = eval_error("5(1)");
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(error.message, "Illegal operation: Number is not a function");
}

TEST_F(InterpreterTest, ArgumentsEvaluateLeftToRight) {
    eval("var log = []");
    eval("fun pair(a, b) -> [a, b]");
    eval("pair(var log = log + 1, var log = log + 2)");
    EXPECT_EQ(repr("log"), "[1, 2]");
}

// ============================================================================
// Builtins
// ============================================================================

TEST_F(InterpreterTest, PrintWritesDisplayForm) {
    EXPECT_TRUE(eval("print(\"hello\")")->is<NullValue>());
    eval("print([1, \"x\"])");
    eval("print(2.5)");
    EXPECT_EQ(output_.str(), "hello\n[1, \"x\"]\n2.5\n");
}

TEST_F(InterpreterTest, StrAndLen) {
    EXPECT_EQ(repr("str(12)"), "\"12\"");
    EXPECT_EQ(repr("len(\"abc\")"), "3");
    EXPECT_EQ(repr("len([1, 2])"), "2");
    EXPECT_EQ(eval_error("len(1)").runtime_kind, RuntimeErrorKind::InvalidArgument);
}

TEST_F(InterpreterTest, TypePredicates) {
    eval("fun f() -> 1");
    EXPECT_EQ(repr("[isNumber(1), isNumber(\"1\"), isNumber([])]"), "[true, false, false]");
    EXPECT_EQ(repr("[isString(\"s\"), isString(1)]"), "[true, false]");
    EXPECT_EQ(repr("[isList([]), isList(\"[]\")]"), "[true, false]");
    EXPECT_EQ(repr("[isFunction(f), isFunction(print), isFunction(1)]"),
              "[true, true, false]");
}

TEST_F(InterpreterTest, AppendReturnsNewList) {
    eval("var xs = [1, 2]");
    EXPECT_EQ(repr("var ys = append(xs, 3)"), "[1, 2, 3]");
    EXPECT_EQ(repr("xs"), "[1, 2]");
    EXPECT_EQ(repr("len(ys)"), "3");
}

TEST_F(InterpreterTest, ExtendReturnsNewList) {
    eval("var xs = [1]");
    EXPECT_EQ(repr("extend(xs, [2, 3])"), "[1, 2, 3]");
    EXPECT_EQ(repr("xs"), "[1]");
    EXPECT_EQ(eval_error("extend(xs, 2)").runtime_kind, RuntimeErrorKind::InvalidArgument);
}

TEST_F(InterpreterTest, BuiltinArityIsChecked) {
    auto error = eval_error("print(1, 2)");
    EXPECT_EQ(error.runtime_kind, RuntimeErrorKind::ArityMismatch);
    EXPECT_EQ(error.message, "too many args passed into 'print' (expected 1, got 2)");
}

TEST_F(InterpreterTest, BuiltinErrorTraceback) {
    auto error = eval_error("append(1, 2)");
    ASSERT_EQ(error.traceback.size(), 2u);
    EXPECT_EQ(error.traceback[0].context_name, "append");
    EXPECT_EQ(error.traceback[1].context_name, "<program>");
}

// ============================================================================
// Tracebacks
// ============================================================================

TEST_F(InterpreterTest, TracebackFollowsCallChain) {
    eval("fun inner() -> 1 / 0");
    eval("fun outer() -> inner()");

    auto error = eval_error("outer()");
    ASSERT_EQ(error.traceback.size(), 3u);
    EXPECT_EQ(error.traceback[0].context_name, "inner");
    EXPECT_EQ(error.traceback[1].context_name, "outer");
    EXPECT_EQ(error.traceback[2].context_name, "<program>");
    EXPECT_EQ(error.traceback[1].position.col, 15u);
}

TEST_F(InterpreterTest, CallDepthReturnsToZero) {
    auto tokens = lexer::tokenize("<test>", "(fun (x) -> x)(1)");
    ASSERT_TRUE(is_ok(tokens));
    auto ast = parser::parse(std::move(unwrap(tokens)));
    ASSERT_TRUE(is_ok(ast));

    Interpreter interpreter;
    Frame frame{.env = make_rc<Environment>(), .context = make_program_context()};
    auto result = interpreter.evaluate(*unwrap(ast), frame);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result)->repr(), "1");
    EXPECT_EQ(interpreter.call_depth(), 0u);
}

TEST(InterpreterScopeTest, ReleasedDefiningScopeCannotBeCalled) {
    Interpreter interpreter;
    auto function = make_function("stale", {}, nullptr, make_rc<Environment>());
    Frame frame{.env = make_rc<Environment>(), .context = make_program_context()};

    auto result = interpreter.call(*function, {}, SourceSpan{}, frame);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).runtime_kind, RuntimeErrorKind::IllegalOperation);
    EXPECT_EQ(unwrap_err(result).message,
              "'stale' can no longer be called: its defining scope was released");
    EXPECT_EQ(interpreter.arena().size(), 0u);
}
