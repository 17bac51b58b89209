//! # Diagnostic Format Tests
//!
//! Exact rendering of lexer, parser and runtime errors.

#include "kite/error.hpp"
#include "kite/runtime/session.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace kite;

class ErrorFormatTest : public ::testing::Test {
protected:
    std::ostringstream output_;
    runtime::Session session_{runtime::SessionOptions{.output = &output_}};

    auto error_text(const std::string& code) -> std::string {
        auto result = session_.run("<stdin>", code);
        EXPECT_TRUE(is_err(result)) << "expected an error for: " << code;
        if (is_ok(result)) {
            return "";
        }
        return unwrap_err(result).to_string();
    }
};

TEST_F(ErrorFormatTest, IllegalCharacter) {
    EXPECT_EQ(error_text("1 + @"), "Illegal Character: '@'\n"
                                   "\tFile: '<stdin>' row(0), col(4)\n"
                                   "\n"
                                   "1 + @\n"
                                   "    ^\n");
}

TEST_F(ErrorFormatTest, InvalidSyntax) {
    EXPECT_EQ(error_text("if 1 == 1 2"), "Invalid Syntax: 'Expected 'then''\n"
                                         "\tFile: '<stdin>' row(0), col(10)\n"
                                         "\n"
                                         "if 1 == 1 2\n"
                                         "          ^\n");
}

TEST_F(ErrorFormatTest, RuntimeErrorAtTopLevel) {
    EXPECT_EQ(error_text("10 / 0"), "Traceback (most recent call last):\n"
                                    "\tFile: '<stdin>' row(0), col(5), in <program>\n"
                                    "Runtime Error: 'Division by zero'\n"
                                    "10 / 0\n"
                                    "     ^\n");
}

TEST_F(ErrorFormatTest, UnderlineCoversWholeSpan) {
    EXPECT_EQ(error_text("\"a\" - \"b\""), "Traceback (most recent call last):\n"
                                           "\tFile: '<stdin>' row(0), col(0), in <program>\n"
                                           "Runtime Error: 'Illegal operation: String - String'\n"
                                           "\"a\" - \"b\"\n"
                                           "^^^^^^^^^\n");
}

TEST_F(ErrorFormatTest, TracebackListsInnermostFrameFirst) {
    ASSERT_TRUE(is_ok(session_.run("<stdin>", "fun inner(x) -> x / 0")));
    ASSERT_TRUE(is_ok(session_.run("<stdin>", "fun outer(y) -> inner(y)")));

    EXPECT_EQ(error_text("outer(1)"), "Traceback (most recent call last):\n"
                                      "\tFile: '<stdin>' row(0), col(20), in inner\n"
                                      "\tFile: '<stdin>' row(0), col(16), in outer\n"
                                      "\tFile: '<stdin>' row(0), col(0), in <program>\n"
                                      "Runtime Error: 'Division by zero'\n"
                                      "fun inner(x) -> x / 0\n"
                                      "                    ^\n");
}

TEST(ErrorTest, ArrowsOnLaterRow) {
    auto source = make_rc<const lexer::Source>("<test>", "first\nsecond line");
    lexer::Position start{.index = 13, .row = 1, .col = 7, .source = source};
    lexer::Position end{.index = 17, .row = 1, .col = 11, .source = source};

    EXPECT_EQ(string_with_arrows(SourceSpan{start, end}), "second line\n"
                                                         "       ^^^^");
}

TEST(ErrorTest, MultiRowSpanUnderlinesToEndOfFirstRow) {
    auto source = make_rc<const lexer::Source>("<test>", "abc def\nghi");
    lexer::Position start{.index = 4, .row = 0, .col = 4, .source = source};
    lexer::Position end{.index = 10, .row = 1, .col = 2, .source = source};

    EXPECT_EQ(string_with_arrows(SourceSpan{start, end}), "abc def\n"
                                                         "    ^^^");
}

TEST(ErrorTest, EmptySpanGetsOneCaret) {
    auto source = make_rc<const lexer::Source>("<test>", "xyz");
    lexer::Position pos{.index = 1, .row = 0, .col = 1, .source = source};

    EXPECT_EQ(string_with_arrows(SourceSpan{pos, pos}), "xyz\n"
                                                       " ^");
}

TEST(ErrorTest, KindNames) {
    EXPECT_EQ(error_kind_name(ErrorKind::IllegalCharacter), "Illegal Character");
    EXPECT_EQ(error_kind_name(ErrorKind::InvalidSyntax), "Invalid Syntax");
    EXPECT_EQ(error_kind_name(ErrorKind::Runtime), "Runtime Error");
    EXPECT_EQ(runtime_error_kind_name(RuntimeErrorKind::ArityMismatch), "ArityMismatch");
}
