#include <libutl/common/utilities.hpp>
#include <libutl/color/color.hpp>
#include <liblex/extract.hpp>
#include <catch2/catch_test_macros.hpp>
#include "test_liblex.hpp"

#define TEST(name) TEST_CASE(name, "[liblex][examples]") // NOLINT

using lexis::Token;
using lexis::Token_kind;

TEST("variable declaration")
{
    REQUIRE(
        lexis::lex("LET x = 5;")
        == std::vector<Token> {
            { Token_kind::identifier, "LET", 0 },
            { Token_kind::identifier, "x", 4 },
            { Token_kind::operator_, "=", 6 },
            { Token_kind::integer, "5", 8 },
            { Token_kind::operator_, ";", 9 },
        });
}

TEST("adjacent comparison operators")
{
    REQUIRE(
        lexis::lex("!====")
        == std::vector<Token> {
            { Token_kind::operator_, "!=", 0 },
            { Token_kind::operator_, "==", 2 },
            { Token_kind::operator_, "=", 4 },
        });
}

TEST("escapes are kept verbatim")
{
    REQUIRE(lexis::lex("'\\n'") == std::vector<Token> { { Token_kind::character, "'\\n'", 0 } });
    REQUIRE(liblex::test_failure_offset("'\\a'") == 2);
}

TEST("end of input inside a string")
{
    REQUIRE(liblex::test_failure_offset("\"unterminated") == 13);
}

TEST("repeated decimal points")
{
    REQUIRE(
        lexis::lex("1.2.3")
        == std::vector<Token> {
            { Token_kind::decimal, "1.2", 0 },
            { Token_kind::operator_, ".", 3 },
            { Token_kind::integer, "3", 4 },
        });
}

TEST("a leading zero ends the number")
{
    lexis::Cursor cursor { "007" };
    REQUIRE(liblex::extract_number(cursor) == Token { Token_kind::integer, "0", 0 });
    REQUIRE(cursor.has());

    REQUIRE(
        lexis::lex("0123")
        == std::vector<Token> {
            { Token_kind::integer, "0", 0 },
            { Token_kind::integer, "123", 1 },
        });
}

TEST("function call")
{
    REQUIRE(
        lexis::lex("print(\"Hello, World!\");")
        == std::vector<Token> {
            { Token_kind::identifier, "print", 0 },
            { Token_kind::operator_, "(", 5 },
            { Token_kind::string, "\"Hello, World!\"", 6 },
            { Token_kind::operator_, ")", 21 },
            { Token_kind::operator_, ";", 22 },
        });
}

TEST("quotes inside literals")
{
    REQUIRE(
        lexis::lex("'\"'string\"'\"")
        == std::vector<Token> {
            { Token_kind::character, "'\"'", 0 },
            { Token_kind::identifier, "string", 3 },
            { Token_kind::string, "\"'\"", 9 },
        });
}

TEST("multi-line program")
{
    REQUIRE(
        lexis::lex("LET x = -123.456;\nprint(\"Hello,\\nWorld!\");")
        == std::vector<Token> {
            { Token_kind::identifier, "LET", 0 },
            { Token_kind::identifier, "x", 4 },
            { Token_kind::operator_, "=", 6 },
            { Token_kind::decimal, "-123.456", 8 },
            { Token_kind::operator_, ";", 16 },
            { Token_kind::identifier, "print", 18 },
            { Token_kind::operator_, "(", 23 },
            { Token_kind::string, "\"Hello,\\nWorld!\"", 24 },
            { Token_kind::operator_, ")", 40 },
            { Token_kind::operator_, ";", 41 },
        });
}

TEST("signed numbers after an operator")
{
    REQUIRE(
        lexis::lex("!=-0.12+02")
        == std::vector<Token> {
            { Token_kind::operator_, "!=", 0 },
            { Token_kind::decimal, "-0.12", 2 },
            { Token_kind::integer, "+0", 7 },
            { Token_kind::integer, "2", 9 },
        });
}

TEST("failures are rendered as diagnostics")
{
    auto const result = liblex::test_lex("LET s = \"oops");
    REQUIRE(result.formatted_tokens == "lexical error");
    REQUIRE(
        result.diagnostic_messages
        == "Error: Unterminated string literal\n\n"
           "  --> 1:14\n"
           "  |\n"
           "1 | LET s = \"oops\n"
           "  |              ^ input ends here\n\n"
           "Help: string literals can not span multiple lines, use '\\n' instead");
}

TEST("rendering a failure leaves the color setting alone")
{
    utl::enable_color_formatting();
    auto const result        = liblex::test_lex("'");
    bool const still_enabled = utl::is_color_formatting_enabled();
    utl::disable_color_formatting();

    REQUIRE(result.formatted_tokens == "lexical error");
    REQUIRE(still_enabled);
}

TEST("diagnostics point at characters, not bytes")
{
    auto const result = liblex::test_lex("\xC3\xA9 = '");
    REQUIRE(
        result.diagnostic_messages
        == "Error: Unterminated character literal\n\n"
           "  --> 1:6\n"
           "  |\n"
           "1 | \xC3\xA9 = '\n"
           "  |      ^ input ends here");
}
