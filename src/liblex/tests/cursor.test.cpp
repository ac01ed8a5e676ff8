#include <libutl/common/utilities.hpp>
#include <liblex/cursor.hpp>
#include <catch2/catch_test_macros.hpp>
#include "test_liblex.hpp"

#define TEST(name) TEST_CASE(name, "[liblex][cursor]") // NOLINT

TEST("character classes")
{
    STATIC_REQUIRE(lexis::is_whitespace(' '));
    STATIC_REQUIRE(lexis::is_whitespace('\r'));
    STATIC_REQUIRE_FALSE(lexis::is_whitespace('\v'));
    STATIC_REQUIRE(lexis::is_sign('-'));
    STATIC_REQUIRE_FALSE(lexis::is_sign('*'));
    STATIC_REQUIRE(lexis::is_digit('0'));
    STATIC_REQUIRE_FALSE(lexis::is_nonzero_digit('0'));
    STATIC_REQUIRE(lexis::is_letter('Q'));
    STATIC_REQUIRE_FALSE(lexis::is_letter('_'));
    STATIC_REQUIRE(lexis::is_identifier_head('_'));
    STATIC_REQUIRE_FALSE(lexis::is_identifier_head('7'));
    STATIC_REQUIRE(lexis::is_identifier_tail('7'));
    STATIC_REQUIRE(lexis::is_none_of<"abc">('d'));
    STATIC_REQUIRE_FALSE(lexis::is_none_of<"abc">('b'));
}

TEST("has")
{
    lexis::Cursor const cursor { "ab" };
    REQUIRE(cursor.has());
    REQUIRE(cursor.has(1));
    REQUIRE_FALSE(cursor.has(2));

    lexis::Cursor const empty { "" };
    REQUIRE_FALSE(empty.has());
}

TEST("advance and peek_char")
{
    lexis::Cursor cursor { "xyz" };
    REQUIRE(cursor.peek_char() == 'x');
    REQUIRE(cursor.peek_char(2) == 'z');
    cursor.advance();
    REQUIRE(cursor.index() == 1);
    REQUIRE(cursor.peek_char() == 'y');
    REQUIRE(cursor.mark() == 0);
}

TEST("peek does not consume")
{
    lexis::Cursor cursor { "-5" };
    REQUIRE(cursor.peek(lexis::is_sign, lexis::is_digit));
    REQUIRE(cursor.peek('-'));
    REQUIRE_FALSE(cursor.peek('-', '-'));
    REQUIRE_FALSE(cursor.peek('-', '5', '5'));
    REQUIRE(cursor.index() == 0);
}

TEST("match consumes only on success")
{
    lexis::Cursor cursor { "&&|" };
    REQUIRE_FALSE(cursor.match('&', '|'));
    REQUIRE(cursor.index() == 0);
    REQUIRE(cursor.match('&', '&'));
    REQUIRE(cursor.index() == 2);
    REQUIRE_FALSE(cursor.match('|', '|'));
    REQUIRE(cursor.match('|'));
    REQUIRE_FALSE(cursor.has());
}

TEST("emit produces the lexeme since the mark")
{
    lexis::Cursor cursor { "ab cd" };
    cursor.advance();
    cursor.advance();
    REQUIRE(cursor.emit(lexis::Token_kind::identifier) == lexis::Token { lexis::Token_kind::identifier, "ab", 0 });
    REQUIRE(cursor.mark() == 2);

    cursor.advance();
    cursor.reset_mark();
    REQUIRE(cursor.mark() == 3);

    cursor.advance();
    cursor.advance();
    REQUIRE(cursor.emit(lexis::Token_kind::identifier) == lexis::Token { lexis::Token_kind::identifier, "cd", 3 });
    REQUIRE(cursor.mark() == cursor.index());
}

TEST("the cursor steps over whole UTF-8 sequences")
{
    lexis::Cursor cursor { "\xC3\xA9\xE2\x82\xAC-" };
    REQUIRE(cursor.has(2));
    REQUIRE_FALSE(cursor.has(3));
    REQUIRE(cursor.peek_char() == '\xC3');
    REQUIRE(cursor.peek_char(1) == '\xE2');
    REQUIRE(cursor.peek_char(2) == '-');
    REQUIRE_FALSE(cursor.peek(lexis::is_letter));

    cursor.advance();
    REQUIRE(cursor.index() == 1);
    REQUIRE(cursor.emit(lexis::Token_kind::operator_) == lexis::Token { lexis::Token_kind::operator_, "\xC3\xA9", 0 });

    cursor.advance();
    REQUIRE(cursor.emit(lexis::Token_kind::operator_) == lexis::Token { lexis::Token_kind::operator_, "\xE2\x82\xAC", 1 });
    REQUIRE(cursor.match('-'));
    REQUIRE(cursor.index() == 3);
    REQUIRE_FALSE(cursor.has());
}

TEST("the cursor owns a copy of its input")
{
    std::string input = "abc";
    lexis::Cursor const cursor { input };
    input.front() = 'x';
    REQUIRE(cursor.input() == "abc");
}

TEST("token formatting")
{
    REQUIRE(fmt::format("{}", lexis::Token { lexis::Token_kind::integer, "-5", 3 }) == "integer(-5)@3");
    REQUIRE(fmt::format("{}", lexis::Token_kind::operator_) == "operator");
    REQUIRE(lexis::token_kind_name(lexis::Token_kind::decimal) == "decimal");
}
