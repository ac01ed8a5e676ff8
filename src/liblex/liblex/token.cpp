#include <libutl/common/utilities.hpp>
#include <liblex/token.hpp>

auto lexis::token_kind_name(Token_kind const kind) -> std::string_view
{
    switch (kind) {
    case Token_kind::identifier:
        return "identifier";
    case Token_kind::integer:
        return "integer";
    case Token_kind::decimal:
        return "decimal";
    case Token_kind::character:
        return "character";
    case Token_kind::string:
        return "string";
    case Token_kind::operator_:
        return "operator";
    default:
        utl::unreachable();
    }
}

DEFINE_FORMATTER_FOR(lexis::Token_kind)
{
    return fmt::format_to(context.out(), "{}", lexis::token_kind_name(value));
}

DEFINE_FORMATTER_FOR(lexis::Token)
{
    return fmt::format_to(context.out(), "{}({})@{}", value.kind, value.lexeme, value.offset);
}
