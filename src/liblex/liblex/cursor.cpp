#include <libutl/common/utilities.hpp>
#include <liblex/cursor.hpp>

lexis::Cursor::Cursor(std::string input) noexcept : m_input { std::move(input) } {}

auto lexis::Cursor::byte_index(std::size_t const offset) const noexcept -> std::size_t
{
    return utl::utf8_advance(m_input, m_index, offset);
}

auto lexis::Cursor::has(std::size_t const offset) const noexcept -> bool
{
    return byte_index(offset) < m_input.size();
}

auto lexis::Cursor::peek_char(std::size_t const offset) const noexcept -> char
{
    utl::always_assert(has(offset));
    return m_input[byte_index(offset)];
}

auto lexis::Cursor::advance() noexcept -> void
{
    utl::always_assert(has());
    m_index = byte_index(1);
    ++m_index_position;
}

auto lexis::Cursor::reset_mark() noexcept -> void
{
    m_mark          = m_index;
    m_mark_position = m_index_position;
}

auto lexis::Cursor::emit(Token_kind const kind) -> Token
{
    utl::always_assert(m_mark < m_index);
    Token token {
        .kind   = kind,
        .lexeme = m_input.substr(m_mark, m_index - m_mark),
        .offset = m_mark_position,
    };
    reset_mark();
    return token;
}

auto lexis::Cursor::index() const noexcept -> std::size_t
{
    return m_index_position;
}

auto lexis::Cursor::mark() const noexcept -> std::size_t
{
    return m_mark_position;
}

auto lexis::Cursor::input() const noexcept -> std::string_view
{
    return m_input;
}
