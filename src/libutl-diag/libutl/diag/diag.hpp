#pragma once

#include <libutl/common/utilities.hpp>
#include <libutl/color/color.hpp>

namespace utl::diag {

    // One-based line and column.
    struct Position {
        std::size_t line   = 1;
        std::size_t column = 1;

        auto operator<=>(Position const&) const = default;
    };

    // Compute the position of the character at `offset` in `text`. Offsets and columns
    // count UTF-8 characters. An offset equal to the character count of `text` denotes
    // the end of input.
    [[nodiscard]] auto position_at(std::string_view text, std::size_t offset) -> Position;

    // `stop_position` is one past the last highlighted character.
    struct Text_section {
        std::string_view           source_string;
        Position                   start_position;
        Position                   stop_position;
        std::optional<std::string> note;
        std::optional<Color>       note_color;
    };

    enum class Level { error, warning, note };

    struct Diagnostic {
        std::vector<Text_section>  text_sections;
        std::string                message;
        std::optional<std::string> help_note;
        Level                      level = Level::error;
    };

    struct Colors {
        Color normal {};
        Color error {};
        Color warning {};
        Color note {};
        Color position_info {};

        static auto defaults() noexcept -> Colors;
    };

    // Format `diagnostic` to `output` according to `colors`.
    auto format_diagnostic(
        Diagnostic const& diagnostic, std::string& output, Colors colors = Colors::defaults())
        -> void;

    // Format `diagnostic` to a new string according to `colors`.
    [[nodiscard]] auto format_diagnostic(
        Diagnostic const& diagnostic, Colors colors = Colors::defaults()) -> std::string;

} // namespace utl::diag

DECLARE_FORMATTER_FOR(utl::diag::Position);
DECLARE_FORMATTER_FOR(utl::diag::Level);
