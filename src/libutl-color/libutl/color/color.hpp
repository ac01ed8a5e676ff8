#pragma once

#include <libutl/common/utilities.hpp>

namespace utl {

    enum class Color {
        dark_red,
        dark_green,
        dark_yellow,
        dark_blue,
        dark_purple,
        dark_cyan,
        dark_grey,

        red,
        green,
        yellow,
        blue,
        purple,
        cyan,
        grey,

        black,
        white,

        _enumerator_count
    };

    // The ANSI escape sequence for `color`, regardless of the formatting state.
    [[nodiscard]] auto color_string(Color color) noexcept -> std::string_view;

    auto enable_color_formatting() noexcept -> void;
    auto disable_color_formatting() noexcept -> void;

    [[nodiscard]] auto is_color_formatting_enabled() noexcept -> bool;

} // namespace utl

// Formats to the escape sequence when color formatting is enabled, and to nothing otherwise.
DECLARE_FORMATTER_FOR(utl::Color);
