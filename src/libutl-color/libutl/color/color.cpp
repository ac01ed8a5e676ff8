#include <libutl/common/utilities.hpp>
#include <libutl/color/color.hpp>

namespace {
    constinit bool color_formatting_state = true;
} // namespace

auto utl::color_string(Color const color) noexcept -> std::string_view
{
    static constexpr auto color_map = std::to_array<std::string_view>({
        "\033[31m",       // dark red
        "\033[32m",       // dark green
        "\033[33m",       // dark yellow
        "\033[34m",       // dark blue
        "\033[35m",       // dark purple
        "\033[36m",       // dark cyan
        "\033[38;5;238m", // dark grey

        "\033[91m", // red
        "\033[92m", // green
        "\033[93m", // yellow
        "\033[94m", // blue
        "\033[95m", // purple
        "\033[96m", // cyan
        "\033[90m", // grey

        "\033[30m", // black
        "\033[0m",  // white
    });
    static_assert(color_map.size() == enumerator_count<Color>);
    return color_map[as_index(color)];
}

auto utl::enable_color_formatting() noexcept -> void
{
    color_formatting_state = true;
}

auto utl::disable_color_formatting() noexcept -> void
{
    color_formatting_state = false;
}

auto utl::is_color_formatting_enabled() noexcept -> bool
{
    return color_formatting_state;
}

DEFINE_FORMATTER_FOR(utl::Color)
{
    if (color_formatting_state) {
        return fmt::format_to(context.out(), "{}", utl::color_string(value));
    }
    return context.out();
}
