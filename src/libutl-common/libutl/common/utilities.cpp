#include <libutl/common/utilities.hpp>

auto utl::abort(std::string_view const message, std::source_location const caller) -> void
{
    fmt::print(
        stderr,
        "[{}:{}:{}] utl::abort invoked with message: {}, in function '{}'\n",
        filename_without_path(caller.file_name()),
        caller.line(),
        caller.column(),
        message,
        caller.function_name());
    std::exit(EXIT_FAILURE);
}

auto utl::unreachable(std::source_location const caller) -> void
{
    abort("Reached unreachable code", caller);
}

auto utl::always_assert(bool const condition, std::source_location const caller) -> void
{
    if (!condition) [[unlikely]] {
        abort("Assertion failed", caller);
    }
}

auto utl::string_with_capacity(std::size_t const capacity) -> std::string
{
    std::string string;
    string.reserve(capacity);
    return string;
}
