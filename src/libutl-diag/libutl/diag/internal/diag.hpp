#pragma once

#include <libutl/diag/diag.hpp>

namespace utl::diag::internal {

    // The full lines of `source_string` spanned by a text section, without line terminators.
    // The last line may be empty when the section points at the end of input.
    [[nodiscard]] auto get_relevant_lines(
        std::string_view source_string, Position section_start, Position section_stop)
        -> std::vector<std::string_view>;

} // namespace utl::diag::internal
