/**
 * @file Options.hpp
 * @brief Options consumed when decoding inputs and encoding results
 */

#ifndef MERGEPATCH_OPTIONS_HPP
#define MERGEPATCH_OPTIONS_HPP

#include "mergepatch/Value.hpp"
#include <cstddef>

namespace mergepatch {

/**
 * @brief Output and resource options for the byte-level operations
 *
 * Example:
 * ```cpp
 * ApplyOptions opts;
 * opts.escape_html = false;
 * auto out = apply_with_options(R"({"x":"a"})", R"({"x":"&<>"})", opts);
 * // out == R"({"x":"&<>"})"
 * ```
 */
struct ApplyOptions {
    /// Emit '&', '<' and '>' in strings as unicode escape sequences.
    bool escape_html = true;

    /// -1 for compact output, otherwise spaces per indentation level.
    int indent = -1;

    /// Deepest container nesting accepted from input.
    std::size_t max_depth = kDefaultMaxDepth;
};

} // namespace mergepatch

#endif // MERGEPATCH_OPTIONS_HPP
