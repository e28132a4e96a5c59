/**
 * @file Codec.hpp
 * @brief Conversion between UTF-8 JSON text and Value
 *
 * Decoding rejects malformed input with ParseError and over-deep input with
 * DepthLimitError, so every tree handed to the merge algorithms is bounded.
 * Encoding is compact by default and escapes HTML-significant characters
 * unless told otherwise.
 */

#ifndef MERGEPATCH_CODEC_HPP
#define MERGEPATCH_CODEC_HPP

#include "mergepatch/Value.hpp"
#include "mergepatch/Options.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace mergepatch {

/**
 * @brief Decode JSON text into a Value
 *
 * @param text UTF-8 JSON text; surrounding whitespace is allowed
 * @param max_depth Deepest container nesting accepted
 * @return Decoded value
 * @throws ParseError if text is not a single well-formed JSON value
 * @throws DepthLimitError if containers nest deeper than max_depth
 */
Value decode(std::string_view text, std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief Encode a Value as JSON text
 *
 * Object keys are written in sorted order. With options.escape_html set
 * (the default) the characters '&', '<' and '>' are written as six-byte
 * unicode escapes; numbers use the codec's shortest round-trip form.
 *
 * @param value Value to encode
 * @param options Output options (escape_html and indent are honoured)
 * @return JSON text
 */
std::string encode(const Value& value, const ApplyOptions& options = ApplyOptions{});

/**
 * @brief Cheap syntactic check for "looks like a JSON array"
 *
 * Strips leading and trailing ASCII whitespace (space, tab, newline,
 * carriage return) and reports whether what remains starts with '['.
 * The content is not validated.
 *
 * Examples:
 * ```cpp
 * resembles_array("  []  ");              // true
 * resembles_array("[not valid syntax]");  // true
 * resembles_array("][");                  // false
 * resembles_array("");                    // false
 * ```
 */
bool resembles_array(std::string_view raw) noexcept;

} // namespace mergepatch

#endif // MERGEPATCH_CODEC_HPP
