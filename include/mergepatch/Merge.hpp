/**
 * @file Merge.hpp
 * @brief Application of JSON merge patches (RFC 7386)
 *
 * Merging rules:
 * - A patch that is not an object replaces the target entirely
 * - An object patch is merged member by member into the target, or into
 *   an empty object when the target is not an object
 * - A null member deletes the key from the target
 * - An object member merges recursively
 * - Any other member (arrays included) replaces the target's value
 */

#ifndef MERGEPATCH_MERGE_HPP
#define MERGEPATCH_MERGE_HPP

#include "mergepatch/Value.hpp"
#include "mergepatch/Options.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace mergepatch {

/**
 * @brief Apply a merge patch to a decoded document
 *
 * The target is taken by value; pass an rvalue to let the merge reuse its
 * storage, or an lvalue to keep the caller's tree untouched.
 *
 * @param target Document to patch
 * @param patch Merge patch
 * @param max_depth Deepest object nesting the merge will recurse into
 * @return Patched document
 * @throws DepthLimitError if the patch nests deeper than max_depth
 *
 * Examples:
 * ```cpp
 * // Nested objects are merged, null deletes
 * Value doc = {{"a", {{"b", "c"}}}};
 * Value patch = {{"a", {{"b", "d"}, {"c", nullptr}}}};
 * auto result = merge_patch(doc, patch);
 * // Result: {"a": {"b": "d"}}
 *
 * // Arrays are replaced, never merged
 * Value doc2 = {{"a", {1, 2}}};
 * Value patch2 = {{"a", {3}}};
 * auto result2 = merge_patch(doc2, patch2);
 * // Result: {"a": [3]}
 * ```
 */
Value merge_patch(Value target, const Value& patch, std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief Apply a merge patch to JSON text with default options
 *
 * @param target Document text
 * @param patch Merge patch text
 * @return Compact JSON text of the patched document
 * @throws ParseError if either input is not valid JSON
 */
std::string apply(std::string_view target, std::string_view patch);

/**
 * @brief Apply a merge patch to JSON text
 *
 * @param target Document text
 * @param patch Merge patch text
 * @param options Encoding and depth options
 * @return JSON text of the patched document
 * @throws ParseError if either input is not valid JSON
 * @throws DepthLimitError if either input nests deeper than options.max_depth
 */
std::string apply_with_options(std::string_view target, std::string_view patch,
                               const ApplyOptions& options);

} // namespace mergepatch

#endif // MERGEPATCH_MERGE_HPP
