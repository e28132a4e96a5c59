/**
 * @file Diff.hpp
 * @brief Creation of the minimal merge patch between two documents
 *
 * Object members are diffed as RFC 7386 prescribes: removed keys map to
 * null, added or changed keys map to the new value, unchanged keys are
 * omitted. Arrays of equal length are additionally diffed position by
 * position. That extension is for change reporting; merge_patch() replaces
 * arrays wholesale, so an array diff does not generally re-apply to the
 * modified array.
 */

#ifndef MERGEPATCH_DIFF_HPP
#define MERGEPATCH_DIFF_HPP

#include "mergepatch/Value.hpp"
#include "mergepatch/Options.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace mergepatch {

/**
 * @brief Compute the merge patch turning one decoded document into another
 *
 * Rules:
 * - Both objects: keys only in original → null; keys only in modified →
 *   modified value as-is; keys in both → recursive diff when both values
 *   are objects or both arrays (omitted if nothing changed), otherwise the
 *   modified value unless the two are equal (omitted)
 * - Both arrays: lengths must match; each position holds the diff of the
 *   pair at that position. Object positions that did not change hold {},
 *   scalar positions always hold the modified element
 * - Both scalars: {} when equal, otherwise the modified value
 *
 * At the root an unchanged document yields {}; an array root always
 * yields the per-position array (e.g. [{}]).
 *
 * @param original Source document
 * @param modified Target document
 * @param max_depth Deepest nesting the diff will recurse into
 * @return Merge patch
 * @throws TypeMismatchError if the root, or any array position, pairs
 *         values of different shape (object, array, scalar)
 * @throws LengthMismatchError if two arrays being diffed differ in length
 * @throws DepthLimitError if the documents nest deeper than max_depth
 *
 * Examples:
 * ```cpp
 * Value a = {{"title", "hello"}, {"nested", {{"one", 1}, {"two", 2}}}};
 * Value b = {{"title", "hello"}, {"nested", {{"one", 1}}}};
 * auto patch = diff(a, b);
 * // Result: {"nested": {"two": null}}
 *
 * auto same = diff(Value::parse(R"([{"foo":"bar"}])"),
 *                  Value::parse(R"([{"foo":"bar"}])"));
 * // Result: [{}]
 * ```
 */
Value diff(const Value& original, const Value& modified,
           std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief Compute the merge patch between two JSON texts
 *
 * @return Compact JSON text of the patch, keys sorted
 * @throws ParseError if either input is not valid JSON
 * @throws TypeMismatchError, LengthMismatchError as for diff()
 */
std::string create_merge_patch(std::string_view original, std::string_view modified);

/**
 * @brief Compute the merge patch between two JSON texts
 *
 * @param options Encoding and depth options
 * @return JSON text of the patch, keys sorted
 * @throws ParseError if either input is not valid JSON
 * @throws TypeMismatchError, LengthMismatchError, DepthLimitError as for diff()
 */
std::string create_merge_patch(std::string_view original, std::string_view modified,
                               const ApplyOptions& options);

} // namespace mergepatch

#endif // MERGEPATCH_DIFF_HPP
