/**
 * @file Compose.hpp
 * @brief Composition of two sequential merge patches
 *
 * For every document x:
 *   merge_patch(merge_patch(x, p1), p2) == merge_patch(x, compose(p1, p2))
 * under semantic equality.
 */

#ifndef MERGEPATCH_COMPOSE_HPP
#define MERGEPATCH_COMPOSE_HPP

#include "mergepatch/Value.hpp"
#include "mergepatch/Options.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace mergepatch {

/**
 * @brief Compose two decoded merge patches into one
 *
 * Rules:
 * - p2 not an object: p2 (it replaces whatever p1 produced)
 * - p1 not an object: p2
 * - Both objects: p1's members, overlaid by p2's; members that are
 *   objects in both compose recursively, otherwise p2's value wins,
 *   null included
 *
 * @param p1 Patch applied first
 * @param p2 Patch applied second
 * @param max_depth Deepest object nesting the composition will recurse into
 * @return Equivalent single patch
 * @throws DepthLimitError if the patches nest deeper than max_depth
 *
 * Example:
 * ```cpp
 * Value p1 = {{"k", "v"}, {"keep", 1}};
 * Value p2 = {{"k", nullptr}};
 * auto p = compose(p1, p2);
 * // Result: {"k": null, "keep": 1}
 * ```
 */
Value compose(Value p1, const Value& p2, std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief Compose two merge patches given as JSON text
 *
 * @return Compact JSON text of the composed patch, keys sorted
 * @throws ParseError if either input is not valid JSON
 */
std::string merge_merge_patches(std::string_view p1, std::string_view p2);

/**
 * @brief Compose two merge patches given as JSON text
 *
 * @param options Encoding and depth options
 * @return JSON text of the composed patch, keys sorted
 * @throws ParseError if either input is not valid JSON
 * @throws DepthLimitError if either input nests deeper than options.max_depth
 */
std::string merge_merge_patches(std::string_view p1, std::string_view p2,
                                const ApplyOptions& options);

} // namespace mergepatch

#endif // MERGEPATCH_COMPOSE_HPP
