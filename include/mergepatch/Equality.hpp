/**
 * @file Equality.hpp
 * @brief Deep structural equality over Values
 */

#ifndef MERGEPATCH_EQUALITY_HPP
#define MERGEPATCH_EQUALITY_HPP

#include "mergepatch/Value.hpp"
#include <string_view>

namespace mergepatch {

/**
 * @brief Deep structural equality
 *
 * Rules:
 * - Different variants are never equal (null is not false, "1" is not 1)
 * - Numbers compare by value, so 1 and 1.0 are equal
 * - Arrays: same length and pairwise equal elements, in order
 * - Objects: identical key sets and equal values per key; a key holding
 *   null is distinct from an absent key
 *
 * Stops at the first mismatch and never serializes either operand.
 *
 * @param a First value
 * @param b Second value
 * @return true if a and b are structurally equal
 */
bool equal(const Value& a, const Value& b);

/**
 * @brief Compare two JSON texts for semantic equality
 *
 * Whitespace and key order are irrelevant.
 *
 * @return true if both texts decode and their values are equal; false if
 *         they differ or either fails to decode
 */
bool json_equal(std::string_view a, std::string_view b);

} // namespace mergepatch

#endif // MERGEPATCH_EQUALITY_HPP
