/**
 * @file Value.hpp
 * @brief Value type for JSON documents and merge patches
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, keys kept in sorted order)
 */

#ifndef MERGEPATCH_VALUE_HPP
#define MERGEPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace mergepatch {

/**
 * @brief Decoded JSON value
 *
 * This is an alias for nlohmann::json. Objects are backed by std::map, so
 * iteration and serialization visit keys in lexicographic byte order; diff
 * and compose results rely on that for deterministic output.
 *
 * Each node exclusively owns its children. Algorithms in this library never
 * modify a tree they received by const reference.
 */
using Value = nlohmann::json;

/**
 * @brief Default bound on container nesting accepted by decode and the
 *        recursive algorithms
 */
constexpr std::size_t kDefaultMaxDepth = 1000;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Check whether two values share a variant for shape comparisons
 *
 * Both objects, both arrays, or both scalars (null, boolean, number,
 * string) are considered the same shape.
 */
inline bool same_shape(const Value& a, const Value& b) {
    if (!is_container(a) && !is_container(b)) return true;
    return a.is_object() == b.is_object() && a.is_array() == b.is_array();
}

} // namespace mergepatch

#endif // MERGEPATCH_VALUE_HPP
