/**
 * @file Equality.cpp
 * @brief Implementation of deep equality
 */

#include "mergepatch/Equality.hpp"
#include "mergepatch/Codec.hpp"
#include "mergepatch/Errors.hpp"

namespace mergepatch {

namespace {
    bool equal_arrays(const Value& a, const Value& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!equal(a[i], b[i])) {
                return false;
            }
        }
        return true;
    }

    // Both maps iterate in key order, so a lockstep walk compares key sets
    // and values in one pass.
    bool equal_objects(const Value& a, const Value& b) {
        if (a.size() != b.size()) {
            return false;
        }
        auto ia = a.begin();
        auto ib = b.begin();
        for (; ia != a.end(); ++ia, ++ib) {
            if (ia.key() != ib.key() || !equal(ia.value(), ib.value())) {
                return false;
            }
        }
        return true;
    }
}

bool equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        // nlohmann compares integer, unsigned and float by numeric value
        return a == b;
    }
    if (a.type() != b.type()) {
        return false;
    }

    switch (a.type()) {
        case Value::value_t::null:
            return true;
        case Value::value_t::boolean:
            return a.get<bool>() == b.get<bool>();
        case Value::value_t::string:
            return a.get_ref<const std::string&>() == b.get_ref<const std::string&>();
        case Value::value_t::array:
            return equal_arrays(a, b);
        case Value::value_t::object:
            return equal_objects(a, b);
        default:
            return a == b;
    }
}

bool json_equal(std::string_view a, std::string_view b) {
    try {
        return equal(decode(a), decode(b));
    } catch (const PatchError&) {
        return false;
    }
}

} // namespace mergepatch
