/**
 * @file Compose.cpp
 * @brief Implementation of merge patch composition
 */

#include "mergepatch/Compose.hpp"
#include "mergepatch/Codec.hpp"
#include "mergepatch/Errors.hpp"
#include <utility>

namespace mergepatch {

namespace {
    Value compose_at(Value p1, const Value& p2, std::size_t depth, std::size_t max_depth) {
        if (!p2.is_object() || !p1.is_object()) {
            return p2;
        }
        if (depth >= max_depth) {
            throw DepthLimitError(max_depth);
        }

        for (auto it = p2.begin(); it != p2.end(); ++it) {
            const auto& v2 = it.value();
            auto found = p1.find(it.key());

            if (found != p1.end() && found->is_object() && v2.is_object()) {
                *found = compose_at(std::move(*found), v2, depth + 1, max_depth);
            } else {
                // Later patch wins, a delete over a set and a set over a delete alike
                p1[it.key()] = v2;
            }
        }

        return p1;
    }
}

Value compose(Value p1, const Value& p2, std::size_t max_depth) {
    return compose_at(std::move(p1), p2, 0, max_depth);
}

std::string merge_merge_patches(std::string_view p1, std::string_view p2) {
    return merge_merge_patches(p1, p2, ApplyOptions{});
}

std::string merge_merge_patches(std::string_view p1, std::string_view p2,
                                const ApplyOptions& options) {
    Value first = decode(p1, options.max_depth);
    Value second = decode(p2, options.max_depth);
    return encode(compose(std::move(first), second, options.max_depth), options);
}

} // namespace mergepatch
