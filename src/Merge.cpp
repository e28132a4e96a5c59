/**
 * @file Merge.cpp
 * @brief Implementation of merge patch application
 */

#include "mergepatch/Merge.hpp"
#include "mergepatch/Codec.hpp"
#include "mergepatch/Errors.hpp"
#include <utility>

namespace mergepatch {

namespace {
    Value merge_at(Value target, const Value& patch, std::size_t depth, std::size_t max_depth) {
        // Non-object patch replaces everything, arrays included
        if (!patch.is_object()) {
            return patch;
        }
        if (depth >= max_depth) {
            throw DepthLimitError(max_depth);
        }

        Value result = target.is_object() ? std::move(target) : Value::object();

        for (auto it = patch.begin(); it != patch.end(); ++it) {
            const auto& key = it.key();
            const auto& value = it.value();

            if (value.is_null()) {
                result.erase(key);
            } else if (value.is_object()) {
                // Missing or non-object base: merge into {} so nested
                // deletion markers are dropped
                auto found = result.find(key);
                if (found != result.end()) {
                    *found = merge_at(std::move(*found), value, depth + 1, max_depth);
                } else {
                    result[key] = merge_at(Value::object(), value, depth + 1, max_depth);
                }
            } else {
                result[key] = value;
            }
        }

        return result;
    }
}

Value merge_patch(Value target, const Value& patch, std::size_t max_depth) {
    return merge_at(std::move(target), patch, 0, max_depth);
}

std::string apply(std::string_view target, std::string_view patch) {
    return apply_with_options(target, patch, ApplyOptions{});
}

std::string apply_with_options(std::string_view target, std::string_view patch,
                               const ApplyOptions& options) {
    Value doc = decode(target, options.max_depth);
    Value pat = decode(patch, options.max_depth);
    return encode(merge_patch(std::move(doc), pat, options.max_depth), options);
}

} // namespace mergepatch
