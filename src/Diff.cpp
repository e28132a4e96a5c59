/**
 * @file Diff.cpp
 * @brief Implementation of merge patch creation
 */

#include "mergepatch/Diff.hpp"
#include "mergepatch/Codec.hpp"
#include "mergepatch/Equality.hpp"
#include "mergepatch/Errors.hpp"
#include <string>
#include <utility>
#include <vector>

namespace mergepatch {

namespace {
    /**
     * @brief One step of the walk from the root, linked to its parent
     *
     * Frames live on the call stack; the JSON Pointer text is only built
     * when an error needs it.
     */
    struct PathFrame {
        const PathFrame* parent;
        const std::string* key;   // nullptr for an array position
        std::size_t index;
    };

    std::string render(const PathFrame* frame) {
        std::vector<const PathFrame*> frames;
        for (; frame != nullptr; frame = frame->parent) {
            frames.push_back(frame);
        }

        Value::json_pointer pointer;
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            pointer = (*it)->key != nullptr ? pointer / *(*it)->key : pointer / (*it)->index;
        }
        return pointer.to_string();
    }

    /**
     * @brief Patch for one position plus whether anything under it changed
     *
     * Array positions cannot be omitted, so "unchanged" has to travel
     * separately from the patch value itself.
     */
    struct Delta {
        Value patch;
        bool changed;
    };

    Delta diff_values(const Value& a, const Value& b, const PathFrame* path,
                      std::size_t depth, std::size_t max_depth);

    Value diff_objects(const Value& a, const Value& b, const PathFrame* path,
                       std::size_t depth, std::size_t max_depth) {
        if (depth >= max_depth) {
            throw DepthLimitError(max_depth);
        }

        Value result = Value::object();

        for (auto it = a.begin(); it != a.end(); ++it) {
            if (!b.contains(it.key())) {
                result[it.key()] = nullptr;
            }
        }

        for (auto it = b.begin(); it != b.end(); ++it) {
            const auto& key = it.key();
            const auto& bv = it.value();

            auto found = a.find(key);
            if (found == a.end()) {
                result[key] = bv;
                continue;
            }

            const Value& av = *found;
            if (is_container(av) && same_shape(av, bv)) {
                const PathFrame child{path, &key, 0};
                Delta nested = diff_values(av, bv, &child, depth + 1, max_depth);
                if (nested.changed) {
                    result[key] = std::move(nested.patch);
                }
            } else if (!equal(av, bv)) {
                // Scalar change or type change: replace wholesale
                result[key] = bv;
            }
        }

        return result;
    }

    Delta diff_arrays(const Value& a, const Value& b, const PathFrame* path,
                      std::size_t depth, std::size_t max_depth) {
        if (depth >= max_depth) {
            throw DepthLimitError(max_depth);
        }
        if (a.size() != b.size()) {
            throw LengthMismatchError(render(path), a.size(), b.size());
        }

        Delta result{Value::array(), false};
        for (std::size_t i = 0; i < a.size(); ++i) {
            const PathFrame child{path, nullptr, i};
            Delta element = diff_values(a[i], b[i], &child, depth + 1, max_depth);
            result.changed = result.changed || element.changed;
            result.patch.push_back(std::move(element.patch));
        }
        return result;
    }

    Delta diff_values(const Value& a, const Value& b, const PathFrame* path,
                      std::size_t depth, std::size_t max_depth) {
        if (!same_shape(a, b)) {
            throw TypeMismatchError(render(path), type_name(a), type_name(b));
        }

        if (a.is_object()) {
            Value patch = diff_objects(a, b, path, depth, max_depth);
            const bool changed = !patch.empty();
            return {std::move(patch), changed};
        }
        if (a.is_array()) {
            return diff_arrays(a, b, path, depth, max_depth);
        }

        // Scalars always echo the modified value
        return {b, !equal(a, b)};
    }
}

Value diff(const Value& original, const Value& modified, std::size_t max_depth) {
    Delta root = diff_values(original, modified, nullptr, 0, max_depth);

    // An array root keeps its per-position form even when nothing changed
    if (!root.changed && !root.patch.is_array()) {
        return Value::object();
    }
    return std::move(root.patch);
}

std::string create_merge_patch(std::string_view original, std::string_view modified) {
    return create_merge_patch(original, modified, ApplyOptions{});
}

std::string create_merge_patch(std::string_view original, std::string_view modified,
                               const ApplyOptions& options) {
    Value a = decode(original, options.max_depth);
    Value b = decode(modified, options.max_depth);
    return encode(diff(a, b, options.max_depth), options);
}

} // namespace mergepatch
