/**
 * @file Codec.cpp
 * @brief Implementation of JSON decoding and encoding
 */

#include "mergepatch/Codec.hpp"
#include "mergepatch/Errors.hpp"

namespace mergepatch {

namespace {
    /**
     * @brief JSON whitespace as accepted around a document
     */
    bool is_json_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    /**
     * @brief Replace '&', '<' and '>' with their unicode escapes
     *
     * These characters only occur inside string tokens of encoded output,
     * so the whole text can be rewritten without tracking string state.
     */
    std::string escape_html(const std::string& text) {
        std::string result;
        result.reserve(text.size());
        for (char c : text) {
            switch (c) {
                case '&': result += "\\u0026"; break;
                case '<': result += "\\u003c"; break;
                case '>': result += "\\u003e"; break;
                default: result += c; break;
            }
        }
        return result;
    }
}

Value decode(std::string_view text, std::size_t max_depth) {
    // depth is the number of enclosing containers of the value being opened
    Value::parser_callback_t guard =
        [max_depth](int depth, Value::parse_event_t event, Value& /*parsed*/) {
            if ((event == Value::parse_event_t::object_start ||
                 event == Value::parse_event_t::array_start) &&
                static_cast<std::size_t>(depth) >= max_depth) {
                throw DepthLimitError(max_depth);
            }
            return true;
        };

    try {
        return Value::parse(text.begin(), text.end(), guard);
    } catch (const Value::parse_error& e) {
        throw ParseError(e.what(), e.byte);
    }
}

std::string encode(const Value& value, const ApplyOptions& options) {
    std::string text = value.dump(options.indent, ' ', false,
                                  Value::error_handler_t::replace);
    if (options.escape_html) {
        return escape_html(text);
    }
    return text;
}

bool resembles_array(std::string_view raw) noexcept {
    std::size_t start = 0;
    while (start < raw.size() && is_json_space(raw[start])) {
        ++start;
    }
    std::size_t end = raw.size();
    while (end > start && is_json_space(raw[end - 1])) {
        --end;
    }
    return start < end && raw[start] == '[';
}

} // namespace mergepatch
