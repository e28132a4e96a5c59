/**
 * @file Settings.cpp
 * @brief Settings loading for the mergepatch tool
 *
 * Implements settings loading from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 * - PREFIX_* environment variables
 */

#include "mergepatch/Settings.hpp"
#include "mergepatch/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace mergepatch {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string ext_of(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

/**
 * @brief Convert a toml++ settings table to a Value.
 *
 * Only tables and the scalar types a setting can hold are carried over.
 * Arrays and date/time values become null, which the key checks reject.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::string:
            return Value(node.as_string()->get());

        default:
            return Value(nullptr);
    }
}

/**
 * @brief Type an environment string: boolean, integer, or raw string.
 */
Value parse_env_value(const std::string& raw) {
    const std::string lower = to_lower(raw);
    if (lower == "true") return true;
    if (lower == "false") return false;

    const std::size_t digits_from = (!raw.empty() && raw.front() == '-') ? 1 : 0;
    const bool integral = raw.size() > digits_from &&
        std::all_of(raw.begin() + static_cast<std::ptrdiff_t>(digits_from), raw.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
    if (integral) {
        try {
            return static_cast<std::int64_t>(std::stoll(raw));
        } catch (const std::out_of_range&) {
            // Too large for int64: keep as string, rejected by the key check
        }
    }
    return raw;
}

bool read_bool(const Value& v, const std::string& source, const std::string& key) {
    if (!v.is_boolean()) {
        throw ConfigParseError(source, "'" + key + "' must be a boolean, got " + type_name(v));
    }
    return v.get<bool>();
}

std::int64_t read_int(const Value& v, const std::string& source, const std::string& key,
                      std::int64_t min) {
    if (!v.is_number_integer()) {
        throw ConfigParseError(source, "'" + key + "' must be an integer, got " + type_name(v));
    }
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw ConfigParseError(source, "'" + key + "' is out of range");
    }
    const auto n = v.get<std::int64_t>();
    if (n < min) {
        throw ConfigParseError(source, "'" + key + "' must be at least " + std::to_string(min));
    }
    return n;
}

void apply_key(ApplyOptions& options, const std::string& key, const Value& v,
               const std::string& source) {
    if (key == "escape_html") {
        options.escape_html = read_bool(v, source, key);
    } else if (key == "indent") {
        const auto n = read_int(v, source, key, -1);
        if (n > std::numeric_limits<int>::max()) {
            throw ConfigParseError(source, "'" + key + "' is out of range");
        }
        options.indent = static_cast<int>(n);
    } else if (key == "max_depth") {
        options.max_depth = static_cast<std::size_t>(read_int(v, source, key, 1));
    }
}

const char* const kKeys[] = {"escape_html", "indent", "max_depth"};

} // anonymous namespace

// ============================================================================
// File loading
// ============================================================================

Value load_settings_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = ext_of(path);
    if (ext == ".json") {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw FileNotFoundError(path);
        }
        try {
            return Value::parse(file);
        } catch (const Value::parse_error& e) {
            throw ConfigParseError(path, e.what());
        }
    }

    if (ext == ".toml") {
        try {
            toml::table table = toml::parse_file(path);
            return toml_value_to_json(table);
        } catch (const toml::parse_error& e) {
            throw ConfigParseError(
                path,
                static_cast<int>(e.source().begin.line),
                static_cast<int>(e.source().begin.column),
                std::string(e.description())
            );
        }
    }

    throw ConfigParseError(path, "Unsupported settings file type: " + ext +
                                 " (expected .json or .toml)");
}

// ============================================================================
// Overlays
// ============================================================================

void apply_settings(ApplyOptions& options, const Value& settings, const std::string& source) {
    if (!settings.is_object()) {
        throw ConfigParseError(source, "settings must be an object, got " + type_name(settings));
    }

    for (const char* key : kKeys) {
        auto it = settings.find(key);
        if (it != settings.end()) {
            apply_key(options, key, *it, source);
        }
    }

    auto output = settings.find("output");
    if (output == settings.end()) {
        return;
    }
    if (!output->is_object()) {
        throw ConfigParseError(source, "'output' must be a table, got " + type_name(*output));
    }
    for (const char* key : kKeys) {
        auto it = output->find(key);
        if (it != output->end()) {
            apply_key(options, key, *it, source);
        }
    }
}

void apply_env_settings(ApplyOptions& options, const std::string& prefix) {
    for (const char* key : kKeys) {
        std::string name = prefix + "_" + key;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return std::toupper(c); });

        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }
        apply_key(options, key, parse_env_value(raw), name);
    }
}

ApplyOptions load_options(const std::optional<std::string>& file, const std::string& prefix) {
    ApplyOptions options;

    if (file.has_value()) {
        apply_settings(options, load_settings_file(*file), *file);
    }
    if (!prefix.empty()) {
        apply_env_settings(options, prefix);
    }

    return options;
}

} // namespace mergepatch
