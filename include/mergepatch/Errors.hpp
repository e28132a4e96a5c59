/**
 * @file Errors.hpp
 * @brief Exception types for merge patch errors
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - ParseError: Input bytes are not valid JSON
 * - TypeMismatchError: Diffed values have incompatible shapes
 * - LengthMismatchError: Diffed arrays have different lengths
 * - DepthLimitError: Nesting deeper than the configured bound
 * - ConfigError: Base for tool configuration problems
 *   - FileNotFoundError: Settings file not found
 *   - ConfigParseError: Settings file or variable is malformed
 */

#ifndef MERGEPATCH_ERRORS_HPP
#define MERGEPATCH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace mergepatch {

/**
 * @brief Base class for all mergepatch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input is not well-formed JSON
 *
 * Raised by every operation that decodes bytes. No partial result is
 * produced.
 */
class ParseError : public PatchError {
public:
    /**
     * @brief Construct with codec details
     * @param details Detailed error message from the JSON parser
     * @param offset Byte offset at which decoding failed
     */
    ParseError(std::string details, std::size_t offset)
        : PatchError("Invalid JSON at byte " + std::to_string(offset) + ": " + details)
        , details_(std::move(details))
        , offset_(offset)
    {}

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

    /**
     * @brief Get the byte offset of the failure
     */
    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    std::string details_;
    std::size_t offset_;
};

/**
 * @brief Values compared during diff creation have incompatible shapes
 *
 * Raised for an array diffed against an object, or a scalar against a
 * container, anywhere a member-level replacement is not possible (the
 * document root and array positions).
 */
class TypeMismatchError : public PatchError {
public:
    /**
     * @brief Construct with location and both type names
     * @param path JSON Pointer of the offending position ("" for the root)
     * @param original Type name of the original value
     * @param modified Type name of the modified value
     */
    TypeMismatchError(std::string path, std::string original, std::string modified)
        : PatchError("Cannot diff " + original + " against " + modified +
                     " at '" + path + "'")
        , path_(std::move(path))
        , original_(std::move(original))
        , modified_(std::move(modified))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& original() const noexcept {
        return original_;
    }

    const std::string& modified() const noexcept {
        return modified_;
    }

private:
    std::string path_;
    std::string original_;
    std::string modified_;
};

/**
 * @brief Arrays compared during diff creation differ in length
 */
class LengthMismatchError : public PatchError {
public:
    /**
     * @brief Construct with location and both lengths
     * @param path JSON Pointer of the arrays ("" for the root)
     * @param original Length of the original array
     * @param modified Length of the modified array
     */
    LengthMismatchError(std::string path, std::size_t original, std::size_t modified)
        : PatchError("Cannot diff arrays of length " + std::to_string(original) +
                     " and " + std::to_string(modified) + " at '" + path + "'")
        , path_(std::move(path))
        , original_(original)
        , modified_(modified)
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    std::size_t original_length() const noexcept {
        return original_;
    }

    std::size_t modified_length() const noexcept {
        return modified_;
    }

private:
    std::string path_;
    std::size_t original_;
    std::size_t modified_;
};

/**
 * @brief Document nesting exceeds the configured depth bound
 */
class DepthLimitError : public PatchError {
public:
    explicit DepthLimitError(std::size_t max_depth)
        : PatchError("Maximum nesting depth of " + std::to_string(max_depth) + " exceeded")
        , max_depth_(max_depth)
    {}

    std::size_t max_depth() const noexcept {
        return max_depth_;
    }

private:
    std::size_t max_depth_;
};

/**
 * @brief Base class for tool configuration errors
 */
class ConfigError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Settings file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Settings source is malformed (syntax or wrong value type)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with source name and error details
     * @param source File path or environment variable name
     * @param details Detailed error message
     */
    ConfigParseError(std::string source, std::string details)
        : ConfigError("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    /**
     * @brief Construct with source position (TOML errors)
     * @param source File path
     * @param line 1-based line of the error
     * @param column 1-based column of the error
     * @param details Detailed error message
     */
    ConfigParseError(std::string source, int line, int column, std::string details)
        : ConfigError("Parse error in '" + source + "' at line " + std::to_string(line) +
                      ", column " + std::to_string(column) + ": " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the file path or variable name
     */
    const std::string& source() const noexcept {
        return source_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

} // namespace mergepatch

#endif // MERGEPATCH_ERRORS_HPP
