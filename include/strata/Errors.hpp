/**
 * @file Errors.hpp
 * @brief Exception types for strata merge errors
 *
 * Error taxonomy:
 * - Error: Base class
 * - SerializationError: Template, zero value or override cannot be serialized
 * - SchemaResolutionError: Malformed or conflicting schema annotations
 * - PatchComputationError: Override shape contradicts the schema
 * - PatchApplicationError: Patch cannot be applied onto the template
 * - DeserializationError: Merged tree does not fit the target type
 * - BatchMergeError: One override of a batch failed (cause is nested)
 * - FileNotFoundError / DocumentParseError: Document loading
 * - ConfigError: Invalid run configuration
 */

#ifndef STRATA_ERRORS_HPP
#define STRATA_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace strata {

/**
 * @brief Base class for all strata exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A value could not be converted into the interchange tree
 */
class SerializationError : public Error {
public:
    /**
     * @brief Construct with the role of the value and error details
     * @param subject What was being serialized ("template", "override", ...)
     * @param details Detailed error message
     */
    SerializationError(std::string subject, std::string details)
        : Error("Cannot serialize " + subject + ": " + details)
        , subject_(std::move(subject))
        , details_(std::move(details))
    {}

    const std::string& subject() const noexcept {
        return subject_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string subject_;
    std::string details_;
};

/**
 * @brief Base for errors that are reported against a field path
 */
class PathError : public Error {
public:
    PathError(const std::string& prefix, std::string path, std::string details)
        : Error(prefix + " at '" + (path.empty() ? std::string("<root>") : path) +
                "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the field path (empty for the root)
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Schema descriptor is malformed or carries conflicting annotations
 *
 * Raised e.g. for a merge-strategy list of objects without a merge key, or
 * a merge key declared on a field that is not a list.
 */
class SchemaResolutionError : public PathError {
public:
    SchemaResolutionError(std::string path, std::string details)
        : PathError("Invalid schema", std::move(path), std::move(details))
    {}
};

/**
 * @brief Diff between the empty value and an override failed
 *
 * Raised when the override's shape contradicts the declared kind of a
 * field (e.g. a list field holding an object).
 */
class PatchComputationError : public PathError {
public:
    PatchComputationError(std::string path, std::string details)
        : PathError("Cannot compute patch", std::move(path), std::move(details))
    {}
};

/**
 * @brief Patch could not be applied onto the template
 *
 * Raised for missing or duplicate merge keys and for type conflicts
 * between the template and the patch.
 */
class PatchApplicationError : public PathError {
public:
    PatchApplicationError(std::string path, std::string details)
        : PathError("Cannot apply patch", std::move(path), std::move(details))
    {}
};

/**
 * @brief Merged tree cannot be converted back into the target type
 */
class DeserializationError : public Error {
public:
    explicit DeserializationError(std::string details)
        : Error("Cannot deserialize merged value: " + details)
        , details_(std::move(details))
    {}

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string details_;
};

/**
 * @brief One override of a fail-fast batch could not be merged
 *
 * Thrown with std::throw_with_nested; std::rethrow_if_nested yields the
 * original error of the failing override.
 */
class BatchMergeError : public Error {
public:
    /**
     * @brief Construct with the failing override index
     * @param index Zero-based position of the override in the batch
     * @param details Message of the underlying error
     */
    BatchMergeError(std::size_t index, std::string details)
        : Error("Failed to merge override #" + std::to_string(index) + ": " + details)
        , index_(index)
    {}

    /**
     * @brief Get the zero-based index of the failing override
     */
    std::size_t index() const noexcept {
        return index_;
    }

private:
    std::size_t index_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public Error {
public:
    explicit FileNotFoundError(std::string path)
        : Error("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax or unsupported format)
 */
class DocumentParseError : public Error {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file (or "<string>" for in-memory text)
     * @param line 1-based line, 0 when unknown
     * @param column 1-based column, 0 when unknown
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : Error(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) {
                msg += ", column " + std::to_string(column);
            }
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Run configuration holds a value of the wrong type
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& details)
        : Error("Invalid configuration: " + details)
    {}
};

} // namespace strata

#endif // STRATA_ERRORS_HPP
