/**
 * @file Loader.hpp
 * @brief Loading templates, overrides and schema descriptors from files
 *
 * Supported formats:
 * - JSON (using nlohmann::json)
 * - TOML (using toml++); tables become objects, dates and times become
 *   strings
 *
 * The format is picked by file extension (.json / .toml,
 * case-insensitive).
 */

#ifndef STRATA_LOADER_HPP
#define STRATA_LOADER_HPP

#include "strata/Value.hpp"

#include <string>
#include <vector>

namespace strata {

/**
 * @brief Document formats understood by the loader
 */
enum class DocumentFormat {
    Json,
    Toml
};

/**
 * @brief Parse document text
 *
 * @param text Document content
 * @param format Format of @p text
 * @param source Name used in error messages
 * @return Parsed Value
 * @throws DocumentParseError on syntax errors
 */
Value parse_document(const std::string& text, DocumentFormat format,
                     const std::string& source = "<string>");

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Get file extension (lowercase, including the dot)
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Detect the format of a file by its extension
 * @throws DocumentParseError if the extension is not .json or .toml
 */
DocumentFormat detect_format(const std::string& path);

/**
 * @brief Load a JSON or TOML file, detecting the format by extension
 * @throws FileNotFoundError, DocumentParseError
 */
Value load_document(const std::string& path);

/**
 * @brief Load a list of overrides
 *
 * Accepted shapes:
 * - an array of objects (JSON)
 * - an object with an "items" array of objects (TOML [[items]] only; in
 *   JSON such an object is a single override with an "items" field)
 * - a single object, taken as a one-element list
 *
 * @throws FileNotFoundError, DocumentParseError (also for other shapes)
 */
std::vector<Value> load_overrides(const std::string& path);

} // namespace strata

#endif // STRATA_LOADER_HPP
