/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "strata/Loader.hpp"
#include "strata/Errors.hpp"
#include "strata/Logging.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace strata {

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

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
Value stringify(const T& value) {
    std::ostringstream ss;
    ss << value;
    return Value(ss.str());
}

/**
 * @brief Convert toml++ node to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return stringify(node.as_date()->get());

        case toml::node_type::time:
            return stringify(node.as_time()->get());

        case toml::node_type::date_time:
            return stringify(node.as_date_time()->get());

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

Value parse_json_text(const std::string& text, const std::string& source) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        // byte offset only; nlohmann does not report line/column
        throw DocumentParseError(source, 0, 0, e.what());
    }
}

Value parse_toml_text(const std::string& text, const std::string& source) {
    try {
        toml::table table = toml::parse(std::string_view{text}, std::string_view{source});
        return toml_value_to_json(table);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            source,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

} // anonymous namespace

Value parse_document(const std::string& text, DocumentFormat format, const std::string& source) {
    if (format == DocumentFormat::Toml) {
        return parse_toml_text(text, source);
    }
    return parse_json_text(text, source);
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_json_text(read_file(path), path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_toml_text(read_file(path), path);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

DocumentFormat detect_format(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return DocumentFormat::Json;
    }
    if (ext == ".toml") {
        return DocumentFormat::Toml;
    }
    throw DocumentParseError(path, 0, 0,
                             "unsupported file type '" + ext + "' (expected .json or .toml)");
}

Value load_document(const std::string& path) {
    const DocumentFormat format = detect_format(path);
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    logger()->debug("loading {} document '{}'",
                    format == DocumentFormat::Toml ? "TOML" : "JSON", path);
    return parse_document(read_file(path), format, path);
}

std::vector<Value> load_overrides(const std::string& path) {
    Value doc = load_document(path);
    // TOML has no top-level arrays, so a batch is spelled [[items]] there
    const bool toml = detect_format(path) == DocumentFormat::Toml;

    Value items;
    if (doc.is_array()) {
        items = std::move(doc);
    } else if (toml && doc.size() == 1 && doc.contains("items") && doc["items"].is_array()) {
        items = std::move(doc["items"]);
    } else if (doc.is_object()) {
        items = Value::array({std::move(doc)});
    } else {
        throw DocumentParseError(path, 0, 0, "expected an object or a list of objects, got " +
                                                 type_name(doc));
    }

    std::vector<Value> overrides;
    overrides.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!items[i].is_object()) {
            throw DocumentParseError(path, 0, 0, "override #" + std::to_string(i) +
                                                     " must be an object, got " + type_name(items[i]));
        }
        overrides.push_back(std::move(items[i]));
    }
    return overrides;
}

} // namespace strata
