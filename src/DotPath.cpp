/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "strata/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace strata {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

std::string child_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) {
        return key;
    }
    return parent + "." + key;
}

std::string index_path(const std::string& parent, std::size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

std::string keyed_path(const std::string& parent, const std::string& key_field,
                       const Value& key_value) {
    return parent + "[" + key_field + "=" + key_value.dump() + "]";
}

namespace {
    /**
     * @brief Check if segment is a valid non-negative array index
     *
     * No leading zeros except "0" itself, and short enough for size_t.
     */
    bool is_array_index(const std::string& segment) {
        if (segment.empty() || segment.size() > 18) return false;
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }
}

const Value* find_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                return nullptr;
            }
            current = &*it;
        } else if (current->is_array()) {
            if (!is_array_index(seg)) {
                return nullptr;
            }
            size_t idx = std::stoull(seg);
            if (idx >= current->size()) {
                return nullptr;
            }
            current = &(*current)[idx];
        } else {
            return nullptr;
        }
    }

    return current;
}

} // namespace strata
