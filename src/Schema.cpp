/**
 * @file Schema.cpp
 * @brief Resolution of schema descriptors into merge tables
 */

#include "strata/Schema.hpp"
#include "strata/DotPath.hpp"
#include "strata/Errors.hpp"

#include <set>

namespace strata {

const char* to_string(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::Scalar: return "scalar";
        case FieldKind::Object: return "object";
        case FieldKind::List: return "list";
        case FieldKind::Map: return "map";
    }
    return "unknown";
}

const char* to_string(MergeStrategy strategy) noexcept {
    switch (strategy) {
        case MergeStrategy::Replace: return "replace";
        case MergeStrategy::Merge: return "merge";
    }
    return "unknown";
}

const char* to_string(ListOrder order) noexcept {
    switch (order) {
        case ListOrder::TemplateFirst: return "template";
        case ListOrder::OverrideFirst: return "override";
    }
    return "unknown";
}

namespace {

const std::set<std::string> kFieldAttributes = {
    "kind", "strategy", "mergeKey", "elements", "schema", "order"
};

/**
 * @brief Read an optional string attribute of a field descriptor
 */
std::optional<std::string> string_attribute(const Value& descriptor, const char* name,
                                            const std::string& path) {
    auto it = descriptor.find(name);
    if (it == descriptor.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw SchemaResolutionError(path, std::string("'") + name + "' must be a string, got " +
                                              type_name(*it));
    }
    return it->get<std::string>();
}

FieldKind parse_kind(const std::string& text, const std::string& path) {
    if (text == "scalar") return FieldKind::Scalar;
    if (text == "object") return FieldKind::Object;
    if (text == "list") return FieldKind::List;
    if (text == "map") return FieldKind::Map;
    throw SchemaResolutionError(path, "unknown kind '" + text + "'");
}

MergeStrategy parse_strategy(const std::string& text, const std::string& path) {
    if (text == "replace") return MergeStrategy::Replace;
    if (text == "merge") return MergeStrategy::Merge;
    throw SchemaResolutionError(path, "unknown strategy '" + text + "'");
}

FieldKind parse_element_kind(const std::string& text, const std::string& path) {
    if (text == "scalar") return FieldKind::Scalar;
    if (text == "object") return FieldKind::Object;
    throw SchemaResolutionError(path, "'elements' must be 'scalar' or 'object', got '" +
                                          text + "'");
}

ListOrder parse_order(const std::string& text, const std::string& path) {
    if (text == "template") return ListOrder::TemplateFirst;
    if (text == "override") return ListOrder::OverrideFirst;
    throw SchemaResolutionError(path, "'order' must be 'template' or 'override', got '" +
                                          text + "'");
}

void reject(const Value& descriptor, const char* attribute, const std::string& path,
            const std::string& reason) {
    if (descriptor.contains(attribute)) {
        throw SchemaResolutionError(path, std::string("'") + attribute + "' " + reason);
    }
}

} // anonymous namespace

std::shared_ptr<const Schema> Schema::open() {
    static const std::shared_ptr<const Schema> instance = std::make_shared<Schema>();
    return instance;
}

std::shared_ptr<const Schema> Schema::resolve(const Value& descriptor) {
    return resolve_at(descriptor, "");
}

std::shared_ptr<const Schema> Schema::resolve_at(const Value& descriptor,
                                                 const std::string& path) {
    if (!descriptor.is_object()) {
        throw SchemaResolutionError(path, "schema descriptor must be an object, got " +
                                              type_name(descriptor));
    }

    for (auto it = descriptor.begin(); it != descriptor.end(); ++it) {
        if (it.key() != "fields") {
            throw SchemaResolutionError(path, "unknown schema attribute '" + it.key() + "'");
        }
    }

    auto schema = std::make_shared<Schema>();
    auto fields = descriptor.find("fields");
    if (fields == descriptor.end()) {
        return schema;
    }
    if (!fields->is_object()) {
        throw SchemaResolutionError(path, "'fields' must be an object, got " +
                                              type_name(*fields));
    }

    for (auto it = fields->begin(); it != fields->end(); ++it) {
        schema->fields_.emplace(it.key(),
                                resolve_field(it.key(), it.value(), child_path(path, it.key())));
    }
    return schema;
}

FieldSchema Schema::resolve_field(const std::string& name, const Value& descriptor,
                                  const std::string& path) {
    if (!descriptor.is_object()) {
        throw SchemaResolutionError(path, "field descriptor must be an object, got " +
                                              type_name(descriptor));
    }
    for (auto it = descriptor.begin(); it != descriptor.end(); ++it) {
        if (kFieldAttributes.count(it.key()) == 0) {
            throw SchemaResolutionError(path, "unknown field attribute '" + it.key() + "'");
        }
    }

    auto kind_text = string_attribute(descriptor, "kind", path);
    if (!kind_text) {
        throw SchemaResolutionError(path, "missing 'kind'");
    }

    FieldSchema field;
    field.name = name;
    field.kind = parse_kind(*kind_text, path);

    const auto strategy = string_attribute(descriptor, "strategy", path);
    const auto merge_key = string_attribute(descriptor, "mergeKey", path);
    const auto elements = string_attribute(descriptor, "elements", path);
    const auto order = string_attribute(descriptor, "order", path);
    const bool has_schema = descriptor.contains("schema");

    switch (field.kind) {
        case FieldKind::Scalar: {
            reject(descriptor, "strategy", path, "is not allowed on a scalar field");
            reject(descriptor, "mergeKey", path, "is only allowed on list fields");
            reject(descriptor, "elements", path, "is not allowed on a scalar field");
            reject(descriptor, "schema", path, "is not allowed on a scalar field");
            reject(descriptor, "order", path, "is only allowed on list fields");
            break;
        }

        case FieldKind::Object: {
            reject(descriptor, "mergeKey", path, "is only allowed on list fields");
            reject(descriptor, "elements", path, "is not allowed on an object field");
            reject(descriptor, "order", path, "is only allowed on list fields");
            field.strategy = strategy ? parse_strategy(*strategy, path) : MergeStrategy::Merge;
            field.element_kind = FieldKind::Object;
            field.element = has_schema ? resolve_at(descriptor.at("schema"), child_path(path, "schema"))
                                       : open();
            break;
        }

        case FieldKind::Map: {
            reject(descriptor, "mergeKey", path, "is only allowed on list fields");
            reject(descriptor, "order", path, "is only allowed on list fields");
            field.strategy = strategy ? parse_strategy(*strategy, path) : MergeStrategy::Merge;
            field.element_kind = elements ? parse_element_kind(*elements, path)
                                          : (has_schema ? FieldKind::Object : FieldKind::Scalar);
            if (field.element_kind == FieldKind::Object) {
                field.element = has_schema
                    ? resolve_at(descriptor.at("schema"), child_path(path, "schema"))
                    : open();
            } else if (has_schema) {
                throw SchemaResolutionError(path, "'schema' requires object elements");
            }
            break;
        }

        case FieldKind::List: {
            field.strategy = strategy ? parse_strategy(*strategy, path) : MergeStrategy::Replace;
            field.element_kind = elements
                ? parse_element_kind(*elements, path)
                : ((has_schema || merge_key) ? FieldKind::Object : FieldKind::Scalar);

            if (field.element_kind == FieldKind::Object) {
                field.element = has_schema
                    ? resolve_at(descriptor.at("schema"), child_path(path, "schema"))
                    : open();
            } else if (has_schema) {
                throw SchemaResolutionError(path, "'schema' requires object elements");
            }

            if (merge_key) {
                if (merge_key->empty()) {
                    throw SchemaResolutionError(path, "'mergeKey' must not be empty");
                }
                if (field.strategy != MergeStrategy::Merge) {
                    throw SchemaResolutionError(path, "'mergeKey' conflicts with strategy 'replace'");
                }
                if (field.element_kind != FieldKind::Object) {
                    throw SchemaResolutionError(path, "'mergeKey' requires object elements");
                }
                if (const FieldSchema* key_field = field.element->field(*merge_key)) {
                    if (key_field->kind != FieldKind::Scalar) {
                        throw SchemaResolutionError(
                            path, "merge key '" + *merge_key + "' must be a scalar field, is " +
                                      to_string(key_field->kind));
                    }
                }
                field.merge_key = *merge_key;
            } else if (field.strategy == MergeStrategy::Merge &&
                       field.element_kind == FieldKind::Object) {
                throw SchemaResolutionError(path, "strategy 'merge' on a list of objects requires 'mergeKey'");
            }

            if (order) {
                if (field.strategy != MergeStrategy::Merge) {
                    throw SchemaResolutionError(path, "'order' requires strategy 'merge'");
                }
                field.order = parse_order(*order, path);
            }
            break;
        }
    }

    return field;
}

const FieldSchema* Schema::field(const std::string& name) const {
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        return nullptr;
    }
    return &it->second;
}

Value Schema::describe() const {
    Value fields = Value::object();
    for (const auto& [name, field] : fields_) {
        Value d = {{"kind", to_string(field.kind)}};
        if (field.kind != FieldKind::Scalar) {
            d["strategy"] = to_string(field.strategy);
        }
        if (field.kind == FieldKind::List || field.kind == FieldKind::Map) {
            d["elements"] = to_string(field.element_kind);
        }
        if (field.merge_key) {
            d["mergeKey"] = *field.merge_key;
        }
        if (field.kind == FieldKind::List && field.strategy == MergeStrategy::Merge) {
            d["order"] = to_string(field.order);
        }
        if (field.element && !field.element->empty()) {
            d["schema"] = field.element->describe();
        }
        fields[name] = std::move(d);
    }
    return Value{{"fields", std::move(fields)}};
}

} // namespace strata
