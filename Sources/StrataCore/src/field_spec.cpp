#include "strata/field_spec.hpp"
#include "strata/errors.hpp"
#include "strata/type_mapper.hpp"
#include "strata/log.hpp"
#include <set>

namespace strata {

const char* to_string(field_kind kind) noexcept {
    switch (kind) {
        case field_kind::string: return "string";
        case field_kind::number: return "number";
        case field_kind::integer: return "integer";
        case field_kind::boolean: return "boolean";
        case field_kind::array: return "array";
        case field_kind::object: return "object";
        case field_kind::self_ref: return "$ref";
    }
    return "unknown";
}

json parse_schema_text(const std::string& text) {
    std::vector<std::set<std::string>> open_objects;
    std::optional<std::string> duplicate;

    json::parser_callback_t cb = [&](int, json::parse_event_t event, json& parsed) {
        switch (event) {
            case json::parse_event_t::object_start:
                open_objects.emplace_back();
                break;
            case json::parse_event_t::object_end:
                if (!open_objects.empty()) open_objects.pop_back();
                break;
            case json::parse_event_t::key: {
                auto key = parsed.get<std::string>();
                if (!open_objects.back().insert(key).second && !duplicate) {
                    duplicate = key;
                }
                break;
            }
            default:
                break;
        }
        return true;
    };

    json doc;
    try {
        doc = json::parse(text, cb);
    } catch (const json::parse_error& e) {
        throw schema_error(std::string("Schema is not valid JSON: ") + e.what());
    }
    if (duplicate) {
        throw schema_error("Duplicate key '" + *duplicate + "' in schema document");
    }
    return doc;
}

namespace {

std::string child_path(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "." + name;
}

std::optional<size_t> read_count(const json& node, const char* key, const std::string& path) {
    auto it = node.find(key);
    if (it == node.end()) return std::nullopt;
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        throw schema_error("'" + std::string(key) + "' at '" + path + "' must be a non-negative integer");
    }
    return static_cast<size_t>(it->get<int64_t>());
}

std::optional<double> read_number(const json& node, const char* key, const std::string& path) {
    auto it = node.find(key);
    if (it == node.end()) return std::nullopt;
    if (!it->is_number()) {
        throw schema_error("'" + std::string(key) + "' at '" + path + "' must be a number");
    }
    return it->get<double>();
}

bool read_flag(const json& node, const char* key, const std::string& path, bool fallback) {
    auto it = node.find(key);
    if (it == node.end()) return fallback;
    if (!it->is_boolean()) {
        throw schema_error("'" + std::string(key) + "' at '" + path + "' must be a boolean");
    }
    return it->get<bool>();
}

void read_bounds(const json& node, const std::string& path, numeric_bounds& bounds) {
    bounds.minimum = read_number(node, "minimum", path);
    bounds.maximum = read_number(node, "maximum", path);
    bounds.exclusive_minimum = read_number(node, "exclusiveMinimum", path);
    bounds.exclusive_maximum = read_number(node, "exclusiveMaximum", path);
    bounds.multiple_of = read_number(node, "multipleOf", path);
    if (bounds.minimum && bounds.maximum && *bounds.minimum > *bounds.maximum) {
        throw schema_error("'minimum' exceeds 'maximum' at '" + path + "'");
    }
    if (bounds.multiple_of && *bounds.multiple_of <= 0.0) {
        throw schema_error("'multipleOf' at '" + path + "' must be greater than zero");
    }
}

class tree_parser {
public:
    explicit tree_parser(size_t max_depth) : max_depth_(max_depth) {}

    field_ptr parse(const json& node, const std::string& path, size_t depth) {
        if (!node.is_object()) {
            throw schema_error("Schema node at '" + display(path) + "' must be an object");
        }
        if (depth > max_depth_) {
            throw schema_error("Schema nesting at '" + display(path) + "' exceeds maximum depth " +
                               std::to_string(max_depth_));
        }

        if (node.contains("$ref")) {
            return parse_reference(node, path, depth);
        }

        auto spec = std::make_shared<field_spec>();
        field_kind kind = read_kind(node, path, *spec);

        switch (kind) {
            case field_kind::string: {
                string_field s;
                s.min_length = read_count(node, "minLength", path);
                s.max_length = read_count(node, "maxLength", path);
                if (s.min_length && s.max_length && *s.min_length > *s.max_length) {
                    throw schema_error("'minLength' exceeds 'maxLength' at '" + path + "'");
                }
                if (auto it = node.find("pattern"); it != node.end()) {
                    if (!it->is_string()) {
                        throw schema_error("'pattern' at '" + path + "' must be a string");
                    }
                    s.pattern = it->get<std::string>();
                    try {
                        s.regex = std::make_shared<const std::regex>(*s.pattern, std::regex::ECMAScript);
                    } catch (const std::regex_error& e) {
                        throw schema_error("Invalid pattern '" + *s.pattern + "' at '" + path + "': " + e.what());
                    }
                }
                spec->shape = std::move(s);
                break;
            }
            case field_kind::number: {
                number_field n;
                read_bounds(node, path, n);
                spec->shape = n;
                break;
            }
            case field_kind::integer: {
                integer_field n;
                read_bounds(node, path, n);
                spec->shape = n;
                break;
            }
            case field_kind::boolean:
                spec->shape = boolean_field{};
                break;
            case field_kind::array: {
                array_field a;
                a.min_items = read_count(node, "minItems", path);
                a.max_items = read_count(node, "maxItems", path);
                if (a.min_items && a.max_items && *a.min_items > *a.max_items) {
                    throw schema_error("'minItems' exceeds 'maxItems' at '" + path + "'");
                }
                a.unique_items = read_flag(node, "uniqueItems", path, false);
                if (auto it = node.find("items"); it != node.end()) {
                    a.items = parse(*it, path + "[]", depth + 1);
                }
                spec->shape = std::move(a);
                break;
            }
            case field_kind::object:
                spec->shape = parse_object(node, path, depth);
                break;
            case field_kind::self_ref:
                break;  // read_kind never yields it
        }

        if (auto it = node.find("enum"); it != node.end()) {
            if (!it->is_array() || it->empty()) {
                throw schema_error("'enum' at '" + path + "' must be a non-empty array");
            }
            spec->enum_values.assign(it->begin(), it->end());
        }
        if (auto it = node.find("default"); it != node.end()) {
            spec->default_value = *it;
        }
        if (auto it = node.find("description"); it != node.end() && it->is_string()) {
            spec->description = it->get<std::string>();
        }
        spec->indexed = read_flag(node, "index", path, false);
        if (spec->indexed && (!spec->is_scalar() || depth != 1)) {
            throw schema_error("'index' at '" + path + "' is only supported on scalar root fields");
        }
        return spec;
    }

private:
    size_t max_depth_;

    static std::string display(const std::string& path) {
        return path.empty() ? "<root>" : path;
    }

    field_ptr parse_reference(const json& node, const std::string& path, size_t depth) {
        if (depth == 0) {
            throw schema_error("The schema root cannot be a self-reference");
        }
        const auto& target = node.at("$ref");
        if (!target.is_string() || target.get<std::string>() != "#") {
            throw schema_error("Unsupported $ref at '" + path + "': only \"#\" (the structure root) is allowed");
        }
        // The marker is terminal: it may only be annotated, never combined with structure.
        for (const auto& [key, _] : node.items()) {
            if (key != "$ref" && key != "description" && key != "title") {
                throw schema_error("Self-reference at '" + path + "' cannot be combined with '" + key + "'");
            }
        }
        auto spec = std::make_shared<field_spec>();
        spec->shape = self_reference{};
        if (auto it = node.find("description"); it != node.end() && it->is_string()) {
            spec->description = it->get<std::string>();
        }
        return spec;
    }

    field_kind read_kind(const json& node, const std::string& path, field_spec& spec) {
        auto it = node.find("type");
        if (it == node.end()) {
            throw schema_error("Schema node at '" + display(path) + "' has no 'type'");
        }
        if (it->is_string()) {
            return type_mapper::parse_kind(it->get<std::string>());
        }
        // ["<type>", "null"] declares a nullable field
        if (it->is_array()) {
            std::optional<field_kind> kind;
            bool saw_null = false;
            for (const auto& token : *it) {
                if (!token.is_string()) {
                    throw schema_error("'type' entries at '" + display(path) + "' must be strings");
                }
                auto name = token.get<std::string>();
                if (name == "null") {
                    saw_null = true;
                } else if (kind) {
                    throw schema_error("Union types are not supported at '" + display(path) + "'");
                } else {
                    kind = type_mapper::parse_kind(name);
                }
            }
            if (!kind) {
                throw schema_error("'type' at '" + display(path) + "' names no concrete type");
            }
            spec.nullable = saw_null;
            return *kind;
        }
        throw schema_error("'type' at '" + display(path) + "' must be a string or an array");
    }

    object_field parse_object(const json& node, const std::string& path, size_t depth) {
        object_field obj;
        obj.additional_properties = read_flag(node, "additionalProperties", path, false);

        if (auto it = node.find("properties"); it != node.end()) {
            if (!it->is_object()) {
                throw schema_error("'properties' at '" + display(path) + "' must be an object");
            }
            for (const auto& [name, child] : it->items()) {
                if (name.empty()) {
                    throw schema_error("Empty property name at '" + display(path) + "'");
                }
                obj.properties.push_back({name, parse(child, child_path(path, name), depth + 1)});
            }
        }

        if (auto it = node.find("required"); it != node.end()) {
            if (!it->is_array()) {
                throw schema_error("'required' at '" + display(path) + "' must be an array");
            }
            std::set<std::string> seen;
            for (const auto& entry : *it) {
                if (!entry.is_string()) {
                    throw schema_error("'required' entries at '" + display(path) + "' must be strings");
                }
                auto name = entry.get<std::string>();
                if (!seen.insert(name).second) {
                    throw schema_error("Field '" + name + "' listed twice in 'required' at '" + display(path) + "'");
                }
                if (!obj.find(name)) {
                    throw schema_error("Required field '" + name + "' is not declared at '" + display(path) + "'");
                }
                obj.required.push_back(std::move(name));
            }
        }
        return obj;
    }
};

void walk(const field_spec& spec, const std::string& path,
          const std::function<void(const std::string&, const field_spec&)>& fn) {
    fn(path, spec);
    if (spec.kind() == field_kind::object) {
        for (const auto& p : spec.as<object_field>().properties) {
            walk(*p.spec, child_path(path, p.name), fn);
        }
    } else if (spec.kind() == field_kind::array) {
        const auto& items = spec.as<array_field>().items;
        if (items) walk(*items, path + "[]", fn);
    }
}

} // namespace

field_ptr parse_field_tree(const json& schema, size_t max_depth) {
    if (!schema.is_object()) {
        throw schema_error("Schema document must be a JSON object");
    }
    tree_parser parser(max_depth);
    auto root = parser.parse(schema, "", 0);
    if (root->kind() != field_kind::object) {
        throw schema_error(std::string("Schema root must be of type 'object', got '") +
                           to_string(root->kind()) + "'");
    }
    LOG_DEBUG("schema", "Parsed schema with %zu root field(s)", root->as<object_field>().properties.size());
    return root;
}

void for_each_field(const field_spec& root,
                    const std::function<void(const std::string& path, const field_spec&)>& fn) {
    walk(root, "", fn);
}

} // namespace strata
