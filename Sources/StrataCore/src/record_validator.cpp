#include "strata/record_validator.hpp"
#include "strata/log.hpp"
#include <cmath>
#include <limits>
#include <regex>

namespace strata {

namespace {

constexpr double kInt64Min = -9223372036854775808.0;   // -2^63
constexpr double kInt64Limit = 9223372036854775808.0;  // 2^63, first value past INT64_MAX

std::string child_path(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "." + name;
}

std::string index_path(const std::string& parent, size_t i) {
    return parent + "[" + std::to_string(i) + "]";
}

// Length in code points, as JSON Schema counts it.
size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string format_number(double v) {
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        return std::to_string(static_cast<int64_t>(v));
    }
    return json(v).dump();
}

void add(std::vector<violation>& out, const std::string& field, const char* rule, std::string message) {
    out.push_back({field, rule, std::move(message)});
}

} // namespace

json record_validator::validate(const structure_definition& def, const json& candidate) const {
    std::vector<violation> violations;
    json normalized = check(*def.root, *def.root, candidate, "", violations, 0);
    if (!violations.empty()) {
        LOG_DEBUG("validator", "Document for '%s' rejected with %zu violation(s)",
                  def.name.c_str(), violations.size());
        throw validation_error(std::move(violations));
    }
    return normalized;
}

json record_validator::check(const field_spec& root, const field_spec& spec, const json& value,
                             const std::string& path, std::vector<violation>& out,
                             size_t depth) const {
    if (depth > max_depth_) {
        throw depth_exceeded_error(path.empty() ? "<root>" : path, max_depth_);
    }

    if (spec.kind() == field_kind::self_ref) {
        return check(root, root, value, path, out, depth);
    }

    if (value.is_null()) {
        if (!spec.nullable) {
            add(out, path, "type", std::string("expected ") + to_string(spec.kind()) + ", got null");
        }
        return value;
    }

    if (!spec.enum_values.empty()) {
        bool member = false;
        for (const auto& allowed : spec.enum_values) {
            if (allowed == value) { member = true; break; }
        }
        if (!member) {
            add(out, path, "enum", "value " + value.dump() + " is not one of the allowed values");
        }
    }

    switch (spec.kind()) {
        case field_kind::string:
            return check_string(spec, value, path, out);
        case field_kind::number:
        case field_kind::integer:
            return check_numeric(spec, value, path, out);
        case field_kind::boolean:
            if (!value.is_boolean()) {
                add(out, path, "type", std::string("expected boolean, got ") + value.type_name());
            }
            return value;
        case field_kind::array:
            return check_array(root, spec, value, path, out, depth);
        case field_kind::object:
            return check_object(root, spec.as<object_field>(), value, path, out, depth);
        case field_kind::self_ref:
            break;
    }
    return value;
}

json record_validator::check_string(const field_spec& spec, const json& value, const std::string& path,
                                    std::vector<violation>& out) const {
    if (!value.is_string()) {
        add(out, path, "type", std::string("expected string, got ") + value.type_name());
        return value;
    }
    const auto& s = spec.as<string_field>();
    const auto& text = value.get_ref<const std::string&>();
    size_t length = utf8_length(text);

    if (s.min_length && length < *s.min_length) {
        add(out, path, "minLength", "length " + std::to_string(length) + " is shorter than " +
                                    std::to_string(*s.min_length));
    }
    if (s.max_length && length > *s.max_length) {
        add(out, path, "maxLength", "length " + std::to_string(length) + " is longer than " +
                                    std::to_string(*s.max_length));
    }
    if (s.regex) {
        // std::regex recurses per input character; long subjects would exhaust the stack.
        if (text.size() > max_pattern_subject_) {
            add(out, path, "pattern", "length " + std::to_string(text.size()) +
                                      " bytes is too long to match against pattern '" + *s.pattern +
                                      "' (limit " + std::to_string(max_pattern_subject_) + ")");
        } else if (!std::regex_search(text, *s.regex)) {
            add(out, path, "pattern", "does not match pattern '" + *s.pattern + "'");
        }
    }
    return value;
}

json record_validator::check_numeric(const field_spec& spec, const json& value, const std::string& path,
                                     std::vector<violation>& out) const {
    bool integral = spec.kind() == field_kind::integer;
    if (!value.is_number()) {
        add(out, path, "type", std::string("expected ") + to_string(spec.kind()) + ", got " + value.type_name());
        return value;
    }

    json normalized = value;
    double v = value.get<double>();
    if (integral) {
        // Integers are stored as signed 64-bit; anything outside that range
        // cannot be projected faithfully.
        if (value.is_number_unsigned() &&
            value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            add(out, path, "range", value.dump() + " is outside the 64-bit integer range");
            return value;
        }
        if (value.is_number_float()) {
            if (std::floor(v) != v || !std::isfinite(v)) {
                add(out, path, "type", "expected integer, got " + format_number(v));
                return value;
            }
            if (v < kInt64Min || v >= kInt64Limit) {
                add(out, path, "range", format_number(v) + " is outside the 64-bit integer range");
                return value;
            }
            normalized = static_cast<int64_t>(v);
        }
    }

    const numeric_bounds& b = integral
        ? static_cast<const numeric_bounds&>(spec.as<integer_field>())
        : static_cast<const numeric_bounds&>(spec.as<number_field>());

    if (b.minimum && v < *b.minimum) {
        add(out, path, "minimum", format_number(v) + " is less than the minimum " + format_number(*b.minimum));
    }
    if (b.maximum && v > *b.maximum) {
        add(out, path, "maximum", format_number(v) + " is greater than the maximum " + format_number(*b.maximum));
    }
    if (b.exclusive_minimum && v <= *b.exclusive_minimum) {
        add(out, path, "exclusiveMinimum", format_number(v) + " must be greater than " +
                                           format_number(*b.exclusive_minimum));
    }
    if (b.exclusive_maximum && v >= *b.exclusive_maximum) {
        add(out, path, "exclusiveMaximum", format_number(v) + " must be less than " +
                                           format_number(*b.exclusive_maximum));
    }
    if (b.multiple_of) {
        double quotient = v / *b.multiple_of;
        if (std::fabs(quotient - std::round(quotient)) > 1e-9) {
            add(out, path, "multipleOf", format_number(v) + " is not a multiple of " + format_number(*b.multiple_of));
        }
    }
    return normalized;
}

json record_validator::check_array(const field_spec& root, const field_spec& spec, const json& value,
                                   const std::string& path, std::vector<violation>& out,
                                   size_t depth) const {
    if (!value.is_array()) {
        add(out, path, "type", std::string("expected array, got ") + value.type_name());
        return value;
    }
    const auto& a = spec.as<array_field>();

    if (a.min_items && value.size() < *a.min_items) {
        add(out, path, "minItems", "has " + std::to_string(value.size()) + " item(s), fewer than " +
                                   std::to_string(*a.min_items));
    }
    if (a.max_items && value.size() > *a.max_items) {
        add(out, path, "maxItems", "has " + std::to_string(value.size()) + " item(s), more than " +
                                   std::to_string(*a.max_items));
    }

    json normalized = json::array();
    for (size_t i = 0; i < value.size(); ++i) {
        if (a.items) {
            normalized.push_back(check(root, *a.items, value[i], index_path(path, i), out, depth + 1));
        } else {
            normalized.push_back(value[i]);
        }
    }

    if (a.unique_items) {
        for (size_t i = 0; i < normalized.size(); ++i) {
            for (size_t j = i + 1; j < normalized.size(); ++j) {
                if (normalized[i] == normalized[j]) {
                    add(out, index_path(path, j), "uniqueItems",
                        "duplicates item " + std::to_string(i));
                }
            }
        }
    }
    return normalized;
}

json record_validator::check_object(const field_spec& root, const object_field& obj, const json& value,
                                    const std::string& path, std::vector<violation>& out,
                                    size_t depth) const {
    if (!value.is_object()) {
        add(out, path, "type", std::string("expected object, got ") + value.type_name());
        return value;
    }

    json normalized = json::object();
    for (const auto& prop : obj.properties) {
        auto field = child_path(path, prop.name);
        auto it = value.find(prop.name);
        if (it != value.end()) {
            normalized[prop.name] = check(root, *prop.spec, *it, field, out, depth + 1);
        } else if (obj.is_required(prop.name)) {
            add(out, field, "required", "required field '" + prop.name + "' is missing");
        } else if (prop.spec->default_value) {
            normalized[prop.name] = *prop.spec->default_value;
        }
    }

    for (const auto& [key, child] : value.items()) {
        if (obj.find(key)) continue;
        if (obj.additional_properties) {
            normalized[key] = child;
        } else {
            add(out, child_path(path, key), "additionalProperties",
                "field '" + key + "' is not declared in the schema");
        }
    }
    return normalized;
}

} // namespace strata
