#include "strata/type_mapper.hpp"
#include "strata/errors.hpp"
#include <cctype>

namespace strata {

namespace {

physical_type make(column_type affinity, std::string sql, std::optional<size_t> length = std::nullopt) {
    physical_type t;
    t.affinity = affinity;
    t.sql = std::move(sql);
    t.length = length;
    return t;
}

} // namespace

physical_type physical_type::parse(const std::string& declared) {
    if (declared == "INTEGER") return make(column_type::integer, "INTEGER");
    if (declared == "BOOLEAN") return make(column_type::integer, "BOOLEAN");
    if (declared == "REAL") return make(column_type::real, "REAL");
    if (declared.rfind("VARCHAR(", 0) == 0 && declared.back() == ')') {
        auto digits = declared.substr(8, declared.size() - 9);
        bool numeric = !digits.empty();
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) numeric = false;
        }
        if (numeric) {
            return make(column_type::text, declared, static_cast<size_t>(std::stoull(digits)));
        }
    }
    return make(column_type::text, declared.empty() ? "TEXT" : declared);
}

field_kind type_mapper::parse_kind(const std::string& token) {
    if (token == "string") return field_kind::string;
    if (token == "number") return field_kind::number;
    if (token == "integer") return field_kind::integer;
    if (token == "boolean") return field_kind::boolean;
    if (token == "array") return field_kind::array;
    if (token == "object") return field_kind::object;
    throw unsupported_type_error(token);
}

std::optional<physical_type> type_mapper::map_type(const field_spec& spec) {
    switch (spec.kind()) {
        case field_kind::string: {
            const auto& s = spec.as<string_field>();
            if (s.max_length) {
                return make(column_type::text, "VARCHAR(" + std::to_string(*s.max_length) + ")", s.max_length);
            }
            return make(column_type::text, "TEXT");
        }
        case field_kind::number: return make(column_type::real, "REAL");
        case field_kind::integer: return make(column_type::integer, "INTEGER");
        case field_kind::boolean: return make(column_type::integer, "BOOLEAN");
        case field_kind::array:
        case field_kind::object:
        case field_kind::self_ref:
            return std::nullopt;
    }
    return std::nullopt;
}

conversion type_mapper::classify(const physical_type& from, const physical_type& to) {
    if (from == to) return conversion::identical;

    if (from.sql == "BOOLEAN" && (to.sql == "INTEGER" || to.sql == "REAL")) return conversion::widening;
    if (from.sql == "INTEGER" && to.sql == "REAL") return conversion::widening;

    if (from.affinity == column_type::text && to.affinity == column_type::text && from.length) {
        if (!to.length) return conversion::widening;             // VARCHAR(n) -> TEXT
        if (*to.length >= *from.length) return conversion::widening;
    }
    return conversion::incompatible;
}

std::vector<projection> type_mapper::projections(const object_field& root) {
    std::vector<projection> result;
    for (const auto& p : root.properties) {
        auto type = map_type(*p.spec);
        if (!type) continue;
        result.push_back({p.name, column_name(p.name), *type, p.spec->kind(), p.spec->indexed});
    }
    return result;
}

column_value_t type_mapper::project_value(const projection& p, const json* value) {
    if (!value || value->is_null()) return nullptr;
    switch (p.kind) {
        case field_kind::boolean:
            if (value->is_boolean()) return static_cast<int64_t>(value->get<bool>() ? 1 : 0);
            break;
        case field_kind::integer:
            if (value->is_number_integer()) return detail::to_column_value(*value);
            break;
        case field_kind::number:
            if (value->is_number()) return value->get<double>();
            break;
        case field_kind::string:
            if (value->is_string()) return value->get<std::string>();
            break;
        default:
            break;
    }
    return detail::to_column_value(*value);
}

std::string type_mapper::sanitize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        out += std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '_';
    }
    return out;
}

std::string type_mapper::table_name(const std::string& structure_name) {
    return "data_" + sanitize(structure_name);
}

std::string type_mapper::column_name(const std::string& field_path) {
    return "f_" + sanitize(field_path);
}

} // namespace strata
