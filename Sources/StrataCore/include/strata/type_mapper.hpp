#pragma once

#include "field_spec.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strata {

// Physical column type of a projection column.
struct physical_type {
    column_type affinity = column_type::text;
    std::string sql;                    // declared type, e.g. "VARCHAR(32)"
    std::optional<size_t> length;       // VARCHAR bound

    /// Recovers a physical_type from a declared type reported by PRAGMA table_info.
    static physical_type parse(const std::string& declared);

    bool operator==(const physical_type& other) const { return sql == other.sql; }
    bool operator!=(const physical_type& other) const { return sql != other.sql; }
};

enum class conversion {
    identical,
    widening,
    incompatible
};

// One scalar root field mirrored into its own column.
struct projection {
    std::string field;
    std::string column;
    physical_type type;
    field_kind kind;
    bool indexed = false;
};

class type_mapper {
public:
    /// Resolves a schema `type` token. Throws unsupported_type_error.
    static field_kind parse_kind(const std::string& token);

    /// Column type for a scalar field; nullopt for arrays, objects and self-references,
    /// which live only in the document column.
    static std::optional<physical_type> map_type(const field_spec& spec);

    /// Whether a column of type `from` may be retyped to `to` without loss.
    static conversion classify(const physical_type& from, const physical_type& to);

    /// Projection columns for the scalar fields of a root object, in declaration order.
    static std::vector<projection> projections(const object_field& root);

    /// Value written to a projection column for a document value.
    static column_value_t project_value(const projection& p, const json* value);

    static std::string sanitize(const std::string& name);
    static std::string table_name(const std::string& structure_name);
    static std::string column_name(const std::string& field_path);
};

} // namespace strata
