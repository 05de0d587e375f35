#pragma once

#include "field_spec.hpp"
#include "type_mapper.hpp"
#include <string>
#include <vector>

namespace strata {

/// A named, versioned schema and the physical table that backs it.
struct structure_definition {
    std::string name;
    std::string table_name;
    json schema;                                // document as submitted
    field_ptr root;                             // parsed tree, always an object
    int64_t version = 0;
    std::vector<projection> projections;        // scalar root fields of this version
    std::vector<std::string> deprecated_columns;
    timestamp_t created_at{};
    timestamp_t updated_at{};

    const object_field& root_object() const { return root->as<object_field>(); }

    const projection* find_projection(const std::string& field) const {
        for (const auto& p : projections) {
            if (p.field == field) return &p;
        }
        return nullptr;
    }

    const projection* find_projection_column(const std::string& column) const {
        for (const auto& p : projections) {
            if (p.column == column) return &p;
        }
        return nullptr;
    }

    bool is_deprecated(const std::string& column) const {
        for (const auto& c : deprecated_columns) {
            if (c == column) return true;
        }
        return false;
    }

    json to_json() const {
        return {
            {"name", name},
            {"table_name", table_name},
            {"schema", schema},
            {"version", version},
            {"deprecated_columns", deprecated_columns},
            {"created_at", detail::to_seconds(created_at)},
            {"updated_at", detail::to_seconds(updated_at)},
        };
    }
};

} // namespace strata
