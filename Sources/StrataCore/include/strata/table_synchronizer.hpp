#pragma once

#include "db.hpp"
#include "structure.hpp"
#include <string>
#include <vector>

namespace strata {

/// Column-level difference between a structure's table and a target schema version.
struct migration_plan {
    struct widened_column {
        std::string column;
        physical_type from;
        physical_type to;
    };

    bool create_table = false;
    std::vector<projection> added;
    std::vector<std::string> deprecated;   // newly deprecated in this version
    std::vector<std::string> restored;     // previously deprecated, back in use
    std::vector<widened_column> widened;

    bool has_changes() const {
        return create_table || !added.empty() || !deprecated.empty() ||
               !restored.empty() || !widened.empty();
    }

    json to_json() const;
};

/// Brings the physical table of a structure in line with its schema.
/// DDL is issued on the caller's open transaction so a failed step rolls back
/// together with the registry change that triggered it.
class table_synchronizer {
public:
    explicit table_synchronizer(database& db) : db_(db) {}

    /// Diffs the live table against `target`. Fills target.deprecated_columns.
    /// Throws incompatible_migration_error before any change is made.
    migration_plan plan(structure_definition& target,
                        const std::vector<std::string>& previously_deprecated = {});

    void apply(const structure_definition& target, const migration_plan& plan);

    void drop_table(const structure_definition& def);

    /// Rebuilds the table without its deprecated columns. Returns the columns dropped.
    std::vector<std::string> vacuum(structure_definition& def);

    /// id, parent_id, document, created_at, updated_at
    static bool is_system_column(const std::string& column);

private:
    void create_table(const structure_definition& def,
                      const std::vector<column_info>& kept_columns = {});
    void rebuild_table(const structure_definition& def,
                       const std::vector<std::string>& drop_columns);
    void ensure_indexes(const structure_definition& def);

    database& db_;
};

} // namespace strata
