#pragma once

#include "db.hpp"
#include "record_validator.hpp"
#include "structure.hpp"
#include "structure_locks.hpp"
#include "table_synchronizer.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace strata {

/// One applied schema version, as kept in _strata_migrations.
struct migration_record {
    std::string structure_name;
    int64_t version = 0;
    json changes;
    timestamp_t applied_at{};

    json to_json() const {
        return {
            {"structure", structure_name},
            {"version", version},
            {"changes", changes},
            {"applied_at", detail::to_seconds(applied_at)},
        };
    }
};

/// Owns the structure catalog. Every definition change runs under the
/// structure's exclusive lock and one exclusive transaction covering the
/// catalog row, the migration row and the table DDL.
class schema_registry {
public:
    schema_registry(database& db,
                    table_synchronizer& synchronizer,
                    structure_locks& locks,
                    const record_validator& validator);

    /// Creates the catalog tables if needed and reloads the cache from them.
    void load();

    structure_definition define(const std::string& name, const json& schema);
    structure_definition define(const std::string& name, const std::string& schema_text);
    structure_definition define(const std::string& name, const char* schema_text) {
        return define(name, std::string(schema_text));
    }

    /// Throws not_found_error.
    structure_definition get(const std::string& name) const;
    std::optional<structure_definition> find(const std::string& name) const;
    bool contains(const std::string& name) const;

    /// Applies a new schema version. With `expected_version`, fails with
    /// concurrency_error unless the structure is still at that version.
    structure_definition update(const std::string& name, const json& schema,
                                std::optional<int64_t> expected_version = std::nullopt);
    structure_definition update(const std::string& name, const std::string& schema_text,
                                std::optional<int64_t> expected_version = std::nullopt);
    structure_definition update(const std::string& name, const char* schema_text,
                                std::optional<int64_t> expected_version = std::nullopt) {
        return update(name, std::string(schema_text), expected_version);
    }

    std::vector<structure_definition> list() const;

    void drop(const std::string& name);

    /// Physically removes deprecated columns. The schema version is unchanged.
    std::vector<std::string> vacuum(const std::string& name);

    std::vector<migration_record> history(const std::string& name) const;

    /// Trims and checks a structure name. Throws schema_error.
    static std::string normalize_name(const std::string& name);

private:
    structure_definition build(const std::string& name, const json& schema) const;
    void check_defaults(const structure_definition& def) const;
    void record_migration(const structure_definition& def, const json& changes);
    void write_catalog_row(const structure_definition& def, bool insert);
    void cache_put(const structure_definition& def);

    database& db_;
    table_synchronizer& synchronizer_;
    structure_locks& locks_;
    const record_validator& validator_;

    mutable std::shared_mutex cache_mutex_;
    std::map<std::string, structure_definition> cache_;
};

} // namespace strata
