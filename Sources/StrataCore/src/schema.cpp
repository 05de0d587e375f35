#include "strata/schema.hpp"
#include "strata/log.hpp"
#include <cctype>
#include <unordered_map>

namespace strata {

namespace {

constexpr size_t max_name_length = 64;

bool is_reserved_field(const std::string& name) {
    return name == "id" || name == "parent_id" || name == "created_at" || name == "updated_at";
}

json deprecated_to_json(const std::vector<std::string>& columns) {
    json out = json::array();
    for (const auto& c : columns) out.push_back(c);
    return out;
}

} // namespace

schema_registry::schema_registry(database& db,
                                 table_synchronizer& synchronizer,
                                 structure_locks& locks,
                                 const record_validator& validator)
    : db_(db), synchronizer_(synchronizer), locks_(locks), validator_(validator) {}

std::string schema_registry::normalize_name(const std::string& name) {
    auto begin = name.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        throw schema_error("Structure name must not be empty");
    }
    auto end = name.find_last_not_of(" \t\r\n");
    std::string trimmed = name.substr(begin, end - begin + 1);

    if (trimmed.size() > max_name_length) {
        throw schema_error("Structure name '" + trimmed + "' is longer than " +
                           std::to_string(max_name_length) + " characters");
    }
    if (!std::isalpha(static_cast<unsigned char>(trimmed[0]))) {
        throw schema_error("Structure name '" + trimmed + "' must start with a letter");
    }
    for (char c : trimmed) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            throw schema_error("Structure name '" + trimmed + "' may only contain letters, digits, '_' and '-'");
        }
    }
    return trimmed;
}

void schema_registry::load() {
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS _strata_structures (
            name TEXT PRIMARY KEY,
            table_name TEXT NOT NULL UNIQUE,
            schema_json TEXT NOT NULL,
            version INTEGER NOT NULL,
            deprecated_columns TEXT NOT NULL DEFAULT '[]',
            created_at REAL NOT NULL,
            updated_at REAL NOT NULL
        )
    )");
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS _strata_migrations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            structure_name TEXT NOT NULL,
            version INTEGER NOT NULL,
            migration TEXT NOT NULL,
            applied_at REAL NOT NULL
        )
    )");
    db_.execute("CREATE INDEX IF NOT EXISTS idx_strata_migrations_structure "
                "ON _strata_migrations(structure_name, version)");

    auto rows = db_.query("SELECT name, schema_json, version, deprecated_columns, created_at, updated_at "
                          "FROM _strata_structures ORDER BY name");

    std::map<std::string, structure_definition> loaded;
    for (const auto& row : rows) {
        auto name = detail::as_string(row.at("name"));
        try {
            auto def = build(name, json::parse(detail::as_string(row.at("schema_json"))));
            def.version = detail::as_int(row.at("version")).value_or(1);
            for (const auto& c : json::parse(detail::as_string(row.at("deprecated_columns")))) {
                def.deprecated_columns.push_back(c.get<std::string>());
            }
            def.created_at = detail::to_timestamp(row.at("created_at"));
            def.updated_at = detail::to_timestamp(row.at("updated_at"));
            loaded.emplace(name, std::move(def));
        } catch (const schema_error& e) {
            // A stored schema can outgrow a lower max_depth; leave it unloaded.
            LOG_ERROR("schema", "Skipping structure '%s': %s", name.c_str(), e.what());
        } catch (const json::exception& e) {
            LOG_ERROR("schema", "Skipping structure '%s': corrupt catalog row: %s", name.c_str(), e.what());
        }
    }

    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    cache_ = std::move(loaded);
    LOG_INFO("schema", "Loaded %zu structure(s)", cache_.size());
}

structure_definition schema_registry::build(const std::string& name, const json& schema) const {
    structure_definition def;
    def.name = name;
    def.table_name = type_mapper::table_name(name);
    def.schema = schema;
    def.root = parse_field_tree(schema, validator_.max_depth());

    std::unordered_map<std::string, std::string> columns;
    for (const auto& prop : def.root_object().properties) {
        if (is_reserved_field(prop.name)) {
            throw schema_error("Field name '" + prop.name + "' is reserved");
        }
        auto column = type_mapper::column_name(prop.name);
        auto [it, inserted] = columns.emplace(column, prop.name);
        if (!inserted) {
            throw schema_error("Fields '" + it->second + "' and '" + prop.name +
                               "' map to the same column " + column);
        }
    }
    def.projections = type_mapper::projections(def.root_object());
    check_defaults(def);
    return def;
}

void schema_registry::check_defaults(const structure_definition& def) const {
    std::vector<violation> problems;
    for_each_field(*def.root, [&](const std::string& path, const field_spec& spec) {
        if (!spec.default_value) return;
        validator_.check(*def.root, spec, *spec.default_value, path, problems);
    });
    if (!problems.empty()) {
        const auto& first = problems.front();
        throw schema_error("Default for '" + first.field + "' does not satisfy its own field: " + first.message);
    }
}

void schema_registry::write_catalog_row(const structure_definition& def, bool insert) {
    auto schema_text = def.schema.dump();
    auto deprecated = deprecated_to_json(def.deprecated_columns).dump();
    if (insert) {
        db_.execute("INSERT INTO _strata_structures "
                    "(name, table_name, schema_json, version, deprecated_columns, created_at, updated_at) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?)",
                    {def.name, def.table_name, schema_text, def.version, deprecated,
                     detail::to_column_value(def.created_at), detail::to_column_value(def.updated_at)});
    } else {
        db_.execute("UPDATE _strata_structures SET schema_json = ?, version = ?, deprecated_columns = ?, "
                    "updated_at = ? WHERE name = ?",
                    {schema_text, def.version, deprecated, detail::to_column_value(def.updated_at), def.name});
    }
}

void schema_registry::record_migration(const structure_definition& def, const json& changes) {
    db_.execute("INSERT INTO _strata_migrations (structure_name, version, migration, applied_at) "
                "VALUES (?, ?, ?, ?)",
                {def.name, def.version, changes.dump(), detail::to_column_value(detail::now())});
}

void schema_registry::cache_put(const structure_definition& def) {
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    cache_[def.name] = def;
}

structure_definition schema_registry::define(const std::string& name, const std::string& schema_text) {
    return define(name, parse_schema_text(schema_text));
}

structure_definition schema_registry::define(const std::string& raw_name, const json& schema) {
    auto name = normalize_name(raw_name);
    auto lock = locks_.exclusive(name);

    if (contains(name)) {
        throw duplicate_structure_error(name);
    }
    auto def = build(name, schema);
    {
        std::shared_lock<std::shared_mutex> cache_lock(cache_mutex_);
        for (const auto& [other, existing] : cache_) {
            if (existing.table_name == def.table_name) {
                LOG_WARN("schema", "'%s' maps to the table of '%s'", name.c_str(), other.c_str());
                throw duplicate_structure_error(name);
            }
        }
    }

    def.version = 1;
    def.created_at = def.updated_at = detail::now();

    transaction tx(db_, true);
    // A catalog row the cache lacks was skipped by load(); its table holds live data.
    auto stored = db_.query("SELECT name FROM _strata_structures WHERE name = ? OR table_name = ?",
                            {def.name, def.table_name});
    if (!stored.empty()) {
        LOG_WARN("schema", "'%s' conflicts with stored structure '%s' that failed to load",
                 name.c_str(), detail::as_string(stored.front().at("name")).c_str());
        throw duplicate_structure_error(name);
    }
    // An uncatalogued table with this name must not leak old rows in.
    if (db_.table_exists(def.table_name)) {
        LOG_WARN("schema", "Replacing uncatalogued table %s", def.table_name.c_str());
        synchronizer_.drop_table(def);
    }
    auto plan = synchronizer_.plan(def);
    synchronizer_.apply(def, plan);
    write_catalog_row(def, true);
    record_migration(def, plan.to_json());
    tx.commit();

    cache_put(def);
    LOG_INFO("schema", "Defined structure '%s' (%zu projection column(s))", name.c_str(), def.projections.size());
    return def;
}

structure_definition schema_registry::update(const std::string& name, const std::string& schema_text,
                                             std::optional<int64_t> expected_version) {
    return update(name, parse_schema_text(schema_text), expected_version);
}

structure_definition schema_registry::update(const std::string& raw_name, const json& schema,
                                             std::optional<int64_t> expected_version) {
    auto name = normalize_name(raw_name);
    auto lock = locks_.exclusive(name);

    auto current = get(name);
    if (expected_version && *expected_version != current.version) {
        throw concurrency_error("Structure '" + name + "' is at version " + std::to_string(current.version) +
                                ", expected " + std::to_string(*expected_version));
    }

    auto next = build(name, schema);
    next.version = current.version + 1;
    next.created_at = current.created_at;
    next.updated_at = detail::now();

    transaction tx(db_, true);
    auto plan = synchronizer_.plan(next, current.deprecated_columns);
    synchronizer_.apply(next, plan);
    write_catalog_row(next, false);
    record_migration(next, plan.to_json());
    tx.commit();

    cache_put(next);
    LOG_INFO("schema", "Updated structure '%s' to version %lld (+%zu, -%zu, ~%zu)",
             name.c_str(), static_cast<long long>(next.version),
             plan.added.size(), plan.deprecated.size(), plan.widened.size());
    return next;
}

structure_definition schema_registry::get(const std::string& name) const {
    auto def = find(name);
    if (!def) {
        throw not_found_error("Structure '" + name + "' not found");
    }
    return *def;
}

std::optional<structure_definition> schema_registry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = cache_.find(name);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool schema_registry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return cache_.count(name) > 0;
}

std::vector<structure_definition> schema_registry::list() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    std::vector<structure_definition> result;
    result.reserve(cache_.size());
    for (const auto& [_, def] : cache_) {
        result.push_back(def);
    }
    return result;
}

void schema_registry::drop(const std::string& raw_name) {
    auto name = normalize_name(raw_name);
    auto lock = locks_.exclusive(name);
    auto def = get(name);

    transaction tx(db_, true);
    synchronizer_.drop_table(def);
    db_.execute("DELETE FROM _strata_structures WHERE name = ?", {name});
    db_.execute("DELETE FROM _strata_migrations WHERE structure_name = ?", {name});
    tx.commit();

    std::unique_lock<std::shared_mutex> cache_lock(cache_mutex_);
    cache_.erase(name);
    LOG_INFO("schema", "Dropped structure '%s'", name.c_str());
}

std::vector<std::string> schema_registry::vacuum(const std::string& raw_name) {
    auto name = normalize_name(raw_name);
    auto lock = locks_.exclusive(name);
    auto def = get(name);
    if (def.deprecated_columns.empty()) {
        return {};
    }

    transaction tx(db_, true);
    auto dropped = synchronizer_.vacuum(def);
    def.updated_at = detail::now();
    write_catalog_row(def, false);
    migration_plan none;
    auto changes = none.to_json();
    changes["dropped"] = dropped;
    record_migration(def, changes);
    tx.commit();

    cache_put(def);
    return dropped;
}

std::vector<migration_record> schema_registry::history(const std::string& name) const {
    auto rows = db_.query("SELECT structure_name, version, migration, applied_at FROM _strata_migrations "
                          "WHERE structure_name = ? ORDER BY id", {name});
    if (rows.empty() && !contains(name)) {
        throw not_found_error("Structure '" + name + "' not found");
    }
    std::vector<migration_record> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        migration_record m;
        m.structure_name = detail::as_string(row.at("structure_name"));
        m.version = detail::as_int(row.at("version")).value_or(0);
        m.changes = json::parse(detail::as_string(row.at("migration")));
        m.applied_at = detail::to_timestamp(row.at("applied_at"));
        result.push_back(std::move(m));
    }
    return result;
}

} // namespace strata
