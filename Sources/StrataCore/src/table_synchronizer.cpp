#include "strata/table_synchronizer.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace strata {

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::string index_name(const std::string& table, const std::string& column) {
    return "idx_" + table + "_" + column;
}

} // namespace

json migration_plan::to_json() const {
    json added_json = json::array();
    for (const auto& p : added) {
        added_json.push_back({{"field", p.field}, {"column", p.column}, {"type", p.type.sql}});
    }
    json widened_json = json::array();
    for (const auto& w : widened) {
        widened_json.push_back({{"column", w.column}, {"from", w.from.sql}, {"to", w.to.sql}});
    }
    return {
        {"created", create_table},
        {"added", added_json},
        {"deprecated", deprecated},
        {"restored", restored},
        {"widened", widened_json},
        {"dropped", json::array()},
    };
}

bool table_synchronizer::is_system_column(const std::string& column) {
    return column == "id" || column == "parent_id" || column == "document" ||
           column == "created_at" || column == "updated_at";
}

migration_plan table_synchronizer::plan(structure_definition& target,
                                        const std::vector<std::string>& previously_deprecated) {
    migration_plan result;
    auto existing = db_.get_columns(target.table_name);

    if (existing.empty()) {
        result.create_table = true;
        result.added = target.projections;
        target.deprecated_columns.clear();
        return result;
    }

    std::unordered_map<std::string, const column_info*> by_name;
    for (const auto& c : existing) {
        by_name[c.name] = &c;
    }

    std::vector<std::string> problems;
    for (const auto& p : target.projections) {
        auto it = by_name.find(p.column);
        if (it == by_name.end()) {
            result.added.push_back(p);
            continue;
        }
        auto current = physical_type::parse(it->second->declared_type);
        switch (type_mapper::classify(current, p.type)) {
            case conversion::identical:
                break;
            case conversion::widening:
                result.widened.push_back({p.column, current, p.type});
                break;
            case conversion::incompatible:
                problems.push_back("'" + p.field + "' " + current.sql + " -> " + p.type.sql);
                break;
        }
        if (contains(previously_deprecated, p.column)) {
            result.restored.push_back(p.column);
        }
    }

    if (!problems.empty()) {
        std::string msg = "Incompatible change to structure '" + target.name + "': ";
        for (size_t i = 0; i < problems.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += problems[i];
        }
        LOG_WARN("sync", "%s", msg.c_str());
        throw incompatible_migration_error(msg);
    }

    target.deprecated_columns.clear();
    for (const auto& c : existing) {
        if (is_system_column(c.name)) continue;
        bool active = std::any_of(target.projections.begin(), target.projections.end(),
                                  [&](const projection& p) { return p.column == c.name; });
        if (active) continue;
        target.deprecated_columns.push_back(c.name);
        if (!contains(previously_deprecated, c.name)) {
            result.deprecated.push_back(c.name);
        }
    }
    return result;
}

void table_synchronizer::apply(const structure_definition& target, const migration_plan& plan) {
    if (plan.create_table) {
        create_table(target);
        LOG_INFO("sync", "Created table %s with %zu projection column(s)",
                 target.table_name.c_str(), target.projections.size());
        return;
    }

    for (const auto& p : plan.added) {
        db_.execute("ALTER TABLE " + target.table_name + " ADD COLUMN " + p.column + " " + p.type.sql);
        LOG_DEBUG("sync", "Added column %s.%s %s", target.table_name.c_str(), p.column.c_str(), p.type.sql.c_str());
    }

    // SQLite cannot retype a column in place.
    if (!plan.widened.empty()) {
        rebuild_table(target, {});
        LOG_INFO("sync", "Rebuilt %s to widen %zu column(s)", target.table_name.c_str(), plan.widened.size());
    } else {
        ensure_indexes(target);
    }
}

void table_synchronizer::create_table(const structure_definition& def,
                                      const std::vector<column_info>& kept_columns) {
    std::ostringstream sql;
    sql << "CREATE TABLE " << def.table_name << " (";
    sql << "id INTEGER PRIMARY KEY AUTOINCREMENT, ";
    sql << "parent_id INTEGER, ";
    sql << "document TEXT NOT NULL, ";
    sql << "created_at REAL NOT NULL, ";
    sql << "updated_at REAL NOT NULL";
    for (const auto& p : def.projections) {
        sql << ", " << p.column << " " << p.type.sql;
    }
    for (const auto& c : kept_columns) {
        sql << ", " << c.name << " " << (c.declared_type.empty() ? "TEXT" : c.declared_type);
    }
    sql << ")";
    db_.execute(sql.str());
    ensure_indexes(def);
}

void table_synchronizer::ensure_indexes(const structure_definition& def) {
    db_.execute("CREATE INDEX IF NOT EXISTS " + index_name(def.table_name, "parent_id") +
                " ON " + def.table_name + "(parent_id)");
    for (const auto& p : def.projections) {
        if (!p.indexed) continue;
        db_.execute("CREATE INDEX IF NOT EXISTS " + index_name(def.table_name, p.column) +
                    " ON " + def.table_name + "(" + p.column + ")");
    }
}

void table_synchronizer::rebuild_table(const structure_definition& def,
                                       const std::vector<std::string>& drop_columns) {
    const std::string& table = def.table_name;
    std::string tmp = table + "__old";
    auto existing = db_.get_columns(table);

    // Index names survive the rename and would collide with the new table's.
    auto indexes = db_.query("SELECT name FROM sqlite_master WHERE type='index' AND tbl_name=? AND sql IS NOT NULL",
                             {table});
    for (const auto& row : indexes) {
        db_.execute("DROP INDEX IF EXISTS " + detail::as_string(row.at("name")));
    }

    std::optional<int64_t> sequence;
    auto seq_rows = db_.query("SELECT seq FROM sqlite_sequence WHERE name = ?", {table});
    if (!seq_rows.empty()) {
        sequence = detail::as_int(seq_rows.front().at("seq"));
    }

    db_.execute("ALTER TABLE " + table + " RENAME TO " + tmp);

    std::vector<column_info> kept;
    for (const auto& c : existing) {
        if (is_system_column(c.name) || def.find_projection_column(c.name)) continue;
        if (contains(drop_columns, c.name)) continue;
        kept.push_back(c);
    }
    create_table(def, kept);

    std::string columns = "id, parent_id, document, created_at, updated_at";
    for (const auto& p : def.projections) {
        bool present = std::any_of(existing.begin(), existing.end(),
                                   [&](const column_info& c) { return c.name == p.column; });
        if (present) columns += ", " + p.column;
    }
    for (const auto& c : kept) {
        columns += ", " + c.name;
    }
    db_.execute("INSERT INTO " + table + " (" + columns + ") SELECT " + columns + " FROM " + tmp);
    db_.execute("DROP TABLE " + tmp);

    // Keep AUTOINCREMENT from reissuing ids that were deleted before the rebuild.
    if (sequence) {
        db_.execute("DELETE FROM sqlite_sequence WHERE name = ?", {table});
        db_.execute("INSERT INTO sqlite_sequence (name, seq) VALUES (?, ?)", {table, *sequence});
    }
}

void table_synchronizer::drop_table(const structure_definition& def) {
    db_.execute("DROP TABLE IF EXISTS " + def.table_name);
    LOG_INFO("sync", "Dropped table %s", def.table_name.c_str());
}

std::vector<std::string> table_synchronizer::vacuum(structure_definition& def) {
    auto dropped = def.deprecated_columns;
    if (dropped.empty()) return dropped;
    rebuild_table(def, dropped);
    def.deprecated_columns.clear();
    LOG_INFO("sync", "Vacuumed %zu deprecated column(s) from %s", dropped.size(), def.table_name.c_str());
    return dropped;
}

} // namespace strata
