#include "strata/record_store.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace strata {

namespace {

constexpr const char* record_columns = "id, parent_id, document, created_at, updated_at";

bool is_system_field(const std::string& field) {
    return field == "id" || field == "parent_id" || field == "created_at" || field == "updated_at";
}

std::string escape_like(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '%' || c == '_') out += '\\';
        out += c;
    }
    return out;
}

record to_record(const database::row_t& row) {
    record r;
    r.id = detail::as_int(row.at("id")).value_or(0);
    r.parent_id = detail::as_int(row.at("parent_id"));
    try {
        r.document = json::parse(detail::as_string(row.at("document")));
    } catch (const json::parse_error& e) {
        throw db_error("Stored document for record " + std::to_string(r.id) + " is corrupt: " + e.what());
    }
    r.created_at = detail::to_timestamp(row.at("created_at"));
    r.updated_at = detail::to_timestamp(row.at("updated_at"));
    return r;
}

change_event make_event(const std::string& structure, change_kind kind, const record& r) {
    change_event e;
    e.structure_name = structure;
    e.kind = kind;
    e.record_id = r.id;
    e.payload = r.to_json();
    e.timestamp = detail::now();
    return e;
}

[[noreturn]] void bad_filter(const std::string& field, const std::string& message) {
    throw validation_error({{field, "filter", message}});
}

} // namespace

// MARK: - value types

json record::to_json() const {
    json out = document.is_object() ? document : json::object();
    out["id"] = id;
    out["parent_id"] = parent_id ? json(*parent_id) : json(nullptr);
    out["created_at"] = detail::to_seconds(created_at);
    out["updated_at"] = detail::to_seconds(updated_at);
    return out;
}

const char* to_string(filter_op op) noexcept {
    switch (op) {
        case filter_op::eq: return "eq";
        case filter_op::ne: return "ne";
        case filter_op::lt: return "lt";
        case filter_op::lte: return "lte";
        case filter_op::gt: return "gt";
        case filter_op::gte: return "gte";
        case filter_op::contains: return "contains";
        case filter_op::starts_with: return "starts_with";
        case filter_op::in: return "in";
        case filter_op::is_null: return "is_null";
        case filter_op::not_null: return "not_null";
    }
    return "eq";
}

std::optional<filter_op> parse_filter_op(const std::string& token) {
    static const std::pair<const char*, filter_op> table[] = {
        {"eq", filter_op::eq}, {"ne", filter_op::ne},
        {"lt", filter_op::lt}, {"lte", filter_op::lte},
        {"gt", filter_op::gt}, {"gte", filter_op::gte},
        {"contains", filter_op::contains}, {"starts_with", filter_op::starts_with},
        {"in", filter_op::in}, {"is_null", filter_op::is_null}, {"not_null", filter_op::not_null},
    };
    for (const auto& [name, op] : table) {
        if (token == name) return op;
    }
    return std::nullopt;
}

filter_condition filter_condition::from_json(const json& j) {
    if (!j.is_object()) bad_filter("", "filter condition must be an object");
    auto field = j.find("field");
    if (field == j.end() || !field->is_string()) bad_filter("", "filter condition needs a string 'field'");

    filter_condition c;
    c.field = field->get<std::string>();
    if (auto op = j.find("operator"); op != j.end()) {
        if (!op->is_string()) bad_filter(c.field, "'operator' must be a string");
        auto parsed = parse_filter_op(op->get<std::string>());
        if (!parsed) bad_filter(c.field, "unknown operator '" + op->get<std::string>() + "'");
        c.op = *parsed;
    }
    if (auto value = j.find("value"); value != j.end()) {
        c.value = *value;
    }
    return c;
}

json field_statistics::to_json() const {
    return {
        {"field", field},
        {"total", total},
        {"non_null", non_null},
        {"null_count", null_count},
        {"min", min},
        {"max", max},
        {"avg", avg ? json(*avg) : json(nullptr)},
    };
}

// MARK: - record_sequence

void record_sequence::iterator::fetch() {
    auto& opts = seq_->options_;
    list_options page_opts = opts;
    page_opts.offset = opts.offset + consumed_;
    size_t want = seq_->page_size_;
    if (opts.limit) {
        if (consumed_ >= *opts.limit) want = 0;
        else want = std::min(want, *opts.limit - consumed_);
    }
    if (want > 0) {
        page_opts.limit = want;
        page_ = seq_->store_->list(seq_->structure_, page_opts);
    } else {
        page_.clear();
    }
    index_ = 0;
    if (page_.empty()) {
        seq_ = nullptr;
    }
}

record_sequence::iterator& record_sequence::iterator::operator++() {
    if (!seq_) return *this;
    if (++index_ < page_.size()) return *this;

    consumed_ += page_.size();
    if (page_.size() < seq_->page_size_) {
        page_.clear();
        index_ = 0;
        seq_ = nullptr;
        return *this;
    }
    fetch();
    return *this;
}

// MARK: - record_store

record_store::record_store(database& db,
                           schema_registry& registry,
                           structure_locks& locks,
                           const record_validator& validator,
                           change_notifier& notifier,
                           size_t stream_page_size,
                           database* reader)
    : db_(db), reader_(reader), registry_(registry), locks_(locks), validator_(validator),
      notifier_(notifier), page_size_(stream_page_size == 0 ? 1 : stream_page_size) {}

record_store::prepared record_store::prepare(const structure_definition& def, const json& input,
                                             const std::string& prefix,
                                             std::vector<violation>& violations) const {
    prepared out;
    if (!input.is_object()) {
        violations.push_back({prefix, "type", std::string("expected object, got ") + input.type_name()});
        return out;
    }

    auto field = [&](const char* name) {
        return prefix.empty() ? std::string(name) : prefix + "." + name;
    };

    json body = input;
    if (auto it = body.find("parent_id"); it != body.end()) {
        out.parent_given = true;
        if (it->is_number_integer() && it->get<int64_t>() > 0) {
            out.parent_id = it->get<int64_t>();
        } else if (!it->is_null()) {
            violations.push_back({field("parent_id"), "type", "must be a record id or null"});
        }
        body.erase(it);
    }
    if (body.contains("id")) {
        violations.push_back({field("id"), "readOnly", "id is assigned by the store"});
        body.erase("id");
    }
    // Timestamps are managed here; echoes of a previous read are ignored.
    body.erase("created_at");
    body.erase("updated_at");

    out.document = validator_.check(*def.root, *def.root, body, prefix, violations);
    return out;
}

std::vector<std::pair<std::string, column_value_t>>
record_store::projected_values(const structure_definition& def, const json& document) const {
    std::vector<std::pair<std::string, column_value_t>> values;
    values.reserve(def.projections.size());
    for (const auto& p : def.projections) {
        const json* value = nullptr;
        if (auto it = document.find(p.field); it != document.end()) {
            value = &*it;
        }
        values.emplace_back(p.column, type_mapper::project_value(p, value));
    }
    return values;
}

record record_store::insert_row(const structure_definition& def, const prepared& doc) {
    record r;
    r.parent_id = doc.parent_id;
    r.document = doc.document;
    r.created_at = r.updated_at = detail::now();

    std::vector<std::pair<std::string, column_value_t>> values;
    values.emplace_back("parent_id", r.parent_id ? column_value_t(*r.parent_id) : column_value_t(nullptr));
    values.emplace_back("document", r.document.dump());
    values.emplace_back("created_at", detail::to_column_value(r.created_at));
    values.emplace_back("updated_at", detail::to_column_value(r.updated_at));
    auto projected = projected_values(def, r.document);
    values.insert(values.end(), projected.begin(), projected.end());

    r.id = db_.insert(def.table_name, values);
    return r;
}

std::optional<record> record_store::load_row(database& db, const structure_definition& def, primary_key_t id) {
    auto rows = db.query(std::string("SELECT ") + record_columns + " FROM " + def.table_name + " WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return to_record(rows.front());
}

bool record_store::creates_cycle(const structure_definition& def, primary_key_t id, primary_key_t new_parent) {
    const auto& t = def.table_name;
    auto rows = db_.query(
        "WITH RECURSIVE chain(id, parent_id) AS ("
        "  SELECT id, parent_id FROM " + t + " WHERE id = ?"
        "  UNION"
        "  SELECT " + t + ".id, " + t + ".parent_id FROM " + t + " JOIN chain ON " + t + ".id = chain.parent_id"
        ") SELECT 1 AS hit FROM chain WHERE id = ? LIMIT 1",
        {new_parent, id});
    return !rows.empty();
}

record record_store::create(const std::string& structure, const json& document) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);

    std::vector<violation> violations;
    auto doc = prepare(def, document, "", violations);

    transaction tx(db_);
    if (doc.parent_id && !load_row(db_, def, *doc.parent_id)) {
        violations.push_back({"parent_id", "parent",
                              "record " + std::to_string(*doc.parent_id) + " does not exist in '" + def.name + "'"});
    }
    if (!violations.empty()) {
        throw validation_error(std::move(violations));
    }

    auto r = insert_row(def, doc);
    tx.commit();
    notifier_.publish(make_event(def.name, change_kind::created, r));
    LOG_DEBUG("records", "Created %s #%lld", def.name.c_str(), static_cast<long long>(r.id));
    return r;
}

std::vector<record> record_store::create_many(const std::string& structure, const std::vector<json>& documents) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);

    std::vector<violation> violations;
    std::vector<prepared> docs;
    docs.reserve(documents.size());
    for (size_t i = 0; i < documents.size(); ++i) {
        docs.push_back(prepare(def, documents[i], "[" + std::to_string(i) + "]", violations));
    }

    transaction tx(db_);
    for (size_t i = 0; i < docs.size(); ++i) {
        const auto& parent = docs[i].parent_id;
        if (parent && !load_row(db_, def, *parent)) {
            violations.push_back({"[" + std::to_string(i) + "].parent_id", "parent",
                                  "record " + std::to_string(*parent) + " does not exist in '" + def.name + "'"});
        }
    }
    if (!violations.empty()) {
        throw validation_error(std::move(violations));
    }

    std::vector<record> created;
    created.reserve(docs.size());
    for (const auto& doc : docs) {
        created.push_back(insert_row(def, doc));
    }
    tx.commit();

    for (const auto& r : created) {
        notifier_.publish(make_event(def.name, change_kind::created, r));
    }
    LOG_DEBUG("records", "Created %zu %s record(s)", created.size(), def.name.c_str());
    return created;
}

record record_store::get(const std::string& structure, primary_key_t id) {
    auto r = find(structure, id);
    if (!r) {
        throw not_found_error("Record " + std::to_string(id) + " not found in '" + structure + "'");
    }
    return *r;
}

std::optional<record> record_store::find(const std::string& structure, primary_key_t id) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);
    return load_row(reads(), def, id);
}

record record_store::update(const std::string& structure, primary_key_t id, const json& changes) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);
    if (!changes.is_object()) {
        throw validation_error({{"", "type", std::string("expected object, got ") + changes.type_name()}});
    }

    transaction tx(db_);
    auto existing = load_row(db_, def, id);
    if (!existing) {
        throw not_found_error("Record " + std::to_string(id) + " not found in '" + def.name + "'");
    }

    std::vector<violation> violations;
    json merged = existing->document.is_object() ? existing->document : json::object();
    auto parent = existing->parent_id;
    bool parent_changed = false;

    for (auto it = changes.begin(); it != changes.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();
        if (key == "parent_id") {
            parent_changed = true;
            if (value.is_null()) {
                parent.reset();
            } else if (value.is_number_integer() && value.get<int64_t>() > 0) {
                parent = value.get<int64_t>();
            } else {
                violations.push_back({"parent_id", "type", "must be a record id or null"});
            }
        } else if (key == "id") {
            if (!value.is_number_integer() || value.get<int64_t>() != id) {
                violations.push_back({"id", "readOnly", "id cannot be changed"});
            }
        } else if (key == "created_at" || key == "updated_at") {
            continue;
        } else if (value.is_null()) {
            merged.erase(key);
        } else {
            merged[key] = value;
        }
    }

    auto normalized = validator_.check(*def.root, *def.root, merged, "", violations);

    if (parent_changed && parent) {
        if (*parent == id) {
            violations.push_back({"parent_id", "cycle", "a record cannot be its own parent"});
        } else if (!load_row(db_, def, *parent)) {
            violations.push_back({"parent_id", "parent",
                                  "record " + std::to_string(*parent) + " does not exist in '" + def.name + "'"});
        } else if (creates_cycle(def, id, *parent)) {
            violations.push_back({"parent_id", "cycle",
                                  "record " + std::to_string(*parent) + " descends from record " + std::to_string(id)});
        }
    }
    if (!violations.empty()) {
        throw validation_error(std::move(violations));
    }

    record r = *existing;
    r.document = std::move(normalized);
    r.parent_id = parent;
    r.updated_at = std::max(detail::now(), r.created_at);

    std::vector<std::pair<std::string, column_value_t>> values;
    values.emplace_back("document", r.document.dump());
    values.emplace_back("updated_at", detail::to_column_value(r.updated_at));
    if (parent_changed) {
        values.emplace_back("parent_id", parent ? column_value_t(*parent) : column_value_t(nullptr));
    }
    auto projected = projected_values(def, r.document);
    values.insert(values.end(), projected.begin(), projected.end());
    db_.update(def.table_name, id, values);

    tx.commit();
    notifier_.publish(make_event(def.name, change_kind::updated, r));
    return r;
}

std::vector<primary_key_t> record_store::remove(const std::string& structure, primary_key_t id) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);
    const auto& t = def.table_name;

    transaction tx(db_);
    auto rows = db_.query(
        "WITH RECURSIVE subtree(id) AS ("
        "  SELECT id FROM " + t + " WHERE id = ?"
        "  UNION"
        "  SELECT " + t + ".id FROM " + t + " JOIN subtree ON " + t + ".parent_id = subtree.id"
        ") SELECT " + t + ".id AS id, parent_id, document, created_at, updated_at FROM " + t +
        " JOIN subtree ON " + t + ".id = subtree.id",
        {id});
    if (rows.empty()) {
        throw not_found_error("Record " + std::to_string(id) + " not found in '" + def.name + "'");
    }

    std::unordered_map<primary_key_t, record> by_id;
    std::unordered_map<primary_key_t, std::vector<primary_key_t>> children;
    for (const auto& row : rows) {
        auto r = to_record(row);
        if (r.id != id && r.parent_id) {
            children[*r.parent_id].push_back(r.id);
        }
        by_id.emplace(r.id, std::move(r));
    }
    for (auto& [_, kids] : children) {
        std::sort(kids.begin(), kids.end());
    }

    // Post-order: every descendant goes before its ancestor.
    std::vector<primary_key_t> order;
    order.reserve(by_id.size());
    std::vector<std::pair<primary_key_t, size_t>> stack{{id, 0}};
    while (!stack.empty()) {
        auto node = stack.back().first;
        auto& kids = children[node];
        if (stack.back().second < kids.size()) {
            auto child = kids[stack.back().second++];
            stack.emplace_back(child, 0);
        } else {
            order.push_back(node);
            stack.pop_back();
        }
    }

    for (auto node : order) {
        db_.remove(t, node);
    }
    tx.commit();

    for (auto node : order) {
        notifier_.publish(make_event(def.name, change_kind::deleted, by_id.at(node)));
    }
    LOG_DEBUG("records", "Removed %zu %s record(s) rooted at #%lld",
              order.size(), def.name.c_str(), static_cast<long long>(id));
    return order;
}

std::string record_store::resolve_column(const structure_definition& def, const std::string& field,
                                         field_kind* kind) const {
    if (is_system_field(field)) {
        if (kind) {
            *kind = (field == "id" || field == "parent_id") ? field_kind::integer : field_kind::number;
        }
        return field;
    }
    const auto* p = def.find_projection(field);
    if (!p) {
        throw unfilterable_field_error(field);
    }
    if (kind) *kind = p->kind;
    return p->column;
}

std::string record_store::where_clause(const structure_definition& def,
                                       const std::vector<filter_condition>& filter,
                                       std::vector<column_value_t>& params) const {
    if (filter.empty()) return {};

    auto bind = [&](const filter_condition& c, field_kind kind, const json& value) -> column_value_t {
        if (value.is_object() || value.is_array()) {
            bad_filter(c.field, std::string("operator '") + to_string(c.op) + "' needs a scalar value");
        }
        if (kind == field_kind::boolean && value.is_boolean()) {
            return static_cast<int64_t>(value.get<bool>() ? 1 : 0);
        }
        return detail::to_column_value(value);
    };

    std::ostringstream sql;
    sql << " WHERE ";
    bool first = true;
    for (const auto& c : filter) {
        field_kind kind = field_kind::string;
        auto col = resolve_column(def, c.field, &kind);
        if (!first) sql << " AND ";
        first = false;

        switch (c.op) {
            case filter_op::eq:
                if (c.value.is_null()) {
                    sql << col << " IS NULL";
                } else {
                    sql << col << " = ?";
                    params.push_back(bind(c, kind, c.value));
                }
                break;
            case filter_op::ne:
                if (c.value.is_null()) {
                    sql << col << " IS NOT NULL";
                } else {
                    sql << "(" << col << " IS NULL OR " << col << " <> ?)";
                    params.push_back(bind(c, kind, c.value));
                }
                break;
            case filter_op::lt:
            case filter_op::lte:
            case filter_op::gt:
            case filter_op::gte: {
                if (c.value.is_null()) {
                    bad_filter(c.field, std::string("operator '") + to_string(c.op) + "' needs a value");
                }
                const char* symbol = c.op == filter_op::lt ? "<" : c.op == filter_op::lte ? "<=" :
                                     c.op == filter_op::gt ? ">" : ">=";
                sql << col << " " << symbol << " ?";
                params.push_back(bind(c, kind, c.value));
                break;
            }
            case filter_op::contains:
            case filter_op::starts_with: {
                if (!c.value.is_string()) {
                    bad_filter(c.field, std::string("operator '") + to_string(c.op) + "' needs a string value");
                }
                auto pattern = escape_like(c.value.get<std::string>()) + "%";
                if (c.op == filter_op::contains) pattern = "%" + pattern;
                sql << col << " LIKE ? ESCAPE '\\'";
                params.emplace_back(std::move(pattern));
                break;
            }
            case filter_op::in: {
                if (!c.value.is_array()) {
                    bad_filter(c.field, "operator 'in' needs an array value");
                }
                if (c.value.empty()) {
                    sql << "0";
                    break;
                }
                sql << col << " IN (";
                for (size_t i = 0; i < c.value.size(); ++i) {
                    if (i > 0) sql << ", ";
                    sql << "?";
                    params.push_back(bind(c, kind, c.value[i]));
                }
                sql << ")";
                break;
            }
            case filter_op::is_null:
                sql << col << " IS NULL";
                break;
            case filter_op::not_null:
                sql << col << " IS NOT NULL";
                break;
        }
    }
    return sql.str();
}

std::vector<record> record_store::list(const std::string& structure, const list_options& options) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);

    std::vector<column_value_t> params;
    auto where = where_clause(def, options.filter, params);
    auto sort = options.sort_field.empty() ? std::string("id") : resolve_column(def, options.sort_field);

    std::string sql = std::string("SELECT ") + record_columns + " FROM " + def.table_name + where +
                      " ORDER BY " + sort + (options.order == sort_order::descending ? " DESC" : " ASC");
    if (sort != "id") {
        sql += ", id ASC";
    }
    sql += " LIMIT ? OFFSET ?";
    params.emplace_back(options.limit ? static_cast<int64_t>(*options.limit) : int64_t(-1));
    params.emplace_back(static_cast<int64_t>(options.offset));

    std::vector<record> result;
    for (const auto& row : reads().query(sql, params)) {
        result.push_back(to_record(row));
    }
    return result;
}

record_sequence record_store::stream(const std::string& structure, list_options options) {
    // Resolve names up front so a bad filter fails here rather than mid-iteration.
    {
        auto lock = locks_.shared(structure);
        auto def = registry_.get(structure);
        std::vector<column_value_t> params;
        where_clause(def, options.filter, params);
        if (!options.sort_field.empty()) resolve_column(def, options.sort_field);
    }
    return record_sequence(*this, structure, std::move(options), page_size_);
}

size_t record_store::count(const std::string& structure, const std::vector<filter_condition>& filter) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);

    std::vector<column_value_t> params;
    auto where = where_clause(def, filter, params);
    auto rows = reads().query("SELECT COUNT(*) AS n FROM " + def.table_name + where, params);
    return rows.empty() ? 0 : static_cast<size_t>(detail::as_int(rows.front().at("n")).value_or(0));
}

std::vector<record> record_store::children(const std::string& structure, primary_key_t id) {
    if (!find(structure, id)) {
        throw not_found_error("Record " + std::to_string(id) + " not found in '" + structure + "'");
    }
    list_options options;
    options.filter.push_back({"parent_id", filter_op::eq, id});
    return list(structure, options);
}

std::vector<record> record_store::search(const std::string& structure, const std::string& text, size_t limit) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);

    auto rows = reads().query(std::string("SELECT ") + record_columns + " FROM " + def.table_name +
                              " WHERE document LIKE ? ESCAPE '\\' ORDER BY id ASC LIMIT ?",
                              {"%" + escape_like(text) + "%", static_cast<int64_t>(limit)});
    std::vector<record> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(to_record(row));
    }
    return result;
}

field_statistics record_store::field_stats(const std::string& structure, const std::string& field) {
    auto lock = locks_.shared(structure);
    auto def = registry_.get(structure);

    field_kind kind = field_kind::string;
    auto col = resolve_column(def, field, &kind);
    auto rows = reads().query("SELECT COUNT(*) AS total, COUNT(" + col + ") AS non_null, MIN(" + col +
                          ") AS min_value, MAX(" + col + ") AS max_value, AVG(" + col +
                          ") AS avg_value FROM " + def.table_name);

    field_statistics stats;
    stats.field = field;
    if (rows.empty()) return stats;
    const auto& row = rows.front();
    stats.total = detail::as_int(row.at("total")).value_or(0);
    stats.non_null = detail::as_int(row.at("non_null")).value_or(0);
    stats.null_count = stats.total - stats.non_null;
    stats.min = detail::to_json(row.at("min_value"));
    stats.max = detail::to_json(row.at("max_value"));
    if (kind == field_kind::boolean) {
        if (stats.min.is_number()) stats.min = stats.min.get<int64_t>() != 0;
        if (stats.max.is_number()) stats.max = stats.max.get<int64_t>() != 0;
    }
    bool numeric = kind == field_kind::integer || kind == field_kind::number;
    if (numeric && stats.non_null > 0) {
        const auto& avg = row.at("avg_value");
        if (std::holds_alternative<double>(avg)) stats.avg = std::get<double>(avg);
        else if (auto i = detail::as_int(avg)) stats.avg = static_cast<double>(*i);
    }
    return stats;
}

} // namespace strata
