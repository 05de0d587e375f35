#pragma once

#include "change_notifier.hpp"
#include "db.hpp"
#include "record_validator.hpp"
#include "schema.hpp"
#include "structure_locks.hpp"
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace strata {

/// A stored instance document with its system fields.
struct record {
    primary_key_t id = 0;
    std::optional<primary_key_t> parent_id;
    json document;
    timestamp_t created_at{};
    timestamp_t updated_at{};

    /// Document fields plus id, parent_id, created_at and updated_at.
    json to_json() const;
};

enum class filter_op {
    eq,
    ne,
    lt,
    lte,
    gt,
    gte,
    contains,
    starts_with,
    in,
    is_null,
    not_null
};

const char* to_string(filter_op op) noexcept;
std::optional<filter_op> parse_filter_op(const std::string& token);

struct filter_condition {
    std::string field;
    filter_op op = filter_op::eq;
    json value;

    /// {"field": ..., "operator": ..., "value": ...}. Throws validation_error.
    static filter_condition from_json(const json& j);
};

enum class sort_order {
    ascending,
    descending
};

struct list_options {
    std::vector<filter_condition> filter;   // AND-ed together
    std::string sort_field;                 // empty: by id
    sort_order order = sort_order::ascending;
    std::optional<size_t> limit;
    size_t offset = 0;
};

struct field_statistics {
    std::string field;
    int64_t total = 0;
    int64_t non_null = 0;
    int64_t null_count = 0;
    json min;
    json max;
    std::optional<double> avg;   // numeric fields only

    json to_json() const;
};

class record_store;

/// Lazily paged result of record_store::stream(). Pages are fetched on demand;
/// no statement or lock is held between pages, so stopping early is free.
class record_sequence {
public:
    record_sequence(record_store& store, std::string structure, list_options options, size_t page_size)
        : store_(&store), structure_(std::move(structure)), options_(std::move(options)),
          page_size_(page_size == 0 ? 1 : page_size) {}

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = record;
        using difference_type = std::ptrdiff_t;
        using pointer = const record*;
        using reference = const record&;

        iterator() = default;
        explicit iterator(record_sequence* seq) : seq_(seq) { fetch(); }

        reference operator*() const { return page_[index_]; }
        pointer operator->() const { return &page_[index_]; }
        iterator& operator++();

        bool operator==(const iterator& other) const { return seq_ == other.seq_ && index_ == other.index_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void fetch();

        record_sequence* seq_ = nullptr;
        std::vector<record> page_;
        size_t index_ = 0;
        size_t consumed_ = 0;   // rows handed out before the current page
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    size_t page_size() const noexcept { return page_size_; }

private:
    record_store* store_;
    std::string structure_;
    list_options options_;
    size_t page_size_;
};

/// Validated CRUD over the records of defined structures. Writes run under the
/// structure's shared lock and publish their events after commit, in commit order.
/// Reads go through `reader` when one is given, so they do not queue behind
/// another structure's migration on the write connection.
class record_store {
public:
    record_store(database& db,
                 schema_registry& registry,
                 structure_locks& locks,
                 const record_validator& validator,
                 change_notifier& notifier,
                 size_t stream_page_size = 100,
                 database* reader = nullptr);

    record create(const std::string& structure, const json& document);

    /// All-or-nothing insert. Violations are reported with an "[i]" prefix.
    std::vector<record> create_many(const std::string& structure, const std::vector<json>& documents);

    /// Throws not_found_error.
    record get(const std::string& structure, primary_key_t id);
    std::optional<record> find(const std::string& structure, primary_key_t id);

    /// Top-level merge: keys in `changes` replace, a null value removes.
    record update(const std::string& structure, primary_key_t id, const json& changes);

    /// Removes the record and its descendants, children first.
    /// Returns the removed ids in removal order.
    std::vector<primary_key_t> remove(const std::string& structure, primary_key_t id);

    std::vector<record> list(const std::string& structure, const list_options& options = {});
    record_sequence stream(const std::string& structure, list_options options = {});

    size_t count(const std::string& structure, const std::vector<filter_condition>& filter = {});

    /// Direct children, by id.
    std::vector<record> children(const std::string& structure, primary_key_t id);

    /// Case-insensitive substring match over the stored document text.
    std::vector<record> search(const std::string& structure, const std::string& text, size_t limit = 50);

    field_statistics field_stats(const std::string& structure, const std::string& field);

private:
    struct prepared {
        json document;
        std::optional<primary_key_t> parent_id;
        bool parent_given = false;
    };

    prepared prepare(const structure_definition& def, const json& input,
                     const std::string& prefix, std::vector<violation>& violations) const;
    record insert_row(const structure_definition& def, const prepared& doc);
    std::optional<record> load_row(database& db, const structure_definition& def, primary_key_t id);
    database& reads() { return reader_ ? *reader_ : db_; }
    bool creates_cycle(const structure_definition& def, primary_key_t id, primary_key_t new_parent);
    std::vector<std::pair<std::string, column_value_t>> projected_values(const structure_definition& def,
                                                                         const json& document) const;

    std::string where_clause(const structure_definition& def, const std::vector<filter_condition>& filter,
                             std::vector<column_value_t>& params) const;
    std::string resolve_column(const structure_definition& def, const std::string& field,
                               field_kind* kind = nullptr) const;

    database& db_;
    database* reader_;
    schema_registry& registry_;
    structure_locks& locks_;
    const record_validator& validator_;
    change_notifier& notifier_;
    size_t page_size_;
};

} // namespace strata
