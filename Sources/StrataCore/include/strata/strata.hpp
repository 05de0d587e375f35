#pragma once

#include "change_notifier.hpp"
#include "db.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "record_store.hpp"
#include "record_validator.hpp"
#include "schema.hpp"
#include "structure_locks.hpp"
#include "table_synchronizer.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace strata {

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory database.
    std::string path = ":memory:";

    /// Deepest nesting accepted in schemas and documents.
    size_t max_depth = 16;

    /// How long a record or schema operation waits for a structure that is
    /// being migrated before failing with concurrency_error.
    std::chrono::milliseconds schema_lock_timeout{5000};

    /// Pending events held per subscriber before the oldest are dropped.
    size_t subscriber_buffer = 256;

    /// Rows fetched per page by record_store::stream().
    size_t stream_page_size = 100;

    /// Longest string, in bytes, matched against a schema `pattern`. Longer
    /// values fail validation with a pattern violation.
    size_t max_pattern_subject = 4096;

    /// SQLite busy handler timeout.
    int busy_timeout_ms = 5000;

    /// Overrides the process-wide log level when set.
    std::optional<log_level> log_verbosity;

    configuration() = default;
    configuration(const std::string& path) : path(path) {}
    configuration(const char* path) : path(path) {}
};

/// Entry point. Owns every component and wires them together; members are
/// declared in dependency order so teardown runs in reverse.
class strata_db {
public:
    strata_db() : strata_db(configuration{}) {}
    explicit strata_db(const configuration& config);
    ~strata_db();

    strata_db(const strata_db&) = delete;
    strata_db& operator=(const strata_db&) = delete;

    schema_registry& schemas() { return registry_; }
    record_store& records() { return store_; }
    change_notifier& notifier() { return notifier_; }
    database& db() { return *db_; }
    structure_locks& locks() { return locks_; }

    subscription subscribe(const std::string& structure_name) { return notifier_.subscribe(structure_name); }

    const configuration& config() const { return config_; }

private:
    configuration config_;
    std::unique_ptr<database> db_;
    std::unique_ptr<database> reader_;  // WAL read connection, file databases only
    structure_locks locks_;
    record_validator validator_;
    table_synchronizer synchronizer_;
    schema_registry registry_;
    change_notifier notifier_;
    record_store store_;
};

} // namespace strata
