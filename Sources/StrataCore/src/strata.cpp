#include "strata/strata.hpp"
#include <cctype>
#include <cstdlib>

namespace strata {

std::optional<log_level> parse_log_level(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (auto level : {log_level::off, log_level::error, log_level::warn, log_level::info, log_level::debug}) {
        if (lower == to_string(level)) return level;
    }
    return std::nullopt;
}

namespace {

log_level initial_log_level() {
    const char* env = std::getenv("STRATA_LOG_LEVEL");
    if (!env) return log_level::off;
    return parse_log_level(env).value_or(log_level::off);
}

} // namespace

std::atomic<log_level> g_log_level{initial_log_level()};

namespace {

// A second connection to an in-memory database would open a different database.
bool is_file_database(const std::string& path) {
    return !path.empty() && path != ":memory:" && path.rfind("file::memory:", 0) != 0;
}

} // namespace

strata_db::strata_db(const configuration& config)
    : config_(config),
      db_(std::make_unique<database>(config.path, database::open_mode::read_write, config.busy_timeout_ms)),
      reader_(is_file_database(config.path)
                  ? std::make_unique<database>(config.path, database::open_mode::read_only, config.busy_timeout_ms)
                  : nullptr),
      locks_(config.schema_lock_timeout),
      validator_(config.max_depth, config.max_pattern_subject),
      synchronizer_(*db_),
      registry_(*db_, synchronizer_, locks_, validator_),
      notifier_(config.subscriber_buffer),
      store_(*db_, registry_, locks_, validator_, notifier_, config.stream_page_size, reader_.get()) {
    if (config.log_verbosity) {
        set_log_level(*config.log_verbosity);
    }
    registry_.load();
    LOG_INFO("strata", "Opened %s", config.path.c_str());
}

strata_db::~strata_db() {
    LOG_DEBUG("strata", "Closing %s", config_.path.c_str());
}

} // namespace strata
