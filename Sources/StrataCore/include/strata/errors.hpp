#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

/// Base of every error raised by the engine.
class strata_error : public std::runtime_error {
public:
    explicit strata_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// SQLite reported a failure that is not a caller mistake.
class db_error : public strata_error {
public:
    explicit db_error(const std::string& msg) : strata_error(msg) {}
};

/// Malformed or unsupported schema document.
class schema_error : public strata_error {
public:
    explicit schema_error(const std::string& msg) : strata_error(msg) {}
};

/// A `type` token the type mapper does not know.
class unsupported_type_error : public schema_error {
public:
    explicit unsupported_type_error(const std::string& token)
        : schema_error("Unsupported field type: '" + token + "'"), token_(token) {}

    const std::string& token() const noexcept { return token_; }

private:
    std::string token_;
};

/// define() on a name (or sanitized table name) that is already taken.
class duplicate_structure_error : public schema_error {
public:
    explicit duplicate_structure_error(const std::string& name)
        : schema_error("Structure '" + name + "' already exists") {}
};

class not_found_error : public strata_error {
public:
    explicit not_found_error(const std::string& msg) : strata_error(msg) {}
};

struct violation {
    std::string field;    // dotted path, "" for the document root
    std::string rule;     // keyword that failed, e.g. "required", "maxLength"
    std::string message;
};

/// Instance document failed validation; carries every violation found.
class validation_error : public strata_error {
public:
    explicit validation_error(std::vector<violation> violations)
        : strata_error(summarize(violations)), violations_(std::move(violations)) {}

    const std::vector<violation>& violations() const noexcept { return violations_; }

    /// True if some violation names `field` (and `rule`, when given).
    bool cites(const std::string& field, const std::string& rule = {}) const {
        for (const auto& v : violations_) {
            if (v.field == field && (rule.empty() || v.rule == rule)) return true;
        }
        return false;
    }

private:
    static std::string summarize(const std::vector<violation>& violations) {
        std::string msg = "Validation failed with " + std::to_string(violations.size()) + " violation(s)";
        for (const auto& v : violations) {
            msg += "; " + (v.field.empty() ? std::string("<root>") : v.field) + ": " + v.message;
        }
        return msg;
    }

    std::vector<violation> violations_;
};

/// Schema update would narrow or otherwise retype an existing column.
class incompatible_migration_error : public strata_error {
public:
    explicit incompatible_migration_error(const std::string& msg) : strata_error(msg) {}
};

/// Document nesting went past the configured maximum depth.
class depth_exceeded_error : public strata_error {
public:
    depth_exceeded_error(const std::string& field, size_t max_depth)
        : strata_error("Nesting at '" + field + "' exceeds maximum depth " + std::to_string(max_depth)),
          field_(field) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// Filter or sort on a field that has no projection column.
class unfilterable_field_error : public strata_error {
public:
    explicit unfilterable_field_error(const std::string& field)
        : strata_error("Field '" + field + "' has no projection column and cannot be filtered or sorted"),
          field_(field) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// Lock wait timed out, the backend stayed busy, or an optimistic version check failed.
class concurrency_error : public strata_error {
public:
    explicit concurrency_error(const std::string& msg) : strata_error(msg) {}
};

} // namespace strata
