#pragma once

#include "structure.hpp"
#include "errors.hpp"
#include <vector>

namespace strata {

/// Validates instance documents against a structure's active schema and
/// fills declared defaults. Recursion through self-referential schemas is
/// bounded by max_depth. Strings longer than max_pattern_subject bytes are
/// reported as pattern violations without being matched.
class record_validator {
public:
    explicit record_validator(size_t max_depth = 16, size_t max_pattern_subject = 4096)
        : max_depth_(max_depth), max_pattern_subject_(max_pattern_subject) {}

    /// Returns the normalized document. Throws validation_error carrying every
    /// violation found, or depth_exceeded_error when nesting goes too deep.
    json validate(const structure_definition& def, const json& candidate) const;

    /// Checks one value against `spec` (self-references resolve to `root`),
    /// appending violations instead of throwing. Returns the normalized value.
    json check(const field_spec& root, const field_spec& spec, const json& value,
               const std::string& path, std::vector<violation>& violations,
               size_t depth = 0) const;

    size_t max_depth() const noexcept { return max_depth_; }
    size_t max_pattern_subject() const noexcept { return max_pattern_subject_; }

private:
    size_t max_depth_;
    size_t max_pattern_subject_;

    json check_string(const field_spec& spec, const json& value, const std::string& path,
                      std::vector<violation>& out) const;
    json check_numeric(const field_spec& spec, const json& value, const std::string& path,
                       std::vector<violation>& out) const;
    json check_array(const field_spec& root, const field_spec& spec, const json& value,
                     const std::string& path, std::vector<violation>& out, size_t depth) const;
    json check_object(const field_spec& root, const object_field& obj, const json& value,
                      const std::string& path, std::vector<violation>& out, size_t depth) const;
};

} // namespace strata
