#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>

namespace strata {

using json = nlohmann::json;

// Timestamp type (stored as REAL seconds since Unix epoch)
using timestamp_t = std::chrono::system_clock::time_point;

// Primary key type
using primary_key_t = int64_t;

// Values bound to / read from SQLite
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

// Storage affinity of a physical column
enum class column_type {
    integer,
    real,
    text
};

// One row of PRAGMA table_info, in declaration order
struct column_info {
    std::string name;
    std::string declared_type;  // uppercase, e.g. "VARCHAR(32)"
    bool primary_key = false;
};

namespace detail {
    inline timestamp_t now() {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    inline column_value_t to_column_value(timestamp_t v) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
        return static_cast<double>(millis) / 1000.0;
    }

    inline timestamp_t to_timestamp(const column_value_t& v) {
        double seconds = 0.0;
        if (std::holds_alternative<double>(v)) {
            seconds = std::get<double>(v);
        } else if (std::holds_alternative<int64_t>(v)) {
            seconds = static_cast<double>(std::get<int64_t>(v));
        }
        auto millis = static_cast<int64_t>(seconds * 1000.0 + (seconds >= 0 ? 0.5 : -0.5));
        return timestamp_t(std::chrono::milliseconds(millis));
    }

    inline double to_seconds(timestamp_t v) {
        return std::get<double>(to_column_value(v));
    }

    // Scalar JSON -> bindable value. Booleans become 0/1, containers are dumped.
    inline column_value_t to_column_value(const json& j) {
        if (j.is_null()) return nullptr;
        if (j.is_boolean()) return static_cast<int64_t>(j.get<bool>() ? 1 : 0);
        if (j.is_number_unsigned()) {
            auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<double>(u);
            }
            return static_cast<int64_t>(u);
        }
        if (j.is_number_integer()) return j.get<int64_t>();
        if (j.is_number_float()) return j.get<double>();
        if (j.is_string()) return j.get<std::string>();
        return j.dump();
    }

    inline json to_json(const column_value_t& v) {
        return std::visit([](auto&& x) -> json {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return nullptr;
            } else {
                return x;
            }
        }, v);
    }

    inline std::optional<int64_t> as_int(const column_value_t& v) {
        if (std::holds_alternative<int64_t>(v)) return std::get<int64_t>(v);
        return std::nullopt;
    }

    inline std::string as_string(const column_value_t& v) {
        if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
        return {};
    }
} // namespace detail

} // namespace strata

#endif // __cplusplus
