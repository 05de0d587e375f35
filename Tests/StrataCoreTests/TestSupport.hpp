#pragma once

#include <StrataCore.hpp>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace strata_tests {

using strata::json;

inline json menu_schema() {
    return json::parse(R"({
        "type": "object",
        "properties": {
            "label": {"type": "string", "maxLength": 64},
            "url": {"type": "string"},
            "active": {"type": "boolean", "default": true}
        },
        "required": ["label"]
    })");
}

inline bool has_column(strata::database& db, const std::string& table, const std::string& column,
                       const std::string& declared_type = {}) {
    for (const auto& c : db.get_columns(table)) {
        if (c.name == column) {
            return declared_type.empty() || c.declared_type == declared_type;
        }
    }
    return false;
}

inline std::string temp_db_path(const std::string& stem) {
    return "/tmp/" + stem + "_" + std::to_string(std::rand()) + ".db";
}

inline void remove_db_files(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

} // namespace strata_tests
