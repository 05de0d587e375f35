#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace migration_tests {

using strata::json;
using strata_tests::has_column;

// ============================================================================
// test_add_field_with_default: old rows keep their document, new rows get it
// ============================================================================

void test_add_field_with_default() {
    std::cout << "  test_add_field_with_default..." << std::flush;

    strata::strata_db db;
    db.schemas().define("task", R"({"type": "object", "properties": {"title": {"type": "string"}},
                                    "required": ["title"]})");
    auto old_row = db.records().create("task", {{"title", "before"}});

    auto def = db.schemas().update("task", R"({"type": "object", "properties": {
        "title": {"type": "string"},
        "priority": {"type": "integer", "default": 5, "index": true}}, "required": ["title"]})");
    assert(def.version == 2);
    assert(has_column(db.db(), "data_task", "f_priority", "INTEGER"));

    // Not retroactively rewritten
    auto unchanged = db.records().get("task", old_row.id);
    assert(!unchanged.document.contains("priority"));
    assert(unchanged.updated_at == old_row.updated_at);

    auto explicit_value = db.records().create("task", {{"title", "set"}, {"priority", 7}});
    assert(explicit_value.document["priority"] == 7);
    assert(db.records().get("task", explicit_value.id).document["priority"] == 7);

    auto defaulted = db.records().create("task", {{"title", "default"}});
    assert(defaulted.document["priority"] == 5);

    strata::list_options high;
    high.filter.push_back({"priority", strata::filter_op::eq, 7});
    auto rows = db.records().list("task", high);
    assert(rows.size() == 1 && rows[0].id == explicit_value.id);

    // Touching the old row fills the default and its projection
    db.records().update("task", old_row.id, {{"title", "after"}});
    high.filter[0].value = 5;
    assert(db.records().count("task", high.filter) == 2);

    auto history = db.schemas().history("task");
    assert(history.size() == 2);
    assert(history[1].version == 2);
    assert(history[1].changes["added"].size() == 1);
    assert(history[1].changes["added"][0]["column"] == "f_priority");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_deprecate_restore_vacuum: removed fields keep their column until vacuum
// ============================================================================

void test_deprecate_restore_vacuum() {
    std::cout << "  test_deprecate_restore_vacuum..." << std::flush;

    const char* with_color = R"({"type": "object", "properties": {
        "label": {"type": "string"}, "color": {"type": "string"}}})";
    const char* without_color = R"({"type": "object", "properties": {"label": {"type": "string"}}})";

    strata::strata_db db;
    db.schemas().define("swatch", with_color);
    auto red = db.records().create("swatch", {{"label", "a"}, {"color", "red"}});

    auto v2 = db.schemas().update("swatch", without_color);
    assert(v2.version == 2);
    assert(v2.deprecated_columns == std::vector<std::string>{"f_color"});
    assert(has_column(db.db(), "data_swatch", "f_color"));

    auto raw = db.db().query("SELECT f_color FROM data_swatch WHERE id = ?", {red.id});
    assert(strata::detail::as_string(raw[0].at("f_color")) == "red");

    // No longer part of the active schema
    bool threw = false;
    try {
        strata::list_options o;
        o.filter.push_back({"color", strata::filter_op::eq, "red"});
        db.records().list("swatch", o);
    } catch (const strata::unfilterable_field_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        db.records().create("swatch", {{"label", "b"}, {"color", "blue"}});
    } catch (const strata::validation_error& e) {
        threw = e.cites("color", "additionalProperties");
    }
    assert(threw);

    // Re-adding a compatible field brings the old values back
    auto v3 = db.schemas().update("swatch", with_color);
    assert(v3.deprecated_columns.empty());
    assert(db.schemas().history("swatch").back().changes["restored"][0] == "f_color");
    strata::list_options reds;
    reds.filter.push_back({"color", strata::filter_op::eq, "red"});
    assert(db.records().list("swatch", reds).size() == 1);

    auto v4 = db.schemas().update("swatch", without_color);
    assert(v4.version == 4);
    auto dropped = db.schemas().vacuum("swatch");
    assert(dropped == std::vector<std::string>{"f_color"});
    assert(!has_column(db.db(), "data_swatch", "f_color"));

    auto def = db.schemas().get("swatch");
    assert(def.version == 4);
    assert(def.deprecated_columns.empty());
    assert(db.schemas().history("swatch").back().changes["dropped"][0] == "f_color");
    assert(db.records().get("swatch", red.id).document["label"] == "a");

    // Nothing left to drop
    assert(db.schemas().vacuum("swatch").empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_widening: lossless retypes rebuild the table and keep data and ids
// ============================================================================

void test_widening() {
    std::cout << "  test_widening..." << std::flush;

    strata::strata_db db;
    db.schemas().define("gauge", R"({"type": "object", "properties": {
        "count": {"type": "integer", "index": true},
        "code": {"type": "string", "maxLength": 4},
        "flag": {"type": "boolean"}}})");

    auto first = db.records().create("gauge", {{"count", 3}, {"code", "ab"}, {"flag", true}});
    auto second = db.records().create("gauge", {{"count", 4}, {"code", "cd"}, {"flag", false}});
    db.records().remove("gauge", second.id);

    auto def = db.schemas().update("gauge", R"({"type": "object", "properties": {
        "count": {"type": "number", "index": true},
        "code": {"type": "string", "maxLength": 8},
        "flag": {"type": "integer"}}})");
    assert(def.version == 2);
    assert(has_column(db.db(), "data_gauge", "f_count", "REAL"));
    assert(has_column(db.db(), "data_gauge", "f_code", "VARCHAR(8)"));
    assert(has_column(db.db(), "data_gauge", "f_flag", "INTEGER"));
    assert(db.schemas().history("gauge").back().changes["widened"].size() == 3);

    auto kept = db.records().get("gauge", first.id);
    assert(kept.document["count"] == 3);
    assert(kept.created_at == first.created_at);

    strata::list_options o;
    o.filter.push_back({"count", strata::filter_op::eq, 3});
    assert(db.records().list("gauge", o).size() == 1);

    auto indexes = db.db().query("SELECT name FROM sqlite_master WHERE type='index' AND tbl_name='data_gauge'");
    bool count_index = false;
    for (const auto& row : indexes) {
        if (strata::detail::as_string(row.at("name")) == "idx_data_gauge_f_count") count_index = true;
    }
    assert(count_index);

    // Deleted ids are not handed out again after the rebuild
    auto third = db.records().create("gauge", {{"count", 1.5}, {"code", "abcdefgh"}, {"flag", 2}});
    assert(third.id == 3);

    // VARCHAR may also open up to TEXT
    db.schemas().update("gauge", R"({"type": "object", "properties": {
        "count": {"type": "number"}, "code": {"type": "string"}, "flag": {"type": "integer"}}})");
    assert(has_column(db.db(), "data_gauge", "f_code", "TEXT"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_incompatible_change: narrowing is refused and nothing changes
// ============================================================================

void test_incompatible_change() {
    std::cout << "  test_incompatible_change..." << std::flush;

    strata::strata_db db;
    auto original = json::parse(R"({"type": "object", "properties": {
        "count": {"type": "number"}, "code": {"type": "string", "maxLength": 8}}})");
    db.schemas().define("meter", original);
    db.records().create("meter", {{"count", 2.5}, {"code", "x"}});

    auto refused = [&](const std::string& schema) {
        try {
            db.schemas().update("meter", schema);
        } catch (const strata::incompatible_migration_error&) {
            return true;
        }
        return false;
    };

    assert(refused(R"({"type": "object", "properties": {"count": {"type": "string"}, "code": {"type": "string", "maxLength": 8}}})"));
    assert(refused(R"({"type": "object", "properties": {"count": {"type": "integer"}, "code": {"type": "string", "maxLength": 8}}})"));
    assert(refused(R"({"type": "object", "properties": {"count": {"type": "number"}, "code": {"type": "string", "maxLength": 4}}})"));
    // An added column does not slip through alongside a refused one
    assert(refused(R"({"type": "object", "properties": {"count": {"type": "boolean"}, "code": {"type": "string", "maxLength": 8},
                       "extra": {"type": "string"}}})"));

    auto def = db.schemas().get("meter");
    assert(def.version == 1);
    assert(def.schema == original);
    assert(has_column(db.db(), "data_meter", "f_count", "REAL"));
    assert(has_column(db.db(), "data_meter", "f_code", "VARCHAR(8)"));
    assert(!has_column(db.db(), "data_meter", "f_extra"));
    assert(db.schemas().history("meter").size() == 1);
    assert(db.records().count("meter") == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_expected_version: optimistic check on schema updates
// ============================================================================

void test_expected_version() {
    std::cout << "  test_expected_version..." << std::flush;

    strata::strata_db db;
    db.schemas().define("menu", strata_tests::menu_schema());

    auto next = strata_tests::menu_schema();
    next["properties"]["icon"] = {{"type", "string"}};

    bool threw = false;
    try {
        db.schemas().update("menu", next, 3);
    } catch (const strata::concurrency_error&) {
        threw = true;
    }
    assert(threw);
    assert(db.schemas().get("menu").version == 1);

    auto def = db.schemas().update("menu", next, 1);
    assert(def.version == 2);
    assert(def.find_projection("icon") != nullptr);

    threw = false;
    try {
        db.schemas().update("missing", next);
    } catch (const strata::not_found_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

} // namespace migration_tests
