#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace notifier_tests {

using strata::json;

inline strata::change_event make_event(const std::string& structure, strata::primary_key_t id) {
    strata::change_event e;
    e.structure_name = structure;
    e.kind = strata::change_kind::created;
    e.record_id = id;
    e.payload = {{"id", id}};
    e.timestamp = strata::detail::now();
    return e;
}

// ============================================================================
// test_drop_oldest: a full buffer discards its oldest events
// ============================================================================

void test_drop_oldest() {
    std::cout << "  test_drop_oldest..." << std::flush;

    strata::change_notifier notifier(2);
    auto sub = notifier.subscribe("x");

    for (strata::primary_key_t id = 1; id <= 5; ++id) {
        notifier.publish(make_event("x", id));
    }
    assert(sub.pending() == 2);
    assert(sub.dropped() == 3);

    auto events = sub.drain();
    assert(events.size() == 2);
    assert(events[0].record_id == 4);
    assert(events[1].record_id == 5);
    assert(!sub.try_next());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_structure_isolation: subscribers only see their structure
// ============================================================================

void test_structure_isolation() {
    std::cout << "  test_structure_isolation..." << std::flush;

    strata::change_notifier notifier;
    auto xs = notifier.subscribe("x");
    auto ys = notifier.subscribe("y");
    auto xs2 = notifier.subscribe("x");
    assert(notifier.subscriber_count("x") == 2);

    notifier.publish(make_event("y", 1));
    assert(!xs.try_next());
    assert(!xs2.try_next());

    auto got = ys.next(std::chrono::milliseconds(100));
    assert(got && got->record_id == 1);

    auto message = got->to_message();
    assert(message["type"] == "created");
    assert(message["structure"] == "y");
    assert(message["data"]["id"] == 1);

    // Nothing pending: a timed wait comes back empty
    auto start = std::chrono::steady_clock::now();
    assert(!ys.next(std::chrono::milliseconds(20)));
    assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(20));

    // Events fired before subscribing are never seen
    auto late = notifier.subscribe("y");
    assert(!late.try_next());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unsubscribe: explicit, by destruction, and through moves
// ============================================================================

void test_unsubscribe() {
    std::cout << "  test_unsubscribe..." << std::flush;

    strata::change_notifier notifier;
    {
        auto scoped = notifier.subscribe("x");
        assert(notifier.subscriber_count("x") == 1);
    }
    assert(notifier.subscriber_count("x") == 0);

    auto sub = notifier.subscribe("x");
    strata::subscription moved = std::move(sub);
    assert(!sub.is_active());
    assert(moved.is_active());
    assert(moved.structure_name() == "x");
    assert(notifier.subscriber_count("x") == 1);

    notifier.publish(make_event("x", 7));
    assert(moved.pending() == 1);

    moved.unsubscribe();
    assert(!moved.is_active());
    assert(notifier.subscriber_count("x") == 0);

    // Already-queued events still drain, then the closed channel ends
    auto queued = moved.next();
    assert(queued && queued->record_id == 7);
    assert(!moved.next());

    notifier.publish(make_event("x", 8));
    assert(!moved.try_next());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_blocking_iteration: range-for over a live subscription
// ============================================================================

void test_blocking_iteration() {
    std::cout << "  test_blocking_iteration..." << std::flush;

    auto notifier = std::make_unique<strata::change_notifier>();
    auto sub = notifier->subscribe("x");

    std::thread publisher([&] {
        for (strata::primary_key_t id = 1; id <= 3; ++id) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            notifier->publish(make_event("x", id));
        }
    });

    std::vector<strata::primary_key_t> seen;
    for (const auto& event : sub) {
        seen.push_back(event.record_id);
        if (seen.size() == 3) break;
    }
    publisher.join();
    assert((seen == std::vector<strata::primary_key_t>{1, 2, 3}));

    // Tearing the notifier down closes its channels; the handle outlives it
    notifier->publish(make_event("x", 4));
    notifier.reset();
    size_t rest = 0;
    for (const auto& event : sub) {
        assert(event.record_id == 4);
        ++rest;
    }
    assert(rest == 1);
    sub.unsubscribe();

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_store_events: commits publish created/updated/deleted in order
// ============================================================================

void test_store_events() {
    std::cout << "  test_store_events..." << std::flush;

    strata::strata_db db;
    db.schemas().define("menu", strata_tests::menu_schema());
    db.schemas().define("other", strata_tests::menu_schema());
    auto sub = db.subscribe("menu");

    auto r = db.records().create("menu", {{"label", "A"}});
    db.records().update("menu", r.id, {{"url", "/a"}});
    db.records().create("other", {{"label", "elsewhere"}});
    db.records().remove("menu", r.id);

    // Failed writes publish nothing
    bool threw = false;
    try {
        db.records().create("menu", json::object());
    } catch (const strata::validation_error&) {
        threw = true;
    }
    assert(threw);

    auto events = sub.drain();
    assert(events.size() == 3);
    assert(events[0].kind == strata::change_kind::created);
    assert(events[1].kind == strata::change_kind::updated);
    assert(events[1].payload["url"] == "/a");
    assert(events[2].kind == strata::change_kind::deleted);
    for (const auto& e : events) {
        assert(e.structure_name == "menu");
        assert(e.record_id == r.id);
    }
    assert(std::string(strata::to_string(events[2].kind)) == "deleted");

    std::cout << " OK" << std::endl;
}

} // namespace notifier_tests
