#pragma once

#include "TestSupport.hpp"
#include <nlohmann/json.hpp>

namespace capsync_tests {

namespace {

const instance_id sync_target("video-1", "captions");

sync_options quiet_sync() {
    sync_options options;
    options.heartbeat_interval = millis(0);
    return options;
}

change_set one_change(version_t origin, version_t resulting, const std::string& text) {
    change c;
    c.table = "captions";
    c.pk = "1";
    c.cid = "text";
    c.val = text;
    c.col_version = resulting;
    c.db_version = resulting;
    c.site_id = "site-a";

    change_set set;
    set.origin_version = origin;
    set.resulting_version = resulting;
    set.changes.push_back(c);
    return set;
}

nlohmann::json sent_json(const mock_sync_transport& transport, size_t index) {
    return nlohmann::json::parse(transport.get_sent_messages().at(index).as_string());
}

} // namespace

// ============================================================================
// Test: connect
// ============================================================================

void test_sync_connect() {
    std::cout << "Testing sync connect..." << std::endl;

    auto sched = std::make_shared<manual_scheduler>();
    auto transport = std::make_unique<mock_sync_transport>();
    auto* t = transport.get();
    sync_manager sync(sync_target, std::move(transport), sched, "wss://sync.example.com/ws/", "tab_1", quiet_sync());

    std::vector<connection_state> states;
    sync.set_on_status_change([&](const sync_status& status) { states.push_back(status.state); });

    assert(sync.url() == "wss://sync.example.com/ws/video-1/captions?tab_id=tab_1");

    sync.connect("secret");
    assert(sync.status().state == connection_state::connecting);
    assert(t->url() == sync.url());
    assert(t->headers().at("Authorization") == "Bearer secret");

    sched->run_pending();
    assert(sync.status().connected);
    assert(sync.status().state == connection_state::connected);
    assert(states.front() == connection_state::connecting);
    assert(states.back() == connection_state::connected);

    // Already connected.
    sync.connect("secret");
    assert(t->connect_count() == 1);

    // Server-initiated normal closure ends the session.
    t->simulate_drop(close_normal, "bye");
    sched->run_pending();
    assert(sync.status().state == connection_state::disconnected);
    sched->advance(millis(60000));
    assert(t->connect_count() == 1);

    std::cout << "  Sync connect test passed!" << std::endl;
}

// ============================================================================
// Test: outbound queue, acks, pending count
// ============================================================================

void test_sync_backlog_and_ack() {
    std::cout << "Testing sync backlog and ack..." << std::endl;

    auto sched = std::make_shared<manual_scheduler>();
    auto transport = std::make_unique<mock_sync_transport>();
    auto* t = transport.get();
    t->set_auto_open(false);
    sync_manager sync(sync_target, std::move(transport), sched, "wss://sync.example.com/ws", "tab_1", quiet_sync());

    std::vector<version_t> acks;
    sync.set_on_ack([&](version_t v) { acks.push_back(v); });

    sync.set_local_version(5);
    sync.connect("");
    assert(t->headers().empty());

    sync.send_changes(one_change(5, 6, "one"));
    sync.send_changes(one_change(6, 7, "two"));
    sync.send_changes(change_set{});  // nothing to send
    assert(sync.queued_count() == 2);
    assert(sync.status().pending_changes == 2);
    assert(t->get_sent_messages().empty());
    assert(sync.local_version() == 7);

    t->simulate_open();
    sched->run_pending();
    assert(t->get_sent_messages().size() == 2);
    assert(sync.queued_count() == 0);
    assert(sync.in_flight_count() == 2);
    assert(sync.status().pending_changes == 2);

    auto first = sent_json(*t, 0);
    auto second = sent_json(*t, 1);
    assert(first["type"] == "changes" && first["baseVersion"] == 5);
    assert(second["baseVersion"] == 6);
    assert(first["messageId"] == "video-1:captions:1");
    assert(second["messageId"] == "video-1:captions:2");

    t->simulate_message(ack_message(6));
    sched->run_pending();
    assert(sync.in_flight_count() == 1);
    assert(sync.status().pending_changes == 1);
    assert(sync.status().last_sync_time);

    t->simulate_message(ack_message(7, 0));
    sched->run_pending();
    assert(sync.in_flight_count() == 0);
    assert(sync.status().pending_changes == 0);
    assert(!sync.status().syncing);
    assert(acks == (std::vector<version_t>{6, 7}));

    // Ack by message id for a set the server versioned differently.
    sync.send_changes(one_change(7, 8, "three"));
    server_message by_id;
    by_id.message_type = server_message::type::ack;
    by_id.version = 7;
    by_id.message_id = "video-1:captions:3";
    t->simulate_message(by_id.to_json());
    sched->run_pending();
    assert(sync.in_flight_count() == 0);

    std::cout << "  Sync backlog and ack test passed!" << std::endl;
}

void test_sync_send_batching() {
    std::cout << "Testing sync send batching..." << std::endl;

    auto sched = std::make_shared<manual_scheduler>();
    auto transport = std::make_unique<mock_sync_transport>();
    auto* t = transport.get();

    auto options = quiet_sync();
    options.send_delay = millis(50);
    sync_manager sync(sync_target, std::move(transport), sched, "wss://sync.example.com/ws", "tab_1", options);

    sync.connect("token");
    sched->run_pending();
    assert(sync.status().connected);

    sync.send_changes(one_change(0, 1, "a"));
    sched->advance(millis(30));
    sync.send_changes(one_change(1, 2, "b"));
    assert(t->get_sent_messages().empty());
    assert(sync.status().pending_changes == 1);
    assert(sync.status().syncing);
    assert(sync.local_version() == 2);

    // The second set restarted the window.
    sched->advance(millis(30));
    assert(t->get_sent_messages().empty());
    sched->advance(millis(20));
    assert(t->get_sent_messages().size() == 1);

    auto frame = sent_json(*t, 0);
    assert(frame["baseVersion"] == 0);
    assert(frame["changes"].size() == 2);
    assert(frame["messageId"] == "video-1:captions:1");
    assert(sync.in_flight_count() == 1);

    t->simulate_message(ack_message(2, 0));
    sched->run_pending();
    assert(sync.in_flight_count() == 0);
    assert(sync.status().pending_changes == 0);

    // An open batch moves to the backlog on disconnect.
    sync.send_changes(one_change(2, 3, "c"));
    sync.disconnect();
    assert(sync.queued_count() == 1);
    assert(sync.status().pending_changes == 1);
    sched->advance(millis(100));
    assert(t->get_sent_messages().size() == 1);
    assert(sync.queued_count() == 1);

    std::cout << "  Sync send batching test passed!" << std::endl;
}

void test_sync_resend_after_drop() {
    std::cout << "Testing sync resend after drop..." << std::endl;

    auto sched = std::make_shared<manual_scheduler>();
    auto transport = std::make_unique<mock_sync_transport>();
    auto* t = transport.get();
    sync_manager sync(sync_target, std::move(transport), sched, "wss://sync.example.com/ws", "tab_1", quiet_sync());

    sync.connect("token");
    sched->run_pending();
    sync.send_changes(one_change(0, 1, "unconfirmed"));
    assert(t->get_sent_messages().size() == 1);

    t->simulate_drop();
    sched->run_pending();
    assert(sync.status().state == connection_state::reconnecting);
    assert(!sync.status().connected);
    assert(sync.reconnect_attempts() == 1);

    sched->advance(millis(1000));
    assert(t->connect_count() == 2);
    assert(sync.status().connected);
    assert(sync.reconnect_attempts() == 0);

    // The unconfirmed set goes out again on the new connection.
    assert(t->get_sent_messages().size() == 2);
    assert(sent_json(*t, 1)["messageId"] == sent_json(*t, 0)["messageId"]);
    assert(sync.in_flight_count() == 1);

    std::cout << "  Sync resend test passed!" << std::endl;
}

void test_sync_reconnect_ceiling() {
    std::cout << "Testing sync reconnect ceiling..." << std::endl;

    auto sched = std::make_shared<manual_scheduler>();
    auto transport = std::make_unique<mock_sync_transport>();
    auto* t = transport.get();
    t->set_auto_open(false);

    auto options = quiet_sync();
    options.max_reconnect_attempts = 3;
    sync_manager sync(sync_target, std::move(transport), sched, "wss://sync.example.com/ws", "tab_1", options);

    std::vector<std::exception_ptr> errors;
    sync.set_on_error([&](std::exception_ptr e) { errors.push_back(e); });

    sync.connect("token");
    const int64_t delays[] = {1000, 2000, 4000};
    for (int i = 0; i < 3; ++i) {
        t->simulate_drop();
        sched->run_pending();
        assert(sync.status().state == connection_state::reconnecting);

        sched->advance(millis(delays[i] - 1));
        assert(t->connect_count() == i + 1);
        sched->advance(millis(1));
        assert(t->connect_count() == i + 2);
    }

    t->simulate_error("connection refused");
    sched->run_pending();
    assert(sync.status().state == connection_state::disconnected);
    assert(errors.size() == 1);
    try {
        std::rethrow_exception(errors[0]);
    } catch (const sync_error& e) {
        assert(e.code() == error_code::sync_failed);
    }

    sched->advance(millis(120000));
    assert(t->connect_count() == 4);

    // A fresh connect starts a new budget.
    sync.connect("token");
    assert(t->connect_count() == 5);
    assert(sync.reconnect_attempts() == 0);

    std::cout << "  Sync reconnect ceiling test passed!" << std::endl;
}

// ============================================================================
// Test: inbound frames
// ============================================================================

void test_sync_inbound() {
    std::cout << "Testing sync inbound frames..." << std::endl;

    auto sched = std::make_shared<manual_scheduler>();
    auto transport = std::make_unique<mock_sync_transport>();
    auto* t = transport.get();
    sync_manager sync(sync_target, std::move(transport), sched, "wss://sync.example.com/ws", "tab_1", quiet_sync());

    std::vector<change_set> received;
    std::vector<std::pair<lock_state, std::optional<std::string>>> locks;
    std::vector<std::string> transfers;
    std::vector<std::string> errors;
    bool fail_apply = false;

    sync.set_on_changes([&](const change_set& changes) {
        if (fail_apply) throw apply_changes_error("constraint failed");
        received.push_back(changes);
    });
    sync.set_on_lock([&](lock_state state, const std::optional<std::string>& holder) {
        locks.emplace_back(state, holder);
    });
    sync.set_on_session_transferred([&](const std::string& tab) { transfers.push_back(tab); });
    sync.set_on_error([&](std::exception_ptr e) { errors.push_back(describe(e)); });

    sync.set_local_version(4);
    sync.connect("token");
    sched->run_pending();

    t->simulate_message(changes_message(one_change(4, 9, "remote")));
    sched->run_pending();
    assert(received.size() == 1);
    assert(received[0].origin_version == 4);
    assert(received[0].resulting_version == 9);
    assert(received[0].changes.size() == 1);
    assert(sync.local_version() == 9);
    assert(sync.status().last_sync_time);

    t->simulate_message("{\"type\":");
    t->simulate_message("{\"type\":\"mystery\"}");
    sched->run_pending();
    assert(errors.empty());
    assert(sync.status().connected);

    t->simulate_message(lock_message(lock_state::granted, std::string("tab_2")));
    t->simulate_message(R"({"type":"session_transferred","newTabId":"tab_3"})");
    t->simulate_message(R"({"type":"error","detail":"quota exceeded"})");
    sched->run_pending();
    assert(locks.size() == 1);
    assert(locks[0].first == lock_state::granted);
    assert(locks[0].second == std::optional<std::string>("tab_2"));
    assert(transfers == std::vector<std::string>{"tab_3"});
    assert(errors.size() == 1 && errors[0] == "quota exceeded");

    // A failing merge is reported, the channel stays up and the baseline
    // does not move.
    auto synced_at = sync.status().last_sync_time;
    fail_apply = true;
    t->simulate_message(changes_message(one_change(9, 10, "bad")));
    sched->run_pending();
    assert(errors.size() == 2);
    assert(errors[1] == "constraint failed");
    assert(sync.status().connected);
    assert(sync.local_version() == 9);
    assert(sync.status().last_sync_time == synced_at);
    assert(!sync.status().syncing);

    // Inbound changes clear `syncing` even while local sets are unconfirmed.
    fail_apply = false;
    sync.send_changes(one_change(9, 10, "local"));
    assert(sync.status().pending_changes == 1);
    assert(sync.status().syncing);
    t->simulate_message(changes_message(one_change(10, 11, "remote again")));
    sched->run_pending();
    assert(sync.local_version() == 11);
    assert(sync.status().pending_changes == 1);
    assert(!sync.status().syncing);

    std::cout << "  Sync inbound test passed!" << std::endl;
}

void test_sync_heartbeat() {
    std::cout << "Testing sync heartbeat..." << std::endl;

    auto sched = std::make_shared<manual_scheduler>();
    auto transport = std::make_unique<mock_sync_transport>();
    auto* t = transport.get();

    sync_options options;
    options.heartbeat_interval = millis(1000);
    sync_manager sync(sync_target, std::move(transport), sched, "wss://sync.example.com/ws", "tab_1", options);

    sync.connect("token");
    sched->run_pending();
    assert(t->get_sent_messages().empty());

    sched->advance(millis(1000));
    assert(t->get_sent_messages().size() == 1);
    assert(sent_json(*t, 0)["type"] == "ping");

    sched->advance(millis(1000));
    assert(t->get_sent_messages().size() == 2);

    sync.disconnect();
    sched->run_pending();
    assert(sync.status().state == connection_state::disconnected);
    sched->advance(millis(5000));
    assert(t->get_sent_messages().size() == 2);

    // Queued sets survive a disconnect.
    sync.send_changes(one_change(0, 1, "offline"));
    assert(sync.queued_count() == 1);
    assert(sync.status().pending_changes == 1);

    std::cout << "  Sync heartbeat test passed!" << std::endl;
}

} // namespace capsync_tests
