#pragma once

#include "config.hpp"
#include "network.hpp"
#include "protocol.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace capsync {

// ============================================================================
// sync_manager - one duplex channel per instance
// ============================================================================
//
// Outbound change sets are queued while the channel is down and flushed in
// order when it opens. Sent sets stay in flight until an ack covers their
// resulting version; in-flight sets are resent after a reconnect. Every
// transport callback is marshalled onto the scheduler.

class sync_manager {
public:
    using changes_handler = std::function<void(const change_set& changes)>;
    using ack_handler = std::function<void(version_t version)>;
    using lock_handler = std::function<void(lock_state state, const std::optional<std::string>& holder)>;
    using session_handler = std::function<void(const std::string& new_tab_id)>;
    using error_handler = std::function<void(std::exception_ptr error)>;
    using status_handler = std::function<void(const sync_status& status)>;

    sync_manager(instance_id id,
                 std::unique_ptr<sync_transport> transport,
                 std::shared_ptr<scheduler> sched,
                 std::string websocket_url,
                 std::string client_id,
                 sync_options options = {});
    ~sync_manager();

    sync_manager(const sync_manager&) = delete;
    sync_manager& operator=(const sync_manager&) = delete;

    /// Open the channel with `Authorization: Bearer <auth_token>`.
    void connect(const std::string& auth_token);

    /// Close with code 1000. Queued and in-flight change sets are kept.
    void disconnect();

    void set_local_version(version_t version);
    version_t local_version() const { return local_version_; }

    /// Frame `changes` as one message based on changes.origin_version.
    void send_changes(const change_set& changes);

    const sync_status& status() const { return status_; }
    std::string url() const;

    size_t queued_count() const { return queue_.size(); }
    size_t in_flight_count() const { return in_flight_.size(); }
    int reconnect_attempts() const { return attempts_; }

    void set_on_changes(changes_handler handler) { on_changes_ = std::move(handler); }
    void set_on_ack(ack_handler handler) { on_ack_ = std::move(handler); }
    void set_on_lock(lock_handler handler) { on_lock_ = std::move(handler); }
    void set_on_session_transferred(session_handler handler) { on_session_transferred_ = std::move(handler); }
    void set_on_error(error_handler handler) { on_error_ = std::move(handler); }
    void set_on_status_change(status_handler handler) { on_status_change_ = std::move(handler); }

private:
    struct outbound {
        client_message message;
        version_t resulting_version = 0;
    };

    void open_transport();
    void handle_open();
    void handle_message(const std::string& text);
    void handle_error(const std::string& error);
    void handle_close(int code, const std::string& reason);

    void handle_changes(const server_message& msg);
    void handle_ack(const server_message& msg);

    void schedule_reconnect();
    void start_heartbeat();
    void schedule_heartbeat(uint64_t epoch);
    void schedule_batch();
    void commit_batch();
    [[nodiscard]] bool flush();

    // The helpers below run consumer callbacks, which may destroy this
    // manager. They return false when it is gone; callers must return
    // without touching members.
    template <typename Handler, typename... Args>
    bool emit(const Handler& handler, Args&&... args) {
        if (!handler) return true;
        std::weak_ptr<char> alive = lifetime_;
        auto callback = handler;
        callback(std::forward<Args>(args)...);
        return !alive.expired();
    }

    [[nodiscard]] bool set_state(connection_state state);
    void refresh_pending();
    [[nodiscard]] bool publish_status();
    [[nodiscard]] bool report_error(std::exception_ptr error);

    instance_id id_;
    std::unique_ptr<sync_transport> transport_;
    std::shared_ptr<scheduler> scheduler_;
    std::string websocket_url_;
    std::string client_id_;
    sync_options options_;

    std::string auth_token_;
    bool should_reconnect_ = false;
    bool reconnect_pending_ = false;
    int attempts_ = 0;
    uint64_t session_ = 0;          // bumped by disconnect(); stale timers check it
    uint64_t heartbeat_epoch_ = 0;
    uint64_t next_message_id_ = 1;
    uint64_t batch_epoch_ = 0;

    version_t local_version_ = 0;
    std::optional<outbound> batch_;  // open while options_.send_delay runs
    std::deque<outbound> queue_;
    std::deque<outbound> in_flight_;
    std::optional<int64_t> server_pending_;
    sync_status status_;

    changes_handler on_changes_;
    ack_handler on_ack_;
    lock_handler on_lock_;
    session_handler on_session_transferred_;
    error_handler on_error_;
    status_handler on_status_change_;

    std::shared_ptr<char> lifetime_ = std::make_shared<char>();
};

} // namespace capsync
