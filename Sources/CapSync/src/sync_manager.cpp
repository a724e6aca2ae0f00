#include "capsync/sync_manager.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include <algorithm>

namespace capsync {

sync_manager::sync_manager(instance_id id,
                           std::unique_ptr<sync_transport> transport,
                           std::shared_ptr<scheduler> sched,
                           std::string websocket_url,
                           std::string client_id,
                           sync_options options)
    : id_(std::move(id))
    , transport_(std::move(transport))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
    , websocket_url_(std::move(websocket_url))
    , client_id_(std::move(client_id))
    , options_(options)
{
    std::weak_ptr<char> alive = lifetime_;
    auto sched_ref = scheduler_;

    transport_->set_on_open([this, alive, sched_ref] {
        sched_ref->invoke([this, alive] {
            if (!alive.expired()) handle_open();
        });
    });
    transport_->set_on_message([this, alive, sched_ref](const transport_message& msg) {
        sched_ref->invoke([this, alive, text = msg.as_string()] {
            if (!alive.expired()) handle_message(text);
        });
    });
    transport_->set_on_error([this, alive, sched_ref](const std::string& error) {
        sched_ref->invoke([this, alive, error] {
            if (!alive.expired()) handle_error(error);
        });
    });
    transport_->set_on_close([this, alive, sched_ref](int code, const std::string& reason) {
        sched_ref->invoke([this, alive, code, reason] {
            if (!alive.expired()) handle_close(code, reason);
        });
    });
}

sync_manager::~sync_manager() {
    lifetime_.reset();
    should_reconnect_ = false;
    if (transport_ && transport_->state() != transport_state::closed) {
        transport_->disconnect();
    }
}

std::string sync_manager::url() const {
    return join_url(websocket_url_, url_escape(id_.video_id) + "/" + url_escape(id_.database_name)) +
           "?tab_id=" + url_escape(client_id_);
}

// ============================================================================
// Connection lifecycle
// ============================================================================

void sync_manager::connect(const std::string& auth_token) {
    auth_token_ = auth_token;
    if (should_reconnect_ && status_.state != connection_state::disconnected) {
        return;  // already connected or on the way
    }
    should_reconnect_ = true;
    reconnect_pending_ = false;
    attempts_ = 0;
    ++session_;
    open_transport();
}

void sync_manager::open_transport() {
    if (!set_state(attempts_ > 0 ? connection_state::reconnecting : connection_state::connecting)) return;

    std::map<std::string, std::string> headers;
    if (!auth_token_.empty()) {
        headers["Authorization"] = "Bearer " + auth_token_;
    }

    LOG_INFO("sync", "Connecting %s (attempt %d)", url().c_str(), attempts_ + 1);
    transport_->connect(url(), headers);
}

void sync_manager::disconnect() {
    commit_batch();
    should_reconnect_ = false;
    reconnect_pending_ = false;
    ++session_;
    ++heartbeat_epoch_;

    bool was_open = transport_->state() != transport_state::closed;
    status_.connected = false;
    if (!set_state(connection_state::disconnected)) return;
    if (was_open) {
        transport_->disconnect();
    }
}

void sync_manager::handle_open() {
    if (!should_reconnect_) {
        // Opened after disconnect() was requested.
        transport_->disconnect();
        return;
    }

    LOG_INFO("sync", "Connected %s", id_.to_string().c_str());
    attempts_ = 0;
    reconnect_pending_ = false;
    status_.connected = true;

    // Anything sent on the previous connection may not have arrived.
    while (!in_flight_.empty()) {
        queue_.push_front(std::move(in_flight_.back()));
        in_flight_.pop_back();
    }
    if (!set_state(connection_state::connected)) return;
    if (!flush()) return;
    start_heartbeat();
}

void sync_manager::handle_error(const std::string& error) {
    LOG_WARN("sync", "Transport error on %s: %s", id_.to_string().c_str(), error.c_str());
    if (!should_reconnect_) return;

    status_.connected = false;
    ++heartbeat_epoch_;
    schedule_reconnect();
}

void sync_manager::handle_close(int code, const std::string& reason) {
    status_.connected = false;
    ++heartbeat_epoch_;

    if (!should_reconnect_) {
        (void)set_state(connection_state::disconnected);
        return;
    }

    if (code == close_normal || code == close_going_away) {
        LOG_INFO("sync", "Channel %s closed by server (%d %s)", id_.to_string().c_str(), code, reason.c_str());
        should_reconnect_ = false;
        (void)set_state(connection_state::disconnected);
        return;
    }

    LOG_WARN("sync", "Channel %s dropped (%d %s)", id_.to_string().c_str(), code, reason.c_str());
    schedule_reconnect();
}

void sync_manager::schedule_reconnect() {
    if (reconnect_pending_) return;

    if (attempts_ >= options_.max_reconnect_attempts) {
        LOG_ERROR("sync", "Giving up on %s after %d reconnect attempts", id_.to_string().c_str(), attempts_);
        should_reconnect_ = false;
        auto error = std::make_exception_ptr(sync_error(
            "Sync channel for " + id_.to_string() + " failed after " +
            std::to_string(attempts_) + " reconnect attempts"));
        if (!set_state(connection_state::disconnected)) return;
        (void)report_error(error);
        return;
    }

    auto delay = options_.delay_for(attempts_);
    ++attempts_;
    reconnect_pending_ = true;
    LOG_INFO("sync", "Reconnecting %s in %lld ms", id_.to_string().c_str(),
             static_cast<long long>(delay.count()));
    if (!set_state(connection_state::reconnecting)) return;

    std::weak_ptr<char> alive = lifetime_;
    uint64_t session = session_;
    scheduler_->invoke_after(delay, [this, alive, session] {
        if (alive.expired() || session != session_) return;
        reconnect_pending_ = false;
        if (!should_reconnect_ || status_.connected) return;
        open_transport();
    });
}

// ============================================================================
// Heartbeat
// ============================================================================

void sync_manager::start_heartbeat() {
    ++heartbeat_epoch_;
    if (options_.heartbeat_interval.count() <= 0 || !scheduler_->honors_delays()) return;
    schedule_heartbeat(heartbeat_epoch_);
}

void sync_manager::schedule_heartbeat(uint64_t epoch) {
    std::weak_ptr<char> alive = lifetime_;
    scheduler_->invoke_after(options_.heartbeat_interval, [this, alive, epoch] {
        if (alive.expired() || epoch != heartbeat_epoch_ || !status_.connected) return;
        transport_->send(transport_message::from_string(client_message::ping().to_json()));
        schedule_heartbeat(epoch);
    });
}

// ============================================================================
// Outbound
// ============================================================================

void sync_manager::set_local_version(version_t version) {
    local_version_ = version;
}

void sync_manager::send_changes(const change_set& changes) {
    if (changes.empty()) return;

    if (!batch_) {
        batch_.emplace();
        batch_->message.message_type = client_message::type::changes;
        batch_->message.base_version = changes.origin_version;
    }
    auto& batched = batch_->message.changes;
    batched.insert(batched.end(), changes.changes.begin(), changes.changes.end());
    batch_->resulting_version = std::max(batch_->resulting_version, changes.resulting_version);

    local_version_ = std::max(local_version_, changes.resulting_version);
    server_pending_.reset();

    if (options_.send_delay.count() > 0 && scheduler_->honors_delays()) {
        schedule_batch();
        refresh_pending();
        (void)publish_status();
        return;
    }

    commit_batch();
    refresh_pending();
    if (!publish_status()) return;

    (void)flush();
}

void sync_manager::schedule_batch() {
    // Each send restarts the window.
    uint64_t epoch = ++batch_epoch_;
    std::weak_ptr<char> alive = lifetime_;
    scheduler_->invoke_after(options_.send_delay, [this, alive, epoch] {
        if (alive.expired() || epoch != batch_epoch_) return;
        commit_batch();
        (void)flush();
    });
}

void sync_manager::commit_batch() {
    if (!batch_) return;
    ++batch_epoch_;

    auto out = std::move(*batch_);
    batch_.reset();
    out.message.message_id = id_.to_string() + ":" + std::to_string(next_message_id_++);

    LOG_DEBUG("sync", "Queueing %zu changes for %s (%s)", out.message.changes.size(),
              id_.to_string().c_str(), out.message.message_id.c_str());

    queue_.push_back(std::move(out));
}

bool sync_manager::flush() {
    if (!status_.connected) return true;

    while (!queue_.empty()) {
        auto out = std::move(queue_.front());
        queue_.pop_front();
        transport_->send(transport_message::from_string(out.message.to_json()));
        in_flight_.push_back(std::move(out));
    }
    refresh_pending();
    return publish_status();
}

// ============================================================================
// Inbound
// ============================================================================

void sync_manager::handle_message(const std::string& text) {
    auto msg = server_message::from_json(text);
    if (!msg) {
        LOG_WARN("sync", "Ignoring malformed message on %s: %.200s", id_.to_string().c_str(), text.c_str());
        return;
    }

    switch (msg->message_type) {
        case server_message::type::changes:
            handle_changes(*msg);
            break;
        case server_message::type::ack:
            handle_ack(*msg);
            break;
        case server_message::type::lock:
            (void)emit(on_lock_, msg->state, msg->holder);
            break;
        case server_message::type::session_transferred:
            (void)emit(on_session_transferred_, msg->new_tab_id);
            break;
        case server_message::type::error:
            LOG_ERROR("sync", "Server error on %s: %s", id_.to_string().c_str(), msg->detail.c_str());
            (void)report_error(std::make_exception_ptr(sync_error(msg->detail)));
            break;
    }
}

void sync_manager::handle_changes(const server_message& msg) {
    change_set changes;
    changes.origin_version = local_version_;
    changes.resulting_version = msg.version;
    changes.changes = msg.changes;

    status_.syncing = true;
    if (!publish_status()) return;

    std::weak_ptr<char> alive = lifetime_;
    std::exception_ptr error;
    try {
        if (!emit(on_changes_, changes)) return;
    } catch (const database_error& e) {
        if (alive.expired()) return;
        LOG_ERROR("sync", "Applying remote changes on %s failed: %s", id_.to_string().c_str(), e.what());
        error = std::current_exception();
    }

    // A failed merge leaves the baseline where it was.
    if (!error) {
        local_version_ = std::max(local_version_, msg.version);
        status_.last_sync_time = std::chrono::system_clock::now();
    }
    refresh_pending();
    status_.syncing = false;
    if (!publish_status()) return;
    if (error) (void)report_error(error);
}

void sync_manager::handle_ack(const server_message& msg) {
    auto confirmed = [&](const outbound& out) {
        return out.resulting_version <= msg.version ||
               (msg.message_id && out.message.message_id == *msg.message_id);
    };
    in_flight_.erase(std::remove_if(in_flight_.begin(), in_flight_.end(), confirmed), in_flight_.end());

    server_pending_ = msg.pending_changes;
    local_version_ = std::max(local_version_, msg.version);
    status_.last_sync_time = std::chrono::system_clock::now();
    refresh_pending();

    LOG_DEBUG("sync", "Ack %lld on %s, %lld pending", static_cast<long long>(msg.version),
              id_.to_string().c_str(), static_cast<long long>(status_.pending_changes));

    if (!emit(on_ack_, msg.version)) return;
    (void)publish_status();
}

// ============================================================================
// Status
// ============================================================================

bool sync_manager::set_state(connection_state state) {
    status_.state = state;
    status_.connected = state == connection_state::connected;
    return publish_status();
}

void sync_manager::refresh_pending() {
    auto unconfirmed = static_cast<int64_t>(queue_.size() + in_flight_.size() + (batch_ ? 1 : 0));
    status_.pending_changes = server_pending_ ? *server_pending_ : unconfirmed;
    status_.syncing = status_.pending_changes > 0;
}

bool sync_manager::publish_status() {
    sync_status status = status_;
    return emit(on_status_change_, status);
}

bool sync_manager::report_error(std::exception_ptr error) {
    return emit(on_error_, error);
}

} // namespace capsync
