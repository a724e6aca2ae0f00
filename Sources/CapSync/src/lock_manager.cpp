#include "capsync/lock_manager.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include <nlohmann/json.hpp>

namespace capsync {

lock_manager::lock_manager(std::shared_ptr<http_client> http,
                           std::shared_ptr<scheduler> sched,
                           std::string lock_url,
                           std::string client_id)
    : http_(std::move(http))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
    , lock_url_(std::move(lock_url))
    , client_id_(client_id.empty() ? "tab_" + uuid_t::generate().to_string() : std::move(client_id))
{
}

lock_manager::~lock_manager() = default;

std::string lock_manager::endpoint(const instance_id& id, const std::string& action) const {
    return join_url(lock_url_, url_escape(id.video_id) + "/" + url_escape(id.database_name) + "/" + action);
}

lock_manager::lock_entry& lock_manager::entry(const instance_id& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        it = entries_.emplace(id, lock_entry{}).first;
        it->second.epoch = next_epoch_++;
    }
    return it->second;
}

bool lock_manager::is_current(const instance_id& id, uint64_t epoch) const {
    auto it = entries_.find(id);
    return it != entries_.end() && it->second.epoch == epoch;
}

lock_status lock_manager::status(const instance_id& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? lock_status{} : it->second.status;
}

lock_status lock_manager::to_status(const lock_response& response) const {
    lock_status status;
    status.state = response.state;
    status.holder = response.holder;
    // A grant without a holder is addressed to the requester.
    if (status.state == lock_state::granted && !status.holder && response.can_edit) {
        status.holder = client_id_;
    }
    status.can_edit = status.state == lock_state::granted && status.holder == client_id_;
    return status;
}

void lock_manager::set_status(const instance_id& id, const lock_status& status) {
    auto& e = entry(id);
    if (e.status == status) return;

    LOG_DEBUG("lock", "%s: %s -> %s (holder %s)", id.to_string().c_str(),
              to_string(e.status.state), to_string(status.state),
              status.holder ? status.holder->c_str() : "none");
    e.status = status;

    if (on_status_change_) {
        try {
            on_status_change_(id, status);
        } catch (const std::exception& ex) {
            LOG_ERROR("lock", "Status observer threw: %s", ex.what());
        }
    }
}

void lock_manager::send(const instance_id& id, const http_request& request,
                        std::function<void(http_response)> on_response) {
    uint64_t epoch = entry(id).epoch;
    std::weak_ptr<char> alive = lifetime_;
    auto sched = scheduler_;
    http_->send_async(request,
        [this, alive, sched, id, epoch, on_response = std::move(on_response)](http_response response) {
            sched->invoke([this, alive, id, epoch, on_response, response = std::move(response)]() mutable {
                if (alive.expired() || !is_current(id, epoch)) {
                    LOG_DEBUG("lock", "Dropping stale lock response for %s", id.to_string().c_str());
                    return;
                }
                on_response(std::move(response));
            });
        });
}

static http_request json_request(const std::string& method, const std::string& url,
                                 const std::string& client_id) {
    http_request request;
    request.method = method;
    request.url = url;
    nlohmann::json body;
    body["clientId"] = client_id;
    request.set_json_body(body.dump());
    return request;
}

// ============================================================================
// acquire
// ============================================================================

void lock_manager::acquire(const instance_id& id, completion_handler on_complete) {
    auto& e = entry(id);

    if (e.status.can_edit) {
        auto status = e.status;
        scheduler_->invoke([status, on_complete = std::move(on_complete)] {
            if (on_complete) on_complete(status, nullptr);
        });
        return;
    }

    if (on_complete) e.acquire_waiters.push_back(std::move(on_complete));
    if (e.acquire_in_flight) return;
    e.acquire_in_flight = true;

    lock_status pending;
    pending.state = lock_state::pending;
    pending.holder = client_id_;
    set_status(id, pending);

    LOG_INFO("lock", "Acquiring lock for %s", id.to_string().c_str());
    send(id, json_request("POST", endpoint(id, "acquire"), client_id_),
         [this, id](http_response response) {
        auto parsed = lock_response::from_json(response.body_string());

        if (response.is_success() && parsed) {
            auto status = to_status(*parsed);
            if (status.can_edit) {
                LOG_INFO("lock", "Lock granted for %s", id.to_string().c_str());
                finish_acquire(id, status, nullptr);
                return;
            }
            // Answered, but someone else holds it.
            lock_status denied;
            denied.holder = status.holder;
            finish_acquire(id, denied, std::make_exception_ptr(lock_error(
                "Lock for " + id.to_string() + " is held by " + status.holder.value_or("another client"))));
            return;
        }

        lock_status released;
        std::string reason;
        if (response.status_code == 409) {
            if (parsed) released.holder = parsed->holder;
            reason = "Lock for " + id.to_string() + " is held by " +
                     released.holder.value_or("another client");
        } else if (response.status_code == 0) {
            reason = "Lock request failed: " + (response.error.empty() ? std::string("network error") : response.error);
        } else if (response.is_success()) {
            reason = "Malformed lock response";
        } else {
            reason = "Lock request failed: HTTP " + std::to_string(response.status_code);
        }
        LOG_WARN("lock", "%s", reason.c_str());
        finish_acquire(id, released, std::make_exception_ptr(lock_error(reason)));
    });
}

void lock_manager::finish_acquire(const instance_id& id, const lock_status& status, std::exception_ptr error) {
    // A server push may already have settled the state while the request
    // was in flight; only a still-pending lock takes the response.
    if (entry(id).status.state == lock_state::pending) {
        set_status(id, status);
    }

    auto& e = entry(id);
    e.acquire_in_flight = false;
    auto waiters = std::move(e.acquire_waiters);
    e.acquire_waiters.clear();
    auto current = e.status;
    for (auto& waiter : waiters) {
        waiter(current, current.can_edit ? nullptr : error);
    }
}

// ============================================================================
// release / check
// ============================================================================

void lock_manager::release(const instance_id& id, completion_handler on_complete) {
    auto& e = entry(id);
    bool held = e.status.holder == client_id_ &&
                (e.status.state == lock_state::granted || e.status.state == lock_state::pending ||
                 e.status.state == lock_state::transferring);
    if (!held) {
        auto status = e.status;
        scheduler_->invoke([status, on_complete = std::move(on_complete)] {
            if (on_complete) on_complete(status, nullptr);
        });
        return;
    }

    // Authority ends now, not when the server answers.
    set_status(id, lock_status{});
    LOG_INFO("lock", "Releasing lock for %s", id.to_string().c_str());

    send(id, json_request("POST", endpoint(id, "release"), client_id_),
         [this, id, on_complete = std::move(on_complete)](http_response response) {
        if (!response.is_success()) {
            std::string reason = response.status_code == 0
                ? "Lock release failed: " + response.error
                : "Lock release failed: HTTP " + std::to_string(response.status_code);
            LOG_WARN("lock", "%s (%s)", reason.c_str(), id.to_string().c_str());
            if (on_complete) on_complete(status(id), std::make_exception_ptr(lock_error(reason)));
            return;
        }
        if (on_complete) on_complete(status(id), nullptr);
    });
}

void lock_manager::check(const instance_id& id, completion_handler on_complete) {
    http_request request;
    request.method = "GET";
    request.url = endpoint(id, "check") + "?clientId=" + url_escape(client_id_);

    send(id, request, [this, id, on_complete = std::move(on_complete)](http_response response) {
        auto parsed = lock_response::from_json(response.body_string());
        if (!response.is_success() || !parsed) {
            std::string reason = response.status_code == 0
                ? "Lock check failed: " + response.error
                : "Lock check failed: HTTP " + std::to_string(response.status_code);
            LOG_WARN("lock", "%s (%s)", reason.c_str(), id.to_string().c_str());
            if (on_complete) on_complete(status(id), std::make_exception_ptr(lock_error(reason)));
            return;
        }

        // An in-flight acquire settles through its own response.
        if (!entry(id).acquire_in_flight) {
            set_status(id, to_status(*parsed));
        }
        if (on_complete) on_complete(status(id), nullptr);
    });
}

// ============================================================================
// Server pushes
// ============================================================================

void lock_manager::apply_server_state(const instance_id& id, lock_state state,
                                      const std::optional<std::string>& holder) {
    lock_status next;
    next.state = state;
    next.holder = holder;
    next.can_edit = state == lock_state::granted && holder == client_id_;

    if (state == lock_state::transferring && status(id).can_edit) {
        LOG_INFO("lock", "Lock for %s is being transferred; editing disabled", id.to_string().c_str());
    }
    set_status(id, next);
}

void lock_manager::session_transferred(const instance_id& id, const std::string& new_tab_id) {
    LOG_INFO("lock", "Session for %s transferred to %s", id.to_string().c_str(), new_tab_id.c_str());

    lock_status status;
    status.state = lock_state::transferring;
    if (!new_tab_id.empty()) status.holder = new_tab_id;
    status.can_edit = false;
    set_status(id, status);
}

void lock_manager::forget(const instance_id& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return;

    auto waiters = std::move(it->second.acquire_waiters);
    entries_.erase(it);
    if (waiters.empty()) return;

    auto error = std::make_exception_ptr(lock_error("Lock request for " + id.to_string() + " abandoned: instance closed"));
    for (auto& waiter : waiters) {
        waiter(lock_status{}, error);
    }
}

} // namespace capsync
