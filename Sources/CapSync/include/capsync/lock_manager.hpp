#pragma once

#include "network.hpp"
#include "protocol.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace capsync {

// ============================================================================
// lock_manager - client of the server-side edit lock
// ============================================================================
//
// Per instance: released -> pending -> granted -> transferring -> released.
// The server is authoritative; this side never expires a lock on its own.
// can_edit is derived locally: granted and held by client_id().

class lock_manager {
public:
    using completion_handler = std::function<void(lock_status status, std::exception_ptr error)>;
    using status_handler = std::function<void(const instance_id& id, const lock_status& status)>;

    lock_manager(std::shared_ptr<http_client> http,
                 std::shared_ptr<scheduler> sched,
                 std::string lock_url,
                 std::string client_id);
    ~lock_manager();

    lock_manager(const lock_manager&) = delete;
    lock_manager& operator=(const lock_manager&) = delete;

    const std::string& client_id() const { return client_id_; }

    /// POST .../acquire. Denial completes with the released status and a
    /// lock_error. A second acquire while one is pending joins it.
    void acquire(const instance_id& id, completion_handler on_complete);

    /// POST .../release. No request when already released.
    void release(const instance_id& id, completion_handler on_complete);

    /// GET .../check. Refreshes the local status from the server.
    void check(const instance_id& id, completion_handler on_complete);

    lock_status status(const instance_id& id) const;
    bool can_edit(const instance_id& id) const { return status(id).can_edit; }

    /// Lock state pushed over the sync channel.
    void apply_server_state(const instance_id& id, lock_state state,
                            const std::optional<std::string>& holder);

    /// Editing authority moved to another tab of the same holder.
    void session_transferred(const instance_id& id, const std::string& new_tab_id);

    /// Drop all state for `id`; responses still in flight are ignored.
    /// Pending acquire completions fail with lock_error.
    void forget(const instance_id& id);

    void set_on_status_change(status_handler handler) { on_status_change_ = std::move(handler); }

private:
    struct lock_entry {
        lock_status status;
        uint64_t epoch = 0;
        bool acquire_in_flight = false;
        std::vector<completion_handler> acquire_waiters;
    };

    std::string endpoint(const instance_id& id, const std::string& action) const;
    lock_entry& entry(const instance_id& id);
    bool is_current(const instance_id& id, uint64_t epoch) const;
    lock_status to_status(const lock_response& response) const;
    void set_status(const instance_id& id, const lock_status& status);
    void finish_acquire(const instance_id& id, const lock_status& status, std::exception_ptr error);

    /// Send `request` and deliver the response on the scheduler if `id`
    /// still has the same epoch.
    void send(const instance_id& id, const http_request& request,
              std::function<void(http_response)> on_response);

    std::shared_ptr<http_client> http_;
    std::shared_ptr<scheduler> scheduler_;
    std::string lock_url_;
    std::string client_id_;
    std::map<instance_id, lock_entry> entries_;
    uint64_t next_epoch_ = 1;
    status_handler on_status_change_;
    std::shared_ptr<char> lifetime_ = std::make_shared<char>();
};

} // namespace capsync
