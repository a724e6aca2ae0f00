#pragma once

#include "scheduler.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capsync {

// ============================================================================
// Notification Token (RAII)
// ============================================================================

/// Move-only handle that unregisters its subscription when destroyed.
class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    void unregister() {
        if (unregister_) {
            unregister_();
            unregister_ = nullptr;
        }
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

// ============================================================================
// Change subscriptions
// ============================================================================

/// Empty fields match everything. `pk` is the key's JSON text ("3", "\"a\"").
struct change_filter {
    std::optional<std::string> table;
    std::optional<std::string> pk;
    std::optional<std::string> column;

    static change_filter for_table(const std::string& table) {
        change_filter f;
        f.table = table;
        return f;
    }

    static change_filter for_row(const std::string& table, const column_value_t& key);

    static change_filter for_column(const std::string& table, const std::string& column) {
        change_filter f;
        f.table = table;
        f.column = column;
        return f;
    }

    bool matches(const change& c) const;
};

enum class change_origin {
    local,
    remote
};

struct change_event {
    instance_id id;
    change_origin origin = change_origin::local;
    version_t version = 0;
    /// Only the changes that passed the subscriber's filter.
    std::vector<change> changes;
};

using change_callback = std::function<void(const change_event& event)>;

class subscription_manager {
public:
    /// Debounce timers run on `sched`. Null uses an immediate_scheduler.
    explicit subscription_manager(std::shared_ptr<scheduler> sched = nullptr);

    /// With a non-zero `debounce`, matching changes accumulate and are
    /// delivered as one event once no new change arrived for that long.
    uint64_t add(const instance_id& id, change_filter filter, change_callback callback,
                 std::chrono::milliseconds debounce = std::chrono::milliseconds(0));
    bool remove(uint64_t subscription_id);

    /// Drop every subscription of `id`, pending batches included.
    void clear(const instance_id& id);

    /// Deliver to each matching subscriber. A subscriber that throws is
    /// logged and does not affect the others.
    void notify(const instance_id& id, change_origin origin, version_t version,
                const std::vector<change>& changes);

    size_t count(const instance_id& id) const;
    size_t size() const { return subscriptions_.size(); }

private:
    struct subscription {
        instance_id id;
        change_filter filter;
        change_callback callback;
        std::chrono::milliseconds debounce{0};
        std::optional<change_event> pending;
        uint64_t timer_epoch = 0;
    };

    void schedule(uint64_t sid, subscription& sub);
    void deliver(uint64_t sid, change_callback callback, const change_event& event);

    std::shared_ptr<scheduler> scheduler_;
    std::map<uint64_t, subscription> subscriptions_;
    uint64_t next_id_ = 1;

    std::shared_ptr<char> lifetime_ = std::make_shared<char>();
};

} // namespace capsync
