#include "capsync/subscriptions.hpp"
#include "capsync/log.hpp"
#include "capsync/protocol.hpp"

namespace capsync {

change_filter change_filter::for_row(const std::string& table, const column_value_t& key) {
    change_filter f;
    f.table = table;
    f.pk = encode_primary_key(key);
    return f;
}

bool change_filter::matches(const change& c) const {
    if (table && *table != c.table) return false;
    if (pk && *pk != c.pk) return false;
    // Row creation and deletion touch every column.
    if (column && *column != c.cid && c.cid != row_sentinel_cid) return false;
    return true;
}

subscription_manager::subscription_manager(std::shared_ptr<scheduler> sched)
    : scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>()) {}

uint64_t subscription_manager::add(const instance_id& id, change_filter filter, change_callback callback,
                                   std::chrono::milliseconds debounce) {
    uint64_t sid = next_id_++;
    subscription sub;
    sub.id = id;
    sub.filter = std::move(filter);
    sub.callback = std::move(callback);
    sub.debounce = debounce;
    subscriptions_.emplace(sid, std::move(sub));
    return sid;
}

bool subscription_manager::remove(uint64_t subscription_id) {
    return subscriptions_.erase(subscription_id) > 0;
}

void subscription_manager::clear(const instance_id& id) {
    for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
        if (it->second.id == id) {
            it = subscriptions_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t subscription_manager::count(const instance_id& id) const {
    size_t n = 0;
    for (const auto& [_, sub] : subscriptions_) {
        if (sub.id == id) ++n;
    }
    return n;
}

void subscription_manager::notify(const instance_id& id, change_origin origin, version_t version,
                                  const std::vector<change>& changes) {
    if (changes.empty()) return;

    // Callbacks may subscribe or unsubscribe; walk a snapshot of ids.
    std::vector<uint64_t> ids;
    for (const auto& [sid, sub] : subscriptions_) {
        if (sub.id == id) ids.push_back(sid);
    }

    for (auto sid : ids) {
        auto it = subscriptions_.find(sid);
        if (it == subscriptions_.end()) continue;

        change_event event;
        event.id = id;
        event.origin = origin;
        event.version = version;
        for (const auto& c : changes) {
            if (it->second.filter.matches(c)) event.changes.push_back(c);
        }
        if (event.changes.empty()) continue;

        auto& sub = it->second;
        if (sub.debounce.count() > 0) {
            if (!sub.pending) {
                sub.pending = change_event{};
                sub.pending->id = id;
            }
            sub.pending->origin = origin;
            sub.pending->version = version;
            sub.pending->changes.insert(sub.pending->changes.end(),
                                        event.changes.begin(), event.changes.end());
            schedule(sid, sub);
            continue;
        }

        deliver(sid, sub.callback, event);
    }
}

void subscription_manager::schedule(uint64_t sid, subscription& sub) {
    // Trailing edge: every new change restarts the timer.
    uint64_t epoch = ++sub.timer_epoch;
    std::weak_ptr<char> alive = lifetime_;
    scheduler_->invoke_after(sub.debounce, [this, alive, sid, epoch] {
        if (alive.expired()) return;
        auto it = subscriptions_.find(sid);
        if (it == subscriptions_.end() || it->second.timer_epoch != epoch || !it->second.pending) return;

        auto event = std::move(*it->second.pending);
        it->second.pending.reset();
        deliver(sid, it->second.callback, event);
    });
}

void subscription_manager::deliver(uint64_t sid, change_callback callback, const change_event& event) {
    try {
        callback(event);
    } catch (const std::exception& e) {
        LOG_ERROR("subscriptions", "Subscriber %llu on %s threw: %s",
                  static_cast<unsigned long long>(sid), event.id.to_string().c_str(), e.what());
    }
}

} // namespace capsync
