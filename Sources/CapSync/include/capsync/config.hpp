#pragma once

#include "scheduler.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capsync {

class network_factory;

using millis = std::chrono::milliseconds;

/// min(initial * multiplier^attempt, max_delay), attempt counted from 0.
millis backoff_delay(millis initial, millis max_delay, double multiplier, int attempt);

/// Download retry policy.
struct retry_options {
    int max_retries = 3;
    millis initial_delay{1000};
    millis max_delay{10000};
    double backoff_multiplier = 2.0;

    millis delay_for(int attempt) const {
        return backoff_delay(initial_delay, max_delay, backoff_multiplier, attempt);
    }
};

/// Sync channel reconnect and heartbeat policy.
struct sync_options {
    int max_reconnect_attempts = 6;
    millis initial_delay{1000};
    millis max_delay{30000};
    double backoff_multiplier = 2.0;

    /// Ping period while connected. Zero disables the heartbeat.
    millis heartbeat_interval{30000};

    /// Change sets sent within this window go out as one message.
    /// Zero sends each set as it arrives.
    millis send_delay{0};

    millis delay_for(int attempt) const {
        return backoff_delay(initial_delay, max_delay, backoff_multiplier, attempt);
    }
};

/// Per-call options for registry::initialize.
struct initialize_options {
    /// Request the edit lock once the instance is ready.
    bool acquire_lock = false;

    /// Bypass the downloaded-image cache.
    bool force_download = false;

    /// Tables to replicate. nullopt = the database name's defaults.
    std::optional<std::vector<std::string>> tracked_tables;
};

struct registry_config {
    /// Base URL of the image store: <storage_url>/<tenant>/<video>/<db>.db
    std::string storage_url;

    /// Base URL of the lock service: <lock_url>/<video>/<db>/{acquire,release,check}
    std::string lock_url;

    /// Base URL of the sync channel: <websocket_url>/<video>/<db>?tab_id=<client_id>
    std::string websocket_url;

    /// Bearer token sent when the channel connects.
    std::string auth_token;

    /// Identity of this client as a lock holder. Empty = generated tab_<uuid>.
    std::string client_id;

    /// Database name -> tracked tables, overriding the built-in defaults.
    std::map<std::string, std::vector<std::string>> tracked_tables;

    retry_options retry;
    sync_options sync;

    /// Scheduler for all completions and timers. nullptr = immediate_scheduler.
    std::shared_ptr<scheduler> sched = nullptr;

    /// Platform transports. Required.
    std::shared_ptr<network_factory> network = nullptr;

    /// Tables replicated for `database_name` under this configuration.
    std::vector<std::string> tables_for(const std::string& database_name) const;

    /// Parse the serializable fields (URLs, token, client id, tracked tables,
    /// retry and sync policy). Durations are in milliseconds. Throws
    /// std::invalid_argument on malformed input.
    static registry_config from_json(const std::string& json_str);
};

} // namespace capsync
