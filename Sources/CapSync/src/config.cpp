#include "capsync/config.hpp"
#include "capsync/types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace capsync {

using json = nlohmann::json;

millis backoff_delay(millis initial, millis max_delay, double multiplier, int attempt) {
    double delay = static_cast<double>(initial.count()) * std::pow(multiplier, attempt);
    double cap = static_cast<double>(max_delay.count());
    return millis(static_cast<int64_t>(std::min(delay, cap)));
}

std::vector<std::string> registry_config::tables_for(const std::string& database_name) const {
    auto it = tracked_tables.find(database_name);
    if (it != tracked_tables.end()) {
        return it->second;
    }
    return default_tracked_tables(database_name);
}

static millis read_millis(const json& j, const char* key, millis fallback) {
    if (!j.contains(key)) return fallback;
    auto value = j[key].get<int64_t>();
    if (value < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return millis(value);
}

registry_config registry_config::from_json(const std::string& json_str) {
    registry_config config;
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            throw std::invalid_argument("configuration must be a JSON object");
        }

        config.storage_url = j.value("storageUrl", std::string());
        config.lock_url = j.value("lockUrl", std::string());
        config.websocket_url = j.value("websocketUrl", std::string());
        config.auth_token = j.value("authToken", std::string());
        config.client_id = j.value("clientId", std::string());

        if (j.contains("trackedTables")) {
            for (auto& [name, tables] : j["trackedTables"].items()) {
                config.tracked_tables[name] = tables.get<std::vector<std::string>>();
            }
        }

        if (j.contains("retry")) {
            const auto& r = j["retry"];
            config.retry.max_retries = r.value("maxRetries", config.retry.max_retries);
            config.retry.initial_delay = read_millis(r, "initialDelay", config.retry.initial_delay);
            config.retry.max_delay = read_millis(r, "maxDelay", config.retry.max_delay);
            config.retry.backoff_multiplier = r.value("backoffMultiplier", config.retry.backoff_multiplier);
        }

        if (j.contains("sync")) {
            const auto& s = j["sync"];
            config.sync.max_reconnect_attempts =
                s.value("maxReconnectAttempts", config.sync.max_reconnect_attempts);
            config.sync.initial_delay = read_millis(s, "initialDelay", config.sync.initial_delay);
            config.sync.max_delay = read_millis(s, "maxDelay", config.sync.max_delay);
            config.sync.backoff_multiplier = s.value("backoffMultiplier", config.sync.backoff_multiplier);
            config.sync.heartbeat_interval =
                read_millis(s, "heartbeatInterval", config.sync.heartbeat_interval);
            config.sync.send_delay = read_millis(s, "sendDelay", config.sync.send_delay);
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid configuration: ") + e.what());
    }

    if (config.retry.max_retries < 0 || config.sync.max_reconnect_attempts < 0) {
        throw std::invalid_argument("Invalid configuration: retry counts must not be negative");
    }
    return config;
}

} // namespace capsync
