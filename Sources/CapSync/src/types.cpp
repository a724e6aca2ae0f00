#include "capsync/types.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace capsync {

std::string uuid_t::to_string() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

uuid_t uuid_t::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uuid_t result;
    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    for (int i = 0; i < 8; ++i) {
        result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
        result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
    }

    // Set version (4) and variant (RFC 4122)
    result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
    result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

    return result;
}

std::vector<std::string> default_tracked_tables(const std::string& database_name) {
    if (database_name == database_names::layout) {
        return {"boxes", "layout_config", "preferences"};
    }
    if (database_name == database_names::captions) {
        return {"captions"};
    }
    return {};
}

std::optional<instance_id> instance_id::parse(const std::string& s) {
    auto pos = s.find(':');
    if (pos == std::string::npos || s.find(':', pos + 1) != std::string::npos) {
        return std::nullopt;
    }
    std::string video = s.substr(0, pos);
    std::string db = s.substr(pos + 1);
    if (video.empty() || db.empty()) {
        return std::nullopt;
    }
    return instance_id(std::move(video), std::move(db));
}

const char* to_string(connection_state state) {
    switch (state) {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::reconnecting: return "reconnecting";
    }
    return "disconnected";
}

const char* to_string(lock_state state) {
    switch (state) {
        case lock_state::released: return "released";
        case lock_state::pending: return "pending";
        case lock_state::granted: return "granted";
        case lock_state::transferring: return "transferring";
    }
    return "released";
}

std::optional<lock_state> lock_state_from_string(const std::string& s) {
    if (s == "released") return lock_state::released;
    if (s == "pending") return lock_state::pending;
    if (s == "granted") return lock_state::granted;
    if (s == "transferring") return lock_state::transferring;
    return std::nullopt;
}

} // namespace capsync
