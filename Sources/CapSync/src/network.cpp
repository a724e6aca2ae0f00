#include "capsync/network.hpp"
#include <cctype>
#include <stdexcept>

namespace capsync {

std::string url_escape(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string out = base;
    while (!out.empty() && out.back() == '/') out.pop_back();
    size_t start = 0;
    while (start < path.size() && path[start] == '/') ++start;
    return out + "/" + path.substr(start);
}

std::optional<uint64_t> http_response::content_length() const {
    for (const auto& [name, value] : headers) {
        if (name.size() != 14) continue;
        bool match = true;
        static const char* expected = "content-length";
        for (size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) != expected[i]) {
                match = false;
                break;
            }
        }
        if (!match) continue;
        try {
            return static_cast<uint64_t>(std::stoull(value));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool mock_http_client::respond(http_response response) {
    if (pending_.empty()) return false;
    auto req = std::move(pending_.front());
    pending_.pop_front();
    if (req.handler) req.handler(std::move(response));
    return true;
}

bool mock_http_client::progress(uint64_t received, uint64_t total) {
    if (pending_.empty()) return false;
    if (pending_.front().on_progress) pending_.front().on_progress(received, total);
    return true;
}

bool mock_http_client::respond_json(int status, const std::string& json) {
    http_response response;
    response.status_code = status;
    response.headers["Content-Type"] = "application/json";
    response.body = std::vector<uint8_t>(json.begin(), json.end());
    return respond(std::move(response));
}

} // namespace capsync
