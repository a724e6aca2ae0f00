#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <optional>
#include <map>
#include <deque>

namespace capsync {

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Abstract interface for HTTP operations. Platform-specific implementations:
// - Browser/WASM: fetch
// - Native: libcurl, asio, etc.
//
// status_code 0 means the request never produced a response (DNS, reset,
// timeout); `error` then carries the transport's description.

struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::string error;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
    std::optional<uint64_t> content_length() const;
};

struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    using completion_handler = std::function<void(http_response)>;
    /// (bytesReceived, totalBytes); totalBytes is 0 when unknown.
    using progress_handler = std::function<void(uint64_t, uint64_t)>;

    virtual void send_async(const http_request& request,
                            completion_handler handler,
                            progress_handler on_progress = {}) = 0;
};

// ============================================================================
// Sync Transport Interface
// ============================================================================
//
// Abstract interface for the bidirectional sync channel (WebSocket in the
// browser and on native platforms).

enum class transport_state {
    connecting,
    open,
    closing,
    closed
};

/// One text frame. The sync protocol is JSON only.
struct transport_message {
    std::vector<uint8_t> data;

    std::string as_string() const {
        return std::string(data.begin(), data.end());
    }

    static transport_message from_string(const std::string& s) {
        transport_message msg;
        msg.data = std::vector<uint8_t>(s.begin(), s.end());
        return msg;
    }
};

class sync_transport {
public:
    virtual ~sync_transport() = default;

    virtual void connect(const std::string& url,
                        const std::map<std::string, std::string>& headers = {}) = 0;
    virtual void disconnect() = 0;
    virtual transport_state state() const = 0;

    virtual void send(const transport_message& message) = 0;

    using on_open_handler = std::function<void()>;
    using on_message_handler = std::function<void(const transport_message&)>;
    using on_error_handler = std::function<void(const std::string& error)>;
    using on_close_handler = std::function<void(int code, const std::string& reason)>;

    virtual void set_on_open(on_open_handler handler) = 0;
    virtual void set_on_message(on_message_handler handler) = 0;
    virtual void set_on_error(on_error_handler handler) = 0;
    virtual void set_on_close(on_close_handler handler) = 0;
};

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string url_escape(const std::string& s);

/// base + "/" + path, with exactly one slash between them.
std::string join_url(const std::string& base, const std::string& path);

// WebSocket close codes that end a session without reconnecting.
inline constexpr int close_normal = 1000;
inline constexpr int close_going_away = 1001;

// ============================================================================
// Factory for creating platform-specific clients
// ============================================================================

class network_factory {
public:
    virtual ~network_factory() = default;

    virtual std::shared_ptr<http_client> create_http_client() = 0;
    virtual std::unique_ptr<sync_transport> create_sync_transport() = 0;
};

// ============================================================================
// Mock implementations for testing
// ============================================================================

/// Records requests; the test completes them explicitly.
class mock_http_client : public http_client {
public:
    struct pending_request {
        http_request request;
        completion_handler handler;
        progress_handler on_progress;
    };

    void send_async(const http_request& request,
                    completion_handler handler,
                    progress_handler on_progress = {}) override {
        sent_.push_back(request);
        pending_.push_back({request, std::move(handler), std::move(on_progress)});
    }

    /// Complete the oldest outstanding request. Returns false if none.
    bool respond(http_response response);

    /// Report progress on the oldest outstanding request.
    bool progress(uint64_t received, uint64_t total);

    /// Complete the oldest outstanding request with a JSON body.
    bool respond_json(int status, const std::string& json);

    size_t outstanding() const { return pending_.size(); }
    const pending_request* peek() const { return pending_.empty() ? nullptr : &pending_.front(); }
    const std::vector<http_request>& sent() const { return sent_; }

private:
    std::deque<pending_request> pending_;
    std::vector<http_request> sent_;
};

class mock_sync_transport : public sync_transport {
public:
    void connect(const std::string& url,
                const std::map<std::string, std::string>& headers = {}) override {
        url_ = url;
        headers_ = headers;
        ++connect_count_;
        state_ = transport_state::connecting;
        if (auto_open_) {
            simulate_open();
        }
    }

    void disconnect() override {
        if (state_ == transport_state::closed) return;
        state_ = transport_state::closed;
        if (on_close_) on_close_(close_normal, "Normal closure");
    }

    transport_state state() const override { return state_; }

    void send(const transport_message& message) override {
        sent_messages_.push_back(message);
    }

    void set_on_open(on_open_handler handler) override { on_open_ = std::move(handler); }
    void set_on_message(on_message_handler handler) override { on_message_ = std::move(handler); }
    void set_on_error(on_error_handler handler) override { on_error_ = std::move(handler); }
    void set_on_close(on_close_handler handler) override { on_close_ = std::move(handler); }

    // Test helpers
    void set_auto_open(bool value) { auto_open_ = value; }

    void simulate_open() {
        state_ = transport_state::open;
        if (on_open_) on_open_();
    }

    void simulate_message(const std::string& text) {
        if (on_message_) on_message_(transport_message::from_string(text));
    }

    void simulate_error(const std::string& error) {
        if (on_error_) on_error_(error);
    }

    /// Drop the connection the way a network failure would.
    void simulate_drop(int code = 1006, const std::string& reason = "Abnormal closure") {
        state_ = transport_state::closed;
        if (on_close_) on_close_(code, reason);
    }

    const std::vector<transport_message>& get_sent_messages() const {
        return sent_messages_;
    }

    void clear_sent_messages() { sent_messages_.clear(); }

    const std::string& url() const { return url_; }
    const std::map<std::string, std::string>& headers() const { return headers_; }
    int connect_count() const { return connect_count_; }

private:
    std::string url_;
    std::map<std::string, std::string> headers_;
    transport_state state_ = transport_state::closed;
    bool auto_open_ = true;
    int connect_count_ = 0;
    on_open_handler on_open_;
    on_message_handler on_message_;
    on_error_handler on_error_;
    on_close_handler on_close_;
    std::vector<transport_message> sent_messages_;
};

class mock_network_factory : public network_factory {
public:
    mock_network_factory() : http_(std::make_shared<mock_http_client>()) {}

    std::shared_ptr<http_client> create_http_client() override {
        return http_;
    }

    std::unique_ptr<sync_transport> create_sync_transport() override {
        auto client = std::make_unique<mock_sync_transport>();
        client->set_auto_open(auto_open_);
        last_transport_ = client.get();
        transports_.push_back(client.get());
        return client;
    }

    mock_http_client& http() { return *http_; }

    /// Transports created so far, oldest first. Pointers stay valid while the
    /// owning sync manager is alive.
    mock_sync_transport* last_transport() { return last_transport_; }
    const std::vector<mock_sync_transport*>& transports() const { return transports_; }

    void set_auto_open(bool value) { auto_open_ = value; }

private:
    std::shared_ptr<mock_http_client> http_;
    mock_sync_transport* last_transport_ = nullptr;
    std::vector<mock_sync_transport*> transports_;
    bool auto_open_ = true;
};

} // namespace capsync
