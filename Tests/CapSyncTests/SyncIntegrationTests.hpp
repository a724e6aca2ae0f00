#pragma once

// Integration tests for the sync channel against a real WebSocket server.
// Crow hosts a relay server; websocketpp is the client transport.

#include "TestSupport.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>

#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif

#include <asio.hpp>
#include <crow.h>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

namespace capsync_integration_tests {

using namespace capsync_tests;

// ============================================================================
// Real sync transport using websocketpp
// ============================================================================

class websocketpp_transport : public sync_transport {
public:
    using client_t = websocketpp::client<websocketpp::config::asio_client>;
    using message_ptr = websocketpp::config::asio_client::message_type::ptr;

    websocketpp_transport() {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();

        client_.set_open_handler([this](websocketpp::connection_hdl hdl) {
            hdl_ = hdl;
            state_ = transport_state::open;
            if (on_open_) on_open_();
        });

        client_.set_message_handler([this](websocketpp::connection_hdl, message_ptr msg) {
            if (on_message_) on_message_(transport_message::from_string(msg->get_payload()));
        });

        client_.set_fail_handler([this](websocketpp::connection_hdl) {
            state_ = transport_state::closed;
            if (on_error_) on_error_("Connection failed");
        });

        client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
            state_ = transport_state::closed;
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(hdl, ec);
            int code = ec ? 1006 : static_cast<int>(con->get_remote_close_code());
            std::string reason = ec ? "Connection lost" : con->get_remote_close_reason();
            if (on_close_) on_close_(code, reason);
        });
    }

    ~websocketpp_transport() override {
        disconnect();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    void connect(const std::string& url,
                const std::map<std::string, std::string>& headers = {}) override {
        // A reconnect reuses the client; the previous io loop must be done.
        if (io_thread_.joinable()) {
            client_.stop();
            io_thread_.join();
            client_.reset();
        }

        websocketpp::lib::error_code ec;
        auto con = client_.get_connection(url, ec);
        if (ec) {
            if (on_error_) on_error_(ec.message());
            return;
        }

        for (const auto& [key, value] : headers) {
            con->append_header(key, value);
        }

        state_ = transport_state::connecting;
        client_.connect(con);

        io_thread_ = std::thread([this]() {
            client_.run();
        });
    }

    void disconnect() override {
        if (state_ == transport_state::open) {
            state_ = transport_state::closing;
            websocketpp::lib::error_code ec;
            client_.close(hdl_, websocketpp::close::status::normal, "Client disconnect", ec);
        }
        client_.stop();
    }

    transport_state state() const override { return state_; }

    void send(const transport_message& message) override {
        if (state_ != transport_state::open) return;

        websocketpp::lib::error_code ec;
        client_.send(hdl_, message.as_string(), websocketpp::frame::opcode::text, ec);
        if (ec) {
            std::cout << "    [Client] Send failed: " << ec.message() << std::endl;
        }
    }

    void set_on_open(on_open_handler handler) override { on_open_ = std::move(handler); }
    void set_on_message(on_message_handler handler) override { on_message_ = std::move(handler); }
    void set_on_error(on_error_handler handler) override { on_error_ = std::move(handler); }
    void set_on_close(on_close_handler handler) override { on_close_ = std::move(handler); }

private:
    client_t client_;
    websocketpp::connection_hdl hdl_;
    std::thread io_thread_;
    std::atomic<transport_state> state_{transport_state::closed};

    on_open_handler on_open_;
    on_message_handler on_message_;
    on_error_handler on_error_;
    on_close_handler on_close_;
};

/// Real channel, mocked storage and lock service.
class integration_network_factory : public network_factory {
public:
    integration_network_factory() : http_(std::make_shared<mock_http_client>()) {}

    std::shared_ptr<http_client> create_http_client() override { return http_; }

    std::unique_ptr<sync_transport> create_sync_transport() override {
        return std::make_unique<websocketpp_transport>();
    }

    mock_http_client& http() { return *http_; }

private:
    std::shared_ptr<mock_http_client> http_;
};

// ============================================================================
// Relay server using Crow
// ============================================================================
//
// Acks every change frame to its sender and rebroadcasts it to the other
// clients with a server-assigned version.

class relay_server {
public:
    explicit relay_server(int port) : port_(port) {}

    ~relay_server() { stop(); }

    void start() {
        CROW_WEBSOCKET_ROUTE(app_, "/ws/video-1/captions")
            .onopen([this](crow::websocket::connection& conn) {
                std::lock_guard<std::mutex> lock(clients_mutex_);
                clients_.insert(&conn);
                std::cout << "    [Server] Client connected" << std::endl;
            })
            .onclose([this](crow::websocket::connection& conn, const std::string& reason) {
                std::lock_guard<std::mutex> lock(clients_mutex_);
                clients_.erase(&conn);
                std::cout << "    [Server] Client disconnected: " << reason << std::endl;
            })
            .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool) {
                handle_message(conn, data);
            });

        app_.loglevel(crow::LogLevel::Warning);
        server_thread_ = std::thread([this]() {
            app_.port(port_).run();
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        running_ = true;
        std::cout << "    [Server] Started on port " << port_ << std::endl;
    }

    void stop() {
        if (running_) {
            app_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            running_ = false;
            std::cout << "    [Server] Stopped" << std::endl;
        }
    }

    version_t version() const { return version_; }

private:
    void handle_message(crow::websocket::connection& sender, const std::string& data) {
        auto msg = client_message::from_json(data);
        if (!msg) {
            std::cout << "    [Server] Failed to parse message" << std::endl;
            return;
        }
        if (msg->message_type != client_message::type::changes) return;

        std::lock_guard<std::mutex> lock(clients_mutex_);
        version_t version = version_;
        for (const auto& c : msg->changes) version = std::max(version, c.db_version);
        version_ = version;

        server_message ack;
        ack.message_type = server_message::type::ack;
        ack.version = version;
        ack.message_id = msg->message_id;
        ack.pending_changes = 0;
        sender.send_text(ack.to_json());

        server_message relay;
        relay.message_type = server_message::type::changes;
        relay.version = version;
        relay.changes = msg->changes;
        auto frame = relay.to_json();
        for (auto* client : clients_) {
            if (client != &sender) {
                client->send_text(frame);
            }
        }
    }

    crow::SimpleApp app_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    int port_;

    std::mutex clients_mutex_;
    std::set<crow::websocket::connection*> clients_;
    std::atomic<version_t> version_{0};
};

// ============================================================================
// Client harness
// ============================================================================

/// Registry on its own scheduler thread; every call is marshalled onto it.
struct live_client {
    std::shared_ptr<std_thread_scheduler> sched = std::make_shared<std_thread_scheduler>();
    std::shared_ptr<integration_network_factory> network = std::make_shared<integration_network_factory>();
    std::unique_ptr<registry> reg;

    live_client(const std::string& client_id, int port) {
        registry_config config;
        config.storage_url = "https://storage.example.com/dbs";
        config.lock_url = "https://api.example.com/locks";
        config.websocket_url = "ws://127.0.0.1:" + std::to_string(port) + "/ws";
        config.client_id = client_id;
        config.sync.heartbeat_interval = millis(0);
        config.sched = sched;
        config.network = network;
        reg = std::make_unique<registry>(config);
    }

    ~live_client() {
        run([this] { reg.reset(); });
    }

    template <typename F>
    auto run(F&& fn) -> decltype(fn()) {
        if (sched->is_on_thread()) return fn();
        std::packaged_task<decltype(fn())()> task(std::forward<F>(fn));
        auto result = task.get_future();
        sched->invoke([&task] { task(); });
        return result.get();
    }

    void open(const byte_vector& image, bool acquire_lock) {
        run([&] {
            initialize_options options;
            options.acquire_lock = acquire_lock;
            reg->initialize("tenant", "video-1", "captions", options, {});
            network->http().respond(ok_body(image));
        });
        if (!acquire_lock) return;
        for (int i = 0; i < 50; ++i) {
            if (run([&] { return network->http().respond_json(200, granted_to(reg->client_id())); })) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    bool connected() {
        return run([this] {
            auto snap = reg->instance("video-1", "captions");
            return snap && snap->sync.connected;
        });
    }

    int64_t exec(const std::string& sql) {
        return run([&] { return reg->exec("video-1", "captions", sql); });
    }

    std::vector<row_t> rows() {
        return run([this] {
            return reg->query("video-1", "captions", "SELECT id, text FROM captions ORDER BY id");
        });
    }
};

// ============================================================================
// Integration Tests
// ============================================================================

inline void test_CaptionSync() {
    std::cout << "Testing CaptionSync integration..." << std::endl;

    relay_server server(18090);
    server.start();

    live_client a("tab_a", 18090);
    live_client b("tab_b", 18090);
    auto image = captions_image(5);
    a.open(image, true);
    b.open(image, false);

    std::cout << "  Waiting for clients to connect..." << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    if (!a.connected() || !b.connected()) {
        std::cout << "  FAILED: Clients did not connect (a=" << a.connected()
                  << ", b=" << b.connected() << ")" << std::endl;
        server.stop();
        return;
    }
    std::cout << "    Both clients connected" << std::endl;

    // -------------------------------------------------------------------------
    // Insert on A, expect it on B
    // -------------------------------------------------------------------------
    std::cout << "  Inserting caption on client A..." << std::endl;
    a.exec("INSERT INTO captions (id, start_ms, end_ms, text) VALUES (1, 0, 1500, 'Hello')");
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    auto on_b = b.rows();
    if (on_b.size() == 1 && as_text(on_b[0].at("text")) == "Hello") {
        std::cout << "    SUCCESS: Caption synced to client B" << std::endl;
    } else {
        std::cout << "    FAILED: Client B has " << on_b.size() << " captions" << std::endl;
    }

    // -------------------------------------------------------------------------
    // Update on A
    // -------------------------------------------------------------------------
    std::cout << "  Updating caption text on client A..." << std::endl;
    a.exec("UPDATE captions SET text = 'Hello there' WHERE id = 1");
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    on_b = b.rows();
    if (on_b.size() == 1 && as_text(on_b[0].at("text")) == "Hello there") {
        std::cout << "    SUCCESS: Update synced to client B" << std::endl;
    } else {
        std::cout << "    FAILED: Update not synced" << std::endl;
    }

    auto pending = a.run([&] { return a.reg->instance("video-1", "captions")->sync.pending_changes; });
    if (pending == 0) {
        std::cout << "    SUCCESS: Server acknowledged every change set" << std::endl;
    } else {
        std::cout << "    FAILED: " << pending << " change sets still pending" << std::endl;
    }

    // -------------------------------------------------------------------------
    // Delete on A
    // -------------------------------------------------------------------------
    std::cout << "  Deleting caption on client A..." << std::endl;
    a.exec("DELETE FROM captions WHERE id = 1");
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    if (b.rows().empty()) {
        std::cout << "    SUCCESS: Delete synced to client B" << std::endl;
    } else {
        std::cout << "    FAILED: Delete not synced" << std::endl;
    }

    a.run([&] { a.reg->close_all(); });
    b.run([&] { b.reg->close_all(); });
    server.stop();

    std::cout << "  CaptionSync integration test completed!" << std::endl;
}

} // namespace capsync_integration_tests
