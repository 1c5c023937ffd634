#pragma once

#include <string>
#include <functional>
#include <thread>
#include <atomic>
#include <mutex>
#include <optional>
#include <cstdint>
#include "common/types.hpp"

namespace tarb {

struct WsEndpoint {
    std::string host;
    int port{443};
    std::string path{"/"};
    bool tls{true};
};

/**
 * Split a ws:// or wss:// URL into host, port and request path.
 * nullopt for any other scheme or an empty host.
 */
std::optional<WsEndpoint> parse_ws_url(const std::string& url);

/**
 * WebSocket client over POSIX sockets and OpenSSL with its own receive
 * thread. Reconnects after a fixed delay for as long as it is running.
 *
 * Subclasses send their subscriptions from on_open() and get every
 * complete text message in handle_message(), both on the receive thread.
 */
class WebSocketClientBase {
public:
    using StatusCallback = std::function<void(ConnectionStatus)>;

    WebSocketClientBase(const std::string& url, const std::string& name);
    virtual ~WebSocketClientBase();

    WebSocketClientBase(const WebSocketClientBase&) = delete;
    WebSocketClientBase& operator=(const WebSocketClientBase&) = delete;

    // Starts the receive thread; returns immediately
    void connect();

    // Stops the receive thread and closes the socket. Safe to call twice.
    void disconnect();

    // Send a text frame; false when not connected or the write failed.
    // The TLS session is not shared across threads, so call this from
    // on_open() or handle_message().
    bool send(const std::string& message);

    ConnectionStatus status() const { return status_.load(); }
    bool is_connected() const { return status_.load() == ConnectionStatus::CONNECTED; }

    void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }
    void set_reconnect_delay(int ms) { reconnect_delay_ms_ = ms; }
    void set_ping_interval(int ms) { ping_interval_ms_ = ms; }  // 0 disables client pings

    int64_t messages_received() const { return messages_received_.load(); }
    int64_t reconnects() const { return reconnects_.load(); }

protected:
    virtual void on_open() {}
    virtual void handle_message(const std::string& msg) = 0;

    const std::string& name() const { return name_; }

private:
    void run_connection_loop();
    bool connect_socket();
    void close_socket();
    bool perform_handshake();

    // One complete message; nullopt on timeout, throws on a dead connection
    std::optional<std::string> read_message();
    bool wait_readable(int timeout_ms);

    void read_exact(void* buf, size_t n);
    bool write_all(const std::string& data);
    bool send_frame(const std::string& payload, uint8_t opcode);
    void set_status(ConnectionStatus s);
    void sleep_while_running(int ms);

    std::string url_;
    std::string name_;
    WsEndpoint endpoint_;

    std::atomic<ConnectionStatus> status_{ConnectionStatus::DISCONNECTED};
    StatusCallback on_status_;

    int reconnect_delay_ms_{3000};
    int ping_interval_ms_{0};

    std::atomic<int64_t> messages_received_{0};
    std::atomic<int64_t> reconnects_{0};

    std::atomic<bool> running_{false};
    std::thread recv_thread_;

    std::mutex write_mutex_;
    int fd_{-1};
    void* ssl_ctx_{nullptr};
    void* ssl_{nullptr};
};

} // namespace tarb
