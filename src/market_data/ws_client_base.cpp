#include "market_data/ws_client_base.hpp"
#include "utils/crypto.hpp"
#include <spdlog/spdlog.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace tarb {

namespace {
    constexpr uint8_t OP_CONTINUATION = 0x0;
    constexpr uint8_t OP_TEXT = 0x1;
    constexpr uint8_t OP_BINARY = 0x2;
    constexpr uint8_t OP_CLOSE = 0x8;
    constexpr uint8_t OP_PING = 0x9;
    constexpr uint8_t OP_PONG = 0xA;

    constexpr uint64_t MAX_MESSAGE_BYTES = 16 * 1024 * 1024;
    constexpr int READ_POLL_MS = 200;
    constexpr int SOCKET_TIMEOUT_SECS = 10;

    SSL* as_ssl(void* p) { return static_cast<SSL*>(p); }

    std::string create_ws_frame(const std::string& data, uint8_t opcode) {
        std::string frame;
        frame += static_cast<char>(0x80 | opcode);

        size_t len = data.size();
        if (len < 126) {
            frame += static_cast<char>(0x80 | len);
        } else if (len < 65536) {
            frame += static_cast<char>(0x80 | 126);
            frame += static_cast<char>((len >> 8) & 0xFF);
            frame += static_cast<char>(len & 0xFF);
        } else {
            frame += static_cast<char>(0x80 | 127);
            for (int i = 7; i >= 0; i--) {
                frame += static_cast<char>((static_cast<uint64_t>(len) >> (8 * i)) & 0xFF);
            }
        }

        auto mask = crypto::random_bytes(4);
        frame.append(reinterpret_cast<const char*>(mask.data()), 4);
        for (size_t i = 0; i < data.size(); i++) {
            frame += static_cast<char>(data[i] ^ mask[i % 4]);
        }
        return frame;
    }
}

std::optional<WsEndpoint> parse_ws_url(const std::string& url) {
    WsEndpoint ep;
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        ep.tls = true;
        ep.port = 443;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        ep.tls = false;
        ep.port = 80;
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    ep.path = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        try {
            ep.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        authority.resize(colon);
    }
    if (authority.empty() || ep.port <= 0 || ep.port > 65535) {
        return std::nullopt;
    }
    ep.host = authority;
    return ep;
}

WebSocketClientBase::WebSocketClientBase(const std::string& url, const std::string& name)
    : url_(url)
    , name_(name)
{
    auto ep = parse_ws_url(url);
    if (!ep) {
        throw std::invalid_argument("Invalid WebSocket URL for " + name + ": " + url);
    }
    endpoint_ = *ep;
}

WebSocketClientBase::~WebSocketClientBase() {
    // Subclasses must disconnect() in their own destructor before members go away
    disconnect();
}

void WebSocketClientBase::connect() {
    if (running_.exchange(true)) {
        spdlog::warn("{} already running", name_);
        return;
    }
    set_status(ConnectionStatus::CONNECTING);
    recv_thread_ = std::thread(&WebSocketClientBase::run_connection_loop, this);
}

void WebSocketClientBase::disconnect() {
    running_ = false;
    if (recv_thread_.joinable()) {
        recv_thread_.join();
    }
    close_socket();
    if (status_.load() != ConnectionStatus::DISCONNECTED) {
        set_status(ConnectionStatus::DISCONNECTED);
    }
}

void WebSocketClientBase::set_status(ConnectionStatus s) {
    status_ = s;
    spdlog::debug("{} status -> {}", name_, conn_status_to_string(s));
    if (on_status_) on_status_(s);
}

void WebSocketClientBase::sleep_while_running(int ms) {
    auto deadline = now() + std::chrono::milliseconds(ms);
    while (running_.load() && now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

bool WebSocketClientBase::connect_socket() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(endpoint_.port);
    int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        spdlog::error("{}: failed to resolve {}: {}", name_, endpoint_.host, gai_strerror(rc));
        return false;
    }

    int sock = -1;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) continue;
        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) break;
        ::close(sock);
        sock = -1;
    }
    freeaddrinfo(result);

    if (sock < 0) {
        spdlog::error("{}: failed to connect to {}:{}: {}", name_, endpoint_.host, endpoint_.port, strerror(errno));
        return false;
    }

    struct timeval tv{};
    tv.tv_sec = SOCKET_TIMEOUT_SECS;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        fd_ = sock;
    }

    if (endpoint_.tls) {
        SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) {
            spdlog::error("{}: failed to create SSL context", name_);
            close_socket();
            return false;
        }
        SSL_CTX_set_default_verify_paths(ctx);

        SSL* ssl = SSL_new(ctx);
        SSL_set_fd(ssl, sock);
        SSL_set_tlsext_host_name(ssl, endpoint_.host.c_str());

        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            ssl_ctx_ = ctx;
            ssl_ = ssl;
        }

        if (SSL_connect(ssl) <= 0) {
            char err[256];
            ERR_error_string_n(ERR_get_error(), err, sizeof(err));
            spdlog::error("{}: TLS handshake with {} failed: {}", name_, endpoint_.host, err);
            close_socket();
            return false;
        }
    }

    if (!perform_handshake()) {
        close_socket();
        return false;
    }

    spdlog::info("{} connected to {}", name_, url_);
    return true;
}

bool WebSocketClientBase::perform_handshake() {
    std::string key = crypto::base64_encode(crypto::random_bytes(16));

    std::string request = "GET " + endpoint_.path + " HTTP/1.1\r\n";
    request += "Host: " + endpoint_.host + "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: " + key + "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";
    request += "\r\n";

    if (!write_all(request)) {
        spdlog::error("{}: failed to send WebSocket handshake", name_);
        return false;
    }

    // Read byte-wise up to the blank line so no frame bytes are consumed
    std::string response;
    try {
        while (response.size() < 8192 &&
               (response.size() < 4 || response.compare(response.size() - 4, 4, "\r\n\r\n") != 0)) {
            char c;
            read_exact(&c, 1);
            response.push_back(c);
        }
    } catch (const std::exception& e) {
        spdlog::error("{}: no handshake response: {}", name_, e.what());
        return false;
    }

    auto line_end = response.find("\r\n");
    std::string status_line = response.substr(0, line_end);
    if (status_line.find(" 101") == std::string::npos) {
        spdlog::error("{}: WebSocket upgrade refused: {}", name_, status_line);
        return false;
    }
    return true;
}

void WebSocketClientBase::close_socket() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (ssl_) {
        SSL_shutdown(as_ssl(ssl_));
        SSL_free(as_ssl(ssl_));
        ssl_ = nullptr;
    }
    if (ssl_ctx_) {
        SSL_CTX_free(static_cast<SSL_CTX*>(ssl_ctx_));
        ssl_ctx_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void WebSocketClientBase::read_exact(void* buf, size_t n) {
    auto* out = static_cast<uint8_t*>(buf);
    size_t got = 0;
    while (got < n) {
        int chunk;
        if (ssl_) {
            chunk = SSL_read(as_ssl(ssl_), out + got, static_cast<int>(n - got));
        } else {
            chunk = static_cast<int>(::recv(fd_, out + got, n - got, 0));
        }
        if (chunk <= 0) {
            throw std::runtime_error("connection closed while reading");
        }
        got += static_cast<size_t>(chunk);
    }
}

bool WebSocketClientBase::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        int n;
        if (ssl_) {
            n = SSL_write(as_ssl(ssl_), data.data() + sent, static_cast<int>(data.size() - sent));
        } else if (fd_ >= 0) {
            n = static_cast<int>(::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL));
        } else {
            return false;
        }
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketClientBase::send_frame(const std::string& payload, uint8_t opcode) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ < 0) return false;
    return write_all(create_ws_frame(payload, opcode));
}

bool WebSocketClientBase::send(const std::string& message) {
    if (!is_connected()) {
        return false;
    }
    return send_frame(message, OP_TEXT);
}

bool WebSocketClientBase::wait_readable(int timeout_ms) {
    if (ssl_ && SSL_pending(as_ssl(ssl_)) > 0) {
        return true;
    }
    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0 && errno != EINTR) {
        throw std::runtime_error(std::string("poll failed: ") + strerror(errno));
    }
    return rc > 0;
}

std::optional<std::string> WebSocketClientBase::read_message() {
    std::string message;
    bool in_message = false;

    while (true) {
        if (!in_message && !wait_readable(READ_POLL_MS)) {
            return std::nullopt;
        }

        uint8_t header[2];
        read_exact(header, 2);

        bool fin = (header[0] & 0x80) != 0;
        uint8_t opcode = header[0] & 0x0F;
        bool masked = (header[1] & 0x80) != 0;
        uint64_t payload_len = header[1] & 0x7F;

        if (payload_len == 126) {
            uint8_t ext[2];
            read_exact(ext, 2);
            payload_len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
        } else if (payload_len == 127) {
            uint8_t ext[8];
            read_exact(ext, 8);
            payload_len = 0;
            for (int i = 0; i < 8; i++) {
                payload_len = (payload_len << 8) | ext[i];
            }
        }

        uint8_t mask[4] = {0};
        if (masked) {
            read_exact(mask, 4);
        }

        if (payload_len + message.size() > MAX_MESSAGE_BYTES) {
            throw std::runtime_error("message too large: " + std::to_string(payload_len));
        }

        std::string payload(payload_len, '\0');
        if (payload_len > 0) {
            read_exact(payload.data(), payload_len);
        }
        if (masked) {
            for (size_t i = 0; i < payload.size(); i++) {
                payload[i] ^= mask[i % 4];
            }
        }

        switch (opcode) {
            case OP_PING:
                send_frame(payload, OP_PONG);
                continue;
            case OP_PONG:
                continue;
            case OP_CLOSE:
                send_frame(payload.substr(0, 2), OP_CLOSE);
                throw std::runtime_error("server closed the connection");
            case OP_TEXT:
            case OP_BINARY:
                message = std::move(payload);
                in_message = true;
                break;
            case OP_CONTINUATION:
                if (!in_message) {
                    throw std::runtime_error("continuation frame without a message");
                }
                message += payload;
                break;
            default:
                throw std::runtime_error("unknown opcode " + std::to_string(opcode));
        }

        if (fin) {
            return message;
        }
    }
}

void WebSocketClientBase::run_connection_loop() {
    bool first_attempt = true;

    while (running_.load()) {
        if (!first_attempt) {
            reconnects_++;
            set_status(ConnectionStatus::RECONNECTING);
            spdlog::info("{} reconnecting in {}ms", name_, reconnect_delay_ms_);
            sleep_while_running(reconnect_delay_ms_);
            if (!running_.load()) break;
        }
        first_attempt = false;

        if (!connect_socket()) {
            continue;
        }
        set_status(ConnectionStatus::CONNECTED);

        try {
            on_open();

            auto last_ping = now();
            while (running_.load()) {
                auto msg = read_message();
                if (msg) {
                    messages_received_++;
                    handle_message(*msg);
                }

                if (ping_interval_ms_ > 0 &&
                    now() - last_ping >= std::chrono::milliseconds(ping_interval_ms_)) {
                    if (!send_frame("", OP_PING)) {
                        throw std::runtime_error("ping failed");
                    }
                    last_ping = now();
                }
            }
        } catch (const std::exception& e) {
            if (running_.load()) {
                spdlog::warn("{} connection lost: {}", name_, e.what());
            }
        }

        close_socket();
    }

    set_status(ConnectionStatus::DISCONNECTED);
}

} // namespace tarb
