#include "relay_client.h"
#include "constants.h"
#include "errors.h"
#include "logger.h"
#include "protocol.h"
#include <sys/socket.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace neurax {

bool parse_relay_endpoint(const std::string& url, RelayEndpoint& out) {
    std::string rest = url;
    static const char* schemes[] = {"tcp://", "http://", "https://", "ws://", "wss://"};
    for (const char* scheme : schemes) {
        size_t length = strlen(scheme);
        if (rest.compare(0, length, scheme) == 0) {
            rest = rest.substr(length);
            break;
        }
    }

    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) {
        return false;
    }

    RelayEndpoint endpoint;
    size_t colon = rest.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = rest;
        endpoint.port = DEFAULT_RELAY_PORT;
    } else {
        endpoint.host = rest.substr(0, colon);
        std::string port = rest.substr(colon + 1);
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos ||
            port.size() > 5) {
            return false;
        }
        endpoint.port = std::stoi(port);
        if (endpoint.port <= 0 || endpoint.port > 65535) {
            return false;
        }
    }
    if (endpoint.host.empty()) {
        return false;
    }
    out = endpoint;
    return true;
}

// TcpRelayConnection

TcpRelayConnection::TcpRelayConnection(const RelayEndpoint& endpoint) : endpoint_(endpoint) {}

TcpRelayConnection::~TcpRelayConnection() {
    disconnect();
}

std::string TcpRelayConnection::endpoint() const {
    return endpoint_.host + ":" + std::to_string(endpoint_.port);
}

void TcpRelayConnection::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

void TcpRelayConnection::set_disconnect_handler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    disconnect_handler_ = std::move(handler);
}

void TcpRelayConnection::join_reader() {
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
}

bool TcpRelayConnection::connect() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (connected_) {
        return true;
    }
    // Previous reader has finished by the time we reconnect
    join_reader();
    if (reader_.joinable()) {
        reader_.detach();
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string port = std::to_string(endpoint_.port);
    int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        LOG_WARN("Relay") << "cannot resolve " << endpoint_.host << ": " << gai_strerror(rc);
        return false;
    }

    int fd = -1;
    for (struct addrinfo* ai = results; ai != nullptr && fd < 0; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }

        // Non-blocking connect bounded by RELAY_CONNECT_TIMEOUT_SECONDS
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        int result = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (result < 0 && errno == EINPROGRESS) {
            struct pollfd pfd = {fd, POLLOUT, 0};
            result = poll(&pfd, 1, RELAY_CONNECT_TIMEOUT_SECONDS * 1000);
            int error = 0;
            socklen_t length = sizeof(error);
            if (result == 1 && getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) == 0 &&
                error == 0) {
                result = 0;
            } else {
                result = -1;
            }
        }
        if (result != 0) {
            close(fd);
            fd = -1;
            continue;
        }
        fcntl(fd, F_SETFL, flags);
    }
    freeaddrinfo(results);

    if (fd < 0) {
        LOG_WARN("Relay") << "cannot connect to " << endpoint();
        return false;
    }

    fd_ = fd;
    closing_ = false;
    connected_ = true;
    reader_ = std::thread(&TcpRelayConnection::read_loop, this, fd);
    LOG_DEBUG("Relay") << "socket open to " << endpoint();
    return true;
}

void TcpRelayConnection::read_loop(int fd) {
    std::string buffer;
    char chunk[PIPE_BUFFER_SIZE];

    while (true) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        buffer.append(chunk, static_cast<size_t>(n));
        if (buffer.size() > MAX_RELAY_LINE) {
            LOG_ERROR("Relay") << "relay frame exceeds " << MAX_RELAY_LINE << " bytes, dropping connection";
            break;
        }

        size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (line.empty()) {
                continue;
            }

            RelayEvent event;
            try {
                event = MessageCodec::decode_relay_event(line);
            } catch (const DecodeError& e) {
                LOG_WARN("Relay") << "ignoring malformed event: " << e.what();
                continue;
            }

            EventHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = event_handler_;
            }
            if (handler) {
                handler(event);
            }
        }
    }

    bool was_connected = connected_.exchange(false);
    if (closing_ || !was_connected) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (fd_ == fd) {
            close(fd_);
            fd_ = -1;
        }
    }
    LOG_WARN("Relay") << "connection to " << endpoint() << " lost";

    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = disconnect_handler_;
    }
    if (handler) {
        handler();
    }
}

bool TcpRelayConnection::emit(const RelayEvent& event) {
    std::string line = MessageCodec::encode_relay_event(event);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!connected_ || fd_ < 0) {
        LOG_DEBUG("Relay") << "dropping '" << event.name << "', not connected";
        return false;
    }

    size_t sent = 0;
    while (sent < line.size()) {
        ssize_t n = send(fd_, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            LOG_WARN("Relay") << "write of '" << event.name << "' failed: " << strerror(errno);
            shutdown(fd_, SHUT_RDWR);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void TcpRelayConnection::disconnect() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    closing_ = true;
    bool was_open = false;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (fd_ >= 0) {
            shutdown(fd_, SHUT_RDWR);
            was_open = true;
        }
    }
    join_reader();
    if (reader_.joinable()) {
        // disconnect() from a handler on the reader thread
        reader_.detach();
    }
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }
    connected_ = false;
    if (was_open) {
        LOG_INFO("Relay") << "disconnected from " << endpoint();
    }
}

// RelayTunnelChannel

RelayTunnelChannel::RelayTunnelChannel(std::string session_id, std::shared_ptr<RelayConnection> relay)
    : session_id_(std::move(session_id)), relay_(std::move(relay)) {}

bool RelayTunnelChannel::send(const std::string& message) {
    if (!open_) {
        return false;
    }
    return relay_->emit(MessageCodec::channel_message(session_id_, message));
}

void RelayTunnelChannel::close() {
    if (open_.exchange(false) && !relay_->emit(MessageCodec::channel_close(session_id_))) {
        LOG_DEBUG("Relay") << session_id_ << ": channel_close not delivered";
    }
}

bool RelayTunnelChannel::is_open() const {
    return open_ && relay_->connected();
}

} // namespace neurax
