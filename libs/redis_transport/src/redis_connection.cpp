// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/redis_connection.hpp"

#include <glog/logging.h>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <limits>

namespace logship {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr int kMaxReplyDepth = 32;
constexpr int64_t kMaxBulkLength = 512LL * 1024 * 1024;  // Redis proto-max-bulk-len

TransportError::Cause io_cause(int err) {
    return (err == EAGAIN || err == EWOULDBLOCK) ? TransportError::Cause::Timeout
                                                 : TransportError::Cause::Io;
}

// Rejects anything outside [-INT64_MAX, INT64_MAX]
bool parse_int64(const std::string& text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    bool negative = text[0] == '-';
    size_t i = negative ? 1 : 0;
    if (i == text.size()) {
        return false;
    }
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t value = 0;
    for (; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
        int digit = text[i] - '0';
        if (value > (kMax - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = negative ? -value : value;
    return true;
}

}  // namespace

RedisConnection::RedisConnection(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {
}

RedisConnection::~RedisConnection() {
    disconnect();
}

std::string RedisConnection::encode_command(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

void RedisConnection::send_command(const std::vector<std::string>& args) {
    if (fd_ < 0) {
        connect();
    }
    write_all(encode_command(args));
}

RedisReply RedisConnection::read_response() {
    if (fd_ < 0) {
        throw TransportError(TransportError::Cause::Io,
                             "Not connected to " + endpoint_.to_string());
    }

    RedisReply reply = read_reply();

    // Drop consumed bytes so the buffer only holds unread replies
    buffer_.erase(0, buffer_pos_);
    buffer_pos_ = 0;

    if (reply.type == RedisReply::Type::Error) {
        throw TransportError(TransportError::Cause::ServerError,
                             endpoint_.to_string() + " replied: " + reply.str);
    }
    return reply;
}

void RedisConnection::disconnect() {
    if (fd_ >= 0) {
        VLOG(1) << "Closing connection to " << endpoint_.to_string();
        close(fd_);
    }
    abandon();
}

void RedisConnection::abandon() {
    fd_ = -1;
    buffer_.clear();
    buffer_pos_ = 0;
}

void RedisConnection::connect() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(endpoint_.port);
    int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw TransportError(TransportError::Cause::ConnectFailed,
                             "Cannot resolve " + endpoint_.host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = result; ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }

        if (endpoint_.timeout_ms > 0) {
            struct timeval tv;
            tv.tv_sec = endpoint_.timeout_ms / 1000;
            tv.tv_usec = (endpoint_.timeout_ms % 1000) * 1000;
            if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
                setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
                LOG(WARNING) << "Failed to set socket timeout: " << strerror(errno);
            }
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            int nodelay = 1;
            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
                VLOG(1) << "Failed to set TCP_NODELAY: " << strerror(errno);
            }
            fd_ = fd;
            break;
        }
        last_error = strerror(errno);
        close(fd);
    }
    freeaddrinfo(result);

    if (fd_ < 0) {
        throw TransportError(TransportError::Cause::ConnectFailed,
                             "Cannot connect to " + endpoint_.to_string() + ": " + last_error);
    }

    VLOG(1) << "Connected to " << endpoint_.to_string();

    try {
        if (!endpoint_.password.empty()) {
            write_all(encode_command({"AUTH", endpoint_.password}));
            read_response();
        }
        if (endpoint_.db != 0) {
            write_all(encode_command({"SELECT", std::to_string(endpoint_.db)}));
            read_response();
        }
    } catch (const TransportError&) {
        disconnect();
        throw;
    }
}

void RedisConnection::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            fail(io_cause(err), "Send to " + endpoint_.to_string() + " failed: " + strerror(err));
        }
        sent += static_cast<size_t>(n);
    }
}

void RedisConnection::fill_buffer() {
    char chunk[kReadChunk];
    while (true) {
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            return;
        }
        if (n == 0) {
            fail(TransportError::Cause::Io, "Connection closed by " + endpoint_.to_string());
        }
        if (errno == EINTR) {
            continue;
        }
        int err = errno;
        fail(io_cause(err), "Receive from " + endpoint_.to_string() + " failed: " + strerror(err));
    }
}

std::string RedisConnection::read_line() {
    while (true) {
        size_t crlf = buffer_.find("\r\n", buffer_pos_);
        if (crlf != std::string::npos) {
            std::string line = buffer_.substr(buffer_pos_, crlf - buffer_pos_);
            buffer_pos_ = crlf + 2;
            return line;
        }
        fill_buffer();
    }
}

std::string RedisConnection::read_exact(size_t count) {
    // Payload plus trailing CRLF
    while (buffer_.size() - buffer_pos_ < count + 2) {
        fill_buffer();
    }
    if (buffer_.compare(buffer_pos_ + count, 2, "\r\n") != 0) {
        fail(TransportError::Cause::Protocol, "Bulk reply without CRLF from " + endpoint_.to_string());
    }
    std::string data = buffer_.substr(buffer_pos_, count);
    buffer_pos_ += count + 2;
    return data;
}

RedisReply RedisConnection::read_reply() {
    // Arrays nest; walk them with an explicit stack to bound depth
    struct Frame {
        RedisReply reply;
        size_t remaining;
    };
    std::vector<Frame> stack;

    while (true) {
        std::string line = read_line();
        if (line.empty()) {
            fail(TransportError::Cause::Protocol, "Empty reply line from " + endpoint_.to_string());
        }

        char kind = line[0];
        std::string body = line.substr(1);
        RedisReply reply;
        bool open_array = false;
        int64_t count = 0;

        switch (kind) {
            case '+':
                reply = RedisReply::status(body);
                break;
            case '-':
                reply = RedisReply::error(body);
                break;
            case ':':
                if (!parse_int64(body, reply.integer)) {
                    fail(TransportError::Cause::Protocol, "Bad integer reply: " + body);
                }
                reply.type = RedisReply::Type::Integer;
                break;
            case '$':
                if (!parse_int64(body, count) || count < -1 || count > kMaxBulkLength) {
                    fail(TransportError::Cause::Protocol, "Bad bulk length: " + body);
                }
                reply = (count == -1) ? RedisReply::nil()
                                      : RedisReply::bulk(read_exact(static_cast<size_t>(count)));
                break;
            case '*':
                if (!parse_int64(body, count) || count < -1) {
                    fail(TransportError::Cause::Protocol, "Bad array length: " + body);
                }
                if (count == -1) {
                    reply = RedisReply::nil();
                } else {
                    reply.type = RedisReply::Type::Array;
                    open_array = count > 0;
                }
                break;
            default:
                fail(TransportError::Cause::Protocol,
                     "Unexpected reply type '" + std::string(1, kind) + "' from " +
                         endpoint_.to_string());
        }

        if (open_array) {
            if (stack.size() >= static_cast<size_t>(kMaxReplyDepth)) {
                fail(TransportError::Cause::Protocol, "Reply nested too deeply");
            }
            stack.push_back(Frame{std::move(reply), static_cast<size_t>(count)});
            continue;
        }

        // Attach the completed reply to its parent, closing finished arrays
        while (true) {
            if (stack.empty()) {
                return reply;
            }
            Frame& top = stack.back();
            top.reply.elements.push_back(std::move(reply));
            if (--top.remaining > 0) {
                break;
            }
            reply = std::move(top.reply);
            stack.pop_back();
        }
    }
}

void RedisConnection::fail(TransportError::Cause cause, const std::string& what) {
    disconnect();
    throw TransportError(cause, what);
}

ConnectionFactory make_redis_connection_factory() {
    return [](const Endpoint& endpoint) -> std::unique_ptr<Connection> {
        return std::make_unique<RedisConnection>(endpoint);
    };
}

}  // namespace logship
