#include "line_stream.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>

namespace pong {

TcpLineStream::TcpLineStream(int fd, std::string peerName) : fd_(fd), peerName_(std::move(peerName)) {
    int yes = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    // Bounds how long a blocking write can stall its connection thread.
    timeval tv{};
    tv.tv_sec = 2;
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

TcpLineStream::~TcpLineStream() {
    close();
    ::close(fd_);
}

bool TcpLineStream::takeBufferedLine(std::string& line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) return false;
    line = buffer_.substr(0, pos);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    buffer_.erase(0, pos + 1);
    return true;
}

ReadStatus TcpLineStream::readLine(std::string& line, int timeoutMs) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs > 0 ? timeoutMs : 0);
    while (true) {
        if (takeBufferedLine(line)) return ReadStatus::Line;
        if (buffer_.size() > kMaxLineLength) return ReadStatus::Oversized;
        if (eof_ || closed_) return ReadStatus::Closed;

        int waitMs = -1;
        if (timeoutMs >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            waitMs = left > 0 ? static_cast<int>(left) : 0;
        }
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int r = poll(&pfd, 1, waitMs);
        if (r < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Closed;
        }
        if (r == 0) return ReadStatus::Timeout;

        char buf[1024];
        ssize_t n = recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            eof_ = true;
            return ReadStatus::Closed;
        }
        if (n == 0) {
            // A trailing partial line from a closing peer is discarded.
            eof_ = true;
            continue;
        }
        buffer_.append(buf, static_cast<size_t>(n));
    }
}

bool TcpLineStream::sendAll(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool TcpLineStream::writeLine(const std::string& line) {
    if (closed_) return false;
    std::string framed = line + "\n";
    return sendAll(framed.data(), framed.size());
}

WriteStatus TcpLineStream::tryWriteLine(const std::string& line) {
    if (closed_) return WriteStatus::Failed;
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    int r = poll(&pfd, 1, 0);
    if (r < 0) return errno == EINTR ? WriteStatus::Dropped : WriteStatus::Failed;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return WriteStatus::Failed;
    if (r == 0 || !(pfd.revents & POLLOUT)) return WriteStatus::Dropped;

    std::string framed = line + "\n";
    ssize_t n = send(fd_, framed.data(), framed.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return WriteStatus::Dropped;
        return WriteStatus::Failed;
    }
    // Once part of a line is out the rest has to follow to keep the framing intact.
    size_t done = static_cast<size_t>(n);
    if (done < framed.size() && !sendAll(framed.data() + done, framed.size() - done)) {
        return WriteStatus::Failed;
    }
    return WriteStatus::Sent;
}

void TcpLineStream::close() {
    bool expected = false;
    if (closed_.compare_exchange_strong(expected, true)) {
        shutdown(fd_, SHUT_RDWR);
    }
}

}  // namespace pong
