#pragma once

#include <atomic>
#include <string>

namespace pong {

enum class ReadStatus {
    Line,
    Timeout,
    Closed,
    Oversized,
};

enum class WriteStatus {
    Sent,
    Dropped,  // peer not accepting data right now, nothing was written
    Failed,
};

// Newline-framed text connection to one peer.
class LineStream {
public:
    virtual ~LineStream() = default;

    // timeoutMs == 0 only consumes what is already buffered or readable, < 0 waits forever.
    virtual ReadStatus readLine(std::string& line, int timeoutMs) = 0;
    // Writes the whole line (a '\n' is appended).
    virtual bool writeLine(const std::string& line) = 0;
    // Like writeLine, but gives up immediately when the peer is not draining its socket.
    virtual WriteStatus tryWriteLine(const std::string& line) = 0;
    // Safe to call from another thread; wakes a blocked readLine.
    virtual void close() = 0;
    virtual std::string peerName() const = 0;
};

class TcpLineStream : public LineStream {
public:
    static constexpr size_t kMaxLineLength = 4096;

    TcpLineStream(int fd, std::string peerName);
    ~TcpLineStream() override;

    TcpLineStream(const TcpLineStream&) = delete;
    TcpLineStream& operator=(const TcpLineStream&) = delete;

    ReadStatus readLine(std::string& line, int timeoutMs) override;
    bool writeLine(const std::string& line) override;
    WriteStatus tryWriteLine(const std::string& line) override;
    void close() override;
    std::string peerName() const override { return peerName_; }

private:
    bool takeBufferedLine(std::string& line);
    bool sendAll(const char* data, size_t len);

    int fd_;
    std::string peerName_;
    std::string buffer_;
    bool eof_{false};
    std::atomic<bool> closed_{false};
};

}  // namespace pong
