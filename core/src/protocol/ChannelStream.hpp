// Buffered reader/writer over a RemoteChannel. Owns the channel and closes it
// when destroyed, so every exit path of a flow releases the remote command.
#pragma once
#include "scplite/RemoteSession.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace scplite {

class ChannelStream {
public:
    explicit ChannelStream(std::unique_ptr<RemoteChannel> channel);
    ~ChannelStream();
    ChannelStream(const ChannelStream&) = delete;
    ChannelStream& operator=(const ChannelStream&) = delete;

    void setCancel(RemoteChannel::CancelCB cb) { shouldCancel_ = std::move(cb); }

    // False on error or end of stream; atEof() tells them apart.
    bool readByte(std::uint8_t& out, std::string& err);
    // Pushes back the byte returned by the last readByte().
    void unreadByte();

    // Reads through '\n' and returns the line without it. With allowEof, a
    // stream ending before the newline yields the partial line.
    bool readLine(std::string& line, bool allowEof, std::string& err);

    // Buffered bytes first, then straight from the channel with at most
    // `len` bytes requested. 0 at end of stream, -1 on error.
    long read(char* buf, std::size_t len, std::string& err);

    void writeByte(std::uint8_t b) { wbuf_.push_back(static_cast<char>(b)); }
    void write(const char* data, std::size_t len) { wbuf_.append(data, len); }
    void write(const std::string& s) { wbuf_ += s; }
    bool flush(std::string& err);

    bool atEof() const { return eof_; }
    void close();

private:
    bool fill(std::string& err);

    std::unique_ptr<RemoteChannel> channel_;
    RemoteChannel::CancelCB shouldCancel_;
    std::vector<char> rbuf_;
    std::size_t rpos_ = 0;
    std::size_t rend_ = 0;
    std::string wbuf_;
    bool eof_ = false;
};

} // namespace scplite
