#include "ChannelStream.hpp"

#include <algorithm>
#include <cstring>

namespace scplite {

namespace {
constexpr std::size_t kReadBuffer = 4096;
}

ChannelStream::ChannelStream(std::unique_ptr<RemoteChannel> channel)
    : channel_(std::move(channel)), rbuf_(kReadBuffer) {}

ChannelStream::~ChannelStream() { close(); }

void ChannelStream::close() {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

bool ChannelStream::fill(std::string& err) {
    if (!channel_) {
        err = "channel closed";
        return false;
    }
    const long n = channel_->read(rbuf_.data(), rbuf_.size(), err, shouldCancel_);
    if (n < 0)
        return false;
    if (n == 0) {
        eof_ = true;
        err = "unexpected end of stream";
        return false;
    }
    rpos_ = 0;
    rend_ = static_cast<std::size_t>(n);
    return true;
}

bool ChannelStream::readByte(std::uint8_t& out, std::string& err) {
    if (rpos_ == rend_ && !fill(err))
        return false;
    out = static_cast<std::uint8_t>(rbuf_[rpos_++]);
    return true;
}

void ChannelStream::unreadByte() {
    if (rpos_ > 0)
        --rpos_;
}

bool ChannelStream::readLine(std::string& line, bool allowEof, std::string& err) {
    line.clear();
    for (;;) {
        if (rpos_ == rend_ && !fill(err))
            return eof_ && allowEof;
        const char* start = rbuf_.data() + rpos_;
        const std::size_t avail = rend_ - rpos_;
        const void* nl = std::memchr(start, '\n', avail);
        if (nl) {
            const std::size_t n = static_cast<const char*>(nl) - start;
            line.append(start, n);
            rpos_ += n + 1;
            return true;
        }
        line.append(start, avail);
        rpos_ = rend_;
    }
}

long ChannelStream::read(char* buf, std::size_t len, std::string& err) {
    if (len == 0)
        return 0;
    if (rpos_ < rend_) {
        const std::size_t n = std::min(len, rend_ - rpos_);
        std::memcpy(buf, rbuf_.data() + rpos_, n);
        rpos_ += n;
        return static_cast<long>(n);
    }
    if (!channel_) {
        err = "channel closed";
        return -1;
    }
    const long n = channel_->read(buf, len, err, shouldCancel_);
    if (n == 0)
        eof_ = true;
    return n;
}

bool ChannelStream::flush(std::string& err) {
    if (wbuf_.empty())
        return true;
    if (!channel_) {
        err = "channel closed";
        return false;
    }
    const bool ok = channel_->write(wbuf_.data(), wbuf_.size(), err);
    wbuf_.clear();
    return ok;
}

} // namespace scplite
