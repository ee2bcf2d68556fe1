#include "scplite/ByteStream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace scplite {

long StringReader::read(char* buf, std::size_t len, ScpError& err) {
    if (closed_) {
        err.set(ScpErrorKind::IO, "read from closed stream");
        return -1;
    }
    if (pos_ >= data_.size())
        return 0;
    const std::size_t n = std::min(len, data_.size() - pos_);
    std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return static_cast<long>(n);
}

bool FileReader::open(const std::string& path, ScpError& err) {
    close();
    fp_ = std::fopen(path.c_str(), "rb");
    if (!fp_) {
        err.set(ScpErrorKind::IO,
                "cannot open " + path + ": " + std::strerror(errno));
        return false;
    }
    path_ = path;
    return true;
}

long FileReader::read(char* buf, std::size_t len, ScpError& err) {
    if (!fp_) {
        err.set(ScpErrorKind::IO, "read from closed file");
        return -1;
    }
    const std::size_t n = std::fread(buf, 1, len, fp_);
    if (n == 0 && std::ferror(fp_)) {
        err.set(ScpErrorKind::IO, "local read failed: " + path_);
        return -1;
    }
    return static_cast<long>(n);
}

void FileReader::close() {
    if (fp_) {
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

ContentPipe::ContentPipe(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ContentPipe::write(const char* data, std::size_t len) {
    std::size_t done = 0;
    std::unique_lock<std::mutex> lk(mtx_);
    while (done < len) {
        cv_.wait(lk, [this] { return readClosed_ || buf_.size() < capacity_; });
        if (readClosed_)
            return false;
        const std::size_t room = capacity_ - buf_.size();
        const std::size_t n = std::min(room, len - done);
        buf_.insert(buf_.end(), data + done, data + done + n);
        done += n;
        cv_.notify_all();
    }
    return true;
}

void ContentPipe::closeWrite(const ScpError& error) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (writeClosed_)
        return;
    writeClosed_ = true;
    writeError_ = error;
    cv_.notify_all();
}

long ContentPipe::read(char* buf, std::size_t len, ScpError& err) {
    if (len == 0)
        return 0;
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return readClosed_ || writeClosed_ || !buf_.empty(); });
    if (readClosed_) {
        err.set(ScpErrorKind::IO, "read from closed content stream");
        return -1;
    }
    if (buf_.empty()) {
        // writeClosed_
        if (!writeError_.ok()) {
            err = writeError_;
            return -1;
        }
        return 0;
    }
    const std::size_t n = std::min(len, buf_.size());
    std::copy(buf_.begin(), buf_.begin() + static_cast<long>(n), buf);
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<long>(n));
    cv_.notify_all();
    return static_cast<long>(n);
}

void ContentPipe::closeRead() {
    std::lock_guard<std::mutex> lk(mtx_);
    readClosed_ = true;
    buf_.clear();
    cv_.notify_all();
}

bool ContentPipe::readerClosed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return readClosed_;
}

bool readAll(ByteReader& reader, std::string& out, ScpError& err) {
    out.clear();
    std::vector<char> buf(16 * 1024);
    for (;;) {
        const long n = reader.read(buf.data(), buf.size(), err);
        if (n < 0)
            return false;
        if (n == 0)
            return true;
        out.append(buf.data(), static_cast<std::size_t>(n));
    }
}

bool copyToFile(ByteReader& reader, const std::string& localPath,
                std::uint64_t total, ScpError& err,
                std::function<void(std::size_t, std::size_t)> progress) {
    FILE* lf = std::fopen(localPath.c_str(), "wb");
    if (!lf) {
        err.set(ScpErrorKind::IO,
                "cannot open " + localPath + " for writing: " + std::strerror(errno));
        return false;
    }
    std::vector<char> buf(64 * 1024);
    std::size_t done = 0;
    for (;;) {
        const long n = reader.read(buf.data(), buf.size(), err);
        if (n < 0) {
            std::fclose(lf);
            return false;
        }
        if (n == 0)
            break;
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
            static_cast<std::size_t>(n)) {
            err.set(ScpErrorKind::IO, "local write failed: " + localPath);
            std::fclose(lf);
            return false;
        }
        done += static_cast<std::size_t>(n);
        if (progress && total)
            progress(done, static_cast<std::size_t>(total));
    }
    if (std::fclose(lf) != 0) {
        err.set(ScpErrorKind::IO, "local close failed: " + localPath);
        return false;
    }
    return true;
}

} // namespace scplite
