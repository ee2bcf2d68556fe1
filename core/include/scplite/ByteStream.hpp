// Content streams: what a RemoteFile carries and what the flows read from.
#pragma once
#include "ScpTypes.hpp"

#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace scplite {

class ByteReader {
public:
    virtual ~ByteReader() = default;

    // >0 bytes read, 0 end of stream, -1 error (err filled).
    virtual long read(char* buf, std::size_t len, ScpError& err) = 0;

    // Releases the source early. Later reads fail.
    virtual void close() {}
};

class StringReader : public ByteReader {
public:
    explicit StringReader(std::string data) : data_(std::move(data)) {}

    long read(char* buf, std::size_t len, ScpError& err) override;
    void close() override { closed_ = true; }

private:
    std::string data_;
    std::size_t pos_ = 0;
    bool closed_ = false;
};

// Local file opened for reading (binary).
class FileReader : public ByteReader {
public:
    FileReader() = default;
    ~FileReader() override { close(); }
    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    bool open(const std::string& path, ScpError& err);
    long read(char* buf, std::size_t len, ScpError& err) override;
    void close() override;

private:
    FILE* fp_ = nullptr;
    std::string path_;
};

// Bounded single-producer/single-consumer pipe between the download task and
// whoever reads the RemoteFile content.
class ContentPipe {
public:
    explicit ContentPipe(std::size_t capacity);

    // Blocks while the buffer is full. Returns false once the reader closed.
    bool write(const char* data, std::size_t len);
    // Producer side done. A non-ok error surfaces to the reader after the
    // buffered bytes.
    void closeWrite(const ScpError& error = ScpError{});

    // Blocks while empty and the writer is still open.
    long read(char* buf, std::size_t len, ScpError& err);
    void closeRead();

    bool readerClosed() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<char> buf_;
    std::size_t capacity_;
    bool writeClosed_ = false;
    bool readClosed_ = false;
    ScpError writeError_;
};

// Drains `reader` into memory.
bool readAll(ByteReader& reader, std::string& out, ScpError& err);

// Drains `reader` into a local file (created/truncated). `total` is only used
// for progress reporting.
bool copyToFile(ByteReader& reader, const std::string& localPath,
                std::uint64_t total, ScpError& err,
                std::function<void(std::size_t /*done*/, std::size_t /*total*/)> progress = {});

} // namespace scplite
