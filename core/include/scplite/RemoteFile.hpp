// A file read from or written to a remote host: metadata plus a content stream.
// Never touches the local filesystem; the caller supplies or drains the content.
#pragma once
#include "ByteStream.hpp"
#include "ScpTypes.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace scplite {

class RemoteFile {
public:
    // The size must be known up front: the remote may refuse the file before
    // any data is sent (e.g. out of space).
    RemoteFile(std::string name, std::int64_t size, std::uint32_t mode,
               std::unique_ptr<ByteReader> content);

    // Base name, no directory part.
    const std::string& name() const { return name_; }
    std::int64_t size() const { return size_; }
    // POSIX permission bits only.
    std::uint32_t mode() const { return mode_; }
    bool isDirectory() const { return false; }
    // SCP without -p carries no times.
    std::uint64_t modTime() const { return 0; }

    ByteReader* content() { return content_.get(); }
    std::unique_ptr<ByteReader> releaseContent() { return std::move(content_); }

    FileInfo toFileInfo() const;

private:
    std::string name_;
    std::int64_t size_;
    std::uint32_t mode_;
    std::unique_ptr<ByteReader> content_;
};

} // namespace scplite
