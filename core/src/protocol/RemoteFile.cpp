#include "scplite/RemoteFile.hpp"
#include "scplite/ScpProtocol.hpp"

namespace scplite {

RemoteFile::RemoteFile(std::string name, std::int64_t size, std::uint32_t mode,
                       std::unique_ptr<ByteReader> content)
    : name_(std::move(name)),
      size_(size),
      mode_(mode & kPermissionMask),
      content_(std::move(content)) {}

FileInfo RemoteFile::toFileInfo() const {
    FileInfo fi{};
    fi.name = name_;
    fi.is_dir = false;
    fi.size = size_ > 0 ? static_cast<std::uint64_t>(size_) : 0;
    fi.mtime = modTime();
    fi.mode = mode_;
    return fi;
}

} // namespace scplite
