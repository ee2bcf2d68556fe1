// Download ("scp -f") and upload ("scp -t") flows for a single file.
#include "scplite/ScpTransfer.hpp"
#include "scplite/Logging.hpp"
#include "scplite/RuntimeLogging.hpp"
#include "scplite/ScpProtocol.hpp"
#include "ChannelStream.hpp"

#include <QString>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

namespace scplite {

namespace {

QString q(const std::string& s) { return QString::fromStdString(s); }

// Content stream of a download. Owns the background task, the remote channel
// it reads from, and the pipe the caller reads. Destroying it cancels the
// task and waits for it, which also closes the remote command.
class DownloadStream final : public ByteReader {
public:
    DownloadStream(std::unique_ptr<ChannelStream> io, std::int64_t size,
                   std::string label, const TransferOptions& options)
        : io_(std::move(io)),
          size_(size),
          label_(std::move(label)),
          chunk_(options.chunk_size == 0 ? 1 : options.chunk_size),
          pipe_(options.pipe_capacity) {
        io_->setCancel([this] { return cancel_.load(); });
        worker_ = std::thread(&DownloadStream::run, this);
    }

    ~DownloadStream() override {
        cancel();
        if (worker_.joinable())
            worker_.join();
    }

    long read(char* buf, std::size_t len, ScpError& err) override {
        return pipe_.read(buf, len, err);
    }

    void close() override { cancel(); }

private:
    void cancel() {
        cancel_.store(true);
        pipe_.closeRead();
    }

    void run() {
        ScpError err;
        const bool ok = transfer(err);
        // The remote command goes away before the reader sees the outcome.
        io_->close();
        if (ok) {
            qCInfo(scpProto) << "download finished" << q(label_) << "bytes=" << size_;
            pipe_.closeWrite();
            return;
        }
        if (cancel_.load())
            qCInfo(scpProto) << "download cancelled by reader" << q(label_);
        else
            qCWarning(scpProto) << "download failed" << q(label_) << q(err.describe());
        pipe_.closeWrite(err);
    }

    bool transfer(ScpError& err) {
        std::vector<char> buf(chunk_);
        std::string cerr;
        std::int64_t total = 0;

        while (total < size_) {
            const std::size_t want = static_cast<std::size_t>(
                std::min<std::int64_t>(static_cast<std::int64_t>(chunk_), size_ - total));
            const long n = io_->read(buf.data(), want, cerr);
            if (n < 0) {
                err.set(ScpErrorKind::IO, "reading content: " + cerr);
                return false;
            }
            if (n == 0) {
                err.set(ScpErrorKind::IO,
                        "remote closed the stream after " + std::to_string(total) +
                            " of " + std::to_string(size_) + " bytes");
                return false;
            }
            if (!pipe_.write(buf.data(), static_cast<std::size_t>(n))) {
                err.set(ScpErrorKind::IO, "content stream closed by reader");
                return false;
            }
            total += n;
        }

        io_->writeByte(static_cast<std::uint8_t>(StatusByte::Ok));
        if (!io_->flush(cerr)) {
            err.set(ScpErrorKind::IO, "acknowledging content: " + cerr);
            return false;
        }

        // Whatever follows (the source's own trailing status byte) is
        // discarded until the remote closes its output.
        for (;;) {
            const long n = io_->read(buf.data(), buf.size(), cerr);
            if (n == 0)
                return true;
            if (n < 0) {
                err.set(ScpErrorKind::IO, "draining remote output: " + cerr);
                return false;
            }
        }
    }

    std::unique_ptr<ChannelStream> io_;
    const std::int64_t size_;
    const std::string label_;
    const std::size_t chunk_;
    ContentPipe pipe_;
    std::atomic<bool> cancel_{false};
    std::thread worker_;
};

bool checkpoint(ChannelStream& io, const char* phase,
                std::vector<std::string>& warnings, ScpError& err) {
    std::string serr;
    std::uint8_t b = 0;
    if (!io.readByte(b, serr)) {
        err.set(ScpErrorKind::IO,
                std::string("waiting for status after ") + phase + ": " + serr);
        return false;
    }

    ControlMessage::Type type = ControlMessage::Type::Ack;
    DiagnosticLevel level = DiagnosticLevel::Error;
    if (!parseStatusByte(b, type, level)) {
        char msg[80];
        std::snprintf(msg, sizeof(msg), "unexpected status byte %02x after %s",
                      static_cast<unsigned>(b), phase);
        err.set(ScpErrorKind::ProtocolViolation, msg);
        return false;
    }
    if (type == ControlMessage::Type::Ack)
        return true;

    std::string text;
    if (!io.readLine(text, false, serr)) {
        err.set(ScpErrorKind::IO, "reading remote diagnostic: " + serr);
        return false;
    }
    text = trimDiagnostic(text);
    if (level == DiagnosticLevel::Error) {
        err.set(ScpErrorKind::RemoteError, text);
        return false;
    }
    qCWarning(scpProto) << "remote warning after" << phase << q(text);
    warnings.push_back(text);
    return true;
}

bool sendFile(RemoteSession& session, const std::string& dir, RemoteFile& file,
              std::vector<std::string>& warnings, ScpError& err,
              const TransferOptions& options) {
    if (file.name().empty() || file.name().find('\n') != std::string::npos) {
        err.set(ScpErrorKind::ProtocolViolation,
                "file name must be non-empty and single-line");
        return false;
    }
    if (file.size() < 0) {
        err.set(ScpErrorKind::ProtocolViolation, "negative file size");
        return false;
    }
    ByteReader* src = file.content();
    if (!src && file.size() > 0) {
        err.set(ScpErrorKind::ProtocolViolation, "file has no content stream");
        return false;
    }
    if (!session.isConnected()) {
        err.set(ScpErrorKind::Transport, "not connected");
        return false;
    }

    std::string serr;
    std::unique_ptr<RemoteChannel> channel = session.exec({"scp", "-t", dir}, serr);
    if (!channel) {
        err.set(ScpErrorKind::Transport, serr.empty() ? "remote exec failed" : serr);
        return false;
    }
    ChannelStream io(std::move(channel));
    qCInfo(scpProto) << "upload requested" << q(loggablePath(dir)) << q(file.name())
                     << "bytes=" << file.size();

    CopyDirective d;
    d.mode = file.mode();
    d.size = file.size();
    d.name = file.name();
    io.write(formatCopyDirective(d));
    if (!io.flush(serr)) {
        err.set(ScpErrorKind::IO, "sending directive: " + serr);
        return false;
    }

    if (!checkpoint(io, "directive", warnings, err))
        return false;

    const std::size_t chunk = options.chunk_size == 0 ? 1 : options.chunk_size;
    std::vector<char> buf(chunk);
    std::int64_t sent = 0;
    while (sent < file.size()) {
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::int64_t>(static_cast<std::int64_t>(chunk), file.size() - sent));
        ScpError cerr;
        const long n = src->read(buf.data(), want, cerr);
        if (n < 0) {
            err.set(ScpErrorKind::IO, "reading local content: " + cerr.message);
            return false;
        }
        if (n == 0) {
            err.set(ScpErrorKind::IO,
                    "content ended after " + std::to_string(sent) + " of " +
                        std::to_string(file.size()) + " bytes");
            return false;
        }
        io.write(buf.data(), static_cast<std::size_t>(n));
        if (!io.flush(serr)) {
            err.set(ScpErrorKind::IO, "sending content: " + serr);
            return false;
        }
        sent += n;
    }

    // End of data; the sink reads this before acknowledging the file.
    io.writeByte(static_cast<std::uint8_t>(StatusByte::Ok));
    if (!io.flush(serr)) {
        err.set(ScpErrorKind::IO, "sending end of data: " + serr);
        return false;
    }

    return checkpoint(io, "content", warnings, err);
}

} // namespace

bool readFile(RemoteSession& session, const std::string& path,
              std::unique_ptr<RemoteFile>& out, ScpError& err,
              const TransferOptions& options) {
    out.reset();
    err.clear();
    if (!session.isConnected()) {
        err.set(ScpErrorKind::Transport, "not connected");
        return false;
    }

    std::string serr;
    std::unique_ptr<RemoteChannel> channel = session.exec({"scp", "-qf", path}, serr);
    if (!channel) {
        err.set(ScpErrorKind::Transport, serr.empty() ? "remote exec failed" : serr);
        return false;
    }
    auto io = std::make_unique<ChannelStream>(std::move(channel));
    qCInfo(scpProto) << "download requested" << q(loggablePath(path));

    io->writeByte(static_cast<std::uint8_t>(StatusByte::Ok));
    if (!io->flush(serr)) {
        err.set(ScpErrorKind::IO, "sending ready signal: " + serr);
        return false;
    }

    std::uint8_t lead = 0;
    if (!io->readByte(lead, serr)) {
        err.set(ScpErrorKind::IO, "waiting for directive: " + serr);
        return false;
    }
    ControlMessage::Type type = ControlMessage::Type::Ack;
    DiagnosticLevel level = DiagnosticLevel::Error;
    if (parseStatusByte(lead, type, level) &&
        type == ControlMessage::Type::Diagnostic) {
        std::string text;
        if (!io->readLine(text, true, serr)) {
            err.set(ScpErrorKind::IO, "reading remote diagnostic: " + serr);
            return false;
        }
        err.set(level == DiagnosticLevel::Warning ? ScpErrorKind::RemoteWarning
                                                  : ScpErrorKind::RemoteError,
                text);
        qCWarning(scpProto) << "download refused" << q(loggablePath(path))
                            << diagnosticLevelName(level) << q(text);
        return false;
    }

    io->unreadByte();
    std::string line;
    if (!io->readLine(line, false, serr)) {
        err.set(ScpErrorKind::IO, "reading directive: " + serr);
        return false;
    }
    CopyDirective d;
    if (!parseCopyDirective(line, d, serr)) {
        err.set(ScpErrorKind::ProtocolViolation, serr);
        qCWarning(scpProto) << "bad directive from remote" << q(serr);
        return false;
    }

    io->writeByte(static_cast<std::uint8_t>(StatusByte::Ok));
    if (!io->flush(serr)) {
        err.set(ScpErrorKind::IO, "acknowledging directive: " + serr);
        return false;
    }
    qCDebug(scpProto) << "directive" << q(d.name) << "size=" << d.size
                      << "mode=" << QString::number(d.mode, 8);

    auto stream = std::make_unique<DownloadStream>(std::move(io), d.size,
                                                   loggablePath(path), options);
    out = std::make_unique<RemoteFile>(d.name, d.size, d.mode, std::move(stream));
    return true;
}

bool writeFile(RemoteSession& session, const std::string& dir, RemoteFile& file,
               std::vector<std::string>& warnings, ScpError& err,
               const TransferOptions& options) {
    warnings.clear();
    err.clear();
    if (!sendFile(session, dir, file, warnings, err, options)) {
        qCWarning(scpProto) << "upload failed" << q(file.name()) << q(err.describe());
        warnings.clear();
        return false;
    }
    qCInfo(scpProto) << "upload finished" << q(file.name())
                     << "warnings=" << static_cast<int>(warnings.size());
    return true;
}

} // namespace scplite
