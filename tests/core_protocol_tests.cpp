// Core unit tests without external framework (run via CTest): directive codec,
// RemoteFile, content streams and helpers.
#include "scplite/ByteStream.hpp"
#include "scplite/RemoteFile.hpp"
#include "scplite/RemoteSession.hpp"
#include "scplite/RuntimeLogging.hpp"
#include "scplite/ScpProtocol.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

void test_parse_valid_directive(TestContext &t) {
    scplite::CopyDirective d;
    std::string err;
    t.check(scplite::parseCopyDirective("C0644 13 hello.txt\n", d, err),
            "valid directive should parse: " + err);
    t.check(d.mode == 0644, "mode should be 0644");
    t.check(d.size == 13, "size should be 13");
    t.check(d.name == "hello.txt", "name should be hello.txt");

    scplite::CopyDirective noNewline;
    t.check(scplite::parseCopyDirective("C755 0 run.sh", noNewline, err),
            "directive without trailing newline should parse");
    t.check(noNewline.mode == 0755 && noNewline.size == 0 &&
                noNewline.name == "run.sh",
            "short mode and zero size should be accepted");
}

void test_parse_rejects_wrong_first_byte(TestContext &t) {
    scplite::CopyDirective d;
    std::string err;
    t.check(!scplite::parseCopyDirective("X0644 13 hello.txt\n", d, err),
            "directive starting with X should fail");
    t.checkContains(err, "expected C", "error should name the expected byte");
    t.checkContains(err, "58", "error should show the offending byte in hex");

    err.clear();
    t.check(!scplite::parseCopyDirective("", d, err),
            "empty line should fail");
    t.check(!err.empty(), "empty line should report an error");
}

void test_parse_rejects_bad_fields(TestContext &t) {
    scplite::CopyDirective d;
    std::string err;

    t.check(!scplite::parseCopyDirective("C0689 13 a.txt\n", d, err),
            "non-octal mode should fail");
    t.checkContains(err, "invalid mode", "bad mode should be reported as mode");

    err.clear();
    t.check(!scplite::parseCopyDirective("C10644 13 a.txt\n", d, err),
            "mode beyond permission bits should fail");

    err.clear();
    t.check(!scplite::parseCopyDirective("C0644 1x3 a.txt\n", d, err),
            "non-decimal size should fail");
    t.checkContains(err, "invalid size", "bad size should be reported as size");

    err.clear();
    t.check(!scplite::parseCopyDirective("C0644 -5 a.txt\n", d, err),
            "negative size should fail");

    err.clear();
    t.check(!scplite::parseCopyDirective("C0644 99999999999999999999 a\n", d, err),
            "size overflowing int64 should fail");

    err.clear();
    t.check(!scplite::parseCopyDirective("C0644 13\n", d, err),
            "missing name should fail");

    err.clear();
    t.check(!scplite::parseCopyDirective("C0644 13 my file.txt\n", d, err),
            "names with spaces are not supported");

    err.clear();
    t.check(!scplite::parseCopyDirective("C 13 a.txt\n", d, err),
            "empty mode should fail");
}

void test_format_directive(TestContext &t) {
    scplite::CopyDirective d;
    d.mode = 0644;
    d.size = 13;
    d.name = "hello.txt";
    t.check(scplite::formatCopyDirective(d) == "C0644 13 hello.txt\n",
            "format should produce C0644 13 hello.txt");

    d.mode = 04755;
    d.size = 1234567890123LL;
    d.name = "big.bin";
    const std::string line = scplite::formatCopyDirective(d);
    t.check(line == "C4755 1234567890123 big.bin\n",
            "format should keep setuid bit and 64-bit sizes");

    scplite::CopyDirective back;
    std::string err;
    t.check(scplite::parseCopyDirective(line, back, err) &&
                back.mode == d.mode && back.size == d.size && back.name == d.name,
            "formatted directive should parse back to the same values");
}

void test_status_bytes(TestContext &t) {
    scplite::ControlMessage::Type type = scplite::ControlMessage::Type::Copy;
    scplite::DiagnosticLevel level = scplite::DiagnosticLevel::Error;

    t.check(scplite::parseStatusByte(0, type, level) &&
                type == scplite::ControlMessage::Type::Ack,
            "0 should be an ack");
    t.check(scplite::parseStatusByte(1, type, level) &&
                type == scplite::ControlMessage::Type::Diagnostic &&
                level == scplite::DiagnosticLevel::Warning,
            "1 should be a warning diagnostic");
    t.check(scplite::parseStatusByte(2, type, level) &&
                type == scplite::ControlMessage::Type::Diagnostic &&
                level == scplite::DiagnosticLevel::Error,
            "2 should be an error diagnostic");
    t.check(!scplite::parseStatusByte('C', type, level),
            "'C' is not a status byte");
    t.check(!scplite::parseStatusByte(3, type, level), "3 is not a status byte");

    t.check(scplite::formatDiagnostic(scplite::DiagnosticLevel::Warning,
                                      "disk low") == std::string("\x01" "disk low\n"),
            "warning diagnostic should be \\x01 + message + newline");
    t.check(scplite::formatDiagnostic(scplite::DiagnosticLevel::Error,
                                      "no space") == std::string("\x02" "no space\n"),
            "error diagnostic should be \\x02 + message + newline");
    t.check(scplite::trimDiagnostic("  disk low \r\n") == "disk low",
            "trimDiagnostic should strip surrounding whitespace");
}

void test_remote_file_metadata(TestContext &t) {
    scplite::RemoteFile f("notes.md", 5, 0100640,
                          std::make_unique<scplite::StringReader>("hello"));
    t.check(f.name() == "notes.md", "name should be kept");
    t.check(f.size() == 5, "size should be kept");
    t.check(f.mode() == 0640, "mode should keep only permission bits");
    t.check(!f.isDirectory(), "RemoteFile is never a directory");
    t.check(f.modTime() == 0, "modTime should be unset");

    const scplite::FileInfo fi = f.toFileInfo();
    t.check(fi.name == "notes.md" && fi.size == 5 && fi.mode == 0640 &&
                !fi.is_dir && fi.mtime == 0,
            "toFileInfo should mirror the metadata");

    std::string body;
    scplite::ScpError err;
    t.check(f.content() && scplite::readAll(*f.content(), body, err),
            "content should be readable");
    t.check(body == "hello", "content should match");

    auto released = f.releaseContent();
    t.check(released != nullptr && f.content() == nullptr,
            "releaseContent should hand over the stream");
}

void test_string_reader_close(TestContext &t) {
    scplite::StringReader r("abc");
    char buf[2];
    scplite::ScpError err;
    t.check(r.read(buf, sizeof(buf), err) == 2, "first read should return 2");
    r.close();
    t.check(r.read(buf, sizeof(buf), err) == -1, "read after close should fail");
    t.check(err.kind == scplite::ScpErrorKind::IO, "closed read should be IO");
}

void test_file_reader_and_copy(TestContext &t) {
    const auto token = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path dir =
        fs::temp_directory_path() / ("scplite-proto-" + std::to_string(token));
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        t.check(false, "could not create temp dir: " + ec.message());
        return;
    }
    const fs::path src = dir / "src.bin";
    const fs::path dst = dir / "dst.bin";
    std::string payload(70000, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i)
        payload[i] = static_cast<char>(i % 253);
    {
        std::ofstream out(src, std::ios::binary | std::ios::trunc);
        out << payload;
    }

    scplite::FileReader reader;
    scplite::ScpError err;
    t.check(reader.open(src.string(), err), "FileReader should open: " + err.message);
    std::size_t lastDone = 0;
    std::size_t calls = 0;
    t.check(scplite::copyToFile(reader, dst.string(), payload.size(), err,
                                [&](std::size_t done, std::size_t total) {
                                    lastDone = done;
                                    ++calls;
                                    (void)total;
                                }),
            "copyToFile should succeed: " + err.message);
    t.check(calls > 0 && lastDone == payload.size(),
            "progress should reach the total");

    std::ifstream in(dst, std::ios::binary);
    const std::string copied((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
    t.check(copied == payload, "copied file should match the source");

    scplite::FileReader missing;
    err.clear();
    t.check(!missing.open((dir / "nope").string(), err) &&
                err.kind == scplite::ScpErrorKind::IO,
            "opening a missing file should be IO");

    fs::remove_all(dir, ec);
}

void test_pipe_delivers_in_order(TestContext &t) {
    scplite::ContentPipe pipe(7);
    std::string payload;
    for (int i = 0; i < 500; ++i)
        payload += static_cast<char>('a' + i % 26);

    std::thread producer([&] {
        for (std::size_t off = 0; off < payload.size(); off += 13) {
            const std::size_t n = std::min<std::size_t>(13, payload.size() - off);
            if (!pipe.write(payload.data() + off, n))
                return;
        }
        pipe.closeWrite();
    });

    std::string got;
    char buf[5];
    scplite::ScpError err;
    for (;;) {
        const long n = pipe.read(buf, sizeof(buf), err);
        if (n <= 0) {
            t.check(n == 0, "pipe should end cleanly: " + err.message);
            break;
        }
        got.append(buf, static_cast<std::size_t>(n));
    }
    producer.join();
    t.check(got == payload, "pipe should deliver bytes in order");
}

void test_pipe_carries_error(TestContext &t) {
    scplite::ContentPipe pipe(64);
    t.check(pipe.write("abc", 3), "write should succeed");
    scplite::ScpError failure;
    failure.set(scplite::ScpErrorKind::IO, "remote closed the stream");
    pipe.closeWrite(failure);

    char buf[16];
    scplite::ScpError err;
    t.check(pipe.read(buf, sizeof(buf), err) == 3,
            "buffered bytes should be delivered before the error");
    t.check(pipe.read(buf, sizeof(buf), err) == -1,
            "read after failed close should return -1");
    t.check(err.kind == scplite::ScpErrorKind::IO &&
                err.message == "remote closed the stream",
            "the producer's error should reach the reader");
}

void test_pipe_reader_close_unblocks_writer(TestContext &t) {
    scplite::ContentPipe pipe(4);
    bool writeResult = true;
    std::thread producer([&] {
        const std::string big(64, 'x');
        writeResult = pipe.write(big.data(), big.size());
    });
    char buf[2];
    scplite::ScpError err;
    t.check(pipe.read(buf, sizeof(buf), err) == 2, "reader should get bytes");
    pipe.closeRead();
    producer.join();
    t.check(!writeResult, "write should fail once the reader closed");
    t.check(pipe.readerClosed(), "readerClosed should report the close");
}

void test_shell_join(TestContext &t) {
    t.check(scplite::shellJoin({"scp", "-qf", "/srv/data/file.txt"}) ==
                "scp -qf /srv/data/file.txt",
            "safe words should stay bare");
    t.check(scplite::shellJoin({"scp", "-t", "/tmp/my dir"}) ==
                "scp -t '/tmp/my dir'",
            "spaces should be single-quoted");
    t.check(scplite::shellJoin({"scp", "-t", "it's"}) == "scp -t 'it'\\''s'",
            "single quotes should be escaped");
    t.check(scplite::shellJoin({"scp", "-t", ""}) == "scp -t ''",
            "empty argument should become ''");
    t.check(scplite::shellJoin({"scp", "-f", "$(rm -rf ~)"}) ==
                "scp -f '$(rm -rf ~)'",
            "shell metacharacters should be quoted");
}

void test_error_describe(TestContext &t) {
    scplite::ScpError e;
    t.check(e.ok(), "default error should be ok");
    e.set(scplite::ScpErrorKind::RemoteError, "permission denied");
    t.check(!e.ok(), "set error should not be ok");
    t.check(e.describe() == "remote error: permission denied",
            "describe should prefix the kind");
    e.clear();
    t.check(e.ok() && e.message.empty(), "clear should reset the error");
}

void test_loggable_path(TestContext &t) {
    if (scplite::sensitiveLoggingEnabled())
        return;
    t.check(scplite::loggablePath("/home/alice/secret/report.pdf") ==
                ".../report.pdf",
            "paths should be reduced to their basename");
    t.check(scplite::loggablePath("/upload/") == ".../upload",
            "trailing slashes should be ignored");
    t.check(scplite::loggablePath("plain.txt") == "plain.txt",
            "relative names should be kept");
}

} // namespace

int main() {
    TestContext t;
    test_parse_valid_directive(t);
    test_parse_rejects_wrong_first_byte(t);
    test_parse_rejects_bad_fields(t);
    test_format_directive(t);
    test_status_bytes(t);
    test_remote_file_metadata(t);
    test_string_reader_close(t);
    test_file_reader_and_copy(t);
    test_pipe_delivers_in_order(t);
    test_pipe_carries_error(t);
    test_pipe_reader_close_unblocks_writer(t);
    test_shell_join(t);
    test_error_describe(t);
    test_loggable_path(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scplite_protocol_tests\n";
    return EXIT_SUCCESS;
}
