#include "scplite/ScpProtocol.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace scplite {

namespace {

std::vector<std::string> splitOnSpace(const std::string& s) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        const std::size_t sp = s.find(' ', start);
        if (sp == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, sp - start));
        start = sp + 1;
    }
    return parts;
}

// strtoull/strtoll accept leading blanks and signs; the wire format does not.
bool parseUnsigned(const std::string& text, int base, unsigned long long& out,
                   std::string& err) {
    if (text.empty()) {
        err = "empty value";
        return false;
    }
    for (char c : text) {
        const bool okDigit = base == 8 ? (c >= '0' && c <= '7')
                                       : std::isdigit(static_cast<unsigned char>(c)) != 0;
        if (!okDigit) {
            err = "invalid syntax in \"" + text + "\"";
            return false;
        }
    }
    errno = 0;
    out = std::strtoull(text.c_str(), nullptr, base);
    if (errno == ERANGE) {
        err = "value out of range: \"" + text + "\"";
        return false;
    }
    return true;
}

bool parseSigned(const std::string& text, long long& out, std::string& err) {
    std::string digits = text;
    bool negative = false;
    if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
        negative = digits[0] == '-';
        digits.erase(0, 1);
    }
    unsigned long long magnitude = 0;
    if (!parseUnsigned(digits, 10, magnitude, err))
        return false;
    if (magnitude > static_cast<unsigned long long>(INT64_MAX)) {
        err = "value out of range: \"" + text + "\"";
        return false;
    }
    out = negative ? -static_cast<long long>(magnitude)
                   : static_cast<long long>(magnitude);
    return true;
}

} // namespace

bool parseStatusByte(std::uint8_t b, ControlMessage::Type& type,
                     DiagnosticLevel& level) {
    switch (static_cast<StatusByte>(b)) {
    case StatusByte::Ok:
        type = ControlMessage::Type::Ack;
        return true;
    case StatusByte::Warning:
        type = ControlMessage::Type::Diagnostic;
        level = DiagnosticLevel::Warning;
        return true;
    case StatusByte::Error:
        type = ControlMessage::Type::Diagnostic;
        level = DiagnosticLevel::Error;
        return true;
    }
    return false;
}

bool parseCopyDirective(const std::string& line, CopyDirective& out,
                        std::string& err) {
    if (line.empty()) {
        err = "empty directive line";
        return false;
    }
    if (line[0] != 'C') {
        char buf[64];
        std::snprintf(buf, sizeof(buf),
                      "invalid first byte; expected C but got %02x",
                      static_cast<unsigned>(static_cast<unsigned char>(line[0])));
        err = buf;
        return false;
    }

    std::string body = line;
    if (!body.empty() && body.back() == '\n')
        body.pop_back();

    const std::vector<std::string> fields = splitOnSpace(body);
    if (fields.size() != 3) {
        err = "expected 3 fields in directive, got " + std::to_string(fields.size());
        return false;
    }

    unsigned long long mode = 0;
    std::string perr;
    if (!parseUnsigned(fields[0].substr(1), 8, mode, perr)) {
        err = "invalid mode: " + perr;
        return false;
    }
    if (mode > kPermissionMask) {
        err = "invalid mode: " + fields[0].substr(1) + " has bits outside 07777";
        return false;
    }

    long long size = 0;
    if (!parseSigned(fields[1], size, perr)) {
        err = "invalid size: " + perr;
        return false;
    }
    if (size < 0) {
        err = "invalid size: negative value " + fields[1];
        return false;
    }

    if (fields[2].empty()) {
        err = "missing file name";
        return false;
    }

    out.mode = static_cast<std::uint32_t>(mode);
    out.size = static_cast<std::int64_t>(size);
    out.name = fields[2];
    return true;
}

std::string formatCopyDirective(const CopyDirective& d) {
    char head[48];
    std::snprintf(head, sizeof(head), "C%04o %lld ",
                  static_cast<unsigned>(d.mode & kPermissionMask),
                  static_cast<long long>(d.size));
    return std::string(head) + d.name + "\n";
}

std::string formatDiagnostic(DiagnosticLevel level, const std::string& message) {
    std::string out;
    out.reserve(message.size() + 2);
    out.push_back(static_cast<char>(level == DiagnosticLevel::Warning
                                        ? StatusByte::Warning
                                        : StatusByte::Error));
    out += message;
    out.push_back('\n');
    return out;
}

const char* diagnosticLevelName(DiagnosticLevel level) {
    return level == DiagnosticLevel::Warning ? "warning" : "error";
}

std::string trimDiagnostic(const std::string& text) {
    std::size_t start = 0;
    while (start < text.size() &&
           std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

} // namespace scplite
