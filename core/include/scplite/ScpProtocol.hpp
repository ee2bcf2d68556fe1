// Codec of the SCP subset: status bytes (0/1/2) and the "C" copy directive.
#pragma once
#include <cstdint>
#include <string>

namespace scplite {

enum class StatusByte : std::uint8_t { Ok = 0, Warning = 1, Error = 2 };

struct CopyDirective {
    std::uint32_t mode = 0;  // permission bits, at most 07777
    std::int64_t size = 0;
    std::string name;
};

enum class DiagnosticLevel { Warning, Error };

// Kind of message a leading byte introduces. The payload travels separately:
// a CopyDirective for Copy, a DiagnosticLevel plus the line for Diagnostic.
struct ControlMessage {
    enum class Type { Ack, Copy, Diagnostic };
};

constexpr std::uint32_t kPermissionMask = 07777;

// Classifies a leading byte. Returns false for anything other than 0, 1, 2.
bool parseStatusByte(std::uint8_t b, ControlMessage::Type& type,
                     DiagnosticLevel& level);

// Parses "C<mode-octal> <size> <name>[\n]". On failure `err` explains why;
// callers report it as a protocol violation.
bool parseCopyDirective(const std::string& line, CopyDirective& out,
                        std::string& err);

std::string formatCopyDirective(const CopyDirective& d);

// "\x01msg\n" or "\x02msg\n".
std::string formatDiagnostic(DiagnosticLevel level, const std::string& message);

const char* diagnosticLevelName(DiagnosticLevel level);

// Trims leading/trailing whitespace, including the line terminator.
std::string trimDiagnostic(const std::string& text);

} // namespace scplite
