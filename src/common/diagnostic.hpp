#pragma once

#include "common/scan_error.hpp"
#include "common/stream_position.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace instream {

enum class DiagnosticSeverity : uint8_t {
    Note,
    Warning,
    Error,
};

/// One reported event. `kind` is set when the record stems from a failed scan.
struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    StreamLocation location;
    std::string message;
    std::optional<ErrorKind> kind;
};

/// Collects what happened while scanning a stream and forwards each record
/// to an optional handler as it arrives.
class DiagnosticEngine {
public:
    using Handler = std::function<void(const Diagnostic&)>;

    void set_handler(Handler handler) { handler_ = std::move(handler); }

    /// Record a failed scan as an error tagged with its kind.
    void scan_failed(StreamLocation loc, const ScanError& error);

    template <typename... Args>
    void report(DiagnosticSeverity severity, StreamLocation loc,
                fmt::format_string<Args...> fmt_str, Args&&... args) {
        emit(Diagnostic{severity, loc, fmt::format(fmt_str, std::forward<Args>(args)...), {}});
    }

    void error(StreamLocation loc, std::string_view msg) {
        emit(Diagnostic{DiagnosticSeverity::Error, loc, std::string(msg), {}});
    }
    void warning(StreamLocation loc, std::string_view msg) {
        emit(Diagnostic{DiagnosticSeverity::Warning, loc, std::string(msg), {}});
    }
    void note(StreamLocation loc, std::string_view msg) {
        emit(Diagnostic{DiagnosticSeverity::Note, loc, std::string(msg), {}});
    }

    [[nodiscard]] bool has_errors() const { return error_count_ > 0; }
    [[nodiscard]] uint32_t error_count() const { return error_count_; }
    [[nodiscard]] uint32_t warning_count() const { return warning_count_; }

    /// Failed scans of one kind seen so far.
    [[nodiscard]] uint32_t failures(ErrorKind kind) const {
        return failures_[static_cast<size_t>(kind)];
    }

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return records_; }

    void clear();

private:
    void emit(Diagnostic diag);

    std::vector<Diagnostic> records_;
    Handler handler_;
    uint32_t error_count_   = 0;
    uint32_t warning_count_ = 0;
    std::array<uint32_t, static_cast<size_t>(ErrorKind::Io) + 1> failures_{};
};

/// "input.txt:3:7: error: overflow: '99999999999' is out of range for i32"
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diag);

} // namespace instream
