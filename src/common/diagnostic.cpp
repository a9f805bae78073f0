#include "common/diagnostic.hpp"

#include <fmt/format.h>

namespace instream {

namespace {

std::string_view severity_name(DiagnosticSeverity severity) {
    switch (severity) {
    case DiagnosticSeverity::Note:    return "note";
    case DiagnosticSeverity::Warning: return "warning";
    case DiagnosticSeverity::Error:   return "error";
    }
    return "error";
}

} // namespace

void DiagnosticEngine::scan_failed(StreamLocation loc, const ScanError& error) {
    ++failures_[static_cast<size_t>(error.kind)];
    emit(Diagnostic{DiagnosticSeverity::Error, loc, format_error(error), error.kind});
}

void DiagnosticEngine::emit(Diagnostic diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        ++error_count_;
    } else if (diag.severity == DiagnosticSeverity::Warning) {
        ++warning_count_;
    }
    records_.push_back(std::move(diag));
    if (handler_) {
        handler_(records_.back());
    }
}

void DiagnosticEngine::clear() {
    records_.clear();
    error_count_   = 0;
    warning_count_ = 0;
    failures_.fill(0);
}

std::string format_diagnostic(const Diagnostic& diag) {
    return fmt::format("{}: {}: {}", diag.location.to_string(), severity_name(diag.severity),
                       diag.message);
}

} // namespace instream
