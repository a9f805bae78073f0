#include "scan/input_stream.hpp"

#include <utility>

namespace instream {

InputStream::InputStream(ByteSource& source, StreamOptions options)
    : options_(std::move(options)),
      cursor_(source, options_.initial_capacity, options_.read_chunk) {}

// ============================================================================
// Token assembly
// ============================================================================

Result<InputStream::RunEnd> InputStream::consume_run(bool delimiters, bool keep,
                                                     size_t& budget) {
    using R = Result<RunEnd>;
    for (;;) {
        auto avail = cursor_.buffered();
        if (avail.empty()) {
            // Refilling examines nothing, so it is allowed even with no
            // budget left; the byte it brings in is checked below.
            auto more = cursor_.refill();
            if (!more) {
                return R::err(ScanError::from_io(more.error()));
            }
            if (!more.value()) {
                return R::ok(RunEnd::Eof);
            }
            continue;
        }

        size_t n = 0;
        while (n < avail.size() && options_.delimiters.contains(avail[n]) == delimiters) {
            ++n;
        }
        bool stopped = n < avail.size();

        bool over = n > budget;
        size_t take = over ? budget : n;
        if (keep) {
            scratch_.append(reinterpret_cast<const char*>(avail.data()), take);
        }
        cursor_.consume(take);
        budget -= take;

        if (over) {
            return R::ok(RunEnd::Budget);
        }
        if (stopped) {
            return R::ok(RunEnd::Delimited);
        }
    }
}

Result<std::string_view> InputStream::next_token(size_t limit) {
    using R = Result<std::string_view>;
    scratch_.clear();
    size_t budget = limit;

    token_start_ = cursor_.position();
    auto skipped = consume_run(true, false, budget);
    token_start_ = cursor_.position();
    if (!skipped) {
        return R::err(std::move(skipped).error());
    }
    switch (skipped.value()) {
    case RunEnd::Eof:
        return R::err(ScanError::unexpected_eof());
    case RunEnd::Budget:
        return R::err(ScanError::limit_exceeded(limit));
    case RunEnd::Delimited:
        break;
    }

    auto run = consume_run(false, true, budget);
    if (!run) {
        return R::err(std::move(run).error());
    }
    if (run.value() == RunEnd::Budget) {
        return R::err(ScanError::limit_exceeded(limit));
    }
    return R::ok(std::string_view(scratch_));
}

// ============================================================================
// Probing and raw reads
// ============================================================================

bool InputStream::at_end() {
    size_t budget = default_budget();
    auto skipped = consume_run(true, false, budget);
    return skipped && skipped.value() == RunEnd::Eof;
}

Result<size_t> InputStream::read(std::span<uint8_t> dest) {
    token_start_ = cursor_.position();
    auto got = cursor_.read_through(dest);
    if (!got) {
        return Result<size_t>::err(report(ScanError::from_io(got.error())));
    }
    return Result<size_t>::ok(got.value());
}

ScanError InputStream::report(ScanError error) {
    if (diag_) {
        diag_->scan_failed(StreamLocation{options_.source_name, token_start_}, error);
    }
    return error;
}

} // namespace instream
