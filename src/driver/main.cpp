#include "common/diagnostic.hpp"
#include "driver/running_sum.hpp"
#include "io/byte_source.hpp"
#include "scan/input_stream.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace {

using namespace instream;

void print_usage(std::string_view program) {
    fmt::print("Usage: {} [options] [file]\n", program);
    fmt::print("\nScans whitespace-delimited tokens from a file or stdin.\n");
    fmt::print("\nOptions:\n");
    fmt::print("  --help          Show this help message\n");
    fmt::print("  --version       Show version information\n");
    fmt::print("  --type <t>      Token type: i32, i64, u64, f64, char, bool, string (default string)\n");
    fmt::print("  --limit <n>     Byte limit per scan (default: unbounded)\n");
    fmt::print("  --count         Print only the number of tokens scanned\n");
    fmt::print("  --sum           Print the sum of scanned numeric tokens\n");
}

void print_version() {
    fmt::print("instream-scan 0.1.0\n");
    fmt::print("istream-style token scanner\n");
}

enum class Mode : uint8_t {
    Print,
    Count,
    Sum,
};

template <typename T>
void print_value(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        fmt::print("{}\n", value ? "true" : "false");
    } else {
        fmt::print("{}\n", value);
    }
}

template <typename T>
constexpr bool kSummable = std::is_arithmetic_v<T> && !std::is_same_v<T, bool> &&
                           !std::is_same_v<T, char>;

/// Scan tokens of type T until end of input. Returns the process exit code.
template <typename T>
int run(InputStream& in, Mode mode, DiagnosticEngine& diag) {
    uint64_t count = 0;
    [[maybe_unused]] std::conditional_t<kSummable<T>, RunningSum<T>, int> sum{};

    // No at_end() probe: its whitespace skip would escape the --limit budget.
    for (;;) {
        auto value = in.scan<T>();
        if (!value) {
            // End of input is the only clean stop; other failures have
            // already been printed by the diagnostic handler.
            if (!value.error().is(ErrorKind::UnexpectedEof)) return 1;
            break;
        }
        ++count;
        if (mode == Mode::Print) {
            print_value(value.value());
        } else if constexpr (kSummable<T>) {
            if (mode == Mode::Sum && !sum.add(value.value())) {
                diag.report(DiagnosticSeverity::Error,
                            StreamLocation{in.options().source_name, in.position()},
                            "sum overflows after {} values", count);
                return 1;
            }
        }
    }

    if (mode == Mode::Count) {
        fmt::print("{}\n", count);
    } else if constexpr (kSummable<T>) {
        if (mode == Mode::Sum) fmt::print("{}\n", sum.total());
    }
    return 0;
}

bool parse_size(std::string_view text, size_t& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

int main(int argc, char* argv[]) {
    std::string type = "string";
    std::string source_file;
    Mode mode = Mode::Print;
    StreamOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--type") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "error: --type requires an argument\n");
                return 1;
            }
            type = argv[++i];
        } else if (arg == "--limit") {
            if (i + 1 >= argc || !parse_size(argv[i + 1], options.default_limit) ||
                options.default_limit == 0) {
                fmt::print(stderr, "error: --limit requires a positive byte count\n");
                return 1;
            }
            ++i;
        } else if (arg == "--count") {
            mode = Mode::Count;
        } else if (arg == "--sum") {
            mode = Mode::Sum;
        } else if (arg.starts_with("-") && arg != "-") {
            fmt::print(stderr, "error: unknown option '{}'\n", arg);
            print_usage(argv[0]);
            return 1;
        } else {
            source_file = std::string(arg);
        }
    }

    bool numeric = type == "i32" || type == "i64" || type == "u64" || type == "f64";
    if (!numeric && type != "char" && type != "bool" && type != "string") {
        fmt::print(stderr, "error: unknown token type '{}'\n", type);
        return 1;
    }
    if (mode == Mode::Sum && !numeric) {
        fmt::print(stderr, "error: --sum needs a numeric --type\n");
        return 1;
    }

    std::unique_ptr<ByteSource> source;
    if (source_file.empty() || source_file == "-") {
        options.source_name = "<stdin>";
        source = std::make_unique<FdSource>(0);
    } else {
        auto opened = FdSource::open(source_file);
        if (!opened) {
            fmt::print(stderr, "error: cannot open file '{}': {}\n", source_file,
                       opened.error().message());
            return 1;
        }
        options.source_name = source_file;
        source = std::move(opened).value();
    }

    DiagnosticEngine diag;
    diag.set_handler([](const Diagnostic& d) {
        if (d.kind == ErrorKind::UnexpectedEof) return;
        fmt::print(stderr, "{}\n", format_diagnostic(d));
    });

    InputStream in(*source, options);
    in.set_diagnostics(&diag);

    if (type == "i32") return run<int32_t>(in, mode, diag);
    if (type == "i64") return run<int64_t>(in, mode, diag);
    if (type == "u64") return run<uint64_t>(in, mode, diag);
    if (type == "f64") return run<double>(in, mode, diag);
    if (type == "char") return run<char>(in, mode, diag);
    if (type == "bool") return run<bool>(in, mode, diag);
    return run<std::string>(in, mode, diag);
}
