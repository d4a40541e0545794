/// @file main.cpp
/// @brief Container benchmark
///
/// Times construction, midpoint access and midpoint deletion for
/// std::vector, std::list and IndexedList, once with large records and once
/// with plain u64 values, and reports the memory each container holds.

#include <linkvec/bench/config.hpp>
#include <linkvec/bench/report.hpp>
#include <linkvec/core/core.hpp>
#include <linkvec/structures/structures.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <list>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

using linkvec_structures::IndexedList;
using linkvec_core::LogScope;
using linkvec_bench::format_duration;

constexpr std::size_t kRecordWords = 50'000;

/// Large element: a label, a payload array and a trailing word pair
struct LargeRecord {
    std::string label;
    std::array<std::uint64_t, kRecordWords> nums{};
    std::uint64_t extra_hi = 0;
    std::uint64_t extra_lo = 0;

    static std::unique_ptr<LargeRecord> make(std::size_t i) {
        auto record = std::make_unique<LargeRecord>();
        record->label = "Hello, world! item #" + std::to_string(i);
        for (std::size_t j = 0; j < record->nums.size(); ++j) {
            record->nums[j] = static_cast<std::uint64_t>(i) * 10 + j;
        }
        record->extra_hi = ~std::uint64_t{0};
        record->extra_lo = ~std::uint64_t{0} - i;
        return record;
    }
};

/// Human-readable report at info, raw byte counts at debug
void log_report(const linkvec_bench::MemoryReport& report) {
    std::istringstream lines(linkvec_bench::format_report(report));
    std::string line;
    while (std::getline(lines, line)) {
        linkvec_core::bench_logger()->info("{}", line);
    }

    linkvec_core::LogFields fields = {
        {"len", std::to_string(report.len)},
        {"used", std::to_string(report.used)},
        {"real", std::to_string(report.real)},
        {"estimated", report.estimated ? "true" : "false"},
    };
    if (report.true_len) {
        fields["true_len"] = std::to_string(*report.true_len);
    }
    if (report.capacity) {
        fields["capacity"] = std::to_string(*report.capacity);
    }
    linkvec_core::log_structured(spdlog::level::debug, "linkvec_bench", report.container, fields);
}

// =============================================================================
// Construction
// =============================================================================

/// Append `count` copies of `element`, each copy-constructed in place
/// @return Time spent in the append loop
template<typename Container, typename T>
std::chrono::nanoseconds fill(Container& container, std::size_t count, const T& element, const char* phase) {
    LogScope scope(phase, "linkvec_bench");
    for (std::size_t i = 0; i < count; ++i) {
        container.emplace_back(element);
    }
    return scope.finish();
}

// =============================================================================
// Suite
// =============================================================================

/// Run construction, access and deletion for all three containers
/// @param describe Renders the element read at the midpoint
template<typename T, typename Describe>
void run_suite(const std::string& title, std::size_t count, const T& element, Describe describe) {
    auto log = linkvec_core::bench_logger();
    LogScope suite(title, "linkvec_bench");

    log->info("==== Benchmark - {} ====", title);

    // Construction
    log->info("Construction (push_back) for {} elements:", count);

    std::vector<T> v;
    v.reserve(count);
    log->info("std::vector: construction took {}", format_duration(fill(v, count, element, "vector fill")));
    log_report(linkvec_bench::report_memory(v));

    std::list<T> l;
    log->info("std::list: construction took {}", format_duration(fill(l, count, element, "list fill")));
    log_report(linkvec_bench::report_memory(l));

    IndexedList<T> lv;
    log->info("IndexedList: construction took {}", format_duration(fill(lv, count, element, "indexed fill")));
    log_report(linkvec_bench::report_memory(lv));

    // Random access (midpoint)
    log->info("Random access at midpoint:");
    const std::size_t mid = count / 2;

    {
        LogScope scope("vector access", "linkvec_bench");
        const T& found = v[mid];
        auto took = scope.finish();
        log->info("std::vector: access (index {}) took {}; {}", mid, format_duration(took), describe(found));
    }
    {
        LogScope scope("list access", "linkvec_bench");
        const T& found = *std::next(l.begin(), static_cast<std::ptrdiff_t>(mid));
        auto took = scope.finish();
        log->info("std::list: access (walk to {}) took {}; {}", mid, format_duration(took), describe(found));
    }
    {
        LogScope scope("indexed access", "linkvec_bench");
        const T& found = lv[mid].value();
        auto took = scope.finish();
        log->info("IndexedList: access (index {}) took {}; {}", mid, format_duration(took), describe(found));
    }

    // Deletion (midpoint); elements are destroyed in place
    log->info("Deletion at midpoint:");

    {
        LogScope scope("vector erase", "linkvec_bench");
        v.erase(v.begin() + static_cast<std::ptrdiff_t>(mid));
        log->info("std::vector: erase(mid) took {}", format_duration(scope.finish()));
    }
    log_report(linkvec_bench::report_memory(v));

    {
        LogScope scope("list erase", "linkvec_bench");
        l.erase(std::next(l.begin(), static_cast<std::ptrdiff_t>(mid)));
        log->info("std::list: erase(mid) took {}", format_duration(scope.finish()));
    }
    log_report(linkvec_bench::report_memory(l));

    {
        LogScope scope("indexed erase", "linkvec_bench");
        lv.erase(mid);
        log->info("IndexedList: erase(mid) took {}", format_duration(scope.finish()));
    }
    log_report(linkvec_bench::report_memory(lv));

    if (auto valid = lv.validate(); !valid) {
        log->error("IndexedList failed validation: {}", linkvec_core::build_error_chain(valid.error()));
        linkvec_core::debug::record_error(valid.error());
    }

    log->info("{} finished in {}", title, format_duration(suite.finish()));
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>          Load settings from a TOML file\n"
              << "  --struct-count <n>       Elements in the large-record run\n"
              << "  --primitive-count <n>    Elements in the u64 run\n"
              << "  --log-level <level>      trace|debug|info|warn|error|critical|off\n"
              << "  --log-dir <dir>          Also write logs to <dir>\n"
              << "  --help, -h               Show this help message\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    linkvec_core::init_logging();

    std::string config_path;
    std::vector<std::string> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file path\n";
                print_usage(argv[0]);
                return 1;
            }
            config_path = argv[++i];
        } else {
            overrides.push_back(std::move(arg));
        }
    }

    linkvec_bench::BenchConfig config;
    if (!config_path.empty()) {
        auto loaded = linkvec_bench::load_bench_config(config_path);
        if (!loaded) {
            linkvec_core::debug::record_error(loaded.error());
            LINKVEC_LOG_ERROR("{}", linkvec_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(loaded).value();
        LINKVEC_LOG_INFO("Loaded {}", config_path);
    }

    if (auto applied = linkvec_bench::apply_cli_overrides(config, overrides); !applied) {
        linkvec_core::debug::record_error(applied.error());
        LINKVEC_LOG_ERROR("{}", linkvec_core::build_error_chain(applied.error()));
        print_usage(argv[0]);
        return 1;
    }

    linkvec_core::configure_logging(config.log);
    auto log = linkvec_core::bench_logger();

    log->info("Starting benches (log level {}).", linkvec_core::log_level_name(config.log.level));
    log->info("struct_count = {}, primitive_count = {}, sizeof(LargeRecord) = {}",
        config.struct_count, config.primitive_count, linkvec_bench::human_bytes(sizeof(LargeRecord)));

    {
        auto record = LargeRecord::make(42);
        run_suite("Large Record", config.struct_count, *record, [](const LargeRecord& r) {
            return "nums[0] = " + std::to_string(r.nums[0]) + ", extra_lo = " + std::to_string(r.extra_lo);
        });
    }

    run_suite("u64", config.primitive_count, std::uint64_t{0xDEADBEEFDEADBEEFull}, [](std::uint64_t value) {
        return "value = " + std::to_string(value);
    });

    log->info("Done.");
    if (linkvec_core::debug::total_error_count() > 0) {
        log->warn("{}", linkvec_core::debug::error_stats_summary());
        linkvec_core::shutdown_logging();
        return 1;
    }

    linkvec_core::shutdown_logging();
    return 0;
}
