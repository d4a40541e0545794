/// @file report.cpp
/// @brief Human-readable formatting for benchmark reports

#include <linkvec/bench/report.hpp>

#include <array>
#include <iomanip>
#include <sstream>

namespace linkvec_bench {

std::string human_bytes(std::size_t bytes) {
    static constexpr std::array<const char*, 6> units = {"B", "KB", "MB", "GB", "TB", "PB"};

    std::size_t unit = 0;
    double value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit < units.size() - 1) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

std::string format_duration(std::chrono::nanoseconds duration) {
    const auto ns = duration.count();

    std::ostringstream oss;
    if (ns < 1'000) {
        oss << ns << "ns";
        return oss.str();
    }

    oss << std::fixed << std::setprecision(2);
    if (ns < 1'000'000) {
        oss << static_cast<double>(ns) / 1e3 << "us";
    } else if (ns < 1'000'000'000) {
        oss << static_cast<double>(ns) / 1e6 << "ms";
    } else {
        oss << static_cast<double>(ns) / 1e9 << "s";
    }
    return oss.str();
}

std::string format_report(const MemoryReport& report) {
    const char* approx = report.estimated ? "~" : "=";

    std::ostringstream oss;
    oss << report.container << ": len = " << report.len;
    if (report.true_len) {
        oss << ", true_len = " << *report.true_len;
    }
    if (report.capacity) {
        oss << ", capacity = " << *report.capacity;
    }
    oss << "\n  used " << approx << " " << report.used << " (" << human_bytes(report.used) << ")"
        << "\n  real " << approx << " " << report.real << " (" << human_bytes(report.real) << ")";
    return oss.str();
}

} // namespace linkvec_bench
