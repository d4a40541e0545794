#pragma once

/// @file report.hpp
/// @brief Memory and timing reports for the container benchmark

#include <linkvec/structures/indexed_list.hpp>

#include <chrono>
#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <vector>

namespace linkvec_bench {

/// Heap footprint of one container
struct MemoryReport {
    std::string container;
    std::size_t len = 0;
    std::optional<std::size_t> true_len;  ///< IndexedList only
    std::optional<std::size_t> capacity;  ///< Absent for node-based containers
    std::size_t used = 0;                 ///< Bytes held by live contents
    std::size_t real = 0;                 ///< Bytes reserved
    bool estimated = false;               ///< Figures are approximations
};

/// Format a byte count with binary units, e.g. "1.50 KB"
[[nodiscard]] std::string human_bytes(std::size_t bytes);

/// Format a duration with the largest fitting unit, e.g. "12.34us"
[[nodiscard]] std::string format_duration(std::chrono::nanoseconds duration);

/// Multi-line description of a MemoryReport
[[nodiscard]] std::string format_report(const MemoryReport& report);

template<typename T>
[[nodiscard]] MemoryReport report_memory(const std::vector<T>& v) {
    MemoryReport report;
    report.container = "std::vector";
    report.len = v.size();
    report.capacity = v.capacity();
    report.used = sizeof(T) * v.size();
    report.real = sizeof(T) * v.capacity();
    return report;
}

/// Each std::list node carries two links besides the element
template<typename T>
[[nodiscard]] MemoryReport report_memory(const std::list<T>& l) {
    MemoryReport report;
    report.container = "std::list";
    report.len = l.size();
    report.used = (sizeof(T) + 2 * sizeof(void*)) * l.size();
    report.real = report.used;
    report.estimated = true;
    return report;
}

template<typename T>
[[nodiscard]] MemoryReport report_memory(const linkvec_structures::IndexedList<T>& list) {
    MemoryReport report;
    report.container = "IndexedList";
    report.len = list.len();
    report.true_len = list.true_len();
    report.capacity = list.capacity();
    report.used = list.mem_used();
    report.real = list.true_mem_used();
    report.estimated = true;
    return report;
}

} // namespace linkvec_bench
