/// @file error.cpp
/// @brief Error handling implementation for linkvec_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <linkvec/core/error.hpp>
#include <atomic>
#include <sstream>

namespace linkvec_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* list_error_kind_name(ListError::Kind kind) {
    switch (kind) {
        case ListError::Kind::OutOfBounds: return "OutOfBounds";
        case ListError::Kind::BrokenChain: return "BrokenChain";
        case ListError::Kind::CountMismatch: return "CountMismatch";
        case ListError::Kind::EndpointMismatch: return "EndpointMismatch";
        case ListError::Kind::Cycle: return "Cycle";
        case ListError::Kind::SlotAliased: return "SlotAliased";
        default: return "Unknown";
    }
}

/// Format list error with full context
std::string format_list_error(const ListError& err) {
    std::ostringstream oss;
    oss << "[ListError:" << list_error_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    if (!err.source.empty()) {
        oss << " (source: " << err.source << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ListError>) {
            oss << detail::format_list_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

// validate() and CLI overrides; element counts
template class Result<void, Error>;
template class Result<std::size_t, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> list_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ListError>()) {
        s_error_stats.list_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t list_error_count() {
    return s_error_stats.list_errors.load(std::memory_order_relaxed);
}

std::uint64_t config_error_count() {
    return s_error_stats.config_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.list_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  List: " << s_error_stats.list_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace linkvec_core
