#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for linkvec_core module

#include <cstdint>

namespace linkvec_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ListError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace linkvec_core
