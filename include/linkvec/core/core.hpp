#pragma once

/// @file core.hpp
/// @brief Main include file for linkvec_core module

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

/// @namespace linkvec_core
/// @brief Shared infrastructure for linkvec
///
/// - **Error Handling**: ListError / ConfigError taxonomy and Result<T>
/// - **Logging**: spdlog-backed named loggers, LogConfig and LogScope
///
/// Example usage:
/// @code
/// #include <linkvec/core/core.hpp>
///
/// using namespace linkvec_core;
///
/// Result<int> checked_half(int v) {
///     if (v % 2 != 0) {
///         return Err<int>(Error(ErrorCode::InvalidArgument, "odd value"));
///     }
///     return Ok(v / 2);
/// }
/// @endcode
