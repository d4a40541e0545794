#pragma once

/// @file config.hpp
/// @brief Benchmark configuration (bench.toml + command line)

#include <linkvec/core/error.hpp>
#include <linkvec/core/log.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace linkvec_bench {

/// Parameters of one benchmark run
struct BenchConfig {
    std::size_t struct_count = 20;         ///< Elements in the large-record run
    std::size_t primitive_count = 100'000; ///< Elements in the u64 run
    linkvec_core::LogConfig log;
};

/// Load configuration from a TOML file
/// @return ConfigError::file_not_found if the file cannot be opened
[[nodiscard]] linkvec_core::Result<BenchConfig> load_bench_config(const std::filesystem::path& path);

/// Parse configuration from TOML text
/// Keys that are absent keep their default values.
[[nodiscard]] linkvec_core::Result<BenchConfig> parse_bench_config(
    const std::string& content,
    const std::string& source_name = "bench.toml");

/// Apply `--struct-count N`, `--primitive-count N`, `--log-level L` and
/// `--log-dir D` on top of an existing configuration
/// `config` is only modified when every flag is accepted.
[[nodiscard]] linkvec_core::Result<void> apply_cli_overrides(
    BenchConfig& config,
    const std::vector<std::string>& args);

/// Parse a positive element count
[[nodiscard]] linkvec_core::Result<std::size_t> parse_count(const std::string& key, const std::string& text);

} // namespace linkvec_bench
