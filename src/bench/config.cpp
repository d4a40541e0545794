/// @file config.cpp
/// @brief Benchmark configuration parsing

#include <linkvec/bench/config.hpp>

#include <toml++/toml.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace linkvec_bench {

using linkvec_core::ConfigError;
using linkvec_core::Err;
using linkvec_core::Result;

namespace {

Result<std::size_t> read_count(const toml::table& section, const char* key, std::size_t fallback) {
    const toml::node* node = section.get(key);
    if (!node) {
        return fallback;
    }
    auto value = node->value<std::int64_t>();
    if (!value) {
        return Err<std::size_t>(ConfigError::invalid_value(key, "expected an integer"));
    }
    if (*value <= 0) {
        return Err<std::size_t>(ConfigError::invalid_value(key, "must be greater than zero"));
    }
    return static_cast<std::size_t>(*value);
}

} // anonymous namespace

Result<BenchConfig> load_bench_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<BenchConfig>(ConfigError::file_not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_bench_config(buffer.str(), path.string());
}

Result<BenchConfig> parse_bench_config(const std::string& content, const std::string& source_name) {
    BenchConfig config;
    toml::table tbl;

    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return Err<BenchConfig>(ConfigError::parse_error(source_name, std::string(err.description())));
    }

    // [bench]
    if (auto bench = tbl["bench"].as_table()) {
        auto struct_count = read_count(*bench, "struct_count", config.struct_count);
        if (!struct_count) {
            return Err<BenchConfig>(struct_count.error());
        }
        config.struct_count = *struct_count;

        auto primitive_count = read_count(*bench, "primitive_count", config.primitive_count);
        if (!primitive_count) {
            return Err<BenchConfig>(primitive_count.error());
        }
        config.primitive_count = *primitive_count;
    }

    // [log]
    if (auto log = tbl["log"].as_table()) {
        if (auto level = (*log)["level"].value<std::string>()) {
            auto parsed = linkvec_core::parse_log_level(*level);
            if (!parsed) {
                return Err<BenchConfig>(ConfigError::invalid_value("log.level", "unknown level '" + *level + "'"));
            }
            config.log.level = *parsed;
        }
        config.log.file_enabled = (*log)["file"].value_or(config.log.file_enabled);
        config.log.console_enabled = (*log)["console"].value_or(config.log.console_enabled);
        if (auto dir = (*log)["directory"].value<std::string>()) {
            config.log.log_directory = *dir;
        }
    }

    if (config.log.file_enabled && config.log.log_directory.empty()) {
        return Err<BenchConfig>(ConfigError::invalid_value("log.directory", "required when log.file is true"));
    }

    return config;
}

Result<std::size_t> parse_count(const std::string& key, const std::string& text) {
    std::size_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return Err<std::size_t>(ConfigError::invalid_value(key, "'" + text + "' is not a number"));
    }
    if (value == 0) {
        return Err<std::size_t>(ConfigError::invalid_value(key, "must be greater than zero"));
    }
    return value;
}

Result<void> apply_cli_overrides(BenchConfig& config, const std::vector<std::string>& args) {
    static const std::vector<std::string> known = {
        "--struct-count", "--primitive-count", "--log-level", "--log-dir",
    };

    // Applied to a copy so a rejected flag leaves `config` as it was
    BenchConfig updated = config;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (std::find(known.begin(), known.end(), arg) == known.end()) {
            return Err(ConfigError::invalid_value(arg, "unknown option"));
        }
        if (i + 1 >= args.size()) {
            return Err(ConfigError::invalid_value(arg, "missing value"));
        }
        const std::string& value = args[++i];

        if (arg == "--struct-count") {
            auto count = parse_count("struct_count", value);
            if (!count) {
                return Err(count.error());
            }
            updated.struct_count = *count;
        } else if (arg == "--primitive-count") {
            auto count = parse_count("primitive_count", value);
            if (!count) {
                return Err(count.error());
            }
            updated.primitive_count = *count;
        } else if (arg == "--log-level") {
            auto level = linkvec_core::parse_log_level(value);
            if (!level) {
                return Err(ConfigError::invalid_value("log.level", "unknown level '" + value + "'"));
            }
            updated.log.level = *level;
        } else {
            updated.log.log_directory = value;
            updated.log.file_enabled = true;
        }
    }

    config = std::move(updated);
    return linkvec_core::Ok();
}

} // namespace linkvec_bench
