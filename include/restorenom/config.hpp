#pragma once

#include <restorenom/result.hpp>
#include <restorenom/log.hpp>
#include <string>
#include <optional>

namespace restorenom {

// [log] section
struct LogConfig {
    log::Level level = log::Info;
    std::optional<bool> color;  // unset: decided by whether stderr is a TTY
};

enum class OutputFormat { Text, Toml };

// [output] section
struct OutputConfig {
    OutputFormat format = OutputFormat::Text;
};

// Layered configuration: global < local. Later layers override earlier ones.
struct Config {
    LogConfig log;
    OutputConfig output;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool output_format_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push level and color into the logger
    void apply_logging() const;
};

// Per-project config file name, looked up in the working directory
inline const char* local_config_name() { return "restorenom.toml"; }

// ~/.restorenom/config.toml, or "" when no home directory is known
std::string global_config_path();

const char* output_format_name(OutputFormat f);

} // namespace restorenom
