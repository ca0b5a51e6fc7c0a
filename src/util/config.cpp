#include <restorenom/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace restorenom {

static std::optional<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "text") return OutputFormat::Text;
    if (name == "toml") return OutputFormat::Toml;
    return std::nullopt;
}

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Toml: return "toml";
    }
    return "unknown";
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return RestoreError{RestoreError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto v = (*log_tbl)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return RestoreError{RestoreError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log.level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto v = (*log_tbl)["color"].value<bool>()) {
            cfg.log.color = *v;
        }
    }

    // [output] section
    if (auto out_tbl = doc["output"].as_table()) {
        if (auto v = (*out_tbl)["format"].value<std::string>()) {
            auto fmt = parse_output_format(*v);
            if (!fmt) {
                return RestoreError{RestoreError::Config,
                    "unknown output format '" + *v + "'",
                    "use one of: text, toml"};
            }
            cfg.output.format = *fmt;
            cfg.output_format_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RestoreError{RestoreError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log.color.has_value()) {
        log.color = other.log.color;
    }
    if (other.output_format_set) {
        output.format = other.output.format;
        output_format_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log.level);
    if (log.color.has_value()) {
        log::set_color_enabled(*log.color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.restorenom/config.toml";
}

} // namespace restorenom
