#include <restorenom/config.hpp>
#include <restorenom/log.hpp>
#include <restorenom/restore/restore_info_builder.hpp>
#include <restorenom/restore/snapshot.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace restorenom;
namespace fs = std::filesystem;

static int usage() {
    std::cerr << "Usage: restorenom-dump <snapshot.toml> [--toml] [--config <file>]\n";
    return 1;
}

static int fail(const RestoreError& err) {
    std::cerr << err.format() << "\n";
    return 1;
}

// Missing files are skipped; present-but-broken ones are errors
static Result<std::optional<Config>> load_optional_config(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    RESTORENOM_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

int main(int argc, char* argv[]) {
    std::string snapshot_path;
    std::string config_path;
    bool force_toml = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--toml") {
            force_toml = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) return usage();
            config_path = argv[++i];
        } else if (snapshot_path.empty()) {
            snapshot_path = arg;
        } else {
            return usage();
        }
    }
    if (snapshot_path.empty()) return usage();

    auto global = load_optional_config(global_config_path());
    if (global.is_err()) return fail(global.error());
    auto local = load_optional_config(local_config_name());
    if (local.is_err()) return fail(local.error());

    Config cfg = Config::effective(global.value(), local.value());
    if (!config_path.empty()) {
        auto explicit_cfg = Config::load(config_path);
        if (explicit_cfg.is_err()) return fail(explicit_cfg.error());
        cfg.merge(explicit_cfg.value());
    }
    cfg.apply_logging();

    auto snapshot = UpdateSnapshot::load(snapshot_path);
    if (snapshot.is_err()) return fail(snapshot.error());

    log::info("loaded %zu update(s) for %s", snapshot.value().updates.size(),
              snapshot.value().project.full_path.c_str());

    auto info = build_restore_info(snapshot.value().updates, snapshot.value().project);
    if (info.is_err()) return fail(info.error());

    if (!info.value().has_value()) {
        std::cout << "no restore nomination\n";
        return 0;
    }

    if (force_toml || cfg.output.format == OutputFormat::Toml) {
        std::cout << to_toml(*info.value());
    } else {
        std::cout << describe(*info.value());
    }
    return 0;
}
