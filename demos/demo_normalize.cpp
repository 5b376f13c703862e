// demo_normalize.cpp
//
// A small standalone program that runs normalize_version() over its
// arguments using the layered configuration. Run it with:
//
//     ./demo_normalize 1.0alpha1 V2.01 "1.0-1"      # prints canonical forms
//     ./demo_normalize not-a-version                 # InvalidVersion error
//     PEPVER_ALLOW_INVALID=1 ./demo_normalize junk   # passed through, with a warning
//
// Config is read from ~/.pepver/config.toml and ./pepver.toml when they
// exist, then from PEPVER_ALLOW_INVALID / PEPVER_LOG.

#include <pepver/config.hpp>
#include <pepver/log.hpp>
#include <pepver/normalize.hpp>
#include <pepver/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pepver;

// Load a config layer if the file is there; a missing file is not an error.
Result<std::optional<Config>> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    log::debug("loading config %s", path.c_str());
    auto cfg = Config::load(path);
    PEPVER_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

Result<Config> load_config() {
    auto global = load_layer(global_config_path());
    PEPVER_TRY(global);

    auto project = load_layer("pepver.toml");
    PEPVER_TRY(project);

    auto env = Config::from_env();
    PEPVER_TRY(env);

    return Result<Config>::ok(
        Config::effective(global.value(), project.value(), env.value()));
}

Result<std::vector<std::string>> parse_args(int argc, char** argv) {
    if (argc < 2) {
        return PepverError{
            PepverError::InvalidArg,
            "no version numbers given",
            "usage: demo_normalize <version>..."
        };
    }
    return Result<std::vector<std::string>>::ok(
        std::vector<std::string>(argv + 1, argv + argc));
}

int main(int argc, char** argv) {
    auto cfg = load_config();
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();

    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 1;
    }

    NormalizeOptions opts = cfg.value().normalize_options();
    int failures = 0;

    for (const auto& raw : args.value()) {
        auto canonical = normalize_version(raw, opts);
        if (canonical.is_ok()) {
            std::cout << canonical.value() << "\n";
        } else {
            std::cerr << canonical.error().format() << "\n";
            ++failures;
        }
    }

    if (failures > 0) {
        log::error("%d of %zu version numbers could not be normalized",
                   failures, args.value().size());
        return 1;
    }
    return 0;
}
