#pragma once

#include <pepver/log.hpp>
#include <pepver/normalize.hpp>
#include <pepver/result.hpp>
#include <optional>
#include <string>

namespace pepver {

// Layered configuration: global > project > environment
// Later layers override earlier ones, key by key.
//
//   [normalize]
//   allow-invalid = false
//   report-changes = true
//
//   [log]
//   level = "info"
//   color = true
struct Config {
    bool allow_invalid = false;
    bool report_changes = true;
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    // Name of the setting that turned allow_invalid on, for diagnostics
    std::string allow_invalid_source = "allow-invalid";

    // Track which fields were explicitly set (for merge)
    bool allow_invalid_set = false;
    bool report_changes_set = false;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // PEPVER_ALLOW_INVALID (any non-empty value) and PEPVER_LOG
    static Result<Config> from_env();

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> env
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& env);

    // Options for normalize_version(); diagnostics go to log::warn
    // when report_changes is on
    NormalizeOptions normalize_options() const;

    // Push [log] settings into the logger
    void apply_logging() const;
};

// Discover the global config file path: ~/.pepver/config.toml
std::string global_config_path();

} // namespace pepver
