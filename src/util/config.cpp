#include <pepver/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace pepver {

static Result<bool> read_bool(const toml::table& tbl, const char* section,
                              const char* key, bool& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return Result<bool>::ok(false);

    auto v = node->value<bool>();
    if (!v) {
        return PepverError{PepverError::Config,
            std::string("[") + section + "] " + key + " must be a boolean"};
    }
    out = *v;
    return Result<bool>::ok(true);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PepverError{PepverError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [normalize] section
    if (auto norm = doc["normalize"].as_table()) {
        auto allow = read_bool(*norm, "normalize", "allow-invalid", cfg.allow_invalid);
        PEPVER_TRY(allow);
        cfg.allow_invalid_set = allow.value();

        auto report = read_bool(*norm, "normalize", "report-changes", cfg.report_changes);
        PEPVER_TRY(report);
        cfg.report_changes_set = report.value();
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (const toml::node* node = lg->get("level")) {
            auto name = node->value<std::string>();
            if (!name) {
                return PepverError{PepverError::Config,
                    "[log] level must be a string"};
            }
            auto lvl = log::parse_level(*name);
            PEPVER_TRY(lvl);
            cfg.log_level = lvl.value();
        }

        bool color = false;
        auto has_color = read_bool(*lg, "log", "color", color);
        PEPVER_TRY(has_color);
        if (has_color.value()) cfg.log_color = color;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PepverError{PepverError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

Result<Config> Config::from_env() {
    Config cfg;

    const char* allow = std::getenv("PEPVER_ALLOW_INVALID");
    if (allow && *allow) {
        cfg.allow_invalid = true;
        cfg.allow_invalid_set = true;
        cfg.allow_invalid_source = "PEPVER_ALLOW_INVALID";
    }

    const char* level = std::getenv("PEPVER_LOG");
    if (level && *level) {
        auto lvl = log::parse_level(level);
        if (lvl.is_err()) {
            lvl.error().hint = "check the PEPVER_LOG environment variable";
            return std::move(lvl).error();
        }
        cfg.log_level = lvl.value();
    }

    return Result<Config>::ok(std::move(cfg));
}

void Config::merge(const Config& other) {
    // Only explicitly-set fields override
    if (other.allow_invalid_set) {
        allow_invalid = other.allow_invalid;
        allow_invalid_source = other.allow_invalid_source;
        allow_invalid_set = true;
    }
    if (other.report_changes_set) {
        report_changes = other.report_changes;
        report_changes_set = true;
    }
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& env) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (env.has_value()) result.merge(env.value());
    return result;
}

NormalizeOptions Config::normalize_options() const {
    NormalizeOptions opts;
    opts.allow_invalid = allow_invalid;
    if (report_changes) {
        std::string source = allow_invalid_source;
        opts.on_diagnostic = [source](const Diagnostic& d) {
            Diagnostic tagged = d;
            tagged.source = source;
            log_diagnostic(tagged);
        };
    }
    return opts;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
    else log::set_color_enabled(log::is_color_enabled());
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pepver/config.toml";
}

} // namespace pepver
