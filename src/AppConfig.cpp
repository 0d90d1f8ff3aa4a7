#include "AppConfig.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

int intOr(const json& j, const char* key, int fallback, int lo, int hi) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_integer()) {
        spdlog::warn("config: {} must be an integer, using {}", key, fallback);
        return fallback;
    }
    return std::clamp(it->get<int>(), lo, hi);
}

std::string stringOr(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_string()) {
        spdlog::warn("config: {} must be a string, using \"{}\"", key, fallback);
        return fallback;
    }
    return it->get<std::string>();
}

}

fs::path getConfigDir() {
    const char* home_env = std::getenv("HOME");
    return home_env ? fs::path(home_env) / ".config" / "folder_player" : fs::current_path();
}

AppConfig appConfigFromJson(const json& j, const fs::path& configDir) {
    AppConfig cfg;
    cfg.config_dir = configDir;
    cfg.state_dir = configDir;
    if (!j.is_object()) return cfg;

    std::string stateDir = stringOr(j, "state_dir", "");
    if (!stateDir.empty()) {
        fs::path p(stateDir);
        cfg.state_dir = p.is_absolute() ? p : configDir / p;
    }

    cfg.autosave_interval_ms = intOr(j, "autosave_interval_ms", cfg.autosave_interval_ms, 100, 3600 * 1000);
    cfg.seek_step_ms = intOr(j, "seek_step_ms", cfg.seek_step_ms, 100, 600 * 1000);
    cfg.volume_step = intOr(j, "volume_step", cfg.volume_step, 1, 100);

    std::string policy = stringOr(j, "reshuffle_policy", toString(cfg.reshuffle_policy));
    if (!reshufflePolicyFromString(policy, cfg.reshuffle_policy))
        spdlog::warn("config: unknown reshuffle_policy \"{}\", using {}", policy, toString(cfg.reshuffle_policy));

    std::string level = stringOr(j, "log_level", cfg.log_level);
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        spdlog::warn("config: unknown log_level \"{}\", using {}", level, cfg.log_level);
    } else {
        cfg.log_level = level;
    }
    return cfg;
}

AppConfig loadAppConfig(const fs::path& configDir) {
    fs::path p = configDir / "config.json";
    std::error_code ec;
    if (!fs::exists(p, ec)) return appConfigFromJson(json::object(), configDir);

    std::ifstream i(p);
    try {
        return appConfigFromJson(json::parse(i), configDir);
    } catch (const json::parse_error& e) {
        spdlog::warn("cannot parse {}: {}, using defaults", p.string(), e.what());
        return appConfigFromJson(json::object(), configDir);
    }
}
