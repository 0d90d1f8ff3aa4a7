#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "PlaylistState.hpp"

namespace fs = std::filesystem;

struct AppConfig {
    fs::path config_dir;
    fs::path state_dir;
    int autosave_interval_ms = 5000;
    ReshufflePolicy reshuffle_policy = ReshufflePolicy::KeepCurrentFirst;
    std::string log_level = "info";
    int seek_step_ms = 5000;
    int volume_step = 5;

    fs::path stateFile() const { return state_dir / "state.json"; }
    fs::path lockFile() const { return state_dir / "state.lock"; }
    fs::path logFile() const { return state_dir / "folder_player.log"; }
};

// ~/.config/folder_player，没有 HOME 时用当前目录
fs::path getConfigDir();

// 所有字段都可省略；不合法的值用默认值代替
AppConfig appConfigFromJson(const nlohmann::json& j, const fs::path& configDir);

// 读取 configDir/config.json，文件不存在或损坏时返回默认配置
AppConfig loadAppConfig(const fs::path& configDir);

#endif
