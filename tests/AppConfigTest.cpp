#include <gtest/gtest.h>
#include "AppConfig.hpp"
#include "TestUtil.hpp"

using json = nlohmann::json;

TEST(AppConfigTest, DefaultsWhenEmpty) {
    AppConfig cfg = appConfigFromJson(json::object(), "/cfg");

    EXPECT_EQ(cfg.config_dir, fs::path("/cfg"));
    EXPECT_EQ(cfg.state_dir, fs::path("/cfg"));
    EXPECT_EQ(cfg.autosave_interval_ms, 5000);
    EXPECT_EQ(cfg.reshuffle_policy, ReshufflePolicy::KeepCurrentFirst);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.seek_step_ms, 5000);
    EXPECT_EQ(cfg.volume_step, 5);
    EXPECT_EQ(cfg.stateFile(), fs::path("/cfg/state.json"));
    EXPECT_EQ(cfg.lockFile(), fs::path("/cfg/state.lock"));
    EXPECT_EQ(cfg.logFile(), fs::path("/cfg/folder_player.log"));
}

TEST(AppConfigTest, ReadsAllFields) {
    json j = {
        {"state_dir", "/var/lib/fp"},
        {"autosave_interval_ms", 2000},
        {"reshuffle_policy", "restart_from_top"},
        {"log_level", "debug"},
        {"seek_step_ms", 10000},
        {"volume_step", 10},
    };
    AppConfig cfg = appConfigFromJson(j, "/cfg");

    EXPECT_EQ(cfg.state_dir, fs::path("/var/lib/fp"));
    EXPECT_EQ(cfg.autosave_interval_ms, 2000);
    EXPECT_EQ(cfg.reshuffle_policy, ReshufflePolicy::RestartFromTop);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.seek_step_ms, 10000);
    EXPECT_EQ(cfg.volume_step, 10);
}

TEST(AppConfigTest, RelativeStateDirResolvesAgainstConfigDir) {
    AppConfig cfg = appConfigFromJson(json::object({{"state_dir", "data"}}), "/cfg");
    EXPECT_EQ(cfg.state_dir, fs::path("/cfg/data"));
    EXPECT_EQ(cfg.stateFile(), fs::path("/cfg/data/state.json"));
}

TEST(AppConfigTest, InvalidValuesFallBackOrClamp) {
    json j = {
        {"autosave_interval_ms", "fast"},
        {"reshuffle_policy", "sideways"},
        {"log_level", "loud"},
        {"volume_step", 1000},
        {"seek_step_ms", -1},
        {"state_dir", 42},
    };
    AppConfig cfg = appConfigFromJson(j, "/cfg");

    EXPECT_EQ(cfg.autosave_interval_ms, 5000);
    EXPECT_EQ(cfg.reshuffle_policy, ReshufflePolicy::KeepCurrentFirst);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.volume_step, 100);
    EXPECT_EQ(cfg.seek_step_ms, 100);
    EXPECT_EQ(cfg.state_dir, fs::path("/cfg"));
}

TEST(AppConfigTest, LoadsFromDirectory) {
    TempDir dir;
    writeFile(dir / "config.json", R"({"volume_step": 20, "log_level": "off"})");

    AppConfig cfg = loadAppConfig(dir.get());
    EXPECT_EQ(cfg.volume_step, 20);
    EXPECT_EQ(cfg.log_level, "off");
    EXPECT_EQ(cfg.state_dir, dir.get());
}

TEST(AppConfigTest, MissingOrCorruptFileGivesDefaults) {
    TempDir dir;
    EXPECT_EQ(loadAppConfig(dir.get()).autosave_interval_ms, 5000);

    writeFile(dir / "config.json", "{ not json");
    AppConfig cfg = loadAppConfig(dir.get());
    EXPECT_EQ(cfg.autosave_interval_ms, 5000);
    EXPECT_EQ(cfg.state_dir, dir.get());
}
