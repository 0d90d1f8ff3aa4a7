#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "AppConfig.hpp"
#include "AppController.hpp"
#include "LockCoordinator.hpp"
#include "Logging.hpp"
#include "MusicPlayer.hpp"
#include "ShutdownSignal.hpp"
#include "StateStore.hpp"
#include "TerminalUi.hpp"

int main(int argc, char* argv[]) {
    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
        std::cerr << "usage: " << argv[0] << " [FOLDER]\n";
        return argc > 2 ? 2 : 0;
    }

    AppConfig config = loadAppConfig(getConfigDir());
    initLogging(config.logFile(), config.log_level);
    spdlog::info("folder_player starting, state in {}", config.state_dir.string());

    // 锁在最后一次保存完成之后才随 locks 析构释放
    LockCoordinator locks(std::make_unique<FlockInstanceLock>(config.lockFile()));
    const LockOutcome& lock = locks.acquire();

    StateStore store(config.stateFile());
    AppState state;
    std::string loadNotice;
    try {
        state = store.load();
    } catch (const StateLoadError& e) {
        spdlog::warn("{}; starting with empty state", e.what());
        loadNotice = "状态文件损坏，已使用空白状态";
    }
    if (lock.role == Role::Writer) store.removeStaleTemporaries();

    MusicPlayer player;
    if (!player.isReady()) spdlog::error("audio output unavailable, playback disabled");

    installShutdownHandlers();
    AppController app(std::move(state), lock, player, [&store](const AppState& s) { store.save(s); }, config);
    {
        TerminalUi ui(app, player, config);
        if (lock.degraded) app.showNotice(lock.role == Role::Reader ? "无法使用实例锁，以只读模式运行" : "实例锁不可用，多开时可能互相覆盖");
        if (!loadNotice.empty()) app.showNotice(loadNotice);
        app.start(argc == 2 ? argv[1] : "");
        ui.run();
    }
    app.shutdown();
    spdlog::shutdown();
    return 0;
}
