#ifndef APP_CONTROLLER_HPP
#define APP_CONTROLLER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include "AppConfig.hpp"
#include "AppState.hpp"
#include "AutosaveScheduler.hpp"
#include "EventQueue.hpp"
#include "LockCoordinator.hpp"
#include "PlaybackEngine.hpp"

namespace fs = std::filesystem;

/*
 * 持有 AppState 并在单一调度线程上处理所有事件。
 * 界面层只读取状态并 post 事件，播放引擎的播完通知也经由 pump() 进入同一队列。
 */
class AppController {
public:
    using Clock = std::chrono::steady_clock;

    AppController(AppState state, const LockOutcome& lock, PlaybackEngine& player,
                  AutosaveScheduler::Writer writer, const AppConfig& config,
                  std::uint32_t seed = std::random_device{}());

    // 恢复音量，打开命令行给的目录或最近一次的目录 (暂停在上次的位置)
    void start(const std::string& initialFolder = "");

    // 动作接口
    void post(AppEvent event) { queue.push(std::move(event)); }
    void dispatch(const AppEvent& event);

    // 调度循环的一步: 检查播完通知、定时器，然后按顺序处理队列
    void pump(Clock::time_point now);

    // 取消定时器并做最后一次同步保存，可重复调用
    void shutdown();

    // 数据获取 (供UI读取)
    const AppState& getState() const { return state; }
    const std::string& getCurrentFolder() const { return currentFolder; }
    const std::vector<fs::path>& getTracks() const { return tracks; }
    const PlaylistState* getPlaylist() const;
    std::string getCurrentTrackName() const;
    const std::string& getNotice() const { return notice; }
    void showNotice(const std::string& text) { notice = text; }
    void clearNotice() { notice.clear(); }

    Role getRole() const { return lock.role; }
    bool isReadOnly() const { return lock.role == Role::Reader; }
    const LockOutcome& getLock() const { return lock; }
    bool isAtEnd() const { return atEnd; }
    bool isRunning() const { return running; }

    PlaybackEngine& getPlayer() { return player; }
    EventQueue& getQueue() { return queue; }
    const AutosaveScheduler& getAutosave() const { return autosave; }

private:
    PlaylistState* activePlaylist();
    int trackCount() const { return (int)tracks.size(); }

    void openFolder(const std::string& path);
    void playCurrent(std::int64_t startMs, bool paused);
    void capturePosition();
    void step(bool forward, bool fromTrackEnd);
    void playIndex(int pos);
    void toggleShuffle();
    void reshuffle();
    void toggleLoop();
    void seekRelative(std::int64_t deltaMs);
    void onTimerTick(Clock::time_point now);

    AppState state; // 必须先于 autosave 构造
    LockOutcome lock;
    PlaybackEngine& player;
    const AppConfig& config;
    AutosaveScheduler autosave;
    EventQueue queue;
    std::mt19937 rng;

    std::string currentFolder;
    std::vector<fs::path> tracks; // 自然顺序
    std::string notice;
    bool atEnd = false;
    bool running = true;
    bool finished = false;
};

#endif
