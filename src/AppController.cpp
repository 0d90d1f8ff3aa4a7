#include "AppController.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "MediaScanner.hpp"
#include "ShutdownSignal.hpp"

namespace {

// 同一个文件夹无论怎么输入都得到同一个键
std::string normalizeFolder(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::absolute(path, ec), ec);
    std::string s = ec ? fs::path(path).lexically_normal().string() : p.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

}

AppController::AppController(AppState initial, const LockOutcome& lock, PlaybackEngine& player,
                             AutosaveScheduler::Writer writer, const AppConfig& config, std::uint32_t seed)
    : state(std::move(initial)), lock(lock), player(player), config(config),
      autosave(state, std::move(writer), lock.role, std::chrono::milliseconds(config.autosave_interval_ms)),
      rng(seed) {}

void AppController::start(const std::string& initialFolder) {
    player.setVolume(state.volume);

    std::string folder = initialFolder;
    if (folder.empty() && !state.recent_folders.empty()) folder = state.recent_folders.front();
    if (!folder.empty()) openFolder(folder);
}

void AppController::pump(Clock::time_point now) {
    if (!running) return;

    if (shutdownRequested()) {
        spdlog::info("termination signal received");
        post({EventType::Close});
    }
    if (player.consumeTrackFinished()) post({EventType::TrackEnded});
    post({EventType::TimerTick, std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count()});

    AppEvent event{EventType::TimerTick};
    while (running && queue.pop(event)) dispatch(event);
}

void AppController::dispatch(const AppEvent& event) {
    if (!running) return;
    if (event.type != EventType::TimerTick) spdlog::trace("event {}", toString(event.type));

    PlaylistState* ps = activePlaylist();
    switch (event.type) {
        case EventType::OpenFolder: openFolder(event.text); break;
        case EventType::PlayIndex: playIndex((int)event.value); break;
        case EventType::Next: step(true, false); break;
        case EventType::Previous: step(false, false); break;
        case EventType::TrackEnded:
            // 同一轮里用户已经切到别的曲目，这个通知已经过时
            if (player.isActive()) spdlog::debug("stale track end ignored");
            else step(true, true);
            break;
        case EventType::ToggleShuffle: toggleShuffle(); break;
        case EventType::Reshuffle: reshuffle(); break;
        case EventType::ToggleLoop: toggleLoop(); break;
        case EventType::PositionUpdated:
            if (ps) {
                ps->positionUpdated(event.value);
                autosave.markDirty();
            }
            break;
        case EventType::TogglePause:
            if (player.isActive()) player.isPaused() ? player.resume() : player.pause();
            else if (ps && !tracks.empty()) playCurrent(ps->playback_position_ms, false);
            break;
        case EventType::SeekRelative: seekRelative(event.value); break;
        case EventType::RestartTrack:
            if (player.isActive()) {
                player.seek(0);
                if (ps) ps->positionUpdated(0);
                autosave.markDirty();
            }
            break;
        case EventType::SetVolume:
            state.setVolume((int)event.value);
            player.setVolume(state.volume);
            autosave.markDirty();
            break;
        case EventType::AdjustVolume:
            state.setVolume(state.volume + (int)event.value);
            player.setVolume(state.volume);
            autosave.markDirty();
            break;
        case EventType::ZoomIn: state.zoomIn(); autosave.markDirty(); break;
        case EventType::ZoomOut: state.zoomOut(); autosave.markDirty(); break;
        case EventType::ZoomReset: state.resetZoom(); autosave.markDirty(); break;
        case EventType::TimerTick:
            onTimerTick(Clock::time_point(std::chrono::milliseconds(event.value)));
            break;
        case EventType::Close: shutdown(); break;
    }
}

void AppController::shutdown() {
    if (finished) return;
    finished = true;
    running = false;

    capturePosition();
    player.stop();
    autosave.shutdown();
    spdlog::info("shutting down: {} saves written, {} suppressed", autosave.savesWritten(), autosave.savesSuppressed());
}

const PlaylistState* AppController::getPlaylist() const {
    return currentFolder.empty() ? nullptr : state.findPlaylist(currentFolder);
}

PlaylistState* AppController::activePlaylist() {
    return currentFolder.empty() ? nullptr : state.findPlaylist(currentFolder);
}

std::string AppController::getCurrentTrackName() const {
    const PlaylistState* ps = getPlaylist();
    if (!ps || tracks.empty()) return "";
    int natural = ps->currentNatural();
    if (natural < 0 || natural >= trackCount()) return "";
    return tracks[natural].filename().string();
}

// --- 逻辑处理 ---
void AppController::openFolder(const std::string& path) {
    const std::string folder = normalizeFolder(path);

    std::vector<fs::path> scanned;
    try {
        scanned = scanFolder(folder);
    } catch (const FolderNotFound& e) {
        // 保留该目录的播放状态和最近记录，只提示
        spdlog::warn("{}", e.what());
        notice = "文件夹不存在或无法访问: " + folder;
        return;
    }

    capturePosition();
    player.stop();

    currentFolder = folder;
    tracks = std::move(scanned);
    atEnd = false;

    state.touchRecentFolder(folder);
    PlaylistState& ps = state.playlistFor(folder);
    if (ps.reconcile(trackCount()))
        spdlog::info("shuffle order for {} does not match {} tracks, back to straight order", folder, trackCount());
    spdlog::info("opened {} ({} tracks)", folder, trackCount());

    autosave.requestSave();

    if (tracks.empty()) {
        notice = "该文件夹中没有可播放的文件";
        return;
    }
    playCurrent(ps.playback_position_ms, true);
}

void AppController::playCurrent(std::int64_t startMs, bool paused) {
    PlaylistState* ps = activePlaylist();
    if (!ps || tracks.empty()) return;

    int natural = ps->currentNatural();
    if (natural < 0 || natural >= trackCount()) return;

    const fs::path& file = tracks[natural];
    if (!player.play(file.string(), startMs)) {
        spdlog::warn("cannot play {}", file.string());
        notice = "无法播放: " + file.filename().string();
        return;
    }
    if (paused) player.pause();
    atEnd = false;
}

void AppController::capturePosition() {
    PlaylistState* ps = activePlaylist();
    if (!ps || !player.isActive()) return;

    std::int64_t pos = player.positionMs();
    if (pos != ps->playback_position_ms) {
        ps->positionUpdated(pos);
        autosave.markDirty();
    }
}

void AppController::step(bool forward, bool fromTrackEnd) {
    PlaylistState* ps = activePlaylist();
    if (!ps) return;

    StepResult r = forward ? ps->next(trackCount()) : ps->previous(trackCount());
    switch (r) {
        case StepResult::Empty:
            return;
        case StepResult::Moved:
        case StepResult::Wrapped:
            playCurrent(0, false);
            autosave.requestSave();
            return;
        case StepResult::EndOfPlaylist:
            if (forward) {
                atEnd = true;
                if (fromTrackEnd) {
                    // 不循环时播完最后一首就停
                    player.stop();
                    ps->positionUpdated(0);
                    autosave.requestSave();
                }
            } else {
                // 已是第一首: 从头重播
                ps->positionUpdated(0);
                if (player.isActive()) player.seek(0);
                else playCurrent(0, false);
                autosave.markDirty();
            }
            return;
    }
}

void AppController::playIndex(int pos) {
    PlaylistState* ps = activePlaylist();
    if (!ps) return;

    bool same = pos == ps->current_index;
    if (!ps->trackChanged(pos, trackCount())) return;

    if (same && player.isActive()) {
        if (player.isPaused()) player.resume();
    } else {
        playCurrent(ps->playback_position_ms, false);
    }
    autosave.requestSave();
}

void AppController::toggleShuffle() {
    PlaylistState* ps = activePlaylist();
    if (!ps) return;

    ps->setShuffle(!ps->isShuffled(), trackCount(), rng);
    spdlog::debug("shuffle {} for {}", ps->isShuffled() ? "on" : "off", currentFolder);
    autosave.requestSave();
}

void AppController::reshuffle() {
    PlaylistState* ps = activePlaylist();
    if (!ps) return;

    int before = ps->currentNatural();
    if (!ps->reshuffle(trackCount(), config.reshuffle_policy, rng)) return;
    spdlog::debug("reshuffled {} ({})", currentFolder, toString(config.reshuffle_policy));

    if (!tracks.empty() && ps->currentNatural() != before) {
        bool paused = player.isActive() && player.isPaused();
        playCurrent(0, paused);
    }
    autosave.requestSave();
}

void AppController::toggleLoop() {
    PlaylistState* ps = activePlaylist();
    if (!ps) return;

    ps->toggleLoop();
    spdlog::debug("loop {} for {}", ps->loop_enabled ? "on" : "off", currentFolder);
    autosave.requestSave();
}

void AppController::seekRelative(std::int64_t deltaMs) {
    if (!player.isActive()) return;

    std::int64_t target = player.positionMs() + deltaMs;
    std::int64_t length = player.lengthMs();
    if (length > 0) target = std::min(target, length);
    target = std::max<std::int64_t>(0, target);
    player.seek(target);

    if (PlaylistState* ps = activePlaylist()) {
        ps->positionUpdated(target);
        autosave.markDirty();
    }
}

void AppController::onTimerTick(Clock::time_point now) {
    capturePosition();
    autosave.tick(now);
}
