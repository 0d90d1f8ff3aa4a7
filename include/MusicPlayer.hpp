#ifndef MUSIC_PLAYER_HPP
#define MUSIC_PLAYER_HPP

#include <SDL2/SDL.h>
#include <SDL2/SDL_mixer.h>
#include <cstdint>
#include <string>
#include "PlaybackEngine.hpp"

struct SongInfo {
    std::string title;
    std::string artist;
    std::int64_t durationMs = 0;
};

// SDL2_mixer 播放 + TagLib 读取标签
class MusicPlayer : public PlaybackEngine {
public:
    MusicPlayer();
    ~MusicPlayer() override;

    MusicPlayer(const MusicPlayer&) = delete;
    MusicPlayer& operator=(const MusicPlayer&) = delete;

    bool isReady() const { return ready; }

    // 播放控制接口
    bool play(const std::string& path, std::int64_t startMs) override;
    void pause() override;
    void resume() override;
    void stop() override;
    void seek(std::int64_t ms) override;
    void setVolume(int volume) override;

    // 状态查询接口
    std::int64_t positionMs() const override;
    std::int64_t lengthMs() const override { return currentSong.durationMs; }
    bool isPaused() const override;
    bool isActive() const override { return music != nullptr; }
    bool consumeTrackFinished() override;

    const SongInfo& getCurrentSong() const { return currentSong; }

private:
    void readTags(const std::string& path);

    bool ready = false;
    Mix_Music* music = nullptr;
    SongInfo currentSong;
    bool started = false;

    // 进度计算相关变量
    std::int64_t offsetMs = 0; // 最近一次 seek 的目标
    Uint32 startTicks = 0;
    Uint32 pauseTotalTicks = 0;
    Uint32 pauseStartTicks = 0;
};

#endif
