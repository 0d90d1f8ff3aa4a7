#ifndef PLAYBACK_ENGINE_HPP
#define PLAYBACK_ENGINE_HPP

#include <cstdint>
#include <string>

// 播放引擎接口，AppController 只通过它控制播放
class PlaybackEngine {
public:
    virtual ~PlaybackEngine() = default;

    // 播放控制接口
    virtual bool play(const std::string& path, std::int64_t startMs) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;
    virtual void seek(std::int64_t ms) = 0;
    virtual void setVolume(int volume) = 0;

    // 状态查询接口
    virtual std::int64_t positionMs() const = 0;
    virtual std::int64_t lengthMs() const = 0; // 未知时为 0
    virtual bool isPaused() const = 0;
    virtual bool isActive() const = 0; // 已加载曲目且未停止

    // 曲目自然播完后返回一次 true
    virtual bool consumeTrackFinished() = 0;
};

#endif
