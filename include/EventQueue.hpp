#ifndef EVENT_QUEUE_HPP
#define EVENT_QUEUE_HPP

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

enum class EventType {
    OpenFolder,      // text = 路径
    PlayIndex,       // value = 显示顺序中的位置
    Next,
    Previous,
    TrackEnded,
    ToggleShuffle,
    Reshuffle,
    ToggleLoop,
    PositionUpdated, // value = 毫秒
    TogglePause,
    SeekRelative,    // value = 毫秒，可为负
    RestartTrack,
    SetVolume,       // value = 0..100
    AdjustVolume,    // value = 增量
    ZoomIn,
    ZoomOut,
    ZoomReset,
    TimerTick,       // value = steady_clock 毫秒
    Close,
};

const char* toString(EventType type);

struct AppEvent {
    EventType type;
    std::int64_t value = 0;
    std::string text;
};

// 所有修改 AppState 的动作都排进这一个队列，由调度线程按顺序处理。
// push 可以来自任意线程，pop/drain 只在调度线程调用。
class EventQueue {
public:
    void push(AppEvent event);
    bool pop(AppEvent& out);
    std::vector<AppEvent> drain();
    bool empty() const;
    size_t size() const;

private:
    mutable std::mutex mutex;
    std::deque<AppEvent> events;
};

#endif
