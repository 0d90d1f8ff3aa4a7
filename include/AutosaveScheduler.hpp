#ifndef AUTOSAVE_SCHEDULER_HPP
#define AUTOSAVE_SCHEDULER_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "AppState.hpp"
#include "LockCoordinator.hpp"

/*
 * 周期保存 + 事件触发的立即保存。
 * 同一时刻最多只有一次保存在执行；保存进行中到达的请求合并成一次补存。
 * Reader 角色下所有保存都被跳过。
 */
class AutosaveScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Writer = std::function<void(const AppState&)>; // 失败时抛 StateSaveError

    AutosaveScheduler(const AppState& state, Writer writer, Role role, std::chrono::milliseconds interval);

    void markDirty();
    bool isDirty() const;

    // 立即保存，返回这次调用是否真正写入了磁盘
    bool requestSave();

    // 定时器: 每个周期到点时若有改动就保存
    bool tick(Clock::time_point now);

    // 退出前最后一次同步保存，之后 tick 不再生效
    bool shutdown();

    bool lastSaveFailed() const;
    std::string lastError() const;
    int savesWritten() const;
    int savesSuppressed() const;
    bool isSaving() const;
    Role getRole() const { return role; }

private:
    bool runSave();

    const AppState& state;
    Writer writer;
    Role role;
    std::chrono::milliseconds interval;

    mutable std::mutex mutex;
    bool dirty = false;
    bool saving = false;
    bool pending = false;
    bool stopped = false;
    bool failed = false;
    std::string error;
    int written = 0;
    int suppressed = 0;
    std::optional<Clock::time_point> nextDue;
};

#endif
