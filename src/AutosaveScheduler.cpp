#include "AutosaveScheduler.hpp"
#include <spdlog/spdlog.h>
#include "StateStore.hpp"

AutosaveScheduler::AutosaveScheduler(const AppState& state, Writer writer, Role role, std::chrono::milliseconds interval)
    : state(state), writer(std::move(writer)), role(role), interval(interval) {}

void AutosaveScheduler::markDirty() {
    std::lock_guard<std::mutex> l(mutex);
    dirty = true;
}

bool AutosaveScheduler::isDirty() const {
    std::lock_guard<std::mutex> l(mutex);
    return dirty;
}

bool AutosaveScheduler::requestSave() {
    return runSave();
}

bool AutosaveScheduler::tick(Clock::time_point now) {
    {
        std::lock_guard<std::mutex> l(mutex);
        if (stopped) return false;
        if (!nextDue) {
            nextDue = now + interval;
            return false;
        }
        if (now < *nextDue) return false;
        nextDue = now + interval;
        if (!dirty) return false;
    }
    return runSave();
}

bool AutosaveScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> l(mutex);
        stopped = true;
    }
    return runSave();
}

bool AutosaveScheduler::runSave() {
    {
        std::lock_guard<std::mutex> l(mutex);
        if (role == Role::Reader) {
            dirty = false;
            ++suppressed;
            spdlog::debug("read-only instance, save suppressed");
            return false;
        }
        if (saving) {
            // 正在保存，合并为一次补存
            pending = true;
            return false;
        }
        saving = true;
    }

    bool wrote = false;
    for (;;) {
        {
            std::lock_guard<std::mutex> l(mutex);
            dirty = false;
        }

        std::string message;
        try {
            writer(state);
        } catch (const StateSaveError& e) {
            message = e.what();
        }

        std::lock_guard<std::mutex> l(mutex);
        if (message.empty()) {
            wrote = true;
            ++written;
            failed = false;
            error.clear();
        } else {
            // 保持 dirty，下一次触发时重试
            failed = true;
            error = message;
            dirty = true;
            spdlog::warn("could not save state: {}", message);
        }
        if (!pending) {
            saving = false;
            break;
        }
        pending = false;
    }
    return wrote;
}

bool AutosaveScheduler::lastSaveFailed() const {
    std::lock_guard<std::mutex> l(mutex);
    return failed;
}

std::string AutosaveScheduler::lastError() const {
    std::lock_guard<std::mutex> l(mutex);
    return error;
}

int AutosaveScheduler::savesWritten() const {
    std::lock_guard<std::mutex> l(mutex);
    return written;
}

int AutosaveScheduler::savesSuppressed() const {
    std::lock_guard<std::mutex> l(mutex);
    return suppressed;
}

bool AutosaveScheduler::isSaving() const {
    std::lock_guard<std::mutex> l(mutex);
    return saving;
}
