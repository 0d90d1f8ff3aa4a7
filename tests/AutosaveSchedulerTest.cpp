#include <gtest/gtest.h>
#include <functional>
#include <thread>
#include "AutosaveScheduler.hpp"
#include "StateStore.hpp"
#include "TestUtil.hpp"

using namespace std::chrono_literals;

namespace {

class AutosaveSchedulerTest : public ::testing::Test {
protected:
    AutosaveScheduler make(Role role) {
        return AutosaveScheduler(state, [this](const AppState& s) { writer(s); }, role, 5000ms);
    }

    void writer(const AppState& s) {
        ++calls;
        if (onWrite) onWrite(s);
        if (failNext > 0) {
            --failNext;
            throw StateSaveError("disk full");
        }
        snapshots.push_back(s);
    }

    AppState state;
    int calls = 0;
    int failNext = 0;
    std::function<void(const AppState&)> onWrite;
    std::vector<AppState> snapshots;
    const AutosaveScheduler::Clock::time_point t0{};
};

}

TEST_F(AutosaveSchedulerTest, PeriodicSaveOnlyWhenDirtyAndIntervalElapsed) {
    AutosaveScheduler autosave = make(Role::Writer);

    EXPECT_FALSE(autosave.tick(t0)); // 第一次只启动计时
    autosave.markDirty();
    EXPECT_FALSE(autosave.tick(t0 + 4999ms));
    EXPECT_TRUE(autosave.tick(t0 + 5000ms));
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(autosave.isDirty());

    // 没有改动就不写
    EXPECT_FALSE(autosave.tick(t0 + 10000ms));
    EXPECT_EQ(calls, 1);

    autosave.markDirty();
    EXPECT_FALSE(autosave.tick(t0 + 12000ms));
    EXPECT_TRUE(autosave.tick(t0 + 15000ms));
    EXPECT_EQ(calls, 2);
}

TEST_F(AutosaveSchedulerTest, RequestSaveIsImmediate) {
    AutosaveScheduler autosave = make(Role::Writer);
    state.volume = 12;

    EXPECT_TRUE(autosave.requestSave());

    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].volume, 12);
    EXPECT_EQ(autosave.savesWritten(), 1);
}

TEST_F(AutosaveSchedulerTest, ReaderNeverWrites) {
    AutosaveScheduler autosave = make(Role::Reader);
    autosave.markDirty();

    EXPECT_FALSE(autosave.requestSave());
    EXPECT_FALSE(autosave.tick(t0));
    autosave.markDirty();
    EXPECT_FALSE(autosave.tick(t0 + 60s));
    EXPECT_FALSE(autosave.shutdown());

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(autosave.savesSuppressed(), 3);
    EXPECT_FALSE(autosave.lastSaveFailed());
}

TEST_F(AutosaveSchedulerTest, FailureKeepsDirtyAndRetriesOnNextTrigger) {
    AutosaveScheduler autosave = make(Role::Writer);
    failNext = 1;

    EXPECT_FALSE(autosave.requestSave());
    EXPECT_TRUE(autosave.lastSaveFailed());
    EXPECT_EQ(autosave.lastError(), "disk full");
    EXPECT_TRUE(autosave.isDirty());

    autosave.tick(t0);
    EXPECT_TRUE(autosave.tick(t0 + 5s));
    EXPECT_FALSE(autosave.lastSaveFailed());
    EXPECT_TRUE(autosave.lastError().empty());
    EXPECT_EQ(autosave.savesWritten(), 1);
}

TEST_F(AutosaveSchedulerTest, TriggersDuringSaveAreCoalesced) {
    AutosaveScheduler autosave = make(Role::Writer);
    int reentered = 0;
    onWrite = [&](const AppState&) {
        // 保存进行中又来了三次请求
        if (calls == 1) {
            EXPECT_TRUE(autosave.isSaving());
            for (int i = 0; i < 3; ++i) {
                EXPECT_FALSE(autosave.requestSave());
                ++reentered;
            }
        }
    };

    EXPECT_TRUE(autosave.requestSave());

    EXPECT_EQ(reentered, 3);
    EXPECT_EQ(calls, 2); // 一次原始保存 + 一次合并后的补存
    EXPECT_FALSE(autosave.isSaving());
}

TEST_F(AutosaveSchedulerTest, ConcurrentSavesNeverOverlap) {
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    AutosaveScheduler autosave(state, [&](const AppState&) {
        int now = ++inFlight;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(1ms);
        --inFlight;
    }, Role::Writer, 5000ms);

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) threads.emplace_back([&] {
        for (int j = 0; j < 10; ++j) autosave.requestSave();
    });
    for (auto& t : threads) t.join();

    EXPECT_EQ(maxInFlight.load(), 1);
    EXPECT_FALSE(autosave.isSaving());
}

TEST_F(AutosaveSchedulerTest, ShutdownSavesOnceAndStopsTimer) {
    AutosaveScheduler autosave = make(Role::Writer);
    autosave.tick(t0);

    EXPECT_TRUE(autosave.shutdown());
    EXPECT_EQ(calls, 1);

    autosave.markDirty();
    EXPECT_FALSE(autosave.tick(t0 + 60s));
    EXPECT_EQ(calls, 1);
}

TEST_F(AutosaveSchedulerTest, WritesThroughRealStore) {
    TempDir dir;
    StateStore store(dir / "state.json");
    AutosaveScheduler autosave(state, [&store](const AppState& s) { store.save(s); }, Role::Writer, 5000ms);
    state.touchRecentFolder("/music/a");

    EXPECT_TRUE(autosave.requestSave());
    EXPECT_EQ(store.load(), state);
}
