#ifndef PLAYLIST_STATE_HPP
#define PLAYLIST_STATE_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

// 重新洗牌时当前曲目的去向
enum class ReshufflePolicy { KeepCurrentFirst, RestartFromTop };

// Next / Previous 的结果
enum class StepResult { Moved, Wrapped, EndOfPlaylist, Empty };

const char* toString(ReshufflePolicy policy);
bool reshufflePolicyFromString(const std::string& text, ReshufflePolicy& out);

// order 是否恰好是 0..n-1 的一个排列
bool isPermutation(const std::vector<int>& order, int n);

// 单个文件夹的播放状态。
// current_index 始终是 "显示顺序" 中的位置: 顺序模式下等于自然序号，
// 乱序模式下 shuffle_order[current_index] 才是自然序号。
struct PlaylistState {
    int current_index = 0;
    std::optional<std::vector<int>> shuffle_order;
    bool loop_enabled = false;
    std::int64_t playback_position_ms = 0;

    bool isShuffled() const { return shuffle_order.has_value(); }

    int displayToNatural(int pos) const;
    int naturalToDisplay(int natural) const;
    int currentNatural() const { return displayToNatural(current_index); }

    // 重新扫描后修正: 丢弃与 trackCount 不符的乱序表，把 current_index 夹到范围内。
    // 返回是否丢弃了乱序表。
    bool reconcile(int trackCount);

    void setShuffle(bool on, int trackCount, std::mt19937& rng);
    bool reshuffle(int trackCount, ReshufflePolicy policy, std::mt19937& rng);

    StepResult next(int trackCount);
    StepResult previous(int trackCount);

    bool trackChanged(int newIndex, int trackCount);
    void positionUpdated(std::int64_t ms) { playback_position_ms = ms < 0 ? 0 : ms; }
    void toggleLoop() { loop_enabled = !loop_enabled; }
};

bool operator==(const PlaylistState& a, const PlaylistState& b);
inline bool operator!=(const PlaylistState& a, const PlaylistState& b) { return !(a == b); }

#endif
