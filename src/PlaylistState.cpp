#include "PlaylistState.hpp"
#include <algorithm>

namespace {

// 生成 0..n-1 的随机排列，first (若有效) 固定在首位
std::vector<int> makeOrder(int n, int first, std::mt19937& rng) {
    std::vector<int> rest;
    rest.reserve(n);
    for (int i = 0; i < n; ++i) {
        if (i != first) rest.push_back(i);
    }
    std::shuffle(rest.begin(), rest.end(), rng);
    if (first < 0 || first >= n) return rest;

    std::vector<int> order;
    order.reserve(n);
    order.push_back(first);
    order.insert(order.end(), rest.begin(), rest.end());
    return order;
}

}

const char* toString(ReshufflePolicy policy) {
    return policy == ReshufflePolicy::RestartFromTop ? "restart_from_top" : "keep_current_first";
}

bool reshufflePolicyFromString(const std::string& text, ReshufflePolicy& out) {
    if (text == "keep_current_first") { out = ReshufflePolicy::KeepCurrentFirst; return true; }
    if (text == "restart_from_top") { out = ReshufflePolicy::RestartFromTop; return true; }
    return false;
}

bool isPermutation(const std::vector<int>& order, int n) {
    if (n < 0 || (int)order.size() != n) return false;
    std::vector<bool> seen(n, false);
    for (int v : order) {
        if (v < 0 || v >= n || seen[v]) return false;
        seen[v] = true;
    }
    return true;
}

int PlaylistState::displayToNatural(int pos) const {
    if (shuffle_order && pos >= 0 && pos < (int)shuffle_order->size()) return (*shuffle_order)[pos];
    return pos;
}

int PlaylistState::naturalToDisplay(int natural) const {
    if (!shuffle_order) return natural;
    auto it = std::find(shuffle_order->begin(), shuffle_order->end(), natural);
    return it == shuffle_order->end() ? -1 : (int)std::distance(shuffle_order->begin(), it);
}

bool PlaylistState::reconcile(int trackCount) {
    bool discarded = false;
    if (shuffle_order && !isPermutation(*shuffle_order, trackCount)) {
        // 尽量保留原来正在播放的那首
        int natural = displayToNatural(current_index);
        shuffle_order.reset();
        current_index = natural;
        discarded = true;
    }

    int clamped = current_index;
    if (trackCount <= 0) clamped = 0;
    else clamped = std::clamp(current_index, 0, trackCount - 1);

    if (clamped != current_index) {
        current_index = clamped;
        playback_position_ms = 0;
    }
    if (playback_position_ms < 0) playback_position_ms = 0;
    return discarded;
}

void PlaylistState::setShuffle(bool on, int trackCount, std::mt19937& rng) {
    if (on == isShuffled()) return;

    if (on) {
        int natural = trackCount > 0 ? currentNatural() : -1;
        shuffle_order = makeOrder(trackCount, natural, rng);
        current_index = 0;
    } else {
        int natural = currentNatural();
        shuffle_order.reset();
        current_index = trackCount > 0 ? std::clamp(natural, 0, trackCount - 1) : 0;
    }
}

bool PlaylistState::reshuffle(int trackCount, ReshufflePolicy policy, std::mt19937& rng) {
    if (!isShuffled()) return false;

    if (policy == ReshufflePolicy::KeepCurrentFirst) {
        int natural = trackCount > 0 ? currentNatural() : -1;
        shuffle_order = makeOrder(trackCount, natural, rng);
    } else {
        int before = currentNatural();
        shuffle_order = makeOrder(trackCount, -1, rng);
        if (trackCount > 0 && (*shuffle_order)[0] != before) playback_position_ms = 0;
    }
    current_index = 0;
    return true;
}

StepResult PlaylistState::next(int trackCount) {
    if (trackCount <= 0) return StepResult::Empty;

    if (current_index + 1 < trackCount) {
        ++current_index;
        playback_position_ms = 0;
        return StepResult::Moved;
    }
    if (loop_enabled) {
        current_index = 0;
        playback_position_ms = 0;
        return StepResult::Wrapped;
    }
    current_index = trackCount - 1;
    return StepResult::EndOfPlaylist;
}

StepResult PlaylistState::previous(int trackCount) {
    if (trackCount <= 0) return StepResult::Empty;

    if (current_index - 1 >= 0 && current_index - 1 < trackCount) {
        --current_index;
        playback_position_ms = 0;
        return StepResult::Moved;
    }
    if (loop_enabled) {
        current_index = trackCount - 1;
        playback_position_ms = 0;
        return StepResult::Wrapped;
    }
    current_index = 0;
    return StepResult::EndOfPlaylist;
}

bool PlaylistState::trackChanged(int newIndex, int trackCount) {
    if (newIndex < 0 || newIndex >= trackCount) return false;
    if (newIndex != current_index) playback_position_ms = 0;
    current_index = newIndex;
    return true;
}

bool operator==(const PlaylistState& a, const PlaylistState& b) {
    return a.current_index == b.current_index && a.shuffle_order == b.shuffle_order &&
           a.loop_enabled == b.loop_enabled && a.playback_position_ms == b.playback_position_ms;
}
