#ifndef PLAYLIST_VIEW_HPP
#define PLAYLIST_VIEW_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "PlaylistState.hpp"

namespace fs = std::filesystem;

struct PlaylistRow {
    int displayPos; // 在显示顺序中的位置，用于 PlayIndex
    int natural;    // 在自然顺序中的位置
    std::string name;
    bool current;
};

// 按显示顺序列出曲目，filter 为不区分大小写的子串，空串表示不过滤
std::vector<PlaylistRow> buildPlaylistRows(const std::vector<fs::path>& tracks, const PlaylistState& ps,
                                           const std::string& filter);

// 当前曲目在过滤结果中的行号，不在结果中返回 -1
int findCurrentRow(const std::vector<PlaylistRow>& rows);

// M:SS，超过一小时为 H:MM:SS
std::string formatTime(std::int64_t ms);

#endif
