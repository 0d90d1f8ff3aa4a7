#ifndef APP_STATE_HPP
#define APP_STATE_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "PlaylistState.hpp"

constexpr std::size_t kMaxRecentFolders = 10;
constexpr int kDefaultVolume = 100;
constexpr double kMinZoom = 0.5;
constexpr double kMaxZoom = 2.0;
constexpr double kZoomStep = 0.1;

// 整个需要持久化的应用状态，由 AppController 独占持有
struct AppState {
    std::vector<std::string> recent_folders; // 最近的排最前
    std::map<std::string, PlaylistState> playlists;
    int volume = kDefaultVolume;
    double zoom_level = 1.0;

    // 移到最前，去重，超出上限丢掉最旧的
    void touchRecentFolder(const std::string& folder);

    // 第一次打开时创建默认状态
    PlaylistState& playlistFor(const std::string& folder);
    PlaylistState* findPlaylist(const std::string& folder);
    const PlaylistState* findPlaylist(const std::string& folder) const;

    void setVolume(int v);
    void setZoom(double z);
    void zoomIn() { setZoom(zoom_level + kZoomStep); }
    void zoomOut() { setZoom(zoom_level - kZoomStep); }
    void resetZoom() { zoom_level = 1.0; }

    // 加载后修正越界或重复的数据，返回是否改动过
    bool sanitize();
};

bool operator==(const AppState& a, const AppState& b);
inline bool operator!=(const AppState& a, const AppState& b) { return !(a == b); }

#endif
