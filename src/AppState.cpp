#include "AppState.hpp"
#include <algorithm>
#include <cmath>

void AppState::touchRecentFolder(const std::string& folder) {
    recent_folders.erase(std::remove(recent_folders.begin(), recent_folders.end(), folder), recent_folders.end());
    recent_folders.insert(recent_folders.begin(), folder);
    if (recent_folders.size() > kMaxRecentFolders) recent_folders.resize(kMaxRecentFolders);
}

PlaylistState& AppState::playlistFor(const std::string& folder) {
    return playlists[folder];
}

PlaylistState* AppState::findPlaylist(const std::string& folder) {
    auto it = playlists.find(folder);
    return it == playlists.end() ? nullptr : &it->second;
}

const PlaylistState* AppState::findPlaylist(const std::string& folder) const {
    auto it = playlists.find(folder);
    return it == playlists.end() ? nullptr : &it->second;
}

void AppState::setVolume(int v) {
    volume = std::clamp(v, 0, 100);
}

void AppState::setZoom(double z) {
    if (!std::isfinite(z)) z = 1.0;
    // 步进 0.1，避免浮点累积误差
    z = std::round(z * 10.0) / 10.0;
    zoom_level = std::clamp(z, kMinZoom, kMaxZoom);
}

bool AppState::sanitize() {
    bool changed = false;

    std::vector<std::string> folders;
    for (const auto& f : recent_folders) {
        if (f.empty() || std::find(folders.begin(), folders.end(), f) != folders.end()) continue;
        if (folders.size() == kMaxRecentFolders) break;
        folders.push_back(f);
    }
    if (folders != recent_folders) {
        recent_folders = std::move(folders);
        changed = true;
    }

    int v = std::clamp(volume, 0, 100);
    if (v != volume) { volume = v; changed = true; }

    double z = std::isfinite(zoom_level) ? std::clamp(zoom_level, kMinZoom, kMaxZoom) : 1.0;
    if (z != zoom_level) { zoom_level = z; changed = true; }

    for (auto& entry : playlists) {
        PlaylistState& ps = entry.second;
        if (ps.shuffle_order && !isPermutation(*ps.shuffle_order, (int)ps.shuffle_order->size())) {
            // current_index 指向的是被丢弃的顺序，换算回自然顺序
            int natural = ps.displayToNatural(ps.current_index);
            ps.shuffle_order.reset();
            ps.current_index = natural;
            changed = true;
        }
        if (ps.current_index < 0) { ps.current_index = 0; changed = true; }
        if (ps.playback_position_ms < 0) { ps.playback_position_ms = 0; changed = true; }
    }
    return changed;
}

bool operator==(const AppState& a, const AppState& b) {
    return a.recent_folders == b.recent_folders && a.playlists == b.playlists &&
           a.volume == b.volume && a.zoom_level == b.zoom_level;
}
