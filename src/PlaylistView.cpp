#include "PlaylistView.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

}

std::vector<PlaylistRow> buildPlaylistRows(const std::vector<fs::path>& tracks, const PlaylistState& ps,
                                           const std::string& filter) {
    std::vector<PlaylistRow> rows;
    const std::string needle = lower(filter);
    const int n = (int)tracks.size();

    for (int pos = 0; pos < n; ++pos) {
        int natural = ps.displayToNatural(pos);
        if (natural < 0 || natural >= n) continue;

        std::string name = tracks[natural].filename().string();
        if (!needle.empty() && lower(name).find(needle) == std::string::npos) continue;
        rows.push_back({pos, natural, name, pos == ps.current_index});
    }
    return rows;
}

int findCurrentRow(const std::vector<PlaylistRow>& rows) {
    auto it = std::find_if(rows.begin(), rows.end(), [](const PlaylistRow& r) { return r.current; });
    return it == rows.end() ? -1 : (int)std::distance(rows.begin(), it);
}

std::string formatTime(std::int64_t ms) {
    if (ms < 0) return "0:00";

    std::int64_t total = ms / 1000;
    int hours = (int)(total / 3600);
    int minutes = (int)((total % 3600) / 60);
    int seconds = (int)(total % 60);

    char buf[32];
    if (hours > 0) std::snprintf(buf, sizeof(buf), "%d:%02d:%02d", hours, minutes, seconds);
    else std::snprintf(buf, sizeof(buf), "%d:%02d", minutes, seconds);
    return buf;
}
