#include "MediaScanner.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace {

const std::array<const char*, 19> kMediaExtensions = {
    // 音频
    ".mp3", ".wav", ".flac", ".aac", ".ogg", ".wma", ".m4a", ".opus", ".aiff",
    // 视频
    ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm", ".m4v", ".mpeg", ".mpg",
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

bool isDigit(char c) { return std::isdigit((unsigned char)c) != 0; }

// 比较两个数字段，返回 <0 / 0 / >0
int compareDigits(const std::string& a, size_t& i, const std::string& b, size_t& j) {
    size_t si = i, sj = j;
    while (i < a.size() && isDigit(a[i])) ++i;
    while (j < b.size() && isDigit(b[j])) ++j;

    size_t za = si, zb = sj;
    while (za + 1 < i && a[za] == '0') ++za;
    while (zb + 1 < j && b[zb] == '0') ++zb;

    size_t lenA = i - za, lenB = j - zb;
    if (lenA != lenB) return lenA < lenB ? -1 : 1;
    int c = a.compare(za, lenA, b, zb, lenB);
    if (c != 0) return c;
    // 数值相同，前导零少的排前面
    size_t runA = i - si, runB = j - sj;
    if (runA != runB) return runA < runB ? -1 : 1;
    return 0;
}

}

bool isMediaFile(const fs::path& path) {
    std::string ext = lower(path.extension().string());
    return std::find_if(kMediaExtensions.begin(), kMediaExtensions.end(),
                        [&](const char* e) { return ext == e; }) != kMediaExtensions.end();
}

bool naturalLess(const std::string& rawA, const std::string& rawB) {
    const std::string a = lower(rawA);
    const std::string b = lower(rawB);

    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        bool da = isDigit(a[i]), db = isDigit(b[j]);
        if (da && db) {
            int c = compareDigits(a, i, b, j);
            if (c != 0) return c < 0;
            continue;
        }
        if (da != db) return da; // 数字段排在文字段前
        unsigned char ca = (unsigned char)a[i], cb = (unsigned char)b[j];
        if (ca != cb) return ca < cb;
        ++i; ++j;
    }
    if ((i < a.size()) != (j < b.size())) return i >= a.size();
    // 忽略大小写后相同的名字按原文排序，保证严格弱序
    return rawA < rawB;
}

std::vector<fs::path> scanFolder(const fs::path& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) throw FolderNotFound(folder.string());

    std::vector<fs::path> tracks;
    fs::directory_iterator it(folder, ec);
    if (ec) throw FolderNotFound(folder.string());

    const fs::directory_iterator end;
    while (it != end) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && isMediaFile(it->path())) tracks.push_back(it->path());
        it.increment(ec);
        if (ec) throw FolderNotFound(folder.string());
    }

    std::sort(tracks.begin(), tracks.end(), [](const fs::path& x, const fs::path& y) {
        return naturalLess(x.filename().string(), y.filename().string());
    });
    return tracks;
}
