#ifndef MEDIA_SCANNER_HPP
#define MEDIA_SCANNER_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class FolderNotFound : public std::runtime_error {
public:
    explicit FolderNotFound(const std::string& folder)
        : std::runtime_error("folder not found: " + folder), folder(folder) {}

    const std::string& getFolder() const { return folder; }

private:
    std::string folder;
};

bool isMediaFile(const fs::path& path);

// 自然排序: 数字段按数值比较，"track2" 排在 "track10" 前面
bool naturalLess(const std::string& a, const std::string& b);

// 只扫描顶层，不进入子目录
std::vector<fs::path> scanFolder(const fs::path& folder);

#endif
