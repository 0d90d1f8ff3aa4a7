#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "AppState.hpp"

namespace fs = std::filesystem;

// 状态文件损坏、无法读取或不符合格式
class StateLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 写入或改名失败，磁盘上的旧文件保持不变
class StateSaveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void to_json(nlohmann::json& j, const PlaylistState& ps);
void to_json(nlohmann::json& j, const AppState& state);

// 类型不符时抛 StateLoadError；缺少的字段取默认值
AppState appStateFromJson(const nlohmann::json& j);

/*
 * 整个 AppState 存成一个 JSON 文件。
 * 保存采用 "先写临时文件再改名": 同目录下 mkstemp 建临时文件，写完 fsync，
 * 再 rename 覆盖目标。任何时刻磁盘上只会是旧的完整文件或新的完整文件。
 */
class StateStore {
public:
    explicit StateStore(fs::path stateFile);

    // 文件不存在返回默认状态；存在但解析失败抛 StateLoadError
    AppState load() const;

    // 失败抛 StateSaveError，不留下临时文件
    void save(const AppState& state) const;

    // save 的两个阶段，分开暴露以便模拟写到一半崩溃
    fs::path writeTemporary(const AppState& state) const;
    void commitTemporary(const fs::path& temporary) const;

    // 清理上一个写入进程崩溃后残留的临时文件，只应由 Writer 调用
    int removeStaleTemporaries() const;

    const fs::path& getPath() const { return stateFile; }

private:
    fs::path stateFile;
};

#endif
