#include "LineInput.hpp"
#include <algorithm>

LineInput::LineInput(std::vector<int> eraseKeys) : eraseKeys(std::move(eraseKeys)) {}

EditResult LineInput::feed(int ch) {
    if (ch == '\n' || ch == '\r') return EditResult::Done;
    if (ch == 27) return EditResult::Cancelled;

    if (std::find(eraseKeys.begin(), eraseKeys.end(), ch) != eraseKeys.end()) {
        // 先去掉续字节 (10xxxxxx)，再去掉首字节
        while (!text.empty() && (static_cast<unsigned char>(text.back()) & 0xC0) == 0x80) text.pop_back();
        if (!text.empty()) text.pop_back();
        return EditResult::Editing;
    }

    // 方向键等功能键不进入文本
    if (ch >= 32 && ch <= 255 && ch != 127) text.push_back(static_cast<char>(ch));
    return EditResult::Editing;
}
