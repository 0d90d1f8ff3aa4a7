#ifndef LINE_INPUT_HPP
#define LINE_INPUT_HPP

#include <string>
#include <vector>

enum class EditResult { Editing, Done, Cancelled };

// 逐键编辑一行文字，调用方自己轮询按键，编辑期间不阻塞调度循环。
// 按键是 getch 返回的单字节，UTF-8 多字节字符整体删除。
class LineInput {
public:
    explicit LineInput(std::vector<int> eraseKeys = {127, 8});

    EditResult feed(int ch);
    const std::string& getText() const { return text; }

private:
    std::vector<int> eraseKeys;
    std::string text;
};

#endif
