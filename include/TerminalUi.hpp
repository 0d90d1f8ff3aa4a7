#ifndef TERMINAL_UI_HPP
#define TERMINAL_UI_HPP

#include <string>
#include <vector>
#include "AppConfig.hpp"
#include "AppController.hpp"
#include "MusicPlayer.hpp"

enum class Screen { PLAYING, RECENT_FOLDERS };

// ncurses 界面: 只读 AppController 的状态，按键转成事件 post 回去
class TerminalUi {
public:
    TerminalUi(AppController& app, const MusicPlayer& player, const AppConfig& config);
    ~TerminalUi();

    TerminalUi(const TerminalUi&) = delete;
    TerminalUi& operator=(const TerminalUi&) = delete;

    void run();

private:
    void handleKey(int ch);
    void handlePlayingKey(int ch);
    void handleRecentKey(int ch);
    void render();
    void renderPlayer();
    void drawScrollingMenu(const std::string& title, const std::vector<std::string>& options, int highlight);
    std::string inputField(const std::string& prompt);

    AppController& app;
    const MusicPlayer& player;
    const AppConfig& config;

    Screen screen = Screen::PLAYING;
    int highlight = 0;
    bool followCurrent = true; // 高亮跟随当前曲目
    std::string filter;
};

#endif
