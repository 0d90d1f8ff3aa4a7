#include "TerminalUi.hpp"
#include <ncurses.h>
#include <algorithm>
#include <chrono>
#include <clocale>
#include <thread>
#include "LineInput.hpp"
#include "PlaylistView.hpp"

namespace {

const int kKeyEnter = '\n';
const int kKeyEsc = 27;

bool isEnter(int ch) { return ch == kKeyEnter || ch == 13 || ch == KEY_ENTER; }

}

TerminalUi::TerminalUi(AppController& app, const MusicPlayer& player, const AppConfig& config)
    : app(app), player(player), config(config) {
    setlocale(LC_ALL, "");
    initscr(); cbreak(); noecho(); keypad(stdscr, TRUE); nodelay(stdscr, TRUE); curs_set(0);
    set_escdelay(25);
    start_color();
    init_pair(1, COLOR_CYAN, COLOR_BLACK);  // 当前曲目
    init_pair(2, COLOR_WHITE, COLOR_RED);   // 只读标记
    init_pair(3, COLOR_YELLOW, COLOR_BLACK); // 提示
}

TerminalUi::~TerminalUi() {
    endwin();
}

void TerminalUi::run() {
    while (app.isRunning()) {
        int ch = getch();
        if (ch != ERR) handleKey(ch);

        app.pump(AppController::Clock::now());
        if (!app.isRunning()) break;

        render();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
}

// --- 按键处理 ---
void TerminalUi::handleKey(int ch) {
    app.clearNotice();
    if (ch == 'q') {
        app.post({EventType::Close});
        return;
    }
    switch (screen) {
        case Screen::PLAYING: handlePlayingKey(ch); break;
        case Screen::RECENT_FOLDERS: handleRecentKey(ch); break;
    }
}

void TerminalUi::handlePlayingKey(int ch) {
    const PlaylistState* ps = app.getPlaylist();
    std::vector<PlaylistRow> rows;
    if (ps) rows = buildPlaylistRows(app.getTracks(), *ps, filter);
    const int total = (int)rows.size();

    switch (ch) {
        case ' ': app.post({EventType::TogglePause}); break;
        case KEY_RIGHT:
        case KEY_END: app.post({EventType::Next}); followCurrent = true; break;
        case KEY_LEFT: app.post({EventType::Previous}); followCurrent = true; break;
        case KEY_HOME: app.post({EventType::RestartTrack}); break;
        case KEY_UP:
            if (total > 0) { highlight = (highlight - 1 + total) % total; followCurrent = false; }
            break;
        case KEY_DOWN:
            if (total > 0) { highlight = (highlight + 1) % total; followCurrent = false; }
            break;
        case 's': app.post({EventType::ToggleShuffle}); followCurrent = true; break;
        case 'r': app.post({EventType::Reshuffle}); followCurrent = true; break;
        case 'l': app.post({EventType::ToggleLoop}); break;
        case '-': app.post({EventType::AdjustVolume, -config.volume_step}); break;
        case '+':
        case '=': app.post({EventType::AdjustVolume, config.volume_step}); break;
        case '[': app.post({EventType::ZoomOut}); break;
        case ']': app.post({EventType::ZoomIn}); break;
        case '0': app.post({EventType::ZoomReset}); break;
        case ',': app.post({EventType::SeekRelative, -config.seek_step_ms}); break;
        case '.': app.post({EventType::SeekRelative, config.seek_step_ms}); break;
        case 'o': {
            std::string path = inputField("输入目录路径: ");
            if (!path.empty()) {
                filter.clear();
                followCurrent = true;
                app.post({EventType::OpenFolder, 0, path});
            }
            break;
        }
        case 'f':
            screen = Screen::RECENT_FOLDERS;
            highlight = 0;
            break;
        case '/':
            filter = inputField("搜索: ");
            highlight = 0;
            followCurrent = true;
            break;
        case kKeyEsc:
            filter.clear();
            followCurrent = true;
            break;
        default:
            if (isEnter(ch) && highlight >= 0 && highlight < total) {
                app.post({EventType::PlayIndex, rows[highlight].displayPos});
                followCurrent = true;
            }
            break;
    }
}

void TerminalUi::handleRecentKey(int ch) {
    const auto& folders = app.getState().recent_folders;
    const int total = (int)folders.size();

    if (ch == kKeyEsc) {
        screen = Screen::PLAYING;
        followCurrent = true;
        return;
    }
    if (total == 0) return;
    if (ch == KEY_UP) highlight = (highlight - 1 + total) % total;
    if (ch == KEY_DOWN) highlight = (highlight + 1) % total;
    if (isEnter(ch) && highlight < total) {
        app.post({EventType::OpenFolder, 0, folders[highlight]});
        filter.clear();
        screen = Screen::PLAYING;
        followCurrent = true;
    }
}

// --- UI 渲染 ---
void TerminalUi::render() {
    switch (screen) {
        case Screen::PLAYING: renderPlayer(); break;
        case Screen::RECENT_FOLDERS: {
            std::vector<std::string> names;
            for (const auto& f : app.getState().recent_folders) names.push_back(fs::path(f).filename().string() + "  -  " + f);
            drawScrollingMenu("最近的文件夹", names, highlight);
            break;
        }
    }
}

void TerminalUi::drawScrollingMenu(const std::string& title, const std::vector<std::string>& options, int highlight) {
    erase();
    int total = (int)options.size();
    if (total == 0) {
        mvprintw(1, 2, "--- %s ---", title.c_str());
        mvprintw(3, 4, "[列表为空]");
    } else {
        int max_rows = std::max(1, LINES - 6);
        int start_index = (highlight >= max_rows) ? highlight - max_rows + 1 : 0;
        mvprintw(1, 2, "--- %s (%d/%d) ---", title.c_str(), highlight + 1, total);
        for (int i = 0; i < max_rows && (start_index + i) < total; ++i) {
            int idx = start_index + i;
            if (idx == highlight) attron(A_REVERSE);
            mvprintw(3 + i, 4, "%s %s", (idx == highlight ? ">" : " "), options[idx].substr(0, std::max(0, COLS-10)).c_str());
            if (idx == highlight) attroff(A_REVERSE);
        }
    }
    mvprintw(LINES - 2, 2, "ENTER: 选择 | ESC: 返回 | Q: 退出");
    refresh();
}

std::string TerminalUi::inputField(const std::string& prompt) {
    // 不用 getnstr: 输入期间照常 pump，播完切歌和定时保存不停
    LineInput input({127, 8, KEY_BACKSPACE});
    curs_set(1);
    std::string result;
    while (app.isRunning()) {
        int ch = getch();
        if (ch != ERR) {
            EditResult r = input.feed(ch == KEY_ENTER ? '\n' : ch);
            if (r == EditResult::Done) { result = input.getText(); break; }
            if (r == EditResult::Cancelled) break;
        }

        app.pump(AppController::Clock::now());
        if (!app.isRunning()) break;

        render();
        move(LINES/2, 0);
        clrtoeol();
        mvprintw(LINES/2, 4, "%s%s", prompt.c_str(), input.getText().c_str());
        refresh();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
    curs_set(0);
    return result;
}

void TerminalUi::renderPlayer() {
    erase();
    const AppState& state = app.getState();
    const PlaylistState* ps = app.getPlaylist();

    mvprintw(1, 2, "目录: %s", app.getCurrentFolder().empty() ? "(未打开)" : app.getCurrentFolder().c_str());
    if (app.isReadOnly()) {
        // 另一个实例正在运行，本实例不会保存任何改动
        attron(COLOR_PAIR(2) | A_BOLD);
        mvprintw(0, std::max(0, COLS - 10), " 只读模式 ");
        attroff(COLOR_PAIR(2) | A_BOLD);
    }

    std::string mode_name = (ps && ps->isShuffled()) ? "乱序" : "顺序";
    mvprintw(2, 2, "模式: %s | 循环: %s | 音量: %d | 缩放: %d%%", mode_name.c_str(),
             (ps && ps->loop_enabled) ? "开" : "关", state.volume, (int)(state.zoom_level * 100 + 0.5));

    const auto& tracks = app.getTracks();
    std::vector<PlaylistRow> rows;
    if (ps) rows = buildPlaylistRows(tracks, *ps, filter);
    int total = (int)rows.size();

    if (followCurrent) {
        int current = findCurrentRow(rows);
        highlight = current >= 0 ? current : 0;
    }
    if (highlight >= total) highlight = std::max(0, total - 1);

    if (tracks.empty()) {
        mvprintw(LINES/2, std::max(0, (COLS-20)/2), "--- 暂无歌曲 ---");
        mvprintw(LINES/2 + 1, std::max(0, (COLS-30)/2), "请按 [O] 打开目录 或 [F] 最近的目录");
    } else {
        const SongInfo& song = player.getCurrentSong();
        std::string name = song.title.empty() ? app.getCurrentTrackName() : song.title + " - " + song.artist;
        mvprintw(3, 2, "当前播放：[%d/%d] %s", ps ? ps->current_index + 1 : 0, (int)tracks.size(), name.c_str());
        if (!filter.empty()) mvprintw(4, 2, "搜索: %s (%d)", filter.c_str(), total);

        int top = 6;
        int max_rows = std::max(1, LINES - top - 6);
        int start_index = (highlight >= max_rows) ? highlight - max_rows + 1 : 0;
        for (int i = 0; i < max_rows && (start_index + i) < total; ++i) {
            const PlaylistRow& row = rows[start_index + i];
            bool selected = (start_index + i) == highlight;
            if (selected) attron(A_REVERSE);
            if (row.current) attron(COLOR_PAIR(1) | A_BOLD);
            mvprintw(top + i, 4, "%s%s", row.current ? ">> " : "   ", row.name.substr(0, std::max(0, COLS-10)).c_str());
            if (row.current) attroff(COLOR_PAIR(1) | A_BOLD);
            if (selected) attroff(A_REVERSE);
        }

        // 进度条
        std::int64_t elapsed = player.isActive() ? player.positionMs() : (ps ? ps->playback_position_ms : 0);
        std::int64_t duration = player.lengthMs();
        int barWidth = std::max(10, COLS - 30);
        int pos = (duration > 0) ? (int)(std::min(elapsed, duration) * barWidth / duration) : 0;
        mvprintw(LINES - 2, 2, "%s [", formatTime(elapsed).c_str());
        for (int i = 0; i < barWidth; ++i) addch(i < pos ? '=' : (i == pos ? '>' : ' '));
        printw("] %s", formatTime(duration).c_str());
    }

    std::string notice = app.getNotice();
    if (notice.empty() && app.getAutosave().lastSaveFailed()) notice = "无法保存状态，将在下次保存时重试";
    if (notice.empty() && app.isAtEnd()) notice = "已到播放列表末尾";
    if (!notice.empty()) {
        attron(COLOR_PAIR(3));
        mvprintw(LINES - 5, 2, "%s", notice.c_str());
        attroff(COLOR_PAIR(3));
    }

    mvprintw(LINES - 4, 2, "[空格]暂停 [左右]切歌 [回车]播放 [S]乱序 [R]重洗 [L]循环 [O]打开 [F]最近 [/]搜索 [-+]音量 [,.]快进退 [Q]退出");
    refresh();
}
