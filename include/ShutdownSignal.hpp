#ifndef SHUTDOWN_SIGNAL_HPP
#define SHUTDOWN_SIGNAL_HPP

// SIGINT / SIGTERM / SIGHUP 只置一个标志，由调度循环发出 Close 做正常退出和最后一次保存。
// 必须在 initscr 之前安装，否则 ncurses 会装上自己的处理函数。
void installShutdownHandlers();

bool shutdownRequested();
void requestShutdown();
void clearShutdownRequest();

#endif
