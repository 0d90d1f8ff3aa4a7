#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <filesystem>
#include <string>

// 终端被 ncurses 占用，日志写到文件；文件打不开时退回 stderr
void initLogging(const std::filesystem::path& logFile, const std::string& level);

#endif
