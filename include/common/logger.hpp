#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace logger {

// level: trace/debug/info/warn/error/critical/off，未知值退回 info
spdlog::level::level_enum parse_level(const std::string& level);

// format: console / json；json 每行一个对象，msg 字段已转义
std::unique_ptr<spdlog::formatter> make_formatter(const std::string& format);

void init(const std::string& level, const std::string& format);

// 日志里打印外部输出时截断，避免一行刷屏
std::string truncate(const std::string& text, std::size_t limit = 500);

} // namespace logger
