// common/logging.h
#pragma once

#include <cstdio>
#include <string>

namespace dfsio {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

// 进程级阈值，低于阈值的日志直接丢弃
void set_log_level(LogLevel level);
LogLevel log_level();

// 接受 "debug" / "info" / "warn" / "error"（大小写不敏感），非法值返回 false
bool parse_log_level(const std::string& s, LogLevel& out);

// 读取 DFSIO_LOG_LEVEL 环境变量，未设置时不改变当前阈值
void init_log_level_from_env();

void log(LogLevel level, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

} // namespace dfsio
