// common/logging.cc
#include "common/logging.h"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdlib>

namespace dfsio {

namespace {
std::atomic<int> g_level {static_cast<int>(LogLevel::INFO)};
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    std::string v;
    v.reserve(s.size());
    for (char c : s) {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "debug") {
        out = LogLevel::DEBUG;
    } else if (v == "info") {
        out = LogLevel::INFO;
    } else if (v == "warn" || v == "warning") {
        out = LogLevel::WARN;
    } else if (v == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

void init_log_level_from_env() {
    const char* env = std::getenv("DFSIO_LOG_LEVEL");
    if (env == nullptr || *env == '\0') return;

    LogLevel level;
    if (!parse_log_level(env, level)) {
        log(LogLevel::WARN, "ignore invalid DFSIO_LOG_LEVEL=%s", env);
        return;
    }
    set_log_level(level);
}

void log(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed)) {
        return;
    }

    const char* prefix = nullptr;
    switch (level) {
    case LogLevel::DEBUG: prefix = "[DEBUG]"; break;
    case LogLevel::INFO:  prefix = "[INFO ]"; break;
    case LogLevel::WARN:  prefix = "[WARN ]"; break;
    case LogLevel::ERROR: prefix = "[ERROR]"; break;
    }

    std::fprintf(stderr, "%s ", prefix);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);

    std::fprintf(stderr, "\n");
}

} // namespace dfsio
