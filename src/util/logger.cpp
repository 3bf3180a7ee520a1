#include "util/logger.hpp"
#include "update/progress_sinks.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>

namespace extupd {

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};

// Guards the level, the log file and the interleaving of output lines.
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::unique_ptr<std::FILE, FileCloser> g_file;

const char* LevelTag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

// "[2024-05-01 10:00:00] [INFO] [file.cpp:12] " ; parts that are unknown are left out.
std::string LinePrefix(LogLevel lvl, const char* file, int line) {
    std::string prefix;

    char ts[32]{};
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) != nullptr && std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm) > 0) {
        prefix += "[";
        prefix += ts;
        prefix += "] ";
    }

    prefix += "[";
    prefix += LevelTag(lvl);
    prefix += "] ";

    if (file && *file && line > 0) {
        const char* base = std::strrchr(file, '/');
        prefix += "[";
        prefix += base ? base + 1 : file;
        prefix += ":" + std::to_string(line) + "] ";
    }
    return prefix;
}

std::string FormatMessage(const char* fmt, va_list ap) {
    va_list measure;
    va_copy(measure, ap);
    const int needed = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);
    if (needed <= 0) return {};

    std::string msg(static_cast<size_t>(needed) + 1, '\0');
    std::vsnprintf(msg.data(), msg.size(), fmt, ap);
    msg.resize(static_cast<size_t>(needed));
    return msg;
}

} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (const char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none")  return LogLevel::None;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

bool Logger::SetLogFile(const std::string& path, std::string& err) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (path.empty()) {
        g_file.reset();
        return true;
    }

    std::unique_ptr<std::FILE, FileCloser> f(std::fopen(path.c_str(), "ae"));
    if (!f) {
        err = "cannot open log file " + path + ": " + std::strerror(errno);
        return false;
    }
    g_file = std::move(f);
    return true;
}

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    if (lvl == LogLevel::None || lvl < Level()) return;

    const std::string text = LinePrefix(lvl, file, line) + FormatMessage(fmt, ap) + "\n";

    std::lock_guard<std::mutex> lk(g_mu);
    if (IsProgressLineActive()) {
        ClearProgressLine();
    }
    std::fputs(text.c_str(), stderr);
    if (g_file) {
        std::fputs(text.c_str(), g_file.get());
        std::fflush(g_file.get());
    }
}

} // namespace extupd
