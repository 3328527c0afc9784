#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace server::core {

namespace {

LogConfig g_log{};
std::FILE* g_log_file = nullptr;

void close_log_file() {
    if (g_log_file) {
        std::fclose(g_log_file);
        g_log_file = nullptr;
    }
}

} // namespace

void set_log_config(const LogConfig& cfg) {
    close_log_file();
    g_log = cfg;

    if (!g_log.file.empty()) {
        g_log_file = std::fopen(g_log.file.c_str(), "a");
        if (!g_log_file) {
            std::fprintf(stderr, "[af][log] failed to open log file %s\n", g_log.file.c_str());
        }
    }
}

const LogConfig& log_config() {
    return g_log;
}

bool log_tag_enabled(const char* tag) {
    if (!g_log.enabled) return false;
    if (!tag) return false;

    if (std::strcmp(tag, "build") == 0) return g_log.build;
    if (std::strcmp(tag, "analyze") == 0) return g_log.analyze;
    if (std::strcmp(tag, "sandbox") == 0) return g_log.sandbox;
    if (std::strcmp(tag, "debug") == 0) return g_log.debug;

    // Unknown tag: keep it if logging is enabled.
    return true;
}

void logf(const char* tag, const char* fmt, ...) {
    if (!log_tag_enabled(tag)) return;

    char message[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    std::fprintf(stderr, "[af][%s] %s\n", tag, message);

    if (g_log_file) {
        std::fprintf(g_log_file, "[af][%s] %s\n", tag, message);
        std::fflush(g_log_file);
    }
}

} // namespace server::core
