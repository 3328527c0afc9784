#pragma once

#include <string>

namespace server::core {

struct LogConfig {
    bool enabled{true};

    // Mirror every line to this file (append mode). Empty = stderr only.
    std::string file{};

    bool build{true};
    bool analyze{true};
    bool sandbox{true};
    bool debug{false};
};

// Replaces the active configuration and (re)opens the mirror file.
void set_log_config(const LogConfig& cfg);
const LogConfig& log_config();

bool log_tag_enabled(const char* tag);

// printf-style; emits "[af][<tag>] message\n".
void logf(const char* tag, const char* fmt, ...);

} // namespace server::core
