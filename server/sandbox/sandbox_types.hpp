#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace server::sandbox {

constexpr std::size_t kWasmPageSize = 64 * 1024;
constexpr std::size_t kWasmMaxPages = 65536;

// Fixed server-side canvas reported to modules.
constexpr std::int32_t kCanvasWidth = 960;
constexpr std::int32_t kCanvasHeight = 540;

// Host import namespace.
constexpr const char* kImportModule = "env";

// Exports a module must provide to be driven on the server.
// render is client-only and is not required here.
constexpr std::array<const char*, 4> kRequiredExports = {"init", "update", "handleInput", "getState"};

struct SandboxConfig {
    // Upper bound on module size and on linear memory (64 MiB).
    std::size_t maxMemory{64 * 1024 * 1024};

    // Per-call CPU budget in milliseconds.
    double maxTickTime{16.0};

    bool debug{false};

    // Page ceiling derived from maxMemory (at least one page).
    std::uint32_t max_pages() const {
        const std::size_t pages = maxMemory / kWasmPageSize;
        return static_cast<std::uint32_t>(std::clamp<std::size_t>(pages, 1, kWasmMaxPages));
    }
};

struct ValidationResult {
    bool valid{false};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    explicit operator bool() const { return valid; }
};

} // namespace server::sandbox
