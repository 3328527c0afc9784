#pragma once

#include "log.hpp"

#include <builder/build_types.hpp>
#include <sandbox/sandbox_types.hpp>

#include <string>

namespace server::core {

struct ArenaConfig {
    builder::CompilerConfig compiler{};
    sandbox::SandboxConfig sandbox{};
    LogConfig logging{};
};

// INI-style configuration:
//
//   # comment
//   [compiler]
//   strict = false
//
// Unknown sections and keys are ignored; malformed values keep the previous value.
class Config {
public:
    Config() = default;

    bool load_from_file(const std::string& path);
    void load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ArenaConfig& get() const { return config_; }

    const builder::CompilerConfig& compiler() const { return config_.compiler; }
    const sandbox::SandboxConfig& sandbox() const { return config_.sandbox; }
    const LogConfig& logging() const { return config_.logging; }

private:
    ArenaConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static std::size_t parse_size(const std::string& v, std::size_t default_value);
    static double parse_double(const std::string& v, double default_value);

    void apply_line(std::string line, std::string& section);
    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace server::core
