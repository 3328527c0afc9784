#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace server::core {

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

std::size_t Config::parse_size(const std::string& v, std::size_t default_value) {
    const std::string s = trim(v);
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) {
        return default_value;
    }
    try {
        size_t idx = 0;
        const unsigned long long out = std::stoull(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return static_cast<std::size_t>(out);
    } catch (const std::logic_error&) {
        return default_value;
    }
}

double Config::parse_double(const std::string& v, double default_value) {
    const std::string s = trim(v);
    try {
        size_t idx = 0;
        const double out = std::stod(s, &idx);
        if (idx != s.size() || !(out > 0.0)) return default_value;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

static std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "compiler") {
        auto& c = config_.compiler;
        if (k == "optimize") c.optimize = parse_bool(v, c.optimize);
        else if (k == "source_map") c.sourceMap = parse_bool(v, c.sourceMap);
        else if (k == "max_code_size") c.maxCodeSize = parse_size(v, c.maxCodeSize);
        else if (k == "strict") c.strict = parse_bool(v, c.strict);
        return;
    }

    if (sec == "sandbox") {
        auto& s = config_.sandbox;
        if (k == "max_memory") s.maxMemory = parse_size(v, s.maxMemory);
        else if (k == "max_memory_mb") s.maxMemory = parse_size(v, s.maxMemory / (1024 * 1024)) * 1024 * 1024;
        else if (k == "max_tick_ms") s.maxTickTime = parse_double(v, s.maxTickTime);
        else if (k == "debug") s.debug = parse_bool(v, s.debug);
        return;
    }

    if (sec == "logging") {
        auto& l = config_.logging;
        if (k == "enabled") l.enabled = parse_bool(v, l.enabled);
        else if (k == "file") l.file = v;
        else if (k == "build") l.build = parse_bool(v, l.build);
        else if (k == "analyze") l.analyze = parse_bool(v, l.analyze);
        else if (k == "sandbox") l.sandbox = parse_bool(v, l.sandbox);
        else if (k == "debug") l.debug = parse_bool(v, l.debug);
        return;
    }
}

void Config::apply_line(std::string line, std::string& section) {
    // Strip comments (# or ;) - cut at the first occurrence.
    auto hash = line.find('#');
    auto semi = line.find(';');
    size_t cut = std::string::npos;
    if (hash != std::string::npos) cut = hash;
    if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) return;

    if (line.front() == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.size() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) return;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key.empty()) return;

    apply_kv(section, key, value);
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(in, line)) {
        apply_line(line, section);
    }

    loaded_from_path_ = path;
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::string section;
    std::string line;
    while (std::getline(in, line)) {
        apply_line(line, section);
    }
}

} // namespace server::core
