#include "source_map.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace server::builder {

namespace {

constexpr char kBase64[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

void append_json_string(std::string& out, const std::string& s) {
    out.push_back('"');
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(ch);
                }
                break;
        }
    }
    out.push_back('"');
}

} // namespace

std::string encode_vlq(std::int64_t value) {
    std::uint64_t vlq = (value < 0) ? ((static_cast<std::uint64_t>(-value) << 1) | 1)
                                    : (static_cast<std::uint64_t>(value) << 1);
    std::string out;
    do {
        std::uint64_t digit = vlq & 0x1F;
        vlq >>= 5;
        if (vlq > 0) digit |= 0x20;  // continuation
        out.push_back(kBase64[digit]);
    } while (vlq > 0);
    return out;
}

std::string generate_source_map(const std::string& source) {
    // split('\n') semantics: N newlines always give N + 1 lines.
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t nl = source.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(source.substr(start));
            break;
        }
        lines.push_back(source.substr(start, nl - start));
        start = nl + 1;
    }

    std::string mappings;
    std::size_t prevLine = 0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) mappings.push_back(';');
        if (is_blank(lines[i])) continue;

        // [generated column, source index, source line delta, source column]
        mappings += encode_vlq(0);
        mappings += encode_vlq(0);
        mappings += encode_vlq(static_cast<std::int64_t>(i - prevLine));
        mappings += encode_vlq(0);
        prevLine = i;
    }

    std::string json = R"({"version":3,"file":"game.wasm","sources":["game.ts"],"sourcesContent":[)";
    append_json_string(json, source);
    json += R"(],"names":[],"mappings":)";
    append_json_string(json, mappings);
    json += "}";
    return json;
}

} // namespace server::builder
