#pragma once

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>


namespace lcr {
namespace json {

// Escape a string for use inside a JSON string literal
inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    out += escape(s);
    out += '"';
}

inline void append(std::string& out, std::int64_t value) {
    char buf[32];
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(buf, p);
}

// Shortest representation that parses back to the same double.
// Integral values keep a ".0" so they stay floats on reload.
inline void append(std::string& out, double value) {
    char buf[64];
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string_view sv(buf, static_cast<std::size_t>(p - buf));
    out.append(sv);
    if (sv.find_first_of(".eEn") == std::string_view::npos) {
        out += ".0";
    }
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}

inline void indent(std::string& out, int level) {
    out.append(static_cast<std::size_t>(level) * 2, ' ');
}

} // namespace json
} // namespace lcr
