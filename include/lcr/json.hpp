#pragma once

#include <string>
#include <string_view>


namespace lcr {
namespace json {

// Appends `s` escaped for use inside a JSON string literal (quotes not included)
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
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
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

// Appends `s` as a quoted JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '\"';
    append_escaped(out, s);
    out += '\"';
}

// Appends "key": (with leading comma when `first` is false)
inline void append_key(std::string& out, std::string_view key, bool first = false) {
    if (!first) out += ',';
    append_string(out, key);
    out += ':';
}

} // namespace json
} // namespace lcr
