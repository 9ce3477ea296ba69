#include "common/json_escape.hpp"

#include <fmt/format.h>

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned int>(ch));
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}
