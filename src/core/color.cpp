#include "core/color.hpp"

#include <cctype>
#include <cstdio>

namespace forge {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}

Result parse_hex_color(const std::string& text, Color& out) {
    std::string digits = text;
    if (!digits.empty() && digits[0] == '#') {
        digits.erase(0, 1);
    }

    if (digits.size() != 6 && digits.size() != 3) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Malformed color '" + text + "': expected #rrggbb or #rgb");
    }

    int values[6] = {0};
    for (size_t i = 0; i < digits.size(); ++i) {
        values[i] = hex_digit(digits[i]);
        if (values[i] < 0) {
            return Result::fail(ErrorCode::INVALID_INPUT, "Malformed color '" + text + "': non-hex digit");
        }
    }

    if (digits.size() == 3) {
        out = Color(static_cast<uint8_t>(values[0] * 17),
                    static_cast<uint8_t>(values[1] * 17),
                    static_cast<uint8_t>(values[2] * 17));
    } else {
        out = Color(static_cast<uint8_t>(values[0] * 16 + values[1]),
                    static_cast<uint8_t>(values[2] * 16 + values[3]),
                    static_cast<uint8_t>(values[4] * 16 + values[5]));
    }
    return Result::ok();
}

std::string to_hex(const Color& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    return std::string(buf);
}

}
