#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace forge {

namespace CharSet {

// Coverage ramps for glyph art, emptiest cell first.
const std::string STANDARD = " .:-=+*#%@";
const std::string DENSE = " .'`^\",:;Il!i><~+_-?][}{1)(|\\/tfjrxnuvczXYUJCLQ0OZmwqpdbkhao*#MW&8%B@$";
const std::string BLOCKS = " \xE2\x96\x91\xE2\x96\x92\xE2\x96\x93\xE2\x96\x88";
const std::string SHADE = " .oO@";

inline bool is_valid_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

inline std::vector<uint32_t> to_codepoints(const std::string& s) {
    std::vector<uint32_t> result;
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = 0;
        unsigned char c = static_cast<unsigned char>(s[i]);
        
        if (c < 0x80) {
            cp = c;
            ++i;
        } else if ((c & 0xE0) == 0xC0) {
            if (i + 1 >= s.size() || !is_valid_continuation_byte(s[i+1])) {
                ++i;
                continue;
            }
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i+1]) & 0x3F);
            i += 2;
        } else if ((c & 0xF0) == 0xE0) {
            if (i + 2 >= s.size() || 
                !is_valid_continuation_byte(s[i+1]) || 
                !is_valid_continuation_byte(s[i+2])) {
                ++i;
                continue;
            }
            cp = ((c & 0x0F) << 12) | 
                 ((static_cast<unsigned char>(s[i+1]) & 0x3F) << 6) | 
                 (static_cast<unsigned char>(s[i+2]) & 0x3F);
            i += 3;
        } else if ((c & 0xF8) == 0xF0) {
            if (i + 3 >= s.size() || 
                !is_valid_continuation_byte(s[i+1]) || 
                !is_valid_continuation_byte(s[i+2]) ||
                !is_valid_continuation_byte(s[i+3])) {
                ++i;
                continue;
            }
            cp = ((c & 0x07) << 18) | 
                 ((static_cast<unsigned char>(s[i+1]) & 0x3F) << 12) | 
                 ((static_cast<unsigned char>(s[i+2]) & 0x3F) << 6) | 
                 (static_cast<unsigned char>(s[i+3]) & 0x3F);
            i += 4;
        } else {
            ++i;
            continue;
        }
        
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            continue;
        }
        
        result.push_back(cp);
    }
    return result;
}

// Strict check: no truncated or overlong sequences, no surrogates, nothing
// above U+10FFFF.
inline bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if (!is_valid_continuation_byte(cc)) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

inline std::string codepoint_to_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result += static_cast<char>(cp);
    } else if (cp < 0x800) {
        result += static_cast<char>(0xC0 | (cp >> 6));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        result += static_cast<char>(0xE0 | (cp >> 12));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        result += static_cast<char>(0xF0 | (cp >> 18));
        result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return result;
}

inline const std::vector<std::string>& names() {
    static const std::vector<std::string> list = {"standard", "dense", "blocks", "shade"};
    return list;
}

inline bool is_known(const std::string& name) {
    for (const auto& n : names()) {
        if (n == name) return true;
    }
    return false;
}

inline std::vector<uint32_t> get_set(const std::string& name) {
    if (name == "dense") return to_codepoints(DENSE);
    if (name == "blocks") return to_codepoints(BLOCKS);
    if (name == "shade") return to_codepoints(SHADE);
    return to_codepoints(STANDARD);
}

}

}
