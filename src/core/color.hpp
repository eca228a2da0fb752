#pragma once

#include "core/types.hpp"
#include <string>

namespace forge {

// Accepts "#rrggbb" or "#rgb", '#' optional, any case.
Result parse_hex_color(const std::string& text, Color& out);

// Lowercase "#rrggbb"; alpha is ignored.
std::string to_hex(const Color& c);

}
