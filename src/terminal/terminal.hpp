#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace forge {

enum class AnsiColor {
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    White
};

constexpr AnsiColor DEFAULT_ANSI_COLOR = AnsiColor::Cyan;

struct TerminalInfo {
    int cols = 80;
    int rows = 24;
    bool supports_utf8 = true;
    bool is_tty = false;
};

class Terminal {
public:
    static TerminalInfo get_info();

    // Unknown names give the default color and return false.
    static bool parse_color(const std::string& name, AnsiColor& out);
    static const std::vector<std::string>& color_names();
    static std::string color_code(AnsiColor color);
    static std::string reset_code() { return "\033[0m"; }

    // Wraps every non-empty line so each one resets on its own.
    static std::string colorize(const std::string& text, AnsiColor color);
    static std::string strip_ansi(const std::string& text);

    // Boxes `body` under a title line. Falls back to ASCII rules when the
    // terminal does not advertise UTF-8.
    static std::string framed(const std::string& body, const std::string& title, const TerminalInfo& info);

    // Display width of a UTF-8 string with escape sequences removed.
    static size_t display_width(const std::string& text);
};

}
