#include "terminal.hpp"
#include "glyph/char_sets.hpp"

#include <algorithm>
#include <cstdlib>
#include <regex>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace forge {

namespace {

struct NamedColor {
    const char* name;
    AnsiColor color;
    int code;
};

const NamedColor kColors[] = {
    {"red",     AnsiColor::Red,     91},
    {"green",   AnsiColor::Green,   92},
    {"yellow",  AnsiColor::Yellow,  93},
    {"blue",    AnsiColor::Blue,    94},
    {"magenta", AnsiColor::Magenta, 95},
    {"cyan",    AnsiColor::Cyan,    96},
    {"white",   AnsiColor::White,   97},
};

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string repeat(const std::string& s, size_t n) {
    std::string out;
    out.reserve(s.size() * n);
    for (size_t i = 0; i < n; ++i) out += s;
    return out;
}

}

TerminalInfo Terminal::get_info() {
    TerminalInfo info;

#ifdef _WIN32
    HANDLE h_console = GetStdHandle(STD_OUTPUT_HANDLE);
    if (h_console != INVALID_HANDLE_VALUE) {
        CONSOLE_SCREEN_BUFFER_INFO csbi;
        if (GetConsoleScreenBufferInfo(h_console, &csbi)) {
            info.cols = csbi.srWindow.Right - csbi.srWindow.Left + 1;
            info.rows = csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
            info.is_tty = true;
        }
    }
    info.supports_utf8 = true;
#else
    winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0) {
        info.cols = ws.ws_col;
        info.rows = ws.ws_row;
    }
    info.is_tty = isatty(STDOUT_FILENO) != 0;

    const char* lang = std::getenv("LANG");
    const char* lc_all = std::getenv("LC_ALL");
    std::string locale = lc_all && *lc_all ? lc_all : (lang ? lang : "");
    if (!locale.empty()) {
        info.supports_utf8 = locale.find("UTF-8") != std::string::npos ||
                             locale.find("utf8") != std::string::npos ||
                             locale.find("UTF8") != std::string::npos ||
                             locale.find("utf-8") != std::string::npos;
    }
#endif

    if (info.cols <= 0) info.cols = 80;
    if (info.rows <= 0) info.rows = 24;
    return info;
}

bool Terminal::parse_color(const std::string& name, AnsiColor& out) {
    for (const auto& c : kColors) {
        if (name == c.name) {
            out = c.color;
            return true;
        }
    }
    out = DEFAULT_ANSI_COLOR;
    return false;
}

const std::vector<std::string>& Terminal::color_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& c : kColors) v.emplace_back(c.name);
        return v;
    }();
    return names;
}

std::string Terminal::color_code(AnsiColor color) {
    for (const auto& c : kColors) {
        if (c.color == color) return "\033[" + std::to_string(c.code) + "m";
    }
    return "";
}

std::string Terminal::colorize(const std::string& text, AnsiColor color) {
    const std::string on = color_code(color);
    const std::string off = reset_code();

    std::string out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!line.empty()) out += on + line + off;
        if (end == std::string::npos) break;
        out += '\n';
        start = end + 1;
    }
    return out;
}

std::string Terminal::strip_ansi(const std::string& text) {
    static const std::regex escape("\033\\[[0-9;]+m");
    return std::regex_replace(text, escape, "");
}

size_t Terminal::display_width(const std::string& text) {
    return CharSet::to_codepoints(strip_ansi(text)).size();
}

std::string Terminal::framed(const std::string& body, const std::string& title, const TerminalInfo& info) {
    const std::vector<std::string> lines = split_lines(body);

    size_t inner = display_width(title) + 2;
    for (const auto& line : lines) {
        inner = std::max(inner, display_width(line));
    }
    inner = std::min(inner, static_cast<size_t>(std::max(10, info.cols - 4)));

    std::string out;
    if (info.supports_utf8) {
        const size_t title_w = display_width(title);
        const size_t fill = inner > title_w + 1 ? inner - title_w - 1 : 0;
        out += "╭─ " + title + " " + repeat("─", fill) + "╮\n";
        for (const auto& line : lines) {
            size_t w = display_width(line);
            out += "│ " + line + std::string(inner > w ? inner - w : 0, ' ') + " │\n";
        }
        out += "╰" + repeat("─", inner + 2) + "╯\n";
    } else {
        const std::string rule(inner + 4, '=');
        out += rule + "\n" + title + "\n" + rule + "\n";
        for (const auto& line : lines) {
            out += line + "\n";
        }
        out += rule + "\n";
    }
    return out;
}

}
