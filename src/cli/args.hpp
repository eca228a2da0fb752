#pragma once

#include <optional>
#include <string>
#include <vector>

namespace forge {

enum class Command {
    None,
    Ascii,
    Svg,
    Png,
    Combo,
    Batch,
    Info,
    Preview,
    Palette,
    Example,
    Quick
};

const char* command_name(Command command);

struct Args {
    Command command = Command::None;
    std::string text;  // TEXT, or SPEC for batch

    std::string subtitle;
    std::optional<int> width;
    std::optional<int> height;
    std::string palette;
    std::string style;
    std::vector<std::string> effects;
    bool animated = false;
    std::string template_name;

    std::string output;
    std::string prefix;
    std::string font_path;
    std::string glyph_font;
    std::string color = "cyan";
    bool colorize = false;
    bool list_fonts = false;
    bool ai = false;
    std::string quick_type = "svg";

    std::string palette_name;
    std::string bg;
    std::string accent;
    std::string text_color;
    std::string muted;
    bool save = false;

    std::string config_path;
    std::string palette_file;

    bool show_help = false;
    bool show_version = false;
    std::string error;  // non-empty when the command line is unusable
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
