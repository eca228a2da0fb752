#include "args.hpp"
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <cstdio>

namespace forge {

namespace {

struct CommandEntry {
    const char* name;
    Command command;
    bool needs_text;
};

const CommandEntry kCommands[] = {
    {"ascii",   Command::Ascii,   true},
    {"svg",     Command::Svg,     true},
    {"png",     Command::Png,     true},
    {"combo",   Command::Combo,   true},
    {"batch",   Command::Batch,   true},
    {"info",    Command::Info,    false},
    {"preview", Command::Preview, true},
    {"palette", Command::Palette, false},
    {"example", Command::Example, false},
    {"quick",   Command::Quick,   true},
};

bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

bool parse_int(const char* s, int& out) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v < -1000000 || v > 1000000) return false;
    out = static_cast<int>(v);
    return true;
}

bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && strcmp(arg, short_name) == 0) || strcmp(arg, long_name) == 0;
}

}

const char* command_name(Command command) {
    for (const auto& entry : kCommands) {
        if (entry.command == command) return entry.name;
    }
    return "";
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto take_value = [&](int& i, const char* flag, std::string& out) {
        if (i + 1 >= argc) {
            args.error = std::string("Missing value for ") + flag;
            return false;
        }
        out = argv[++i];
        return true;
    };

    auto take_path = [&](int& i, const char* flag, std::string& out) {
        if (!take_value(i, flag, out)) return false;
        if (!validate_path(out)) {
            args.error = std::string("Invalid path for ") + flag;
            out.clear();
            return false;
        }
        return true;
    };

    auto take_int = [&](int& i, const char* flag, std::optional<int>& out) {
        std::string raw;
        if (!take_value(i, flag, raw)) return false;
        int v = 0;
        if (!parse_int(raw.c_str(), v)) {
            args.error = std::string("Invalid number for ") + flag + ": " + raw;
            return false;
        }
        out = v;
        return true;
    };

    bool needs_text = false;
    for (int i = 1; i < argc && args.error.empty(); ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }
        if (strcmp(arg, "--version") == 0) {
            args.show_version = true;
            return args;
        }

        if (is_flag(arg, nullptr, "--config")) {
            take_path(i, arg, args.config_path);
        }
        else if (is_flag(arg, nullptr, "--palette-file")) {
            take_path(i, arg, args.palette_file);
        }
        else if (is_flag(arg, "-s", "--subtitle")) {
            take_value(i, arg, args.subtitle);
        }
        else if (is_flag(arg, "-W", "--width")) {
            take_int(i, arg, args.width);
        }
        else if (is_flag(arg, "-H", "--height")) {
            take_int(i, arg, args.height);
        }
        else if (is_flag(arg, "-p", "--palette")) {
            take_value(i, arg, args.palette);
        }
        else if (is_flag(arg, nullptr, "--style")) {
            take_value(i, arg, args.style);
        }
        else if (is_flag(arg, "-e", "--effects") || is_flag(arg, nullptr, "--effect")) {
            std::string effect;
            if (take_value(i, arg, effect)) args.effects.push_back(effect);
        }
        else if (is_flag(arg, nullptr, "--animated")) {
            args.animated = true;
        }
        else if (is_flag(arg, "-t", "--template")) {
            // quick reuses -t for its output type
            if (args.command == Command::Quick) take_value(i, arg, args.quick_type);
            else take_value(i, arg, args.template_name);
        }
        else if (is_flag(arg, nullptr, "--type")) {
            take_value(i, arg, args.quick_type);
        }
        else if (is_flag(arg, "-o", "--out") || is_flag(arg, nullptr, "--outdir")) {
            take_path(i, arg, args.output);
        }
        else if (is_flag(arg, "-P", "--prefix")) {
            take_path(i, arg, args.prefix);
        }
        else if (is_flag(arg, nullptr, "--font")) {
            // --font is a glyph font name for ascii/preview and a font file elsewhere
            if (args.command == Command::Ascii || args.command == Command::Preview) {
                take_value(i, arg, args.glyph_font);
            } else {
                take_path(i, arg, args.font_path);
            }
        }
        else if (is_flag(arg, "-f", "--glyph-font")) {
            take_value(i, arg, args.glyph_font);
        }
        else if (is_flag(arg, "-c", "--color")) {
            take_value(i, arg, args.color);
        }
        else if (is_flag(arg, nullptr, "--colorize")) {
            args.colorize = true;
        }
        else if (is_flag(arg, nullptr, "--list-fonts")) {
            args.list_fonts = true;
        }
        else if (is_flag(arg, nullptr, "--ai")) {
            args.ai = true;
        }
        else if (is_flag(arg, "-n", "--name")) {
            take_value(i, arg, args.palette_name);
        }
        else if (is_flag(arg, nullptr, "--bg")) {
            take_value(i, arg, args.bg);
        }
        else if (is_flag(arg, nullptr, "--accent")) {
            take_value(i, arg, args.accent);
        }
        else if (is_flag(arg, nullptr, "--text")) {
            take_value(i, arg, args.text_color);
        }
        else if (is_flag(arg, nullptr, "--muted")) {
            take_value(i, arg, args.muted);
        }
        else if (is_flag(arg, nullptr, "--save")) {
            args.save = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.error = std::string("Unknown option: ") + arg;
        }
        else if (args.command == Command::None) {
            for (const auto& entry : kCommands) {
                if (strcmp(arg, entry.name) == 0) {
                    args.command = entry.command;
                    needs_text = entry.needs_text;
                    break;
                }
            }
            if (args.command == Command::None) {
                args.error = std::string("Unknown command: ") + arg;
            }
        }
        else if (args.text.empty()) {
            args.text = arg;
        }
        else {
            args.error = std::string("Unexpected argument: ") + arg;
        }
    }

    if (!args.error.empty()) return args;

    if (args.command == Command::None) {
        args.show_help = true;
        return args;
    }
    if (needs_text && args.text.empty() && !(args.command == Command::Ascii && args.list_fonts)) {
        args.error = std::string("Missing ") + (args.command == Command::Batch ? "SPEC" : "TEXT") +
                     " argument for " + command_name(args.command);
        return args;
    }
    if (args.command == Command::Palette &&
        (args.palette_name.empty() || args.bg.empty() || args.accent.empty() ||
         args.text_color.empty() || args.muted.empty())) {
        args.error = "palette requires -n/--name, --bg, --accent, --text and --muted";
        return args;
    }
    if (args.command == Command::Quick && args.quick_type != "ascii" && args.quick_type != "svg" &&
        args.quick_type != "png" && args.quick_type != "all") {
        args.error = "quick --type must be ascii, svg, png or all";
        return args;
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s <COMMAND> [OPTIONS]\n\n", prog);
    printf("Banner creator: glyph art, SVG and PNG from one palette/style setup.\n\n");
    printf("COMMANDS:\n");
    printf("  ascii TEXT              Glyph-art banner (stdout or -o file)\n");
    printf("  svg TEXT                Vector banner\n");
    printf("  png TEXT                Raster banner\n");
    printf("  combo TEXT              All formats into one folder\n");
    printf("  batch SPEC              Render every [[banner]] of a TOML spec\n");
    printf("  info                    List palettes, templates, fonts, effects, styles\n");
    printf("  preview TEXT            Framed glyph-art preview in the terminal\n");
    printf("  palette                 Create (and optionally save) a custom palette\n");
    printf("  example                 Write a sample batch spec\n");
    printf("  quick TEXT              Defaults-only banner\n\n");
    printf("RENDER OPTIONS (svg, png, combo):\n");
    printf("  -s, --subtitle <TEXT>   Subtitle line\n");
    printf("  -W, --width <N>         Canvas width (default: 1200)\n");
    printf("  -H, --height <N>        Canvas height (default: 300)\n");
    printf("  -p, --palette <NAME>    Palette name (default: stealth)\n");
    printf("      --style <NAME>      Accent style: wave, geometric, grid, particles, glow\n");
    printf("  -e, --effects <NAME>    PNG effect, repeatable: shadow, glow, gradient, stripe, blur\n");
    printf("      --animated          Animate gradient and title (svg)\n");
    printf("  -t, --template <NAME>   minimal, professional, creative, tech, nature, cyberpunk\n");
    printf("      --font <PATH>       TrueType font file for png (glyph font name for ascii)\n");
    printf("      --ai                Fill an empty subtitle with a suggested tagline\n");
    printf("  -o, --out <PATH>        Output file (batch: output directory)\n");
    printf("  -P, --prefix <DIR>      Output folder for combo\n\n");
    printf("GLYPH OPTIONS (ascii, preview):\n");
    printf("  -f, --glyph-font <NAME> standard, dense, blocks, shade\n");
    printf("  -c, --color <NAME>      red, green, yellow, blue, magenta, cyan, white\n");
    printf("      --colorize          Color stdout output\n");
    printf("      --list-fonts        List glyph fonts\n\n");
    printf("PALETTE OPTIONS:\n");
    printf("  -n, --name <NAME>  --bg <HEX>  --accent <HEX>  --text <HEX>  --muted <HEX>  [--save]\n\n");
    printf("QUICK OPTIONS:\n");
    printf("  -t, --type <TYPE>       ascii, svg, png or all (default: svg)\n\n");
    printf("COMMON:\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("      --palette-file <F>  Custom palette store (default: custom_palettes.toml)\n");
    printf("  -h, --help              Show this help\n");
    printf("      --version           Show version\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/bannerforge/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/bannerforge/config.toml\n");
    printf("    Windows: %%APPDATA%%\\bannerforge\\config.toml\n");
}

}
