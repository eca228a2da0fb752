#include "core/types.hpp"
#include "core/config.hpp"
#include "core/request.hpp"
#include "palette/palette.hpp"
#include "palette/palette_store.hpp"
#include "palette/templates.hpp"
#include "glyph/glyph_art.hpp"
#include "render/raster_backend.hpp"
#include "output/dispatcher.hpp"
#include "output/request_builder.hpp"
#include "output/batch.hpp"
#include "suggest/tagline.hpp"
#include "terminal/terminal.hpp"
#include "core/color.hpp"
#include "cli/args.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <new>
#include <string>
#include <vector>

#ifndef BANNERFORGE_VERSION
#define BANNERFORGE_VERSION "2.0.0"
#endif

namespace forge {

namespace {

void warn_unknown_color(const std::string& name) {
    std::string choices;
    for (const auto& c : Terminal::color_names()) {
        if (!choices.empty()) choices += ", ";
        choices += c;
    }
    std::cerr << "Warning: Unknown color '" << name << "' (choose from " << choices << "), using cyan\n";
}

struct App {
    Config config;
    PaletteRegistry palettes;
    std::shared_ptr<const RasterBackend> backend;
    Result backend_status;
};

void report_error(const Result& r) {
    std::cerr << "Error: " << r.message << "\n";
}

void report_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "Warning: " << w << "\n";
    }
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    return (std::filesystem::path(dir) / name).string();
}

RequestSpec make_spec(const App& app, const Args& args) {
    RequestSpec spec;
    spec.text = args.text;
    spec.subtitle = args.subtitle;
    spec.width = app.config.canvas.width;
    spec.height = app.config.canvas.height;
    spec.palette = app.config.render.palette;
    spec.style = app.config.render.style;
    spec.effects = app.config.render.effects;
    spec.animated = app.config.render.animated;
    spec.template_name = app.config.render.template_name;
    return spec;
}

void maybe_suggest_subtitle(const App& app, const Args& args, RequestSpec& spec) {
    if (!args.ai || !spec.subtitle.empty()) return;

    auto service = make_suggestion_service(app.config.suggest.api_key_env);
    auto ideas = service->suggest(normalize_text(spec.text), 1);
    if (!ideas.empty()) {
        spec.subtitle = ideas.front();
        printf("AI suggestion: %s\n", spec.subtitle.c_str());
    }
}

DispatchOptions make_dispatch_options(const App& app) {
    DispatchOptions options;
    options.glyph_font = app.config.fonts.glyph_font;
    options.font_path = app.config.fonts.raster_font;
    options.max_area = app.config.canvas.max_area;
    return options;
}

Dispatcher make_dispatcher(const App& app) {
    return Dispatcher(app.backend, app.backend_status, make_dispatch_options(app));
}

const char* format_label(Format format) {
    switch (format) {
        case Format::Vector: return "SVG";
        case Format::Raster: return "PNG";
        case Format::Glyph: return "ASCII";
    }
    return "";
}

// Renders one format and writes it. Nothing is written on a render failure.
bool render_to_file(const Dispatcher& dispatcher, const RenderRequest& request, Format format,
                    const std::string& path) {
    std::vector<uint8_t> bytes;
    Result r = dispatcher.render(request, format, bytes);
    if (r.success()) r = write_artifact(path, bytes);
    if (r.failure()) {
        report_error(r);
        return false;
    }
    return true;
}

int cmd_ascii(const App& app, const Args& args) {
    if (args.list_fonts) {
        const auto& fonts = GlyphArt::list_fonts();
        printf("Available fonts (%zu):\n", fonts.size());
        for (const auto& f : fonts) {
            printf("  - %s\n", f.c_str());
        }
        printf("\nUse --glyph-font <name> to select.\n");
        return 0;
    }

    std::vector<std::string> warnings;
    RenderRequest request = build_request(make_spec(app, args), app.palettes, &warnings);
    report_warnings(warnings);

    Dispatcher dispatcher = make_dispatcher(app);
    std::vector<uint8_t> bytes;
    Result r = dispatcher.render(request, Format::Glyph, bytes);
    if (r.failure()) {
        report_error(r);
        return 1;
    }
    const std::string art(bytes.begin(), bytes.end());

    if (!args.output.empty()) {
        r = write_artifact(args.output, Terminal::strip_ansi(art));
        if (r.failure()) {
            report_error(r);
            return 1;
        }
        printf("✓ Wrote ASCII banner to %s\n", args.output.c_str());
        return 0;
    }

    if (args.colorize) {
        AnsiColor color;
        if (!Terminal::parse_color(args.color, color)) {
            warn_unknown_color(args.color);
        }
        std::cout << Terminal::colorize(art, color);
    } else {
        std::cout << art;
    }
    return 0;
}

int cmd_render(const App& app, const Args& args, Format format) {
    RequestSpec spec = make_spec(app, args);
    maybe_suggest_subtitle(app, args, spec);

    std::vector<std::string> warnings;
    RenderRequest request = build_request(spec, app.palettes, &warnings);
    report_warnings(warnings);

    std::string out = args.output;
    if (out.empty()) {
        out = join_path(app.config.output.directory, timestamped_name(args.text, format_extension(format)));
    }

    if (!render_to_file(make_dispatcher(app), request, format, out)) return 1;
    printf("✓ Wrote %s to %s\n", format_label(format), out.c_str());
    return 0;
}

int cmd_combo(const App& app, const Args& args) {
    std::string folder = args.prefix;
    if (folder.empty()) {
        folder = join_path(app.config.output.directory, "banners_" + utc_stamp(std::time(nullptr)));
    }

    RequestSpec spec = make_spec(app, args);
    maybe_suggest_subtitle(app, args, spec);

    std::vector<std::string> warnings;
    RenderRequest request = build_request(spec, app.palettes, &warnings);
    report_warnings(warnings);

    const std::string base = safe_name(normalize_text(args.text));
    int failures = 0;
    for (const Artifact& artifact : make_dispatcher(app).render_all(request)) {
        const std::string path = join_path(folder, base + "." + format_extension(artifact.format));
        Result r = artifact.status;
        if (r.success()) r = write_artifact(path, artifact.bytes);
        if (r.failure()) {
            std::cerr << "Error: " << format_label(artifact.format) << ": " << r.message << "\n";
            ++failures;
            continue;
        }
        printf("✓ %s: %s\n", format_label(artifact.format), path.c_str());
    }

    printf("\nGenerated combo in: %s\n", folder.c_str());
    return failures == 0 ? 0 : 1;
}

int cmd_batch(const App& app, const Args& args) {
    BatchSettings settings;
    settings.defaults = make_spec(app, args);
    settings.defaults.text.clear();
    settings.defaults.subtitle.clear();
    settings.glyph_font = app.config.fonts.glyph_font;
    settings.font_path = app.config.fonts.raster_font;
    settings.max_area = app.config.canvas.max_area;
    settings.threads = app.config.batch.threads;

    BatchSpec spec;
    Result r = load_batch_spec(args.text, settings, spec);
    if (r.failure()) {
        report_error(r);
        return 1;
    }

    std::string outdir = args.output;
    if (outdir.empty()) outdir = join_path(app.config.output.directory, DEFAULT_BATCH_DIR);

    printf("Rendering %zu banners into %s\n", spec.records.size(), outdir.c_str());
    BatchReport report = run_batch(std::move(spec), outdir, settings, app.backend, app.backend_status,
                                   app.palettes);

    report_warnings(report.warnings);
    for (const auto& path : report.written) {
        printf("  ✓ %s\n", path.c_str());
    }
    for (const auto& failure : report.failures) {
        std::cerr << "Error: [" << failure.index << "] " << (failure.text.empty() ? "<no text>" : failure.text)
                  << ": " << failure.result.message << "\n";
    }

    printf("\nBatch complete: %zu written, %zu failed in %s\n", report.written.size(), report.failures.size(),
           outdir.c_str());
    return report.ok() ? 0 : 1;
}

int cmd_info(const App& app) {
    printf("Available Palettes:\n");
    for (const auto& name : app.palettes.names()) {
        const Palette& p = app.palettes.resolve(name);
        printf("  %-12s - bg:%s accent:%s\n", name.c_str(), to_hex(p.background).c_str(), to_hex(p.accent).c_str());
    }
    for (const auto& name : app.palettes.custom_names()) {
        const Palette& p = app.palettes.resolve(name);
        printf("  %-12s - bg:%s accent:%s (custom)\n", name.c_str(), to_hex(p.background).c_str(),
               to_hex(p.accent).c_str());
    }

    printf("\nAvailable Templates:\n");
    for (const auto& t : builtin_templates()) {
        printf("  %-12s - %s palette, %s style\n", t.name.c_str(), t.palette.c_str(), style_name(t.style));
    }

    printf("\nGlyph Fonts:\n");
    for (const auto& f : GlyphArt::list_fonts()) {
        printf("  - %s\n", f.c_str());
    }

    printf("\nVisual Effects (PNG):\n");
    for (Effect e : all_effects()) {
        printf("  - %s\n", effect_name(e));
    }

    printf("\nSVG Styles:\n");
    for (Style s : all_styles()) {
        printf("  - %s\n", style_name(s));
    }

    FontResolver fonts(app.config.fonts.raster_font);
    printf("\nRaster:\n");
    printf("  backend : %s\n", app.backend ? app.backend->name() : app.backend_status.message.c_str());
    printf("  font    : %s\n", fonts.has_truetype() ? fonts.font_path().c_str() : "builtin:hershey-duplex");
    return 0;
}

int cmd_preview(const App& app, const Args& args) {
    std::vector<std::string> warnings;
    RenderRequest request = build_request(make_spec(app, args), app.palettes, &warnings);
    report_warnings(warnings);

    std::vector<uint8_t> bytes;
    Result r = make_dispatcher(app).render(request, Format::Glyph, bytes);
    if (r.failure()) {
        report_error(r);
        return 1;
    }

    AnsiColor color;
    if (!Terminal::parse_color(args.color, color)) {
        warn_unknown_color(args.color);
    }
    const std::string art = Terminal::colorize(std::string(bytes.begin(), bytes.end()), color);
    std::cout << Terminal::framed(art, "Banner Preview", Terminal::get_info());
    return 0;
}

int cmd_palette(const App& app, const Args& args) {
    Palette palette;
    Result r = merge_custom(args.palette_name, args.bg, args.accent, args.text_color, args.muted, palette);
    if (r.failure()) {
        report_error(r);
        return 1;
    }

    printf("\n✓ Created palette '%s':\n", args.palette_name.c_str());
    printf("  %-15s : %s\n", "bg", to_hex(palette.background).c_str());
    printf("  %-15s : %s\n", "accent", to_hex(palette.accent).c_str());
    printf("  %-15s : %s\n", "text", to_hex(palette.text).c_str());
    printf("  %-15s : %s\n", "muted", to_hex(palette.muted).c_str());
    printf("  %-15s : %s\n", "gradient_start", to_hex(palette.gradient_start).c_str());
    printf("  %-15s : %s\n", "gradient_end", to_hex(palette.gradient_end).c_str());

    if (args.save) {
        const std::string& file = app.config.palettes.file;
        r = save_custom_palette(file, args.palette_name, palette);
        if (r.failure()) {
            report_error(r);
            return 1;
        }
        printf("\n✓ Saved to %s\n", file.c_str());
        printf("  Load with: --palette-file %s\n", file.c_str());
    }
    return 0;
}

int cmd_example(const Args& args) {
    std::string filename = args.output.empty() ? DEFAULT_EXAMPLE_NAME : args.output;
    if (std::filesystem::path(filename).extension() != ".toml") filename += ".toml";

    Result r = write_artifact(filename, example_batch_spec());
    if (r.failure()) {
        report_error(r);
        return 1;
    }
    printf("✓ Created example config: %s\n", filename.c_str());
    printf("  Run with: bannerforge batch %s\n", filename.c_str());
    return 0;
}

int cmd_quick(const App& app, const Args& args) {
    const std::string& type = args.quick_type;
    const bool all = type == "all";
    const std::string base = safe_name(normalize_text(args.text)) + "_quick";
    Dispatcher dispatcher = make_dispatcher(app);
    int failures = 0;

    RequestSpec spec = make_spec(app, args);
    std::vector<std::string> warnings;
    RenderRequest request = build_request(spec, app.palettes, &warnings);
    report_warnings(warnings);

    if (type == "ascii" || all) {
        std::vector<uint8_t> bytes;
        Result r = dispatcher.render(request, Format::Glyph, bytes);
        if (r.success()) {
            const std::string art(bytes.begin(), bytes.end());
            std::cout << Terminal::colorize(art, DEFAULT_ANSI_COLOR);
            if (all) r = write_artifact(base + ".txt", Terminal::strip_ansi(art));
        }
        if (r.failure()) {
            report_error(r);
            ++failures;
        }
    }

    if (type == "svg" || all) {
        const std::string path = base + ".svg";
        if (render_to_file(dispatcher, request, Format::Vector, path)) {
            printf("✓ SVG: %s\n", path.c_str());
        } else {
            ++failures;
        }
    }

    if (type == "png" || all) {
        RequestSpec png_spec = spec;
        if (!png_spec.effects) png_spec.effects = std::vector<std::string>{"shadow"};
        RenderRequest png_request = build_request(png_spec, app.palettes);
        const std::string path = base + ".png";
        if (render_to_file(dispatcher, png_request, Format::Raster, path)) {
            printf("✓ PNG: %s\n", path.c_str());
        } else {
            ++failures;
        }
    }

    return failures == 0 ? 0 : 1;
}

bool load_config(const Args& args, Config& config) {
    std::string error;
    if (!args.config_path.empty()) {
        auto loaded = Config::load(args.config_path, &error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << error << "\n";
            return false;
        }
        config = *loaded;
        return true;
    }

    std::error_code ec;
    if (std::filesystem::exists(Config::default_config_path(), ec)) {
        auto loaded = Config::load_default(&error);
        if (loaded) {
            config = *loaded;
        } else {
            std::cerr << "Warning: Ignoring default config: " << error << "\n";
        }
    }
    return true;
}

}

}

int main(int argc, char* argv[]) {
    using namespace forge;

    Args args = parse_args(argc, argv);
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return 1;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.show_version) {
        printf("bannerforge %s\n", BANNERFORGE_VERSION);
        return 0;
    }

    App app;
    if (!load_config(args, app.config)) return 1;
    app.config = apply_cli_overrides(app.config, args);

    std::string config_error;
    if (!app.config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    PaletteMap custom;
    Result store = load_palette_store(app.config.palettes.file, custom);
    if (store.failure()) {
        std::cerr << "Warning: " << store.message << " - custom palettes unavailable\n";
    }
    app.palettes = PaletteRegistry::builtin().with_custom(custom);

    app.backend_status = select_raster_backend(app.backend);

    try {
        switch (args.command) {
            case Command::Ascii: return cmd_ascii(app, args);
            case Command::Svg: return cmd_render(app, args, Format::Vector);
            case Command::Png: return cmd_render(app, args, Format::Raster);
            case Command::Combo: return cmd_combo(app, args);
            case Command::Batch: return cmd_batch(app, args);
            case Command::Info: return cmd_info(app);
            case Command::Preview: return cmd_preview(app, args);
            case Command::Palette: return cmd_palette(app, args);
            case Command::Example: return cmd_example(args);
            case Command::Quick: return cmd_quick(app, args);
            case Command::None: break;
        }
    } catch (const std::bad_alloc&) {
        std::cerr << "Error: Out of memory; try a smaller canvas\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_help(argv[0]);
    return 1;
}
