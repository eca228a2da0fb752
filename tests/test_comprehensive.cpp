#include <iostream>
#include <cassert>
#include <fstream>
#include <filesystem>
#include <cmath>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/color.hpp"
#include "../src/core/request.hpp"
#include "../src/core/config.hpp"
#include "../src/palette/palette.hpp"
#include "../src/palette/templates.hpp"
#include "../src/accent/accent_generator.hpp"
#include "../src/render/svg_composer.hpp"
#include "../src/glyph/char_sets.hpp"
#include "../src/output/dispatcher.hpp"
#include "../src/output/request_builder.hpp"
#include "../src/suggest/tagline.hpp"
#include "../src/terminal/terminal.hpp"
#include "../src/cli/args.hpp"

using namespace forge;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

// Every opened element is closed in order; processing instructions skipped.
static bool xml_tags_balanced(const std::string& xml) {
    std::vector<std::string> stack;
    size_t pos = 0;
    while ((pos = xml.find('<', pos)) != std::string::npos) {
        size_t close = xml.find('>', pos);
        if (close == std::string::npos) return false;
        std::string tag = xml.substr(pos + 1, close - pos - 1);
        pos = close + 1;

        if (tag.empty()) return false;
        if (tag[0] == '?') continue;
        if (tag.back() == '/') continue;

        if (tag[0] == '/') {
            std::string name = tag.substr(1);
            if (stack.empty() || stack.back() != name) return false;
            stack.pop_back();
        } else {
            stack.push_back(tag.substr(0, tag.find(' ')));
        }
    }
    return stack.empty();
}

static RenderRequest make_request(const std::string& text) {
    RenderRequest req;
    req.text = text;
    Result r = prepare_request(req);
    assert(r.success());
    return req;
}

struct ArgvBuilder {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.emplace_back("bannerforge");
        for (const char* a : args) storage.emplace_back(a);
        for (auto& s : storage) ptrs.push_back(s.data());
    }

    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
};

TEST(color_parse_long_and_short) {
    Color c;
    assert(parse_hex_color("#00ffff", c).success());
    assert(c == Color(0, 255, 255));

    assert(parse_hex_color("FfF", c).success());
    assert(c == Color(255, 255, 255));

    assert(parse_hex_color("#1a2B3c", c).success());
    assert(to_hex(c) == "#1a2b3c");
}

TEST(color_parse_rejects_malformed) {
    Color c;
    assert(parse_hex_color("#12345", c).error == ErrorCode::INVALID_INPUT);
    assert(parse_hex_color("#gg0000", c).error == ErrorCode::INVALID_INPUT);
    assert(parse_hex_color("", c).error == ErrorCode::INVALID_INPUT);
    assert(parse_hex_color("##fff", c).error == ErrorCode::INVALID_INPUT);
}

TEST(palette_unknown_resolves_to_stealth) {
    const PaletteRegistry& reg = PaletteRegistry::builtin();
    assert(reg.resolve("does-not-exist") == reg.resolve("stealth"));
    assert(reg.resolve("") == reg.resolve(DEFAULT_PALETTE));

    const Palette& stealth = reg.resolve("stealth");
    assert(to_hex(stealth.background) == "#0a0f14");
    assert(to_hex(stealth.gradient_end) == "#0088ff");
}

TEST(palette_table_order) {
    auto names = PaletteRegistry::builtin().names();
    assert(names.size() == 9);
    assert(names.front() == "stealth");
    assert(names.back() == "matrix");
    assert(to_hex(PaletteRegistry::builtin().resolve("cyberpunk").text) == "#f72585");
}

TEST(palette_custom_is_copy_on_write) {
    Palette custom;
    Result r = merge_custom("mine", "#111", "#222222", "#333", "#444444", custom);
    assert(r.success());
    assert(custom.gradient_start == custom.accent);
    assert(custom.gradient_end == custom.accent);

    PaletteMap extra{{"mine", custom}, {"ember", custom}};
    const PaletteRegistry& base = PaletteRegistry::builtin();
    PaletteRegistry extended = base.with_custom(extra);

    assert(extended.resolve("mine") == custom);
    assert(extended.resolve("ember") == custom);
    assert(!base.contains("mine"));
    assert(to_hex(base.resolve("ember").background) == "#0f0a07");
}

TEST(palette_merge_rejects_bad_color) {
    Palette p;
    Result r = merge_custom("bad", "#zzzzzz", "#000", "#000", "#000", p);
    assert(r.error == ErrorCode::INVALID_INPUT);
}

TEST(style_and_effect_names) {
    assert(parse_style("GRID") == Style::Grid);
    assert(parse_style("sparkles") == Style::Wave);
    assert(!is_known_style("sparkles"));

    std::vector<std::string> unknown;
    EffectSet set = EffectSet::from_names({"blur", "sparkle", "shadow"}, &unknown);
    assert(set.has(Effect::Blur));
    assert(set.has(Effect::Shadow));
    assert(!set.has(Effect::Glow));
    assert(unknown.size() == 1 && unknown[0] == "sparkle");

    EffectSet a{Effect::Glow, Effect::Shadow};
    EffectSet b{Effect::Shadow, Effect::Glow};
    assert(a == b);
}

TEST(request_normalization) {
    RenderRequest req;
    req.text = "  \tHello\x01 World \n";
    assert(prepare_request(req).success());
    assert(req.text == "Hello World");

    req.text = " \t\n ";
    assert(prepare_request(req).error == ErrorCode::INVALID_INPUT);
}

TEST(request_rejects_malformed_utf8) {
    RenderRequest req;
    req.text = "Caf\xC3";
    assert(prepare_request(req).error == ErrorCode::INVALID_INPUT);

    req.text = "Cafe";
    req.subtitle = "\xFF\xFE sub";
    assert(prepare_request(req).error == ErrorCode::INVALID_INPUT);

    req.subtitle.clear();
    for (const char* bad : {"\xC0\xAF", "\xED\xA0\x80", "\xF4\x90\x80\x80", "ok\x80"}) {
        req.text = bad;
        assert(prepare_request(req).error == ErrorCode::INVALID_INPUT);
    }

    req.text = "Caf\xC3\xA9 \xE2\x98\x95 \xF0\x9D\x84\x9E";
    assert(prepare_request(req).success());
    assert(CharSet::is_valid_utf8(VectorComposer().compose(req)));
}

TEST(dispatcher_writes_nothing_for_malformed_utf8) {
    Dispatcher dispatcher(nullptr, Result::fail(ErrorCode::MISSING_CAPABILITY, "no PNG writer"));
    RenderRequest req;
    req.text = "Caf\xC3";
    std::vector<uint8_t> bytes{1, 2, 3};
    assert(dispatcher.render(req, Format::Vector, bytes).error == ErrorCode::INVALID_INPUT);
    assert(bytes.empty());
    assert(dispatcher.render(req, Format::Glyph, bytes).error == ErrorCode::INVALID_INPUT);
}

TEST(request_geometry_limits) {
    RenderRequest req;
    req.text = "x";
    req.geometry = {0, 300};
    assert(prepare_request(req).error == ErrorCode::INVALID_INPUT);

    req.geometry = {-5, 300};
    assert(prepare_request(req).error == ErrorCode::INVALID_INPUT);

    req.geometry = {2000, 2000};
    assert(prepare_request(req, 1000000).error == ErrorCode::INVALID_INPUT);
    assert(prepare_request(req).success());
}

TEST(template_precedence) {
    ResolvedTemplate t = resolve_template("creative", TemplateOverrides{});
    assert(t.style == Style::Geometric);
    assert(t.palette == "sunset");
    assert(t.effects == (EffectSet{Effect::Glow, Effect::Gradient}));

    TemplateOverrides o;
    o.palette = "ocean";
    o.effects = EffectSet{Effect::Blur};
    t = resolve_template("creative", o);
    assert(t.style == Style::Geometric);
    assert(t.palette == "ocean");
    assert(t.effects == EffectSet{Effect::Blur});
}

TEST(template_unknown_behaves_as_none) {
    ResolvedTemplate t = resolve_template("no-such-template", TemplateOverrides{});
    assert(t.style == Style::Wave);
    assert(t.palette == "stealth");
    assert(t.effects.empty());

    TemplateOverrides o;
    o.style = Style::Grid;
    t = resolve_template("", o);
    assert(t.style == Style::Grid);
    assert(builtin_templates().size() == 6);
    assert(find_template("cyberpunk") != nullptr);
}

TEST(request_builder_warns_on_unknown_names) {
    RequestSpec spec;
    spec.text = "Hi";
    spec.palette = "nope";
    spec.style = "zigzag";
    spec.effects = std::vector<std::string>{"glow", "sparkle"};
    spec.template_name = "professional";

    std::vector<std::string> warnings;
    RenderRequest req = build_request(spec, PaletteRegistry::builtin(), &warnings);
    assert(warnings.size() == 3);
    assert(req.style == Style::Wave);
    assert(req.palette == PaletteRegistry::builtin().resolve("stealth"));
    assert(req.effects == EffectSet{Effect::Glow});
}

TEST(accent_particles_deterministic) {
    const Color accent(0, 255, 255);
    AccentSequence first = generate_accent(Style::Particles, 1200, 300, accent);
    AccentSequence second = generate_accent(Style::Particles, 1200, 300, accent);
    assert(first.size() == PARTICLE_COUNT);

    std::vector<AccentShape> a(first.begin(), first.end());
    std::vector<AccentShape> b(second.begin(), second.end());
    std::vector<AccentShape> again(first.begin(), first.end());
    assert(a.size() == 30 && b.size() == 30);

    for (size_t i = 0; i < a.size(); ++i) {
        assert(a[i].kind == AccentKind::Circle);
        assert(a[i].center.x == b[i].center.x && a[i].center.y == b[i].center.y);
        assert(a[i].radius == b[i].radius);
        assert(a[i].center.x == again[i].center.x && a[i].radius == again[i].radius);
        assert(a[i].center.x >= 0 && a[i].center.x <= 1200);
        assert(a[i].center.y >= 0 && a[i].center.y <= 300);
        assert(a[i].radius >= 2 && a[i].radius <= 8);
        assert(std::abs(a[i].opacity - 0.08) < 1e-9);
    }
}

TEST(accent_shape_counts) {
    const Color accent(255, 0, 0);
    assert(generate_accent(Style::Wave, 1200, 300, accent).size() == 1);
    assert(generate_accent(Style::Glow, 1200, 300, accent).size() == 1);
    assert(generate_accent(Style::Geometric, 1200, 300, accent).size() == 3);
    // x = 0..1150 (24 lines), y = 0..250 (6 lines)
    assert(generate_accent(Style::Grid, 1200, 300, accent).size() == 30);
    assert(generate_accent(Style::Grid, 1201, 301, accent).size() == 32);
}

TEST(accent_geometric_layout) {
    AccentSequence seq = generate_accent(Style::Geometric, 1000, 200, Color(1, 2, 3), 0.1);
    std::vector<AccentShape> shapes(seq.begin(), seq.end());
    assert(shapes[0].kind == AccentKind::Circle);
    assert(std::abs(shapes[0].radius - 30.0) < 1e-9);
    assert(std::abs(shapes[1].opacity - 0.07) < 1e-9);
    assert(shapes[2].kind == AccentKind::Rect);
    assert(std::abs(shapes[2].rotation_deg - 15.0) < 1e-9);
    assert(std::abs(shapes[2].pivot.x - 800.0) < 1e-9);
    assert(std::abs(shapes[2].pivot.y - 35.0) < 1e-9);
    assert(std::abs(shapes[2].opacity - 0.05) < 1e-9);
}

TEST(svg_number_formatting) {
    assert(VectorComposer::format_number(0.12) == "0.12");
    assert(VectorComposer::format_number(0.5) == "0.5");
    assert(VectorComposer::format_number(195.0) == "195");
    assert(VectorComposer::format_number(1.0 / 3.0) == "0.33");
    assert(VectorComposer::format_number(-0.001) == "0");
}

TEST(svg_well_formed_for_every_combination) {
    const std::vector<std::string> styles = {"wave", "geometric", "grid", "particles", "glow", "unknown"};
    for (const auto& style_str : styles) {
        for (bool animated : {false, true}) {
            for (bool subtitle : {false, true}) {
                RenderRequest req;
                req.text = "A<B & \"C\"";
                req.subtitle = subtitle ? "it's <fine>" : "";
                req.style = parse_style(style_str);
                req.animated = animated;
                assert(prepare_request(req).success());

                std::string svg = VectorComposer().compose(req);
                assert(svg.rfind("<?xml", 0) == 0);
                assert(xml_tags_balanced(svg));
                assert(svg.find("A&lt;B &amp; &quot;C&quot;") != std::string::npos);
                assert(count_of(svg, "<text") == (subtitle ? 2u : 1u));
                assert((svg.find("<animate") != std::string::npos) == animated);

                bool glow_filter = req.style == Style::Glow && !animated;
                assert((svg.find("<filter") != std::string::npos) == glow_filter);
                assert((svg.find("filter=\"url(#glow)\"") != std::string::npos) == glow_filter);
            }
        }
    }
}

TEST(svg_title_geometry) {
    RenderRequest req = make_request("Title");
    req.geometry = {1000, 250};
    req.subtitle = "Sub";
    std::string svg = VectorComposer().compose(req);
    assert(svg.find("<text x=\"500\" y=\"137\"") != std::string::npos);
    assert(svg.find("font-size=\"50\"") != std::string::npos);
    assert(svg.find("y=\"195\"") != std::string::npos);
    assert(svg.find("font-size=\"18\"") != std::string::npos);
    assert(svg.find("role=\"img\" aria-label=\"Title\"") != std::string::npos);
}

TEST(safe_name_rules) {
    assert(safe_name("Hello World") == "Hello_World");
    assert(safe_name("a/b\\c:d*e?f") == "abcdef");
    assert(safe_name("///") == "banner");
    assert(safe_name("..") == "banner");
    assert(safe_name(std::string(50, 'x')).size() == 30);
    assert(CharSet::to_codepoints(safe_name(std::string(40, 'a') + "\xC3\xA9")).size() == 30);
}

TEST(timestamped_name_format) {
    assert(timestamped_name("My Banner", "svg", 0) == "banner_My_Banner_19700101_000000.svg");
    assert(timestamped_name("x", "png", 86400 + 3661) == "banner_x_19700102_010101.png");
}

TEST(format_names) {
    Format f;
    assert(parse_format("svg", f) && f == Format::Vector);
    assert(parse_format("png", f) && f == Format::Raster);
    assert(parse_format("ascii", f) && f == Format::Glyph);
    assert(!parse_format("gif", f));
    assert(std::string(format_extension(Format::Glyph)) == "txt");
}

TEST(ansi_colorize_and_strip) {
    std::string red = Terminal::colorize("Hi", AnsiColor::Red);
    assert(red == "\033[91mHi\033[0m");
    assert(Terminal::strip_ansi(red) == "Hi");

    std::string multi = Terminal::colorize("a\n\nb\n", AnsiColor::Cyan);
    assert(Terminal::strip_ansi(multi) == "a\n\nb\n");
    assert(count_of(multi, "\033[96m") == 2);

    AnsiColor c;
    assert(!Terminal::parse_color("plaid", c));
    assert(c == AnsiColor::Cyan);
    assert(Terminal::parse_color("magenta", c) && c == AnsiColor::Magenta);
}

TEST(ansi_framed_box) {
    TerminalInfo info;
    info.cols = 80;
    info.supports_utf8 = false;
    std::string box = Terminal::framed("line one\nline two", "Banner Preview", info);
    assert(box.find("Banner Preview") != std::string::npos);
    assert(box.find("line two") != std::string::npos);

    info.supports_utf8 = true;
    box = Terminal::framed(Terminal::colorize("ab", AnsiColor::Green), "T", info);
    assert(box.find("\xE2\x94\x82 ") != std::string::npos);
    assert(Terminal::display_width(Terminal::colorize("ab", AnsiColor::Green)) == 2);
}

TEST(suggestions_offline_table) {
    OfflineSuggestions offline;
    auto ideas = offline.suggest("Welcome to BannerForge", 3);
    assert(ideas.size() == 3);
    assert(ideas[0] == "Forge Your Visual Identity");

    ideas = offline.suggest("Something Else", 2);
    assert(ideas.size() == 2);
    assert(ideas[0] == "See What Others Miss");

    assert(offline.suggest("x", 0).empty());
    assert(offline.suggest("x", 10).size() == 3);
}

TEST(suggestion_service_never_fails) {
    auto service = make_suggestion_service("BANNERFORGE_TEST_UNSET_KEY_VAR");
    assert(service);
    assert(service->suggest("bannerforge", 1).size() == 1);
}

TEST(args_svg_command) {
    ArgvBuilder b({"svg", "Hello World", "-s", "Sub", "-W", "800", "-H", "200", "-p", "ocean",
                   "--style", "grid", "--animated", "-t", "tech", "-o", "out/banner.svg"});
    Args args = parse_args(b.argc(), b.argv());
    assert(args.error.empty());
    assert(args.command == Command::Svg);
    assert(args.text == "Hello World");
    assert(args.subtitle == "Sub");
    assert(args.width && *args.width == 800);
    assert(args.height && *args.height == 200);
    assert(args.palette == "ocean");
    assert(args.style == "grid");
    assert(args.animated);
    assert(args.template_name == "tech");
    assert(args.output == "out/banner.svg");
}

TEST(args_png_effects_repeat) {
    ArgvBuilder b({"png", "X", "-e", "glow", "-e", "shadow", "--font", "/tmp/f.ttf"});
    Args args = parse_args(b.argc(), b.argv());
    assert(args.error.empty());
    assert(args.effects.size() == 2);
    assert(args.font_path == "/tmp/f.ttf");
}

TEST(args_errors) {
    ArgvBuilder missing_text({"svg"});
    assert(!parse_args(missing_text.argc(), missing_text.argv()).error.empty());

    ArgvBuilder bad_number({"png", "X", "-W", "wide"});
    assert(!parse_args(bad_number.argc(), bad_number.argv()).error.empty());

    ArgvBuilder unknown({"frobnicate"});
    assert(!parse_args(unknown.argc(), unknown.argv()).error.empty());

    ArgvBuilder palette({"palette", "-n", "x", "--bg", "#000"});
    assert(!parse_args(palette.argc(), palette.argv()).error.empty());

    ArgvBuilder quick({"quick", "X", "--type", "gif"});
    assert(!parse_args(quick.argc(), quick.argv()).error.empty());
}

TEST(args_help_and_quick) {
    ArgvBuilder none({});
    assert(parse_args(none.argc(), none.argv()).show_help);

    ArgvBuilder version({"--version"});
    assert(parse_args(version.argc(), version.argv()).show_version);

    ArgvBuilder quick({"quick", "Hi", "-t", "all"});
    Args args = parse_args(quick.argc(), quick.argv());
    assert(args.error.empty());
    assert(args.quick_type == "all");
    assert(args.template_name.empty());

    ArgvBuilder ascii({"ascii", "Hi", "-f", "blocks", "--colorize", "-c", "red"});
    args = parse_args(ascii.argc(), ascii.argv());
    assert(args.glyph_font == "blocks");
    assert(args.colorize && args.color == "red");
}

TEST(config_load_and_validate) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "bannerforge_config_test";
    fs::create_directories(dir);
    fs::path path = dir / "config.toml";
    {
        std::ofstream f(path);
        f << "config_version = 1\n"
          << "[canvas]\nwidth = 800\nheight = 200\n"
          << "[render]\npalette = \"ember\"\neffects = [\"glow\", \"blur\"]\ntemplate = \"tech\"\n"
          << "[fonts]\nglyph_font = \"blocks\"\n"
          << "[batch]\nthreads = 4\n"
          << "[suggest]\napi_key_env = \"MY_KEY\"\n";
    }

    std::string error;
    auto cfg = Config::load(path.string(), &error);
    assert(cfg.has_value());
    assert(cfg->canvas.width == 800 && cfg->canvas.height == 200);
    assert(cfg->render.palette == "ember");
    assert(cfg->render.effects && cfg->render.effects->size() == 2);
    assert(cfg->render.template_name == "tech");
    assert(cfg->fonts.glyph_font == "blocks");
    assert(cfg->batch.threads == 4);
    assert(cfg->suggest.api_key_env == "MY_KEY");

    {
        std::ofstream f(path);
        f << "[batch]\nthreads = -1\n";
    }
    assert(!Config::load(path.string(), &error).has_value());
    assert(error.find("batch.threads") != std::string::npos);

    {
        std::ofstream f(path);
        f << "[canvas\nwidth = \n";
    }
    assert(!Config::load(path.string(), &error).has_value());
    assert(!Config::load((dir / "missing.toml").string(), &error).has_value());

    fs::remove_all(dir);
}

TEST(config_cli_overrides) {
    ArgvBuilder b({"png", "X", "-W", "640", "-p", "royal", "-e", "stripe", "--palette-file", "p.toml"});
    Args args = parse_args(b.argc(), b.argv());
    Config cfg = apply_cli_overrides(Config::defaults(), args);
    assert(cfg.canvas.width == 640);
    assert(cfg.canvas.height == DEFAULT_HEIGHT);
    assert(cfg.render.palette == "royal");
    assert(cfg.render.effects && (*cfg.render.effects)[0] == "stripe");
    assert(cfg.palettes.file == "p.toml");

    std::string error;
    assert(cfg.validate(error));
    cfg.canvas.max_area = 100;
    assert(!cfg.validate(error));
}

TEST(char_sets_available) {
    assert(CharSet::names().size() == 4);
    assert(CharSet::get_set("blocks").size() == 5);
    assert(CharSet::get_set("dense").size() == 70);
    assert(CharSet::get_set("nope") == CharSet::get_set("standard"));
}

TEST(types_framebuffer_blend) {
    FrameBuffer fb(4, 4, Color(0, 0, 0));
    fb.blend_pixel(1, 1, Color(255, 255, 255, 255), 0.5f);
    Color c = fb.get_pixel(1, 1);
    assert(c.r == 128 && c.g == 128 && c.b == 128 && c.a == 255);

    fb.blend_pixel(-1, 0, Color(255, 0, 0));
    fb.blend_pixel(2, 2, Color(255, 0, 0, 0));
    assert(fb.get_pixel(2, 2) == Color(0, 0, 0));
    assert(std::string(error_code_name(ErrorCode::MISSING_CAPABILITY)) == "missing capability");
}

int main() {
    std::cout << "=== bannerforge unit tests ===\n\n";

    std::cout << "--- Color Tests ---\n";
    RUN_TEST(color_parse_long_and_short);
    RUN_TEST(color_parse_rejects_malformed);

    std::cout << "\n--- Palette Tests ---\n";
    RUN_TEST(palette_unknown_resolves_to_stealth);
    RUN_TEST(palette_table_order);
    RUN_TEST(palette_custom_is_copy_on_write);
    RUN_TEST(palette_merge_rejects_bad_color);

    std::cout << "\n--- Request Tests ---\n";
    RUN_TEST(style_and_effect_names);
    RUN_TEST(request_normalization);
    RUN_TEST(request_geometry_limits);
    RUN_TEST(request_rejects_malformed_utf8);
    RUN_TEST(dispatcher_writes_nothing_for_malformed_utf8);
    RUN_TEST(request_builder_warns_on_unknown_names);

    std::cout << "\n--- Template Tests ---\n";
    RUN_TEST(template_precedence);
    RUN_TEST(template_unknown_behaves_as_none);

    std::cout << "\n--- Accent Tests ---\n";
    RUN_TEST(accent_particles_deterministic);
    RUN_TEST(accent_shape_counts);
    RUN_TEST(accent_geometric_layout);

    std::cout << "\n--- SVG Tests ---\n";
    RUN_TEST(svg_number_formatting);
    RUN_TEST(svg_well_formed_for_every_combination);
    RUN_TEST(svg_title_geometry);

    std::cout << "\n--- Output Naming Tests ---\n";
    RUN_TEST(safe_name_rules);
    RUN_TEST(timestamped_name_format);
    RUN_TEST(format_names);

    std::cout << "\n--- Terminal Tests ---\n";
    RUN_TEST(ansi_colorize_and_strip);
    RUN_TEST(ansi_framed_box);

    std::cout << "\n--- Suggestion Tests ---\n";
    RUN_TEST(suggestions_offline_table);
    RUN_TEST(suggestion_service_never_fails);

    std::cout << "\n--- CLI Tests ---\n";
    RUN_TEST(args_svg_command);
    RUN_TEST(args_png_effects_repeat);
    RUN_TEST(args_errors);
    RUN_TEST(args_help_and_quick);

    std::cout << "\n--- Config Tests ---\n";
    RUN_TEST(config_load_and_validate);
    RUN_TEST(config_cli_overrides);

    std::cout << "\n--- Types Tests ---\n";
    RUN_TEST(char_sets_available);
    RUN_TEST(types_framebuffer_blend);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } else {
        std::cout << "\n✗ Some tests failed!\n";
        return 1;
    }
}
