#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml.hpp>

#include <filesystem>
#include <cstdlib>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace forge {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/bannerforge";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (canvas.width < 1 || canvas.width > MAX_CANVAS_SIDE) {
        error = "canvas.width must be between 1 and " + std::to_string(MAX_CANVAS_SIDE);
        return false;
    }
    if (canvas.height < 1 || canvas.height > MAX_CANVAS_SIDE) {
        error = "canvas.height must be between 1 and " + std::to_string(MAX_CANVAS_SIDE);
        return false;
    }
    if (canvas.max_area < 1) {
        error = "canvas.max_area must be positive";
        return false;
    }
    if (static_cast<int64_t>(canvas.width) * canvas.height > canvas.max_area) {
        error = "canvas.width * canvas.height exceeds canvas.max_area";
        return false;
    }
    if (batch.threads < 0 || batch.threads > MAX_BATCH_THREADS) {
        error = "batch.threads must be between 0 and " + std::to_string(MAX_BATCH_THREADS);
        return false;
    }
    if (suggest.api_key_env.empty()) {
        error = "suggest.api_key_env must not be empty";
        return false;
    }
    if (palettes.file.empty()) {
        error = "palettes.file must not be empty";
        return false;
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        set_error(error, "Config file not found: " + path);
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                set_error(error, "Unsupported config_version " + std::to_string(*v));
                return std::nullopt;
            }
        }

        if (auto canvas = tbl["canvas"]) {
            if (auto v = canvas["width"].value<int>()) cfg.canvas.width = *v;
            if (auto v = canvas["height"].value<int>()) cfg.canvas.height = *v;
            if (auto v = canvas["max_area"].value<int64_t>()) cfg.canvas.max_area = *v;
        }

        if (auto render = tbl["render"]) {
            if (auto v = render["palette"].value<std::string>()) cfg.render.palette = *v;
            if (auto v = render["style"].value<std::string>()) cfg.render.style = *v;
            if (auto v = render["animated"].value<bool>()) cfg.render.animated = *v;
            if (auto v = render["template"].value<std::string>()) cfg.render.template_name = *v;
            if (auto arr = render["effects"].as_array()) {
                std::vector<std::string> effects;
                for (const auto& node : *arr) {
                    if (auto s = node.value<std::string>()) effects.push_back(*s);
                }
                cfg.render.effects = std::move(effects);
            }
        }

        if (auto fonts = tbl["fonts"]) {
            if (auto v = fonts["raster_font"].value<std::string>()) cfg.fonts.raster_font = *v;
            if (auto v = fonts["glyph_font"].value<std::string>()) cfg.fonts.glyph_font = *v;
        }

        if (auto v = tbl["output"]["directory"].value<std::string>()) cfg.output.directory = *v;
        if (auto v = tbl["palettes"]["file"].value<std::string>()) cfg.palettes.file = *v;
        if (auto v = tbl["batch"]["threads"].value<int>()) cfg.batch.threads = *v;
        if (auto v = tbl["suggest"]["api_key_env"].value<std::string>()) cfg.suggest.api_key_env = *v;

        std::string validation_error;
        if (!cfg.validate(validation_error)) {
            set_error(error, "Invalid config " + path + ": " + validation_error);
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        set_error(error, "Failed to parse " + path + ": " + std::string(e.description()));
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default(std::string* error) {
    std::string path = default_config_path();
    return load(path, error);
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.width) config.canvas.width = *args.width;
    if (args.height) config.canvas.height = *args.height;

    if (!args.palette.empty()) config.render.palette = args.palette;
    if (!args.style.empty()) config.render.style = args.style;
    if (!args.effects.empty()) config.render.effects = args.effects;
    if (args.animated) config.render.animated = true;
    if (!args.template_name.empty()) config.render.template_name = args.template_name;

    if (!args.font_path.empty()) config.fonts.raster_font = args.font_path;
    if (!args.glyph_font.empty()) config.fonts.glyph_font = args.glyph_font;
    if (!args.palette_file.empty()) config.palettes.file = args.palette_file;

    return config;
}

}
