#pragma once

#include "core/types.hpp"
#include "core/request.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace forge {

constexpr int CONFIG_VERSION = 1;
constexpr int MAX_BATCH_THREADS = 256;

struct ConfigCanvas {
    int width = DEFAULT_WIDTH;
    int height = DEFAULT_HEIGHT;
    int64_t max_area = DEFAULT_MAX_CANVAS_AREA;
};

// Empty strings and an unset effects list mean "not specified", so a template
// can still supply the value.
struct ConfigRender {
    std::string palette;
    std::string style;
    std::optional<std::vector<std::string>> effects;
    bool animated = false;
    std::string template_name;
};

struct ConfigFonts {
    std::string raster_font;
    std::string glyph_font = "standard";
};

struct ConfigOutput {
    std::string directory;
};

struct ConfigPalettes {
    std::string file = "custom_palettes.toml";
};

struct ConfigBatch {
    int threads = 0;
};

struct ConfigSuggest {
    std::string api_key_env = "GEMINI_API_KEY";
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigCanvas canvas;
    ConfigRender render;
    ConfigFonts fonts;
    ConfigOutput output;
    ConfigPalettes palettes;
    ConfigBatch batch;
    ConfigSuggest suggest;

    std::string config_path;

    bool validate(std::string& error) const;

    static Config defaults();
    // nullopt when the file is missing, unparsable or fails validation;
    // `error` receives the reason.
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::optional<Config> load_default(std::string* error = nullptr);
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config apply_cli_overrides(Config config, const struct Args& args);

}
