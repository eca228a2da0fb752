#pragma once

#include "core/request.hpp"
#include "palette/palette.hpp"
#include <optional>
#include <string>
#include <vector>

namespace forge {

// Loosely typed render options as they arrive from the CLI, the config file
// or a batch record. Empty strings and an unset effects list are "not given".
struct RequestSpec {
    std::string text;
    std::string subtitle;
    int width = DEFAULT_WIDTH;
    int height = DEFAULT_HEIGHT;
    std::string palette;
    std::string style;
    std::optional<std::vector<std::string>> effects;
    bool animated = false;
    std::string template_name;
};

// Resolves template, palette, style and effects into a RenderRequest. Unknown
// names never fail; they are reported through `warnings`.
RenderRequest build_request(const RequestSpec& spec, const PaletteRegistry& palettes,
                            std::vector<std::string>* warnings = nullptr);

}
