#pragma once

#include "glyph/font_resolver.hpp"
#include <string>
#include <vector>

namespace forge {

constexpr const char* DEFAULT_GLYPH_FONT = "standard";

struct GlyphArtOptions {
    int pixel_height = 48;
    int cell_width = 4;
    int cell_height = 8;
};

// Renders text as a grid of ramp characters. Each character cell covers
// cell_width x cell_height pixels of the rasterized run.
class GlyphArt {
public:
    explicit GlyphArt(const FontResolver& fonts, GlyphArtOptions options = GlyphArtOptions());

    // Unknown font names fall back to "standard" with a warning.
    std::vector<std::string> render(const std::string& text, const std::string& font_name) const;

    static std::string join(const std::vector<std::string>& lines);
    static const std::vector<std::string>& list_fonts();

private:
    const FontResolver& fonts_;
    GlyphArtOptions options_;
};

}
