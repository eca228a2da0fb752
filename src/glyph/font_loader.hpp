#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>

namespace forge {

struct FontInfoImpl;

struct GlyphBitmap {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int advance = 0;
    int bearing_x = 0;
    int bearing_y = 0;

    bool empty() const { return pixels.empty(); }
};

using FontData = std::shared_ptr<const std::vector<uint8_t>>;

class FontLoader {
public:
    FontLoader();
    ~FontLoader();

    FontLoader(const FontLoader&) = delete;
    FontLoader& operator=(const FontLoader&) = delete;
    Result load_shared(FontData data, float pixel_height = 16.0f);
    Result load_from_memory(const uint8_t* data, size_t size, float pixel_height = 16.0f);

    GlyphBitmap render_glyph(uint32_t codepoint) const;
    bool has_glyph(uint32_t codepoint) const;

    // Rasterizes a UTF-8 run with kerning. The pen origin sits on the
    // ascender line so callers can position text by its top edge.
    CoverageMask render_text(const std::string& text) const;

    static Result read_font_file(const std::string& path, FontData& out);
    static const std::vector<std::string>& system_font_candidates();

private:
    std::unique_ptr<FontInfoImpl> font_info_;
    FontData font_data_;
    float scale_ = 1.0f;
    int ascent_px_ = 0;
    int descent_px_ = 0;
    bool loaded_ = false;

    mutable std::unordered_map<uint32_t, GlyphBitmap> cache_;

    static bool validate_font_data(const uint8_t* data, size_t size);
};

}
