#include "font_loader.hpp"
#include "char_sets.hpp"

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

#include <cmath>
#include <fstream>
#include <algorithm>
#include <climits>

namespace forge {

constexpr size_t MAX_FONT_FILE_SIZE = 32 * 1024 * 1024;

struct FontInfoImpl {
    stbtt_fontinfo info;
};

static bool has_path_traversal(const std::string& path) {
    if (path.find("..") != std::string::npos) return true;
    if (path.find('\0') != std::string::npos) return true;
    return false;
}

static bool is_safe_font_path(const std::string& path) {
    if (path.empty()) return false;
    if (has_path_traversal(path)) return false;

    size_t max_len = 4096;
    if (path.size() > max_len) return false;

    return true;
}

const std::vector<std::string>& FontLoader::system_font_candidates() {
    static const std::vector<std::string> candidates = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/System/Library/Fonts/Helvetica.ttc",
        "C:\\Windows\\Fonts\\arialbd.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/noto/NotoSans-Bold.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
        "/usr/local/share/fonts/DejaVuSans-Bold.ttf",
    };
    return candidates;
}

FontLoader::FontLoader() : font_info_(std::make_unique<FontInfoImpl>()) {}
FontLoader::~FontLoader() = default;

Result FontLoader::read_font_file(const std::string& path, FontData& out) {
    if (!is_safe_font_path(path)) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Invalid or unsafe font path");
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot open font file: " + path);
    }

    std::streamoff fsize = file.tellg();
    if (fsize <= 0) {
        return Result::fail(ErrorCode::FONT_ERROR, "Font file is empty: " + path);
    }
    if (static_cast<size_t>(fsize) > MAX_FONT_FILE_SIZE) {
        return Result::fail(ErrorCode::FONT_ERROR, "Font file too large: " + path);
    }
    file.seekg(0);

    auto bytes = std::make_shared<std::vector<uint8_t>>(static_cast<size_t>(fsize));
    if (!file.read(reinterpret_cast<char*>(bytes->data()), fsize)) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Failed to read font file: " + path);
    }

    if (!validate_font_data(bytes->data(), bytes->size())) {
        return Result::fail(ErrorCode::FONT_ERROR, "Invalid font file: " + path);
    }

    out = std::move(bytes);
    return Result::ok();
}

Result FontLoader::load_shared(FontData data, float pixel_height) {
    if (!data) {
        return Result::fail(ErrorCode::FONT_ERROR, "Invalid font data");
    }
    font_data_ = std::move(data);
    return load_from_memory(font_data_->data(), font_data_->size(), pixel_height);
}

Result FontLoader::load_from_memory(const uint8_t* data, size_t size, float pixel_height) {
    if (!validate_font_data(data, size)) {
        return Result::fail(ErrorCode::FONT_ERROR, "Invalid font data");
    }

    int offset = stbtt_GetFontOffsetForIndex(data, 0);
    if (offset < 0 || !stbtt_InitFont(&font_info_->info, data, offset)) {
        return Result::fail(ErrorCode::FONT_ERROR, "Failed to initialize font");
    }

    scale_ = stbtt_ScaleForPixelHeight(&font_info_->info, pixel_height);

    int ascent, descent;
    stbtt_GetFontVMetrics(&font_info_->info, &ascent, &descent, nullptr);
    ascent_px_ = static_cast<int>(std::lround(ascent * scale_));
    descent_px_ = static_cast<int>(std::lround(descent * scale_));

    cache_.clear();
    loaded_ = true;
    return Result::ok();
}

GlyphBitmap FontLoader::render_glyph(uint32_t codepoint) const {
    if (!loaded_) return GlyphBitmap();

    auto it = cache_.find(codepoint);
    if (it != cache_.end()) return it->second;

    int advance, lsb;
    stbtt_GetCodepointHMetrics(&font_info_->info, static_cast<int>(codepoint), &advance, &lsb);

    int x0, y0, x1, y1;
    stbtt_GetCodepointBitmapBox(&font_info_->info, static_cast<int>(codepoint), scale_, scale_, &x0, &y0, &x1, &y1);

    int w = std::max(0, x1 - x0);
    int h = std::max(0, y1 - y0);

    GlyphBitmap bitmap;
    bitmap.width = w;
    bitmap.height = h;
    bitmap.advance = static_cast<int>(std::lround(advance * scale_));
    bitmap.bearing_x = x0;
    bitmap.bearing_y = y0;
    bitmap.pixels.resize(static_cast<size_t>(w) * h, 0);

    if (w > 0 && h > 0) {
        stbtt_MakeCodepointBitmap(&font_info_->info, bitmap.pixels.data(), w, h, w, scale_, scale_,
                                  static_cast<int>(codepoint));
    }

    cache_[codepoint] = bitmap;
    return bitmap;
}

bool FontLoader::has_glyph(uint32_t codepoint) const {
    if (!loaded_) return false;
    return stbtt_FindGlyphIndex(&font_info_->info, static_cast<int>(codepoint)) != 0;
}

CoverageMask FontLoader::render_text(const std::string& text) const {
    CoverageMask mask;
    if (!loaded_) return mask;

    const std::vector<uint32_t> codepoints = CharSet::to_codepoints(text);

    struct Placed {
        GlyphBitmap bitmap;
        int x;
        int y;
    };
    std::vector<Placed> placed;
    placed.reserve(codepoints.size());

    // Positions relative to the pen origin on the ascender line.
    float pen = 0.0f;
    int ink_x0 = INT_MAX, ink_y0 = INT_MAX, ink_x1 = INT_MIN, ink_y1 = INT_MIN;
    for (size_t i = 0; i < codepoints.size(); ++i) {
        uint32_t cp = codepoints[i];
        if (!has_glyph(cp) && cp != ' ') cp = '?';

        GlyphBitmap g = render_glyph(cp);
        int gx = static_cast<int>(std::lround(pen)) + g.bearing_x;
        int gy = ascent_px_ + g.bearing_y;
        if (!g.empty()) {
            ink_x0 = std::min(ink_x0, gx);
            ink_y0 = std::min(ink_y0, gy);
            ink_x1 = std::max(ink_x1, gx + g.width);
            ink_y1 = std::max(ink_y1, gy + g.height);
        }

        int advance, lsb;
        stbtt_GetCodepointHMetrics(&font_info_->info, static_cast<int>(cp), &advance, &lsb);
        pen += advance * scale_;
        if (i + 1 < codepoints.size()) {
            pen += scale_ * stbtt_GetCodepointKernAdvance(&font_info_->info, static_cast<int>(cp),
                                                          static_cast<int>(codepoints[i + 1]));
        }

        placed.push_back({std::move(g), gx, gy});
    }

    if (ink_x0 == INT_MAX) {
        ink_x0 = ink_y0 = ink_x1 = ink_y1 = 0;
    }

    const int left = std::min(0, ink_x0);
    const int top = std::min(0, ink_y0);
    const int right = std::max(static_cast<int>(std::ceil(pen)), ink_x1);
    const int bottom = std::max(ascent_px_ - descent_px_, ink_y1);

    mask.width = std::max(1, right - left);
    mask.height = std::max(1, bottom - top);
    mask.origin_x = -left;
    mask.origin_y = -top;
    mask.ink_x0 = ink_x0;
    mask.ink_y0 = ink_y0;
    mask.ink_x1 = ink_x1;
    mask.ink_y1 = ink_y1;
    mask.pixels.assign(static_cast<size_t>(mask.width) * mask.height, 0);

    for (const Placed& p : placed) {
        for (int y = 0; y < p.bitmap.height; ++y) {
            int my = p.y + mask.origin_y + y;
            if (my < 0 || my >= mask.height) continue;
            for (int x = 0; x < p.bitmap.width; ++x) {
                int mx = p.x + mask.origin_x + x;
                if (mx < 0 || mx >= mask.width) continue;
                uint8_t& dst = mask.pixels[static_cast<size_t>(my) * mask.width + mx];
                dst = std::max(dst, p.bitmap.pixels[static_cast<size_t>(y) * p.bitmap.width + x]);
            }
        }
    }

    return mask;
}

bool FontLoader::validate_font_data(const uint8_t* data, size_t size) {
    if (!data || size < 12) return false;

    if (size > MAX_FONT_FILE_SIZE) return false;

    uint32_t signature = (static_cast<uint32_t>(data[0]) << 24) |
                         (static_cast<uint32_t>(data[1]) << 16) |
                         (static_cast<uint32_t>(data[2]) << 8) |
                         static_cast<uint32_t>(data[3]);

    return (signature == 0x00010000) ||
           (signature == 0x74727565) ||
           (signature == 0x4F54544F) ||
           (signature == 0x74746366);
}

}
