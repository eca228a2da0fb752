#include "glyph/glyph_art.hpp"
#include "glyph/char_sets.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace forge {

namespace {

void trim_trailing_spaces(std::string& line) {
    size_t end = line.find_last_not_of(' ');
    if (end == std::string::npos) {
        line.clear();
    } else {
        line.erase(end + 1);
    }
}

}

GlyphArt::GlyphArt(const FontResolver& fonts, GlyphArtOptions options) : fonts_(fonts), options_(options) {
    options_.pixel_height = std::max(4, options_.pixel_height);
    options_.cell_width = std::max(1, options_.cell_width);
    options_.cell_height = std::max(1, options_.cell_height);
}

const std::vector<std::string>& GlyphArt::list_fonts() {
    return CharSet::names();
}

std::string GlyphArt::join(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

std::vector<std::string> GlyphArt::render(const std::string& text, const std::string& font_name) const {
    std::string ramp_name = font_name;
    if (!CharSet::is_known(ramp_name)) {
        std::cerr << "Warning: Unknown glyph font '" << font_name << "', using " << DEFAULT_GLYPH_FONT << "\n";
        ramp_name = DEFAULT_GLYPH_FONT;
    }

    std::vector<std::string> ramp;
    for (uint32_t cp : CharSet::get_set(ramp_name)) {
        ramp.push_back(CharSet::codepoint_to_utf8(cp));
    }

    auto font = fonts_.resolve(options_.pixel_height);
    CoverageMask mask = font->render(text);
    if (mask.empty()) return {};

    const int cw = options_.cell_width;
    const int ch = options_.cell_height;
    const int cols = (mask.width + cw - 1) / cw;
    const int rows = (mask.height + ch - 1) / ch;
    const float top_level = static_cast<float>(ramp.size() - 1);

    std::vector<std::string> lines;
    lines.reserve(rows);
    for (int row = 0; row < rows; ++row) {
        std::string line;
        for (int col = 0; col < cols; ++col) {
            int sum = 0;
            for (int y = row * ch; y < (row + 1) * ch; ++y) {
                for (int x = col * cw; x < (col + 1) * cw; ++x) {
                    sum += mask.at(x, y);
                }
            }
            float coverage = sum / (255.0f * cw * ch);
            // sqrt lifts thin strokes that would otherwise vanish at this cell size
            size_t level = static_cast<size_t>(std::lround(std::sqrt(coverage) * top_level));
            line += ramp[std::min(level, ramp.size() - 1)];
        }
        trim_trailing_spaces(line);
        lines.push_back(std::move(line));
    }

    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    auto first = std::find_if(lines.begin(), lines.end(), [](const std::string& l) { return !l.empty(); });
    lines.erase(lines.begin(), first);
    return lines;
}

}
