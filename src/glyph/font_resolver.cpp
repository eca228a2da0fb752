#include "glyph/font_resolver.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iostream>

namespace forge {

TrueTypeFont::TrueTypeFont(std::unique_ptr<FontLoader> loader, std::string path, int pixel_size)
    : loader_(std::move(loader)), path_(std::move(path)), pixel_size_(pixel_size) {}

CoverageMask TrueTypeFont::render(const std::string& text) const {
    return loader_->render_text(text);
}

HersheyFont::HersheyFont(int pixel_size) : pixel_size_(std::max(1, pixel_size)) {}

CoverageMask HersheyFont::render(const std::string& text) const {
    constexpr int kFace = cv::FONT_HERSHEY_DUPLEX;

    std::string ascii_text;
    ascii_text.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x80) {
            // Skip UTF-8 continuation bytes so each code point becomes one '?'.
            if ((uc & 0xC0) == 0xC0) ascii_text += '?';
            continue;
        }
        ascii_text += c;
    }

    const int thickness = std::max(1, pixel_size_ / 12);
    const double scale = cv::getFontScaleFromHeight(kFace, pixel_size_, thickness);

    int baseline = 0;
    cv::Size size = cv::getTextSize(ascii_text, kFace, scale, thickness, &baseline);
    const int pad = thickness + 1;

    CoverageMask mask;
    mask.width = std::max(1, size.width + 2 * pad);
    mask.height = std::max(1, size.height + baseline + 2 * pad);
    mask.origin_x = pad;
    mask.origin_y = pad;
    mask.ink_x0 = 0;
    mask.ink_y0 = 0;
    mask.ink_x1 = size.width;
    mask.ink_y1 = size.height + baseline;

    cv::Mat canvas(mask.height, mask.width, CV_8UC1, cv::Scalar(0));
    cv::putText(canvas, ascii_text, cv::Point(pad, pad + size.height), kFace, scale,
                cv::Scalar(255), thickness, cv::LINE_AA);

    mask.pixels.assign(canvas.data, canvas.data + static_cast<size_t>(mask.width) * mask.height);
    return mask;
}

FontResolver::FontResolver(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        Result r = FontLoader::read_font_file(explicit_path, font_data_);
        if (r.success()) {
            font_path_ = explicit_path;
            return;
        }
        std::cerr << "Warning: Failed to load font: " << explicit_path << " - " << r.message << "\n";
    }

    for (const auto& candidate : FontLoader::system_font_candidates()) {
        FontData data;
        if (FontLoader::read_font_file(candidate, data).success()) {
            font_data_ = std::move(data);
            font_path_ = candidate;
            return;
        }
    }
}

std::unique_ptr<Font> FontResolver::resolve(int pixel_size) const {
    pixel_size = std::max(1, pixel_size);

    if (font_data_) {
        auto loader = std::make_unique<FontLoader>();
        Result r = loader->load_shared(font_data_, static_cast<float>(pixel_size));
        if (r.success()) {
            return std::make_unique<TrueTypeFont>(std::move(loader), font_path_, pixel_size);
        }
        std::cerr << "Warning: " << r.message << " (" << font_path_ << "), using built-in font\n";
    }

    return std::make_unique<HersheyFont>(pixel_size);
}

}
