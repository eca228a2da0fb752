#pragma once

#include "core/types.hpp"
#include "glyph/font_loader.hpp"
#include <memory>
#include <string>

namespace forge {

// A drawable font at a fixed pixel size.
class Font {
public:
    virtual ~Font() = default;

    virtual CoverageMask render(const std::string& text) const = 0;
    virtual int pixel_size() const = 0;
    virtual std::string description() const = 0;
};

class TrueTypeFont : public Font {
public:
    TrueTypeFont(std::unique_ptr<FontLoader> loader, std::string path, int pixel_size);

    CoverageMask render(const std::string& text) const override;
    int pixel_size() const override { return pixel_size_; }
    std::string description() const override { return path_; }

private:
    std::unique_ptr<FontLoader> loader_;
    std::string path_;
    int pixel_size_;
};

// OpenCV's built-in Hershey vector font. Always available; ASCII only.
class HersheyFont : public Font {
public:
    explicit HersheyFont(int pixel_size);

    CoverageMask render(const std::string& text) const override;
    int pixel_size() const override { return pixel_size_; }
    std::string description() const override { return "builtin:hershey-duplex"; }

private:
    int pixel_size_;
};

// Locates a font file once: the explicit path, then the platform candidates.
// resolve() never fails; without any usable file it hands out Hershey fonts.
class FontResolver {
public:
    FontResolver() : FontResolver(std::string()) {}
    explicit FontResolver(const std::string& explicit_path);

    std::unique_ptr<Font> resolve(int pixel_size) const;

    bool has_truetype() const { return static_cast<bool>(font_data_); }
    const std::string& font_path() const { return font_path_; }

private:
    std::string font_path_;
    FontData font_data_;
};

}
