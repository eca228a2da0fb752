#pragma once

#include "core/request.hpp"
#include "glyph/font_resolver.hpp"
#include "glyph/glyph_art.hpp"
#include "render/raster_backend.hpp"
#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace forge {

enum class Format {
    Vector,
    Raster,
    Glyph
};

const char* format_name(Format format);
const char* format_extension(Format format);
// Accepts svg/vector, png/raster, ascii/glyph/txt.
bool parse_format(const std::string& name, Format& out);
const std::vector<Format>& all_formats();

struct Artifact {
    Format format;
    std::vector<uint8_t> bytes;
    Result status;
};

struct DispatchOptions {
    std::string glyph_font = DEFAULT_GLYPH_FONT;
    std::string font_path;
    int64_t max_area = DEFAULT_MAX_CANVAS_AREA;
};

// Routes a request to the vector, raster or glyph path and serializes the
// result. The raster backend is chosen once by the caller; when it is missing
// every raster render returns `backend_status`.
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const RasterBackend> backend, Result backend_status,
               DispatchOptions options = DispatchOptions());

    Result render(const RenderRequest& request, Format format, std::vector<uint8_t>& out) const;

    // One artifact per format, vector then raster then glyph. A failing
    // format does not stop the others.
    std::vector<Artifact> render_all(const RenderRequest& request) const;

    const FontResolver& fonts() const { return fonts_; }
    const DispatchOptions& options() const { return options_; }

private:
    std::shared_ptr<const RasterBackend> backend_;
    Result backend_status_;
    DispatchOptions options_;
    FontResolver fonts_;
};

// Creates parent directories; IO_ERROR when the file cannot be written.
Result write_artifact(const std::string& path, const std::vector<uint8_t>& bytes);
Result write_artifact(const std::string& path, const std::string& text);

// Spaces become underscores, path-hostile characters are dropped, at most 30
// characters. Never empty.
std::string safe_name(const std::string& text);

// banner_<safe>_<YYYYmmdd_HHMMSS>.<ext> in UTC.
std::string timestamped_name(const std::string& text, const std::string& ext);
std::string timestamped_name(const std::string& text, const std::string& ext, std::time_t when);
std::string utc_stamp(std::time_t when);

}
