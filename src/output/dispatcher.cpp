#include "output/dispatcher.hpp"
#include "glyph/char_sets.hpp"
#include "render/raster_compositor.hpp"
#include "render/svg_composer.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>

namespace forge {

namespace {

constexpr size_t MAX_SAFE_NAME = 30;
constexpr const char* FALLBACK_NAME = "banner";

bool is_path_hostile(uint32_t cp) {
    if (cp < 0x20 || cp == 0x7F) return true;
    return cp < 0x80 && std::strchr("/\\:*?\"<>|", static_cast<int>(cp)) != nullptr;
}

}

const char* format_name(Format format) {
    switch (format) {
        case Format::Vector: return "svg";
        case Format::Raster: return "png";
        case Format::Glyph: return "ascii";
    }
    return "svg";
}

const char* format_extension(Format format) {
    switch (format) {
        case Format::Vector: return "svg";
        case Format::Raster: return "png";
        case Format::Glyph: return "txt";
    }
    return "svg";
}

bool parse_format(const std::string& name, Format& out) {
    if (name == "svg" || name == "vector") { out = Format::Vector; return true; }
    if (name == "png" || name == "raster") { out = Format::Raster; return true; }
    if (name == "ascii" || name == "glyph" || name == "txt") { out = Format::Glyph; return true; }
    return false;
}

const std::vector<Format>& all_formats() {
    static const std::vector<Format> formats = {Format::Vector, Format::Raster, Format::Glyph};
    return formats;
}

Dispatcher::Dispatcher(std::shared_ptr<const RasterBackend> backend, Result backend_status, DispatchOptions options)
    : backend_(std::move(backend)),
      backend_status_(std::move(backend_status)),
      options_(std::move(options)),
      fonts_(options_.font_path) {
    if (!backend_ && backend_status_.success()) {
        backend_status_ = Result::fail(ErrorCode::MISSING_CAPABILITY, "No raster backend available");
    }
}

Result Dispatcher::render(const RenderRequest& request, Format format, std::vector<uint8_t>& out) const {
    out.clear();

    RenderRequest prepared = request;
    Result r = prepare_request(prepared, options_.max_area);
    if (r.failure()) return r;

    switch (format) {
        case Format::Vector: {
            std::string svg = VectorComposer().compose(prepared);
            out.assign(svg.begin(), svg.end());
            return Result::ok();
        }
        case Format::Raster: {
            if (!backend_) return backend_status_;
            FrameBuffer canvas;
            r = RasterCompositor(backend_).render(prepared, fonts_, canvas);
            if (r.failure()) return r;
            return backend_->encode_png(canvas, out);
        }
        case Format::Glyph: {
            GlyphArt art(fonts_);
            std::string text = GlyphArt::join(art.render(prepared.text, options_.glyph_font));
            out.assign(text.begin(), text.end());
            return Result::ok();
        }
    }
    return Result::fail(ErrorCode::INVALID_INPUT, "Unknown output format");
}

std::vector<Artifact> Dispatcher::render_all(const RenderRequest& request) const {
    std::vector<Artifact> artifacts;
    artifacts.reserve(all_formats().size());
    for (Format format : all_formats()) {
        Artifact a{format, {}, Result::ok()};
        a.status = render(request, format, a.bytes);
        artifacts.push_back(std::move(a));
    }
    return artifacts;
}

Result write_artifact(const std::string& path, const std::vector<uint8_t>& bytes) {
    if (path.empty()) {
        return Result::fail(ErrorCode::IO_ERROR, "Empty output path");
    }

    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result::fail(ErrorCode::IO_ERROR,
                                "Cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Result::fail(ErrorCode::IO_ERROR, "Cannot open for writing: " + path);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        return Result::fail(ErrorCode::IO_ERROR, "Failed to write: " + path);
    }
    return Result::ok();
}

Result write_artifact(const std::string& path, const std::string& text) {
    return write_artifact(path, std::vector<uint8_t>(text.begin(), text.end()));
}

std::string safe_name(const std::string& text) {
    std::string out;
    size_t count = 0;
    for (uint32_t cp : CharSet::to_codepoints(text)) {
        if (count >= MAX_SAFE_NAME) break;
        if (cp == ' ') cp = '_';
        if (is_path_hostile(cp)) continue;
        out += CharSet::codepoint_to_utf8(cp);
        ++count;
    }
    if (out.empty() || out.find_first_not_of("._") == std::string::npos) return FALLBACK_NAME;
    return out;
}

std::string utc_stamp(std::time_t when) {
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &when);
#else
    gmtime_r(&when, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::string timestamped_name(const std::string& text, const std::string& ext, std::time_t when) {
    return "banner_" + safe_name(text) + "_" + utc_stamp(when) + "." + ext;
}

std::string timestamped_name(const std::string& text, const std::string& ext) {
    return timestamped_name(text, ext, std::time(nullptr));
}

}
