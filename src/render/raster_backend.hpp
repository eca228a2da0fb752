#pragma once

#include "core/types.hpp"
#include <memory>
#include <vector>

namespace forge {

// Pixel operations the raster pipeline cannot do by hand: blur and PNG
// encoding. One implementation is chosen at startup.
class RasterBackend {
public:
    virtual ~RasterBackend() = default;

    virtual const char* name() const = 0;
    virtual Result gaussian_blur(FrameBuffer& canvas, double sigma) const = 0;
    virtual Result encode_png(const FrameBuffer& canvas, std::vector<uint8_t>& out) const = 0;
};

class OpenCvRasterBackend : public RasterBackend {
public:
    const char* name() const override { return "opencv"; }
    Result gaussian_blur(FrameBuffer& canvas, double sigma) const override;
    Result encode_png(const FrameBuffer& canvas, std::vector<uint8_t>& out) const override;

    static bool png_writer_available();
};

// Fails with MISSING_CAPABILITY and a remediation hint when no backend can
// write PNG files.
Result select_raster_backend(std::shared_ptr<const RasterBackend>& out);

}
