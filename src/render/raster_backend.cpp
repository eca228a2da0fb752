#include "render/raster_backend.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace forge {

bool OpenCvRasterBackend::png_writer_available() {
    try {
        return cv::haveImageWriter(".png");
    } catch (const cv::Exception&) {
        return false;
    }
}

Result OpenCvRasterBackend::gaussian_blur(FrameBuffer& canvas, double sigma) const {
    if (canvas.empty()) return Result::ok();

    try {
        cv::Mat mat(canvas.height(), canvas.width(), CV_8UC4, canvas.data());
        cv::Mat blurred;
        cv::GaussianBlur(mat, blurred, cv::Size(0, 0), sigma, sigma, cv::BORDER_REFLECT_101);
        blurred.copyTo(mat);
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::MISSING_CAPABILITY, std::string("OpenCV blur failed: ") + e.what());
    }
    return Result::ok();
}

Result OpenCvRasterBackend::encode_png(const FrameBuffer& canvas, std::vector<uint8_t>& out) const {
    if (canvas.empty()) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Cannot encode an empty canvas");
    }

    try {
        cv::Mat rgba(canvas.height(), canvas.width(), CV_8UC4, const_cast<uint8_t*>(canvas.data()));
        cv::Mat bgra;
        cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
        if (!cv::imencode(".png", bgra, out)) {
            return Result::fail(ErrorCode::IO_ERROR, "PNG encoding failed");
        }
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::MISSING_CAPABILITY, std::string("OpenCV PNG encoder failed: ") + e.what());
    }
    return Result::ok();
}

Result select_raster_backend(std::shared_ptr<const RasterBackend>& out) {
    out.reset();
    if (!OpenCvRasterBackend::png_writer_available()) {
        return Result::fail(ErrorCode::MISSING_CAPABILITY,
                            "OpenCV was built without a PNG writer; rebuild OpenCV with imgcodecs and libpng "
                            "(e.g. install libopencv-imgcodecs-dev) to render raster banners");
    }
    out = std::make_shared<OpenCvRasterBackend>();
    return Result::ok();
}

}
