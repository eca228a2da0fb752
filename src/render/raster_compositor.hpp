#pragma once

#include "core/request.hpp"
#include "glyph/font_resolver.hpp"
#include "render/raster_backend.hpp"
#include <memory>
#include <vector>

namespace forge {

constexpr uint8_t SHADOW_ALPHA = 128;
constexpr int SHADOW_OFFSET = 4;
constexpr uint8_t GLOW_ALPHA = 80;
constexpr int GLOW_PASSES = 3;
constexpr uint8_t STRIPE_ALPHA = 68;
constexpr int GRADIENT_TOP_ALPHA = 50;
constexpr double BLUR_SIGMA = 1.0;

// Per-render state handed from stage to stage.
struct RasterContext {
    const RenderRequest& request;
    const FontResolver& fonts;
    const RasterBackend& backend;

    std::unique_ptr<Font> title_font;
    CoverageMask title;
    int title_x = 0;
    int title_y = 0;
};

class RasterCompositor {
public:
    using StageFn = Result (*)(FrameBuffer& canvas, RasterContext& ctx);

    struct Stage {
        const char* name;
        bool gated;     // false: always runs
        Effect effect;  // consulted only when gated
        StageFn run;
    };

    explicit RasterCompositor(std::shared_ptr<const RasterBackend> backend);

    // Expects a request that already went through prepare_request().
    Result render(const RenderRequest& request, const FontResolver& fonts, FrameBuffer& out) const;

    // Fixed execution order; effect request order never changes it.
    static const std::vector<Stage>& pipeline();

    // Composites `mask` with its pen origin at (x, y).
    static void draw_mask(FrameBuffer& canvas, const CoverageMask& mask, int x, int y, const Color& color);

private:
    std::shared_ptr<const RasterBackend> backend_;
};

}
