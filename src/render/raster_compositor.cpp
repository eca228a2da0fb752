#include "render/raster_compositor.hpp"

#include <cmath>

namespace forge {

namespace {

Result stage_background(FrameBuffer& canvas, RasterContext& ctx) {
    const Size& g = ctx.request.geometry;
    canvas = FrameBuffer(g.width, g.height, ctx.request.palette.background.with_alpha(255));
    return Result::ok();
}

Result stage_gradient(FrameBuffer& canvas, RasterContext& ctx) {
    const int w = canvas.width();
    const int h = canvas.height();
    for (int y = 0; y < h; ++y) {
        int alpha = static_cast<int>(GRADIENT_TOP_ALPHA * (1.0 - static_cast<double>(y) / h));
        if (alpha <= 0) continue;
        const Color c = ctx.request.palette.accent.with_alpha(static_cast<uint8_t>(alpha));
        for (int x = 0; x < w; ++x) {
            canvas.blend_pixel(x, y, c);
        }
    }
    return Result::ok();
}

Result stage_layout(FrameBuffer& canvas, RasterContext& ctx) {
    const int h = canvas.height();
    ctx.title_font = ctx.fonts.resolve(static_cast<int>(h * 0.22));
    ctx.title = ctx.title_font->render(ctx.request.text);

    // Center the ink box: horizontally on the canvas, vertically on 0.35h.
    const double tw = ctx.title.ink_width();
    const double th = ctx.title.ink_height();
    ctx.title_x = static_cast<int>(std::lround((canvas.width() - tw) / 2.0 - ctx.title.ink_x0));
    ctx.title_y = static_cast<int>(std::lround(h * 0.35 - th / 2.0 - ctx.title.ink_y0));
    return Result::ok();
}

Result stage_shadow(FrameBuffer& canvas, RasterContext& ctx) {
    RasterCompositor::draw_mask(canvas, ctx.title, ctx.title_x + SHADOW_OFFSET, ctx.title_y + SHADOW_OFFSET,
                                Color(0, 0, 0, SHADOW_ALPHA));
    return Result::ok();
}

Result stage_glow(FrameBuffer& canvas, RasterContext& ctx) {
    const Color glow = ctx.request.palette.accent.with_alpha(GLOW_ALPHA);
    const int x = ctx.title_x;
    const int y = ctx.title_y;
    for (int offset = GLOW_PASSES; offset > 0; --offset) {
        RasterCompositor::draw_mask(canvas, ctx.title, x - offset, y, glow);
        RasterCompositor::draw_mask(canvas, ctx.title, x + offset, y, glow);
        RasterCompositor::draw_mask(canvas, ctx.title, x, y - offset, glow);
        RasterCompositor::draw_mask(canvas, ctx.title, x, y + offset, glow);
    }
    return Result::ok();
}

Result stage_title(FrameBuffer& canvas, RasterContext& ctx) {
    RasterCompositor::draw_mask(canvas, ctx.title, ctx.title_x, ctx.title_y,
                                ctx.request.palette.text.with_alpha(255));
    return Result::ok();
}

Result stage_subtitle(FrameBuffer& canvas, RasterContext& ctx) {
    if (!ctx.request.has_subtitle()) return Result::ok();

    const int h = canvas.height();
    auto font = ctx.fonts.resolve(static_cast<int>(h * 0.07));
    CoverageMask sub = font->render(ctx.request.subtitle);

    const double sw = sub.ink_width();
    const double sh = sub.ink_height();
    int x = static_cast<int>(std::lround((canvas.width() - sw) / 2.0 - sub.ink_x0));
    int y = static_cast<int>(std::lround(h * 0.75 - sh / 2.0 - sub.ink_y0));
    RasterCompositor::draw_mask(canvas, sub, x, y, ctx.request.palette.muted.with_alpha(255));
    return Result::ok();
}

Result stage_stripe(FrameBuffer& canvas, RasterContext& ctx) {
    const Color c = ctx.request.palette.accent.with_alpha(STRIPE_ALPHA);
    const int top = static_cast<int>(canvas.height() * 0.85);
    for (int y = top; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            canvas.blend_pixel(x, y, c);
        }
    }
    return Result::ok();
}

Result stage_blur(FrameBuffer& canvas, RasterContext& ctx) {
    return ctx.backend.gaussian_blur(canvas, BLUR_SIGMA);
}

}

RasterCompositor::RasterCompositor(std::shared_ptr<const RasterBackend> backend) : backend_(std::move(backend)) {}

const std::vector<RasterCompositor::Stage>& RasterCompositor::pipeline() {
    static const std::vector<Stage> stages = {
        {"background", false, Effect::Gradient, &stage_background},
        {"gradient",   true,  Effect::Gradient, &stage_gradient},
        {"layout",     false, Effect::Gradient, &stage_layout},
        {"shadow",     true,  Effect::Shadow,   &stage_shadow},
        {"glow",       true,  Effect::Glow,     &stage_glow},
        {"title",      false, Effect::Gradient, &stage_title},
        {"subtitle",   false, Effect::Gradient, &stage_subtitle},
        {"stripe",     true,  Effect::Stripe,   &stage_stripe},
        {"blur",       true,  Effect::Blur,     &stage_blur},
    };
    return stages;
}

void RasterCompositor::draw_mask(FrameBuffer& canvas, const CoverageMask& mask, int x, int y, const Color& color) {
    const int left = x - mask.origin_x;
    const int top = y - mask.origin_y;
    for (int my = 0; my < mask.height; ++my) {
        const int cy = top + my;
        if (cy < 0 || cy >= canvas.height()) continue;
        for (int mx = 0; mx < mask.width; ++mx) {
            uint8_t coverage = mask.pixels[static_cast<size_t>(my) * mask.width + mx];
            if (coverage == 0) continue;
            canvas.blend_pixel(left + mx, cy, color, coverage / 255.0f);
        }
    }
}

Result RasterCompositor::render(const RenderRequest& request, const FontResolver& fonts, FrameBuffer& out) const {
    if (!backend_) {
        return Result::fail(ErrorCode::MISSING_CAPABILITY, "No raster backend available");
    }

    RasterContext ctx{request, fonts, *backend_, nullptr, CoverageMask(), 0, 0};
    FrameBuffer canvas;
    for (const Stage& stage : pipeline()) {
        if (stage.gated && !request.effects.has(stage.effect)) continue;
        Result r = stage.run(canvas, ctx);
        if (r.failure()) {
            return Result::fail(r.error, std::string(stage.name) + " stage: " + r.message);
        }
    }

    out = std::move(canvas);
    return Result::ok();
}

}
