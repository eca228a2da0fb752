#include <iostream>
#include <cassert>
#include <memory>
#include <string>
#include <vector>

#include "../src/core/request.hpp"
#include "../src/glyph/font_resolver.hpp"
#include "../src/glyph/glyph_art.hpp"
#include "../src/render/raster_backend.hpp"
#include "../src/render/raster_compositor.hpp"
#include "../src/output/dispatcher.hpp"

using namespace forge;

static std::shared_ptr<const RasterBackend> opencv_backend() {
    return std::make_shared<OpenCvRasterBackend>();
}

static FrameBuffer render_raster(const RenderRequest& request) {
    static const FontResolver fonts;
    RenderRequest prepared = request;
    assert(prepare_request(prepared).success());

    FrameBuffer canvas;
    Result r = RasterCompositor(opencv_backend()).render(prepared, fonts, canvas);
    assert(r.success());
    return canvas;
}

static RenderRequest stealth_request(const std::string& text) {
    RenderRequest req;
    req.text = text;
    req.geometry = {400, 100};
    return req;
}

void test_pipeline_order_fixed() {
    std::cout << "Testing raster pipeline order... ";
    const auto& stages = RasterCompositor::pipeline();
    const std::vector<std::string> expected = {
        "background", "gradient", "layout", "shadow", "glow", "title", "subtitle", "stripe", "blur"};
    assert(stages.size() == expected.size());
    for (size_t i = 0; i < stages.size(); ++i) {
        assert(expected[i] == stages[i].name);
    }
    std::cout << "✓ Raster pipeline order test passed\n";
}

void test_effect_order_independence() {
    std::cout << "Testing effect order independence... ";
    RenderRequest a = stealth_request("Order");
    a.effects = EffectSet::from_names({"glow", "shadow"});
    RenderRequest b = stealth_request("Order");
    b.effects = EffectSet::from_names({"shadow", "glow"});

    FrameBuffer fa = render_raster(a);
    FrameBuffer fb = render_raster(b);
    assert(fa.size() == (Size{400, 100}));
    assert(fa == fb);

    RenderRequest plain = stealth_request("Order");
    assert(render_raster(plain) != fa);
    std::cout << "✓ Effect order independence test passed\n";
}

void test_background_and_stripe() {
    std::cout << "Testing background and stripe... ";
    RenderRequest req = stealth_request("S");
    req.geometry = {1200, 300};

    FrameBuffer plain = render_raster(req);
    assert(plain.get_pixel(0, 0) == Color(10, 15, 20));
    assert(plain.get_pixel(0, 299) == Color(10, 15, 20));

    req.effects = EffectSet{Effect::Stripe};
    FrameBuffer striped = render_raster(req);
    // Accent #00ffff at 68/255 over #0a0f14, bottom 15% only
    assert(striped.get_pixel(0, 299) == Color(7, 79, 83));
    assert(striped.get_pixel(0, 260) == Color(7, 79, 83));
    assert(striped.get_pixel(0, 250) == Color(10, 15, 20));
    std::cout << "✓ Background and stripe test passed\n";
}

void test_gradient_fades_downward() {
    std::cout << "Testing gradient overlay... ";
    RenderRequest req = stealth_request("G");
    req.geometry = {1200, 300};
    req.effects = EffectSet{Effect::Gradient};

    FrameBuffer canvas = render_raster(req);
    assert(canvas.get_pixel(0, 0) == Color(8, 62, 66));
    assert(canvas.get_pixel(0, 299) == Color(10, 15, 20));
    assert(canvas.get_pixel(0, 100).g > canvas.get_pixel(0, 200).g);
    std::cout << "✓ Gradient overlay test passed\n";
}

void test_title_drawn_near_center() {
    std::cout << "Testing title placement... ";
    RenderRequest req = stealth_request("HHHH");
    req.geometry = {800, 200};
    FrameBuffer canvas = render_raster(req);

    const Color bg(10, 15, 20);
    int ink = 0;
    long sum_x = 0;
    long sum_y = 0;
    for (int y = 0; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            if (canvas.get_pixel(x, y) != bg) {
                ++ink;
                sum_x += x;
                sum_y += y;
            }
        }
    }
    assert(ink > 0);
    const double cx = static_cast<double>(sum_x) / ink;
    const double cy = static_cast<double>(sum_y) / ink;
    assert(cx > 360 && cx < 440);
    assert(cy > 50 && cy < 90);
    std::cout << "✓ Title placement test passed\n";
}

void test_blur_softens_edges() {
    std::cout << "Testing blur effect... ";
    RenderRequest req = stealth_request("X");
    req.effects = EffectSet{Effect::Stripe};
    FrameBuffer sharp = render_raster(req);

    req.effects.add(Effect::Blur);
    FrameBuffer soft = render_raster(req);
    assert(sharp != soft);
    // Rows just above the stripe pick up its color
    assert(soft.get_pixel(10, 83).g > sharp.get_pixel(10, 83).g);
    std::cout << "✓ Blur effect test passed\n";
}

void test_png_encoding() {
    std::cout << "Testing PNG encoding... ";
    FrameBuffer canvas(8, 4, Color(255, 0, 0));
    std::vector<uint8_t> png;
    Result r = OpenCvRasterBackend().encode_png(canvas, png);
    assert(r.success());
    assert(png.size() > 8);
    assert(png[0] == 0x89 && png[1] == 'P' && png[2] == 'N' && png[3] == 'G');

    std::shared_ptr<const RasterBackend> selected;
    assert(select_raster_backend(selected).success());
    assert(selected);
    assert(std::string(selected->name()) == "opencv");
    std::cout << "✓ PNG encoding test passed\n";
}

void test_dispatcher_raster() {
    std::cout << "Testing dispatcher raster output... ";
    Dispatcher dispatcher(opencv_backend(), Result::ok());
    RenderRequest req = stealth_request("Png");
    std::vector<uint8_t> png;
    assert(dispatcher.render(req, Format::Raster, png).success());
    assert(png[1] == 'P');

    auto artifacts = dispatcher.render_all(req);
    for (const auto& artifact : artifacts) {
        assert(artifact.status.success());
        assert(!artifact.bytes.empty());
    }
    std::cout << "✓ Dispatcher raster output test passed\n";
}

void test_hershey_fallback_font() {
    std::cout << "Testing builtin fallback font... ";
    HersheyFont font(40);
    CoverageMask mask = font.render("Ab");
    assert(!mask.empty());
    assert(mask.ink_width() > 0 && mask.ink_height() > 0);

    int lit = 0;
    for (uint8_t p : mask.pixels) lit += p > 0;
    assert(lit > 0);

    // Non-ASCII collapses to one placeholder per code point
    CoverageMask accented = font.render("\xC3\xA9");
    CoverageMask question = font.render("?");
    assert(accented.width == question.width);
    std::cout << "✓ Builtin fallback font test passed\n";
}

void test_font_resolver_never_fails() {
    std::cout << "Testing font resolver fallback... ";
    FontResolver resolver("/nonexistent/bannerforge/font.ttf");
    assert(resolver.font_path() != "/nonexistent/bannerforge/font.ttf");
    auto font = resolver.resolve(32);
    assert(font);
    assert(font->pixel_size() == 32);
    assert(!font->render("ok").empty());
    std::cout << "✓ Font resolver fallback test passed\n";
}

void test_glyph_art_shape() {
    std::cout << "Testing glyph art... ";
    FontResolver fonts;
    GlyphArt art(fonts);

    auto lines = art.render("Hi", "standard");
    assert(!lines.empty());
    assert(!lines.front().empty());
    assert(!lines.back().empty());
    for (const auto& line : lines) {
        assert(line.empty() || line.back() != ' ');
    }

    assert(art.render("Hi", "no-such-font") == lines);

    auto blocks = art.render("Hi", "blocks");
    assert(GlyphArt::join(blocks).find("\xE2\x96") != std::string::npos);
    assert(GlyphArt::list_fonts().size() == 4);
    std::cout << "✓ Glyph art test passed\n";
}

int main() {
    std::cout << "Running raster and glyph tests...\n\n";

    test_pipeline_order_fixed();
    test_effect_order_independence();
    test_background_and_stripe();
    test_gradient_fades_downward();
    test_title_drawn_near_center();
    test_blur_softens_edges();
    test_png_encoding();
    test_dispatcher_raster();
    test_hershey_fallback_font();
    test_font_resolver_never_fails();
    test_glyph_art_shape();

    std::cout << "\n✓ All raster tests passed!\n";
    return 0;
}
