#include "accent/accent_generator.hpp"

namespace forge {

namespace {

// Maps a raw mt19937 draw onto [lo, hi]. Plain modulo keeps the result
// identical across standard library implementations.
int draw_inclusive(std::mt19937& rng, int lo, int hi) {
    uint32_t span = static_cast<uint32_t>(hi - lo) + 1u;
    return lo + static_cast<int>(rng() % span);
}

int line_count(int extent) {
    if (extent <= 0) return 0;
    return (extent + GRID_SPACING - 1) / GRID_SPACING;
}

}

double default_accent_opacity(Style style) {
    switch (style) {
        case Style::Geometric: return 0.10;
        case Style::Grid: return 0.05;
        case Style::Particles: return 0.08;
        case Style::Wave:
        case Style::Glow:
            break;
    }
    return 0.12;
}

AccentSequence::AccentSequence(Style style, int width, int height, const Color& color, double opacity)
    : style_(style), width_(width), height_(height), color_(color), opacity_(opacity) {}

size_t AccentSequence::size() const {
    switch (style_) {
        case Style::Geometric: return 3;
        case Style::Grid: return static_cast<size_t>(line_count(width_) + line_count(height_));
        case Style::Particles: return PARTICLE_COUNT;
        case Style::Wave:
        case Style::Glow:
            break;
    }
    return 1;
}

AccentSequence::const_iterator::const_iterator(const AccentSequence* owner, size_t index)
    : owner_(owner), index_(index), rng_(PARTICLE_SEED) {
    if (index_ < owner_->size()) compute();
}

AccentSequence::const_iterator& AccentSequence::const_iterator::operator++() {
    ++index_;
    if (owner_ && index_ < owner_->size()) compute();
    return *this;
}

void AccentSequence::const_iterator::compute() {
    const double w = owner_->width_;
    const double h = owner_->height_;
    const double opacity = owner_->opacity_;

    AccentShape s;
    s.color = owner_->color_;
    s.opacity = opacity;

    switch (owner_->style_) {
        case Style::Geometric:
            if (index_ == 0) {
                s.kind = AccentKind::Circle;
                s.center = {w * 0.15, h * 0.2};
                s.radius = h * 0.15;
            } else if (index_ == 1) {
                s.kind = AccentKind::Circle;
                s.center = {w * 0.85, h * 0.8};
                s.radius = h * 0.2;
                s.opacity = opacity * 0.7;
            } else {
                s.kind = AccentKind::Rect;
                s.origin = {w * 0.7, h * 0.1};
                s.width = w * 0.2;
                s.height = h * 0.15;
                s.rotation_deg = 15.0;
                s.pivot = {w * 0.8, h * 0.175};
                s.opacity = opacity * 0.5;
            }
            break;

        case Style::Grid: {
            s.kind = AccentKind::Line;
            const size_t verticals = static_cast<size_t>(line_count(owner_->width_));
            if (index_ < verticals) {
                double x = static_cast<double>(index_) * GRID_SPACING;
                s.from = {x, 0.0};
                s.to = {x, h};
            } else {
                double y = static_cast<double>(index_ - verticals) * GRID_SPACING;
                s.from = {0.0, y};
                s.to = {w, y};
            }
            break;
        }

        case Style::Particles: {
            s.kind = AccentKind::Circle;
            int cx = draw_inclusive(rng_, 0, owner_->width_);
            int cy = draw_inclusive(rng_, 0, owner_->height_);
            int r = draw_inclusive(rng_, 2, 8);
            s.center = {static_cast<double>(cx), static_cast<double>(cy)};
            s.radius = r;
            break;
        }

        case Style::Wave:
        case Style::Glow:
            s.kind = AccentKind::Path;
            s.start = {0.0, h * 0.65};
            s.control1 = {w * 0.25, h * 0.4};
            s.control2 = {w * 0.75, h * 0.9};
            s.end = {w, h * 0.6};
            s.bottom_right = {w, h};
            s.bottom_left = {0.0, h};
            break;
    }

    current_ = s;
}

AccentSequence generate_accent(Style style, int width, int height, const Color& color, double opacity) {
    return AccentSequence(style, width, height, color, opacity);
}

AccentSequence generate_accent(Style style, int width, int height, const Color& color) {
    return AccentSequence(style, width, height, color, default_accent_opacity(style));
}

}
