#pragma once

#include "core/request.hpp"
#include <cstddef>
#include <iterator>
#include <random>

namespace forge {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

enum class AccentKind {
    Path,
    Circle,
    Rect,
    Line
};

struct AccentShape {
    AccentKind kind = AccentKind::Path;
    Color color;
    double opacity = 1.0;

    // Circle
    Point center;
    double radius = 0.0;

    // Rect, rotated by rotation_deg about pivot
    Point origin;
    double width = 0.0;
    double height = 0.0;
    double rotation_deg = 0.0;
    Point pivot;

    // Line
    Point from;
    Point to;

    // Cubic curve start -> end, closed through bottom_right and bottom_left
    Point start;
    Point control1;
    Point control2;
    Point end;
    Point bottom_right;
    Point bottom_left;
};

constexpr int GRID_SPACING = 50;
constexpr int PARTICLE_COUNT = 30;
constexpr uint32_t PARTICLE_SEED = 42;

double default_accent_opacity(Style style);

// Finite, restartable, lazily evaluated accent geometry. Every begin() starts
// from a fresh generator state, so iterating twice yields identical shapes.
class AccentSequence {
public:
    AccentSequence(Style style, int width, int height, const Color& color, double opacity);

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = AccentShape;
        using difference_type = std::ptrdiff_t;
        using pointer = const AccentShape*;
        using reference = const AccentShape&;

        const_iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        const_iterator& operator++();
        const_iterator operator++(int) {
            const_iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const const_iterator& other) const { return index_ == other.index_; }
        bool operator!=(const const_iterator& other) const { return index_ != other.index_; }

    private:
        friend class AccentSequence;
        const_iterator(const AccentSequence* owner, size_t index);
        void compute();

        const AccentSequence* owner_ = nullptr;
        size_t index_ = 0;
        std::mt19937 rng_;
        AccentShape current_;
    };

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size()); }
    size_t size() const;

    Style style() const { return style_; }
    int width() const { return width_; }
    int height() const { return height_; }

private:
    Style style_;
    int width_;
    int height_;
    Color color_;
    double opacity_;
};

AccentSequence generate_accent(Style style, int width, int height, const Color& color, double opacity);
AccentSequence generate_accent(Style style, int width, int height, const Color& color);

}
