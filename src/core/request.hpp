#pragma once

#include "core/types.hpp"
#include "palette/palette.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace forge {

enum class Style {
    Wave,
    Geometric,
    Grid,
    Particles,
    Glow
};

// Unknown names map to Style::Wave.
Style parse_style(const std::string& name);
const char* style_name(Style style);
bool is_known_style(const std::string& name);
const std::vector<Style>& all_styles();

// Listed in pipeline order.
enum class Effect : uint8_t {
    Gradient = 1u << 0,
    Shadow   = 1u << 1,
    Glow     = 1u << 2,
    Stripe   = 1u << 3,
    Blur     = 1u << 4
};

bool parse_effect(const std::string& name, Effect& out);
const char* effect_name(Effect effect);
const std::vector<Effect>& all_effects();

// Unordered set of effects. Insertion order is irrelevant.
class EffectSet {
public:
    EffectSet() = default;
    EffectSet(std::initializer_list<Effect> effects) {
        for (Effect e : effects) add(e);
    }

    void add(Effect e) { bits_ |= static_cast<uint8_t>(e); }
    bool has(Effect e) const { return (bits_ & static_cast<uint8_t>(e)) != 0; }
    bool empty() const { return bits_ == 0; }

    // Unknown names are collected into `unknown` and skipped.
    static EffectSet from_names(const std::vector<std::string>& names, std::vector<std::string>* unknown = nullptr);

    bool operator==(const EffectSet& other) const { return bits_ == other.bits_; }
    bool operator!=(const EffectSet& other) const { return bits_ != other.bits_; }

private:
    uint8_t bits_ = 0;
};

constexpr int DEFAULT_WIDTH = 1200;
constexpr int DEFAULT_HEIGHT = 300;
constexpr int MAX_CANVAS_SIDE = 32768;
constexpr int64_t DEFAULT_MAX_CANVAS_AREA = 64ll * 1024 * 1024;

struct RenderRequest {
    std::string text;
    std::string subtitle;
    Size geometry{DEFAULT_WIDTH, DEFAULT_HEIGHT};
    Palette palette = PaletteRegistry::builtin().resolve(DEFAULT_PALETTE);
    Style style = Style::Wave;
    EffectSet effects;
    bool animated = false;

    bool has_subtitle() const { return !subtitle.empty(); }
};

// Trims surrounding whitespace and drops control characters.
std::string normalize_text(const std::string& text);

// Normalizes text/subtitle in place and checks geometry.
Result prepare_request(RenderRequest& request, int64_t max_area = DEFAULT_MAX_CANVAS_AREA);

}
