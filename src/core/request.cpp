#include "core/request.hpp"
#include "glyph/char_sets.hpp"

#include <cctype>

namespace forge {

namespace {

struct StyleName {
    Style style;
    const char* name;
};

constexpr StyleName kStyleNames[] = {
    {Style::Wave, "wave"},
    {Style::Geometric, "geometric"},
    {Style::Grid, "grid"},
    {Style::Particles, "particles"},
    {Style::Glow, "glow"},
};

struct EffectName {
    Effect effect;
    const char* name;
};

constexpr EffectName kEffectNames[] = {
    {Effect::Gradient, "gradient"},
    {Effect::Shadow, "shadow"},
    {Effect::Glow, "glow"},
    {Effect::Stripe, "stripe"},
    {Effect::Blur, "blur"},
};

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

}

Style parse_style(const std::string& name) {
    const std::string lower = to_lower_copy(name);
    for (const auto& entry : kStyleNames) {
        if (lower == entry.name) return entry.style;
    }
    return Style::Wave;
}

const char* style_name(Style style) {
    for (const auto& entry : kStyleNames) {
        if (entry.style == style) return entry.name;
    }
    return "wave";
}

bool is_known_style(const std::string& name) {
    const std::string lower = to_lower_copy(name);
    for (const auto& entry : kStyleNames) {
        if (lower == entry.name) return true;
    }
    return false;
}

const std::vector<Style>& all_styles() {
    static const std::vector<Style> styles = {
        Style::Wave, Style::Geometric, Style::Grid, Style::Particles, Style::Glow
    };
    return styles;
}

bool parse_effect(const std::string& name, Effect& out) {
    const std::string lower = to_lower_copy(name);
    for (const auto& entry : kEffectNames) {
        if (lower == entry.name) {
            out = entry.effect;
            return true;
        }
    }
    return false;
}

const char* effect_name(Effect effect) {
    for (const auto& entry : kEffectNames) {
        if (entry.effect == effect) return entry.name;
    }
    return "";
}

const std::vector<Effect>& all_effects() {
    static const std::vector<Effect> effects = {
        Effect::Shadow, Effect::Glow, Effect::Gradient, Effect::Stripe, Effect::Blur
    };
    return effects;
}

EffectSet EffectSet::from_names(const std::vector<std::string>& names, std::vector<std::string>* unknown) {
    EffectSet set;
    for (const auto& name : names) {
        Effect e;
        if (parse_effect(name, e)) {
            set.add(e);
        } else if (unknown) {
            unknown->push_back(name);
        }
    }
    return set;
}

std::string normalize_text(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            if (c == '\t' || c == '\n' || c == '\r') cleaned += ' ';
            continue;
        }
        cleaned += c;
    }

    size_t begin = cleaned.find_first_not_of(' ');
    if (begin == std::string::npos) return "";
    size_t end = cleaned.find_last_not_of(' ');
    return cleaned.substr(begin, end - begin + 1);
}

Result prepare_request(RenderRequest& request, int64_t max_area) {
    request.text = normalize_text(request.text);
    request.subtitle = normalize_text(request.subtitle);

    if (request.text.empty()) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Banner text must not be empty");
    }
    if (!CharSet::is_valid_utf8(request.text)) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Banner text is not valid UTF-8");
    }
    if (!CharSet::is_valid_utf8(request.subtitle)) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Subtitle is not valid UTF-8");
    }
    if (request.geometry.width <= 0 || request.geometry.height <= 0) {
        return Result::fail(ErrorCode::INVALID_INPUT,
                            "Canvas size must be positive, got " + std::to_string(request.geometry.width) +
                            "x" + std::to_string(request.geometry.height));
    }
    if (request.geometry.area() > max_area) {
        return Result::fail(ErrorCode::INVALID_INPUT,
                            "Canvas " + std::to_string(request.geometry.width) + "x" +
                            std::to_string(request.geometry.height) + " exceeds the maximum area of " +
                            std::to_string(max_area) + " pixels");
    }
    return Result::ok();
}

}
