#include "palette/palette.hpp"
#include "core/color.hpp"

namespace forge {

namespace {

Color rgb(uint32_t hex) {
    return Color(static_cast<uint8_t>((hex >> 16) & 0xFF),
                 static_cast<uint8_t>((hex >> 8) & 0xFF),
                 static_cast<uint8_t>(hex & 0xFF));
}

Palette make(uint32_t bg, uint32_t accent, uint32_t text, uint32_t muted, uint32_t g0, uint32_t g1) {
    return Palette{rgb(bg), rgb(accent), rgb(text), rgb(muted), rgb(g0), rgb(g1)};
}

}

const std::vector<std::pair<std::string, Palette>>& PaletteRegistry::builtin_table() {
    static const std::vector<std::pair<std::string, Palette>> table = {
        {"stealth",   make(0x0a0f14, 0x00ffff, 0xffffff, 0x9aa4ad, 0x00ffff, 0x0088ff)},
        {"ember",     make(0x0f0a07, 0xff8a3b, 0xf5e9e3, 0xc9b5a3, 0xff8a3b, 0xff4d4d)},
        {"forest",    make(0x0d1b0e, 0x4ade80, 0xe8f5e9, 0x81c784, 0x4ade80, 0x22c55e)},
        {"ocean",     make(0x0a1628, 0x38bdf8, 0xe0f2fe, 0x7dd3fc, 0x38bdf8, 0x0ea5e9)},
        {"sunset",    make(0x1a0f1e, 0xf472b6, 0xfce7f3, 0xf9a8d4, 0xf472b6, 0xec4899)},
        {"neon",      make(0x000000, 0x00ff41, 0x00ff41, 0x39ff14, 0x00ff41, 0x39ff14)},
        {"royal",     make(0x1e1b4b, 0xfbbf24, 0xfef3c7, 0xfcd34d, 0xfbbf24, 0xf59e0b)},
        {"cyberpunk", make(0x0d0221, 0xff006e, 0xf72585, 0xb5179e, 0xff006e, 0x8338ec)},
        {"matrix",    make(0x000000, 0x00ff00, 0x00ff00, 0x008f00, 0x00ff00, 0x00aa00)},
    };
    return table;
}

PaletteRegistry::PaletteRegistry() : custom_(std::make_shared<const PaletteMap>()) {}

const PaletteRegistry& PaletteRegistry::builtin() {
    static const PaletteRegistry registry;
    return registry;
}

const Palette& PaletteRegistry::resolve(const std::string& name) const {
    auto it = custom_->find(name);
    if (it != custom_->end()) return it->second;

    const auto& table = builtin_table();
    for (const auto& entry : table) {
        if (entry.first == name) return entry.second;
    }
    // Table starts with the default palette.
    return table.front().second;
}

bool PaletteRegistry::contains(const std::string& name) const {
    if (custom_->count(name)) return true;
    for (const auto& entry : builtin_table()) {
        if (entry.first == name) return true;
    }
    return false;
}

PaletteRegistry PaletteRegistry::with_custom(const PaletteMap& custom) const {
    auto merged = std::make_shared<PaletteMap>(*custom_);
    for (const auto& [name, palette] : custom) {
        (*merged)[name] = palette;
    }
    PaletteRegistry next;
    next.custom_ = std::move(merged);
    return next;
}

std::vector<std::string> PaletteRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& entry : builtin_table()) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::string> PaletteRegistry::custom_names() const {
    std::vector<std::string> out;
    for (const auto& entry : *custom_) {
        out.push_back(entry.first);
    }
    return out;
}

Result merge_custom(const std::string& name, const std::string& bg, const std::string& accent,
                    const std::string& text, const std::string& muted, Palette& out) {
    if (name.empty()) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Palette name must not be empty");
    }

    Palette p;
    Result r = parse_hex_color(bg, p.background);
    if (r.failure()) return Result::fail(r.error, "bg: " + r.message);
    r = parse_hex_color(accent, p.accent);
    if (r.failure()) return Result::fail(r.error, "accent: " + r.message);
    r = parse_hex_color(text, p.text);
    if (r.failure()) return Result::fail(r.error, "text: " + r.message);
    r = parse_hex_color(muted, p.muted);
    if (r.failure()) return Result::fail(r.error, "muted: " + r.message);

    p.gradient_start = p.accent;
    p.gradient_end = p.accent;
    out = p;
    return Result::ok();
}

}
