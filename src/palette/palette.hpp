#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>

namespace forge {

struct Palette {
    Color background;
    Color accent;
    Color text;
    Color muted;
    Color gradient_start;
    Color gradient_end;

    bool operator==(const Palette& other) const {
        return background == other.background && accent == other.accent &&
               text == other.text && muted == other.muted &&
               gradient_start == other.gradient_start && gradient_end == other.gradient_end;
    }
    bool operator!=(const Palette& other) const { return !(*this == other); }
};

constexpr const char* DEFAULT_PALETTE = "stealth";

using PaletteMap = std::map<std::string, Palette>;

// Built-in palettes plus an optional layer of custom ones. Immutable once
// built; with_custom() returns a new registry and leaves this one untouched.
class PaletteRegistry {
public:
    PaletteRegistry();

    // Unknown names resolve to the default palette.
    const Palette& resolve(const std::string& name) const;
    bool contains(const std::string& name) const;

    PaletteRegistry with_custom(const PaletteMap& custom) const;

    std::vector<std::string> names() const;
    std::vector<std::string> custom_names() const;

    static const PaletteRegistry& builtin();
    static const std::vector<std::pair<std::string, Palette>>& builtin_table();

private:
    std::shared_ptr<const PaletteMap> custom_;
};

Result merge_custom(const std::string& name, const std::string& bg, const std::string& accent,
                    const std::string& text, const std::string& muted, Palette& out);

}
