#pragma once

#include "palette/palette.hpp"
#include <string>

namespace forge {

constexpr const char* DEFAULT_PALETTE_FILE = "custom_palettes.toml";

// A missing file is an empty store, not an error.
Result load_palette_store(const std::string& path, PaletteMap& out);

// Writes the whole mapping, replacing the file.
Result write_palette_store(const std::string& path, const PaletteMap& palettes);

// Load, insert or overwrite `name`, write back.
Result save_custom_palette(const std::string& path, const std::string& name, const Palette& palette);

}
