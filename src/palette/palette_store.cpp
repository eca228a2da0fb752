#include "palette/palette_store.hpp"
#include "core/color.hpp"

#include <toml.hpp>

#include <filesystem>
#include <fstream>

namespace forge {

namespace {

const char* const kFields[] = {"bg", "accent", "text", "muted", "gradient_start", "gradient_end"};

Color* field_ptr(Palette& p, int i) {
    switch (i) {
        case 0: return &p.background;
        case 1: return &p.accent;
        case 2: return &p.text;
        case 3: return &p.muted;
        case 4: return &p.gradient_start;
        default: return &p.gradient_end;
    }
}

}

Result load_palette_store(const std::string& path, PaletteMap& out) {
    out.clear();

    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return Result::ok();
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        return Result::fail(ErrorCode::PARSE_ERROR,
                            "Failed to parse palette store " + path + ": " + std::string(e.description()));
    }

    auto* palettes = tbl["palettes"].as_table();
    if (!palettes) {
        return Result::ok();
    }

    for (auto&& [key, node] : *palettes) {
        const std::string name(key.str());
        auto* entry = node.as_table();
        if (!entry) {
            return Result::fail(ErrorCode::PARSE_ERROR, "palettes." + name + " must be a table");
        }

        Palette p;
        for (int i = 0; i < 6; ++i) {
            auto v = (*entry)[kFields[i]].value<std::string>();
            if (!v) {
                return Result::fail(ErrorCode::PARSE_ERROR,
                                    "palettes." + name + " is missing '" + kFields[i] + "'");
            }
            Result r = parse_hex_color(*v, *field_ptr(p, i));
            if (r.failure()) {
                return Result::fail(ErrorCode::INVALID_INPUT, "palettes." + name + "." + kFields[i] + ": " + r.message);
            }
        }
        out[name] = p;
    }

    return Result::ok();
}

Result write_palette_store(const std::string& path, const PaletteMap& palettes) {
    toml::table root_palettes;
    for (const auto& [name, palette] : palettes) {
        Palette copy = palette;
        toml::table entry;
        for (int i = 0; i < 6; ++i) {
            entry.insert_or_assign(kFields[i], to_hex(*field_ptr(copy, i)));
        }
        root_palettes.insert_or_assign(name, std::move(entry));
    }

    toml::table root;
    root.insert_or_assign("palettes", std::move(root_palettes));

    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            return Result::fail(ErrorCode::IO_ERROR, "Cannot create directory for " + path + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Result::fail(ErrorCode::IO_ERROR, "Cannot open palette store for writing: " + path);
    }
    file << root << '\n';
    if (!file.good()) {
        return Result::fail(ErrorCode::IO_ERROR, "Failed to write palette store: " + path);
    }
    return Result::ok();
}

Result save_custom_palette(const std::string& path, const std::string& name, const Palette& palette) {
    PaletteMap palettes;
    Result r = load_palette_store(path, palettes);
    if (r.failure()) return r;

    palettes[name] = palette;
    return write_palette_store(path, palettes);
}

}
