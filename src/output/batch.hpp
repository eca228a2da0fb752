#pragma once

#include "output/dispatcher.hpp"
#include "output/request_builder.hpp"
#include "palette/palette.hpp"
#include <string>
#include <vector>

namespace forge {

constexpr const char* DEFAULT_BATCH_DIR = "batch_banners";
constexpr const char* DEFAULT_EXAMPLE_NAME = "banner_config";

struct BatchRecord {
    size_t index = 0;          // 1-based position in the spec file
    Format format = Format::Vector;
    RequestSpec spec;
    std::string glyph_font;
    std::string font_path;
    Result status;             // parse-time failure, if any
    std::string output_path;   // assigned before rendering
};

struct BatchSpec {
    std::string source;
    std::vector<BatchRecord> records;
};

struct BatchSettings {
    RequestSpec defaults;      // width/height and render defaults from config
    std::string glyph_font = DEFAULT_GLYPH_FONT;
    std::string font_path;
    int64_t max_area = DEFAULT_MAX_CANVAS_AREA;
    int threads = 0;           // 0: OpenMP runtime default
};

struct BatchFailure {
    size_t index;
    std::string text;
    Result result;
};

struct BatchReport {
    std::vector<std::string> written;
    std::vector<BatchFailure> failures;
    std::vector<std::string> warnings;

    bool ok() const { return failures.empty(); }
};

// Reads `[[banner]]` tables. Malformed TOML fails the whole file; a bad
// record only marks that record.
Result load_batch_spec(const std::string& path, const BatchSettings& settings, BatchSpec& out);
Result parse_batch_spec(const std::string& toml_text, const BatchSettings& settings, BatchSpec& out);

// Gives every valid record a unique path under `outdir`.
void assign_output_paths(BatchSpec& spec, const std::string& outdir);

// Renders and writes every valid record, in parallel when OpenMP is enabled.
BatchReport run_batch(BatchSpec spec, const std::string& outdir, const BatchSettings& settings,
                      std::shared_ptr<const RasterBackend> backend, const Result& backend_status,
                      const PaletteRegistry& palettes);

std::string example_batch_spec();

}
