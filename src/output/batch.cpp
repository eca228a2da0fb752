#include "output/batch.hpp"
#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <new>
#include <set>
#include <sstream>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace forge {

namespace {

Result read_string(const toml::table& tbl, const char* key, std::string& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return Result::ok();
    if (auto v = node->value<std::string>()) {
        out = *v;
        return Result::ok();
    }
    return Result::fail(ErrorCode::INVALID_INPUT, std::string("'") + key + "' must be a string");
}

Result read_int(const toml::table& tbl, const char* key, int& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return Result::ok();
    if (auto v = node->value<int64_t>()) {
        if (*v < 1 || *v > MAX_CANVAS_SIDE) {
            return Result::fail(ErrorCode::INVALID_INPUT, std::string("'") + key + "' out of range");
        }
        out = static_cast<int>(*v);
        return Result::ok();
    }
    return Result::fail(ErrorCode::INVALID_INPUT, std::string("'") + key + "' must be an integer");
}

// Case-insensitive filesystems treat "Hello.svg" and "hello.svg" as one file.
std::string fold_case(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

Result parse_record(const toml::table& tbl, const BatchSettings& settings, BatchRecord& rec) {
    rec.spec = settings.defaults;
    rec.glyph_font = settings.glyph_font;
    rec.font_path = settings.font_path;

    std::string kind = "svg";
    Result r = read_string(tbl, "kind", kind);
    if (r.failure()) return r;
    if (kind != "svg" && kind != "png" && kind != "ascii") {
        return Result::fail(ErrorCode::INVALID_INPUT, "unknown kind '" + kind + "'");
    }
    parse_format(kind, rec.format);

    if (!tbl.contains("text")) {
        return Result::fail(ErrorCode::INVALID_INPUT, "missing 'text'");
    }
    if ((r = read_string(tbl, "text", rec.spec.text)).failure()) return r;
    if ((r = read_string(tbl, "subtitle", rec.spec.subtitle)).failure()) return r;
    if ((r = read_string(tbl, "palette", rec.spec.palette)).failure()) return r;
    if ((r = read_string(tbl, "style", rec.spec.style)).failure()) return r;
    if ((r = read_string(tbl, "template", rec.spec.template_name)).failure()) return r;
    if ((r = read_string(tbl, "font", rec.glyph_font)).failure()) return r;
    if ((r = read_string(tbl, "font_path", rec.font_path)).failure()) return r;
    if ((r = read_int(tbl, "width", rec.spec.width)).failure()) return r;
    if ((r = read_int(tbl, "height", rec.spec.height)).failure()) return r;

    if (const toml::node* node = tbl.get("animated")) {
        auto v = node->value<bool>();
        if (!v) return Result::fail(ErrorCode::INVALID_INPUT, "'animated' must be a boolean");
        rec.spec.animated = *v;
    }

    if (const toml::node* node = tbl.get("effects")) {
        const toml::array* arr = node->as_array();
        if (!arr) return Result::fail(ErrorCode::INVALID_INPUT, "'effects' must be an array of strings");
        std::vector<std::string> effects;
        for (const auto& e : *arr) {
            auto v = e.value<std::string>();
            if (!v) return Result::fail(ErrorCode::INVALID_INPUT, "'effects' must be an array of strings");
            effects.push_back(*v);
        }
        rec.spec.effects = std::move(effects);
    }

    if (normalize_text(rec.spec.text).empty()) {
        return Result::fail(ErrorCode::INVALID_INPUT, "empty 'text'");
    }
    return Result::ok();
}

Result parse_table(const toml::table& root, const BatchSettings& settings, BatchSpec& out) {
    const toml::array* banners = root["banner"].as_array();
    if (!banners || banners->empty()) {
        return Result::fail(ErrorCode::INVALID_INPUT, "No [[banner]] entries in " + out.source);
    }

    out.records.clear();
    size_t index = 0;
    for (const auto& node : *banners) {
        BatchRecord rec;
        rec.index = ++index;
        if (const toml::table* tbl = node.as_table()) {
            rec.status = parse_record(*tbl, settings, rec);
        } else {
            rec.status = Result::fail(ErrorCode::INVALID_INPUT, "entry is not a table");
        }
        out.records.push_back(std::move(rec));
    }
    return Result::ok();
}

}

Result load_batch_spec(const std::string& path, const BatchSettings& settings, BatchSpec& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Batch spec not found: " + path);
    }

    out.source = path;
    try {
        toml::table root = toml::parse_file(path);
        return parse_table(root, settings, out);
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << "Failed to parse " << path << ": " << e.description() << " (line " << e.source().begin.line << ")";
        return Result::fail(ErrorCode::PARSE_ERROR, msg.str());
    }
}

Result parse_batch_spec(const std::string& toml_text, const BatchSettings& settings, BatchSpec& out) {
    if (out.source.empty()) out.source = "<string>";
    try {
        toml::table root = toml::parse(toml_text);
        return parse_table(root, settings, out);
    } catch (const toml::parse_error& e) {
        return Result::fail(ErrorCode::PARSE_ERROR, "Failed to parse batch spec: " + std::string(e.description()));
    }
}

void assign_output_paths(BatchSpec& spec, const std::string& outdir) {
    std::set<std::string> taken;
    for (auto& rec : spec.records) {
        if (rec.status.failure()) continue;

        const std::string base = safe_name(normalize_text(rec.spec.text));
        const std::string ext = format_extension(rec.format);
        std::string name = base + "." + ext;
        for (int n = 2; taken.count(fold_case(name)); ++n) {
            name = base + "_" + std::to_string(n) + "." + ext;
        }
        taken.insert(fold_case(name));
        rec.output_path = (std::filesystem::path(outdir) / name).string();
    }
}

BatchReport run_batch(BatchSpec spec, const std::string& outdir, const BatchSettings& settings,
                      std::shared_ptr<const RasterBackend> backend, const Result& backend_status,
                      const PaletteRegistry& palettes) {
    assign_output_paths(spec, outdir);

    const long count = static_cast<long>(spec.records.size());
    std::vector<Result> results(spec.records.size());
    std::vector<std::vector<std::string>> warnings(spec.records.size());

#ifdef HAS_OPENMP
    if (settings.threads > 0) omp_set_num_threads(settings.threads);
    #pragma omp parallel for schedule(dynamic)
#endif
    for (long i = 0; i < count; ++i) {
        const size_t idx = static_cast<size_t>(i);
        const BatchRecord& rec = spec.records[idx];
        if (rec.status.failure()) {
            results[idx] = rec.status;
            continue;
        }

        // Nothing may escape the parallel region; a throw there terminates the process.
        try {
            DispatchOptions options;
            options.glyph_font = rec.glyph_font;
            options.font_path = rec.font_path;
            options.max_area = settings.max_area;
            Dispatcher dispatcher(backend, backend_status, options);

            RenderRequest request = build_request(rec.spec, palettes, &warnings[idx]);
            std::vector<uint8_t> bytes;
            Result r = dispatcher.render(request, rec.format, bytes);
            if (r.success()) {
                r = write_artifact(rec.output_path, bytes);
            }
            results[idx] = r;
        } catch (const std::bad_alloc&) {
            results[idx] = Result::fail(ErrorCode::INVALID_INPUT, "Out of memory rendering this banner");
        } catch (const std::exception& e) {
            results[idx] = Result::fail(ErrorCode::IO_ERROR, std::string("Rendering failed: ") + e.what());
        }
    }

    BatchReport report;
    for (size_t i = 0; i < spec.records.size(); ++i) {
        const BatchRecord& rec = spec.records[i];
        for (const auto& w : warnings[i]) {
            report.warnings.push_back("[" + std::to_string(rec.index) + "] " + w);
        }
        if (results[i].success()) {
            report.written.push_back(rec.output_path);
        } else {
            report.failures.push_back({rec.index, rec.spec.text, results[i]});
        }
    }
    return report;
}

std::string example_batch_spec() {
    return R"(# bannerforge batch spec. Run with: bannerforge batch <file>

[[banner]]
kind = "svg"
text = "BannerForge"
subtitle = "Ultimate Banner Creator"
width = 1200
height = 300
palette = "stealth"
style = "wave"
animated = false

[[banner]]
kind = "png"
text = "Tech Conference 2025"
subtitle = "Innovation & Future"
width = 1920
height = 400
palette = "neon"
effects = ["glow", "shadow"]

[[banner]]
kind = "ascii"
text = "Welcome"
font = "blocks"

[[banner]]
kind = "svg"
text = "Open Source"
subtitle = "Built by the Community"
palette = "forest"
style = "geometric"
animated = true
)";
}

}
