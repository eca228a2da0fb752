#pragma once

#include "core/request.hpp"
#include "accent/accent_generator.hpp"
#include <string>

namespace forge {

class VectorComposer {
public:
    struct Config {
        std::string title_font_family = "Orbitron,Inter,Arial,sans-serif";
        std::string subtitle_font_family = "Inter,Arial,Helvetica,sans-serif";
        std::string gradient_id = "grad1";
        std::string glow_filter_id = "glow";
        double glow_std_deviation = 2.0;
    };

    VectorComposer() : VectorComposer(Config{}) {}
    explicit VectorComposer(const Config& config);

    // Expects a request that already went through prepare_request().
    std::string compose(const RenderRequest& request) const;

    static std::string shape_markup(const AccentShape& shape);
    static std::string escape_xml(const std::string& text);
    static std::string format_number(double value);

private:
    Config config_;

    void append_defs(std::string& out, const RenderRequest& request) const;
    void append_title(std::string& out, const RenderRequest& request) const;
    void append_subtitle(std::string& out, const RenderRequest& request) const;
};

}
