#include "output/request_builder.hpp"
#include "palette/templates.hpp"

namespace forge {

RenderRequest build_request(const RequestSpec& spec, const PaletteRegistry& palettes,
                            std::vector<std::string>* warnings) {
    auto warn = [warnings](const std::string& msg) {
        if (warnings) warnings->push_back(msg);
    };

    TemplateOverrides overrides;
    if (!spec.style.empty()) {
        if (!is_known_style(spec.style)) {
            warn("Unknown style '" + spec.style + "', using " + style_name(Style::Wave));
        }
        overrides.style = parse_style(spec.style);
    }
    if (!spec.palette.empty()) {
        if (!palettes.contains(spec.palette)) {
            warn("Unknown palette '" + spec.palette + "', using " + DEFAULT_PALETTE);
        }
        overrides.palette = spec.palette;
    }
    if (spec.effects) {
        std::vector<std::string> unknown;
        overrides.effects = EffectSet::from_names(*spec.effects, &unknown);
        for (const auto& name : unknown) {
            warn("Unknown effect '" + name + "' ignored");
        }
    }
    if (!spec.template_name.empty() && !find_template(spec.template_name)) {
        warn("Unknown template '" + spec.template_name + "' ignored");
    }

    ResolvedTemplate resolved = resolve_template(spec.template_name, overrides);

    RenderRequest request;
    request.text = spec.text;
    request.subtitle = spec.subtitle;
    request.geometry = {spec.width, spec.height};
    request.palette = palettes.resolve(resolved.palette);
    request.style = resolved.style;
    request.effects = resolved.effects;
    request.animated = spec.animated;
    return request;
}

}
