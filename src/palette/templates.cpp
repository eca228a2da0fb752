#include "palette/templates.hpp"

namespace forge {

const std::vector<Template>& builtin_templates() {
    static const std::vector<Template> templates = {
        {"minimal",      Style::Wave,      "stealth",   {}},
        {"professional", Style::Grid,      "royal",     {Effect::Shadow}},
        {"creative",     Style::Geometric, "sunset",    {Effect::Glow, Effect::Gradient}},
        {"tech",         Style::Wave,      "neon",      {Effect::Glow}},
        {"nature",       Style::Wave,      "forest",    {Effect::Blur}},
        {"cyberpunk",    Style::Particles, "cyberpunk", {Effect::Glow, Effect::Shadow}},
    };
    return templates;
}

const Template* find_template(const std::string& name) {
    for (const auto& t : builtin_templates()) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

ResolvedTemplate resolve_template(const std::string& name, const TemplateOverrides& overrides) {
    ResolvedTemplate resolved;

    if (const Template* t = find_template(name)) {
        resolved.style = t->style;
        resolved.palette = t->palette;
        resolved.effects = t->effects;
    }

    if (overrides.style) resolved.style = *overrides.style;
    if (overrides.palette) resolved.palette = *overrides.palette;
    if (overrides.effects) resolved.effects = *overrides.effects;

    return resolved;
}

}
