#pragma once

#include "core/request.hpp"
#include <optional>
#include <string>
#include <vector>

namespace forge {

struct Template {
    std::string name;
    Style style;
    std::string palette;
    EffectSet effects;
};

struct TemplateOverrides {
    std::optional<Style> style;
    std::optional<std::string> palette;
    std::optional<EffectSet> effects;
};

struct ResolvedTemplate {
    Style style = Style::Wave;
    std::string palette = DEFAULT_PALETTE;
    EffectSet effects;
};

const std::vector<Template>& builtin_templates();
const Template* find_template(const std::string& name);

// explicit override > template value > default. Unknown or empty names behave
// as if no template was requested.
ResolvedTemplate resolve_template(const std::string& name, const TemplateOverrides& overrides);

}
