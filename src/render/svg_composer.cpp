#include "render/svg_composer.hpp"
#include "core/color.hpp"

#include <cmath>
#include <locale>
#include <sstream>
#include <iomanip>

namespace forge {

VectorComposer::VectorComposer(const Config& config) : config_(config) {}

std::string VectorComposer::format_number(double value) {
    if (std::abs(value) < 0.005) value = 0.0;

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::fixed << std::setprecision(2) << value;
    std::string s = ss.str();

    size_t dot = s.find('.');
    if (dot != std::string::npos) {
        size_t last = s.find_last_not_of('0');
        if (last == dot) {
            s.erase(dot);
        } else {
            s.erase(last + 1);
        }
    }
    return s;
}

std::string VectorComposer::escape_xml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string VectorComposer::shape_markup(const AccentShape& shape) {
    const std::string color = to_hex(shape.color);
    const std::string opacity = format_number(shape.opacity);
    std::string out;

    switch (shape.kind) {
        case AccentKind::Path:
            out = "<path d=\"M" + format_number(shape.start.x) + " " + format_number(shape.start.y) +
                  " C " + format_number(shape.control1.x) + " " + format_number(shape.control1.y) +
                  ", " + format_number(shape.control2.x) + " " + format_number(shape.control2.y) +
                  ", " + format_number(shape.end.x) + " " + format_number(shape.end.y) +
                  " L " + format_number(shape.bottom_right.x) + " " + format_number(shape.bottom_right.y) +
                  " L " + format_number(shape.bottom_left.x) + " " + format_number(shape.bottom_left.y) +
                  " Z\" fill=\"" + color + "\" opacity=\"" + opacity + "\"/>";
            break;
        case AccentKind::Circle:
            out = "<circle cx=\"" + format_number(shape.center.x) + "\" cy=\"" + format_number(shape.center.y) +
                  "\" r=\"" + format_number(shape.radius) + "\" fill=\"" + color +
                  "\" opacity=\"" + opacity + "\"/>";
            break;
        case AccentKind::Rect:
            out = "<rect x=\"" + format_number(shape.origin.x) + "\" y=\"" + format_number(shape.origin.y) +
                  "\" width=\"" + format_number(shape.width) + "\" height=\"" + format_number(shape.height) +
                  "\" fill=\"" + color + "\" opacity=\"" + opacity + "\"";
            if (shape.rotation_deg != 0.0) {
                out += " transform=\"rotate(" + format_number(shape.rotation_deg) + " " +
                       format_number(shape.pivot.x) + " " + format_number(shape.pivot.y) + ")\"";
            }
            out += "/>";
            break;
        case AccentKind::Line:
            out = "<line x1=\"" + format_number(shape.from.x) + "\" y1=\"" + format_number(shape.from.y) +
                  "\" x2=\"" + format_number(shape.to.x) + "\" y2=\"" + format_number(shape.to.y) +
                  "\" stroke=\"" + color + "\" opacity=\"" + opacity + "\"/>";
            break;
    }
    return out;
}

void VectorComposer::append_defs(std::string& out, const RenderRequest& request) const {
    const std::string start = to_hex(request.palette.gradient_start);
    const std::string end = to_hex(request.palette.gradient_end);

    out += "  <defs>\n";
    out += "    <linearGradient id=\"" + config_.gradient_id + "\" x1=\"0%\" y1=\"0%\" x2=\"100%\" y2=\"100%\">\n";
    if (request.animated) {
        out += "      <stop offset=\"0%\" stop-color=\"" + start + "\" stop-opacity=\"1\">\n";
        out += "        <animate attributeName=\"stop-color\" values=\"" + start + ";" + end + ";" + start +
               "\" dur=\"3s\" repeatCount=\"indefinite\"/>\n";
        out += "      </stop>\n";
        out += "      <stop offset=\"100%\" stop-color=\"" + end + "\" stop-opacity=\"1\">\n";
        out += "        <animate attributeName=\"stop-color\" values=\"" + end + ";" + start + ";" + end +
               "\" dur=\"3s\" repeatCount=\"indefinite\"/>\n";
        out += "      </stop>\n";
    } else {
        out += "      <stop offset=\"0%\" stop-color=\"" + start + "\" stop-opacity=\"1\"/>\n";
        out += "      <stop offset=\"100%\" stop-color=\"" + end + "\" stop-opacity=\"1\"/>\n";
    }
    out += "    </linearGradient>\n";

    if (request.style == Style::Glow && !request.animated) {
        out += "    <filter id=\"" + config_.glow_filter_id + "\">\n";
        out += "      <feGaussianBlur stdDeviation=\"" + format_number(config_.glow_std_deviation) +
               "\" result=\"coloredBlur\"/>\n";
        out += "      <feMerge>\n";
        out += "        <feMergeNode in=\"coloredBlur\"/>\n";
        out += "        <feMergeNode in=\"SourceGraphic\"/>\n";
        out += "      </feMerge>\n";
        out += "    </filter>\n";
    }
    out += "  </defs>\n";
}

void VectorComposer::append_title(std::string& out, const RenderRequest& request) const {
    const int w = request.geometry.width;
    const int h = request.geometry.height;
    const int x = w / 2;
    const int y = static_cast<int>(h * 0.55);
    const int font_size = static_cast<int>(h * 0.2);

    out += "  <text x=\"" + std::to_string(x) + "\" y=\"" + std::to_string(y) +
           "\" font-family=\"" + config_.title_font_family + "\" font-size=\"" + std::to_string(font_size) +
           "\" font-weight=\"700\" text-anchor=\"middle\"";

    if (request.animated) {
        out += " fill=\"url(#" + config_.gradient_id + ")\">";
        out += escape_xml(request.text);
        out += "<animate attributeName=\"opacity\" values=\"0.8;1;0.8\" dur=\"2s\" repeatCount=\"indefinite\"/>";
        out += "</text>\n";
        return;
    }

    out += " fill=\"" + to_hex(request.palette.text) + "\"";
    if (request.style == Style::Glow) {
        out += " filter=\"url(#" + config_.glow_filter_id + ")\"";
    }
    out += ">" + escape_xml(request.text) + "</text>\n";
}

void VectorComposer::append_subtitle(std::string& out, const RenderRequest& request) const {
    if (!request.has_subtitle()) return;

    const int w = request.geometry.width;
    const int h = request.geometry.height;
    out += "  <text x=\"" + std::to_string(w / 2) + "\" y=\"" + std::to_string(static_cast<int>(h * 0.78)) +
           "\" font-family=\"" + config_.subtitle_font_family + "\" font-size=\"" +
           std::to_string(static_cast<int>(h * 0.075)) + "\" fill=\"" + to_hex(request.palette.muted) +
           "\" text-anchor=\"middle\">" + escape_xml(request.subtitle) + "</text>\n";
}

std::string VectorComposer::compose(const RenderRequest& request) const {
    const int w = request.geometry.width;
    const int h = request.geometry.height;
    const std::string ws = std::to_string(w);
    const std::string hs = std::to_string(h);

    std::string out;
    out.reserve(4096);
    out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<svg width=\"" + ws + "\" height=\"" + hs + "\" viewBox=\"0 0 " + ws + " " + hs +
           "\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"" +
           escape_xml(request.text) + "\">\n";

    append_defs(out, request);

    out += "  <rect width=\"100%\" height=\"100%\" fill=\"" + to_hex(request.palette.background) + "\"/>\n";

    for (const AccentShape& shape : generate_accent(request.style, w, h, request.palette.accent)) {
        out += "  " + shape_markup(shape) + "\n";
    }

    append_title(out, request);
    append_subtitle(out, request);

    out += "</svg>\n";
    return out;
}

}
