#pragma once

#include <rack.hpp>
#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace rack;

namespace chromatone {
namespace ui {

/**
 * Layout and positioning utilities for the Chromatone panels
 */
class LayoutHelper {
public:
    /**
     * Lightweight SVG panel parser to position controls by element id
     * Usage:
     *   PanelSVGParser p(asset::plugin(pluginInstance, "res/panels/Prism.svg"));
     *   Vec knobPos = p.centerPx("prism-hue", 30.0f, 24.0f); // mm defaults
     */
    class PanelSVGParser {
    private:
        std::string svg;

        static std::string readFile(const std::string& path) {
            std::ifstream f(path);
            if (!f) return {};
            std::stringstream ss; ss << f.rdbuf();
            return ss.str();
        }

        // Full tag string containing id="..."
        std::string findTag(const std::string& id) const {
            if (svg.empty()) return {};
            std::string needle = std::string("id=\"") + id + "\"";
            size_t pos = svg.find(needle);
            if (pos == std::string::npos) return {};
            size_t start = svg.rfind('<', pos);
            size_t end = svg.find('>', pos);
            if (start == std::string::npos || end == std::string::npos || end <= start) return {};
            return svg.substr(start, end - start + 1);
        }

        static float getAttr(const std::string& tag, const std::string& key, float defVal) {
            if (tag.empty()) return defVal;
            // Leading space keeps "x" from matching inside "cx"
            std::string k = " " + key + "=\"";
            size_t p = tag.find(k);
            if (p == std::string::npos) return defVal;
            p += k.size();
            size_t q = tag.find('"', p);
            if (q == std::string::npos) return defVal;
            try {
                return std::stof(tag.substr(p, q - p));
            } catch (const std::logic_error&) {
                return defVal;
            }
        }

    public:
        explicit PanelSVGParser(const std::string& svgPath) : svg(readFile(svgPath)) {}

        bool loaded() const { return !svg.empty(); }

        // Element center in millimeters (circle cx/cy or rect x+width/2, y+height/2)
        Vec centerMm(const std::string& id, float defx, float defy) const {
            std::string tag = findTag(id);
            if (tag.find("<rect") != std::string::npos) {
                float rx = getAttr(tag, "x", defx);
                float ry = getAttr(tag, "y", defy);
                float rw = getAttr(tag, "width", 0.0f);
                float rh = getAttr(tag, "height", 0.0f);
                return Vec(rx + rw * 0.5f, ry + rh * 0.5f);
            }
            return Vec(getAttr(tag, "cx", defx), getAttr(tag, "cy", defy));
        }

        Vec centerPx(const std::string& id, float defx, float defy) const {
            return rack::mm2px(centerMm(id, defx, defy));
        }
    };

    /**
     * Standard screw positions
     */
    class ScrewPositions {
    public:
        static Vec topLeft() {
            return Vec(RACK_GRID_WIDTH, 0);
        }

        static Vec topRight(float moduleWidth) {
            return Vec(moduleWidth - 2 * RACK_GRID_WIDTH, 0);
        }

        static Vec bottomLeft() {
            return Vec(RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH);
        }

        static Vec bottomRight(float moduleWidth) {
            return Vec(moduleWidth - 2 * RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH);
        }

        template <typename ScrewWidget = ScrewSilver>
        static void addStandardScrews(ModuleWidget* widget, float moduleWidth) {
            widget->addChild(createWidget<ScrewWidget>(topLeft()));
            widget->addChild(createWidget<ScrewWidget>(topRight(moduleWidth)));
            widget->addChild(createWidget<ScrewWidget>(bottomLeft()));
            widget->addChild(createWidget<ScrewWidget>(bottomRight(moduleWidth)));
        }
    };
};

} // namespace ui
} // namespace chromatone
