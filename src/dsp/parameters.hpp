#pragma once

#include <rack.hpp>
#include <string>
#include <vector>

namespace chromatone {
namespace dsp {

/**
 * Helper class for standardized parameter configuration
 * Provides the parameter types used by the Chromatone panels
 */
class ParameterHelper {
public:
    // Percentage knob stored on the UI scale (0-100), shown with a % unit
    static void configPercent(rack::engine::Module* module, int paramId, const std::string& label, float defaultValue = 0.0f) {
        module->configParam(paramId, 0.0f, 100.0f, defaultValue, label, "%");
    }

    // Hue wheel in degrees
    static void configHue(rack::engine::Module* module, int paramId, const std::string& label = "Hue", float defaultValue = 0.0f) {
        module->configParam(paramId, 0.0f, 360.0f, defaultValue, label, "°");
    }

    // LFO frequency in whole Hz
    static void configLFOFrequency(rack::engine::Module* module, int paramId, const std::string& label,
                                   float minHz = 1.0f, float maxHz = 30.0f, float defaultHz = 15.0f) {
        module->configParam(paramId, minHz, maxHz, defaultHz, label, " Hz");
        module->paramQuantities[paramId]->snapEnabled = true;
    }

    // Time in seconds on a linear scale; the module quantizes to its own step
    static void configSeconds(rack::engine::Module* module, int paramId, const std::string& label,
                              float minSeconds, float maxSeconds, float defaultSeconds) {
        module->configParam(paramId, minSeconds, maxSeconds, defaultSeconds, label, " s");
    }

    // Latching on/off button
    static void configToggle(rack::engine::Module* module, int paramId, const std::string& label, bool defaultValue = false) {
        module->configSwitch(paramId, 0.0f, 1.0f, defaultValue ? 1.0f : 0.0f, label, {"Off", "On"});
    }

    /**
     * Parameter value utilities
     */

    // Knob value plus a CV contribution, clamped to the knob range
    static float getClampedParameterValue(rack::engine::Module* module, int paramId,
                                          float minValue, float maxValue,
                                          rack::engine::Input* cvInput = nullptr, float cvScale = 0.1f) {
        float value = module->params[paramId].getValue();
        if (cvInput && cvInput->isConnected()) {
            value += cvInput->getVoltage() * cvScale;
        }
        return rack::math::clamp(value, minValue, maxValue);
    }

    /**
     * Common I/O configurations
     */

    static void configAudioOutput(rack::engine::Module* module, int outputId, const std::string& label) {
        module->configOutput(outputId, label);
    }

    static void configCVInput(rack::engine::Module* module, int inputId, const std::string& label) {
        module->configInput(inputId, label);
    }
};

/**
 * Common parameter configurations as constants for consistency
 */
namespace StandardParams {
    // UI percentage scale
    constexpr float PERCENT_MAX = 100.0f;

    // Common CV scaling factors
    constexpr float CV_SCALE_HUE = 36.0f;      // 10V → 360°
    constexpr float CV_SCALE_PERCENT = 10.0f;  // 10V → 100%

    // Audio output level for a full-scale signal
    constexpr float AUDIO_VOLTAGE = 5.0f;
}

} // namespace dsp
} // namespace chromatone
