#pragma once
// Chromatone Utilities
// Single include for the DSP, graph and layout helpers used by the modules

// DSP Utilities
#include "dsp/parameters.hpp"
#include "dsp/oscillators.hpp"
#include "dsp/audio.hpp"
#include "dsp/convolution.hpp"

// UI Utilities
#include "ui/layout.hpp"

namespace chromatone {
    using ParameterHelper = dsp::ParameterHelper;
    using AudioProcessor = dsp::AudioProcessor;
    using LayoutHelper = ui::LayoutHelper;
}
