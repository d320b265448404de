#include "plugin.hpp"
#include "prism/sound_manager.hpp"

#include <atomic>
#include <cmath>

struct Prism : Module {
    enum ParamIds {
        HUE_PARAM,
        SATURATION_PARAM,
        LIGHTNESS_PARAM,
        VOLUME_PARAM,
        REVERB_PARAM,
        WOBBLE_PARAM,
        WOBBLE_RATE_PARAM,
        DURATION_PARAM,
        CHORDS_PARAM,
        PLAY_PARAM,
        CYCLE_PARAM,
        NUM_PARAMS
    };
    enum InputIds {
        HUE_INPUT,
        SATURATION_INPUT,
        LIGHTNESS_INPUT,
        NUM_INPUTS
    };
    enum OutputIds {
        AUDIO_OUTPUT,
        NUM_OUTPUTS
    };
    enum LightIds {
        PLAY_LIGHT,
        CHORDS_LIGHT,
        CYCLE_LIGHT,
        ENUMS(COLOR_LIGHT, 3),
        NUM_LIGHTS
    };

    // Control-rate state
    static constexpr int CONTROL_DIVISION = 64;
    static constexpr float CHANGE_EPSILON = 1e-4f;

    chromatone::prism::SoundManager engine;
    chromatone::prism::ColorCycler cycler;
    rack::dsp::ClockDivider controlDivider;

    // Last values handed to the engine; NAN forces the first update
    float appliedHue = NAN;
    float appliedSaturation = NAN;
    float appliedLightness = NAN;
    float appliedVolume = NAN;
    float appliedReverb = NAN;
    float appliedWobble = NAN;
    float appliedWobbleRate = NAN;
    float appliedDuration = NAN;
    bool appliedChords = false;
    bool appliedPlay = false;

    // Set from the context menu, consumed on the engine thread
    std::atomic<bool> clearDriftRequested{false};

    // DC blocking state
    float dcLastIn = 0.f;
    float dcLastOut = 0.f;

    Prism() {
        config(NUM_PARAMS, NUM_INPUTS, NUM_OUTPUTS, NUM_LIGHTS);

        using chromatone::ParameterHelper;
        using chromatone::prism::Limits;
        chromatone::prism::SoundSettings defaults;

        ParameterHelper::configHue(this, HUE_PARAM, "Hue", defaults.hue);
        ParameterHelper::configPercent(this, SATURATION_PARAM, "Saturation", defaults.saturation);
        ParameterHelper::configPercent(this, LIGHTNESS_PARAM, "Lightness", defaults.lightness);
        ParameterHelper::configPercent(this, VOLUME_PARAM, "Volume", defaults.volume * 100.f);
        ParameterHelper::configPercent(this, REVERB_PARAM, "Reverb", defaults.reverbIntensity * 100.f);
        ParameterHelper::configPercent(this, WOBBLE_PARAM, "Wobble", defaults.lfoIntensity * 100.f);
        ParameterHelper::configLFOFrequency(this, WOBBLE_RATE_PARAM, "Wobble rate",
            Limits::LFO_FREQUENCY_MIN, Limits::LFO_FREQUENCY_MAX, defaults.lfoFrequency);
        ParameterHelper::configSeconds(this, DURATION_PARAM, "Chord duration",
            Limits::CHORD_DURATION_MIN, Limits::CHORD_DURATION_MAX, defaults.chordDuration);
        ParameterHelper::configToggle(this, CHORDS_PARAM, "Chord progressions");
        ParameterHelper::configToggle(this, PLAY_PARAM, "Play");
        ParameterHelper::configToggle(this, CYCLE_PARAM, "Colour cycle");

        ParameterHelper::configCVInput(this, HUE_INPUT, "Hue CV (10 V = 360°)");
        ParameterHelper::configCVInput(this, SATURATION_INPUT, "Saturation CV");
        ParameterHelper::configCVInput(this, LIGHTNESS_INPUT, "Lightness CV");
        ParameterHelper::configAudioOutput(this, AUDIO_OUTPUT, "Audio");

        controlDivider.setDivision(CONTROL_DIVISION);

        chromatone::prism::AssetPaths paths;
        paths.squareWave = asset::plugin(pluginInstance, "res/waves/square.json");
        paths.sawtoothWave = asset::plugin(pluginInstance, "res/waves/sawtooth.json");
        paths.impulseResponse = asset::plugin(pluginInstance, "res/impulses/hall.wav");
        engine.loadAssets(paths);
    }

    void onSampleRateChange(const SampleRateChangeEvent& e) override {
        engine.setSampleRate(e.sampleRate);
    }

    void onReset(const ResetEvent& e) override {
        Module::onReset(e);
        cycler.reset();
    }

    void process(const ProcessArgs& args) override {
        if (controlDivider.process()) {
            updateControls(args.sampleTime * CONTROL_DIVISION);
        }

        float sample = engine.process() * chromatone::dsp::StandardParams::AUDIO_VOLTAGE;
        sample = chromatone::AudioProcessor::processDCBlock(sample, dcLastIn, dcLastOut);
        outputs[AUDIO_OUTPUT].setVoltage(chromatone::AudioProcessor::softLimit(sample));
    }

    json_t* dataToJson() override {
        json_t* rootJ = json_object();
        json_object_set_new(rootJ, "cycleHue", json_real(cycler.getHueOffset()));
        json_object_set_new(rootJ, "cycleSaturation", json_real(cycler.getSaturationOffset()));
        json_object_set_new(rootJ, "cycleTime", json_real(cycler.getWaveTime()));
        return rootJ;
    }

    void dataFromJson(json_t* rootJ) override {
        json_t* hueJ = json_object_get(rootJ, "cycleHue");
        json_t* saturationJ = json_object_get(rootJ, "cycleSaturation");
        json_t* timeJ = json_object_get(rootJ, "cycleTime");
        if (hueJ && saturationJ) {
            cycler.restore(json_number_value(hueJ), json_number_value(saturationJ),
                timeJ ? json_number_value(timeJ) : 0.f);
        }
    }

private:
    static bool changed(float value, float applied) {
        return std::isnan(applied) || std::fabs(value - applied) > CHANGE_EPSILON;
    }

    void updateControls(float deltaTime) {
        using chromatone::dsp::StandardParams::CV_SCALE_HUE;
        using chromatone::dsp::StandardParams::CV_SCALE_PERCENT;
        using chromatone::dsp::StandardParams::PERCENT_MAX;

        if (clearDriftRequested.exchange(false)) {
            cycler.reset();
        }
        bool cycling = params[CYCLE_PARAM].getValue() > 0.5f;
        if (cycling) {
            cycler.step(deltaTime);
        }

        // Colour: knob + CV + accumulated drift
        float hue = params[HUE_PARAM].getValue() + inputs[HUE_INPUT].getVoltage() * CV_SCALE_HUE + cycler.getHueOffset();
        hue = chromatone::prism::normalizeHue(hue);
        float saturation = chromatone::ParameterHelper::getClampedParameterValue(this, SATURATION_PARAM,
            -PERCENT_MAX, 2.f * PERCENT_MAX, &inputs[SATURATION_INPUT], CV_SCALE_PERCENT);
        saturation = rack::math::clamp(saturation + cycler.getSaturationOffset(), 0.f, PERCENT_MAX);
        float lightness = chromatone::ParameterHelper::getClampedParameterValue(this, LIGHTNESS_PARAM,
            0.f, PERCENT_MAX, &inputs[LIGHTNESS_INPUT], CV_SCALE_PERCENT);

        if (changed(hue, appliedHue)) {
            engine.changeHue(hue);
            appliedHue = hue;
        }
        if (changed(saturation, appliedSaturation)) {
            engine.changeSaturation(saturation);
            appliedSaturation = saturation;
        }
        if (changed(lightness, appliedLightness)) {
            engine.changeLightness(lightness);
            appliedLightness = lightness;
        }

        // Mix controls arrive on the 0-100 panel scale
        float volume = params[VOLUME_PARAM].getValue();
        if (changed(volume, appliedVolume)) {
            engine.changeVolume(volume / PERCENT_MAX);
            appliedVolume = volume;
        }
        float reverb = params[REVERB_PARAM].getValue();
        if (changed(reverb, appliedReverb)) {
            engine.changeReverbIntensity(reverb / PERCENT_MAX);
            appliedReverb = reverb;
        }
        float wobble = params[WOBBLE_PARAM].getValue();
        if (changed(wobble, appliedWobble)) {
            engine.changeLfoIntensity(wobble / PERCENT_MAX);
            appliedWobble = wobble;
        }
        float wobbleRate = params[WOBBLE_RATE_PARAM].getValue();
        if (changed(wobbleRate, appliedWobbleRate)) {
            engine.changeLfoFrequency(wobbleRate);
            appliedWobbleRate = wobbleRate;
        }

        // Quarter-second steps
        float step = chromatone::prism::Limits::CHORD_DURATION_STEP;
        float duration = std::round(params[DURATION_PARAM].getValue() / step) * step;
        if (changed(duration, appliedDuration)) {
            engine.changeChordDuration(duration);
            appliedDuration = duration;
        }

        bool chords = params[CHORDS_PARAM].getValue() > 0.5f;
        if (chords != appliedChords) {
            engine.changeChordProgression(chords);
            appliedChords = chords;
        }
        bool play = params[PLAY_PARAM].getValue() > 0.5f;
        if (play != appliedPlay) {
            if (play) engine.play();
            else engine.pause();
            appliedPlay = play;
        }

        lights[PLAY_LIGHT].setBrightness(engine.isPlaying() ? 1.f : 0.f);
        lights[CHORDS_LIGHT].setBrightness(chords ? 1.f : 0.f);
        lights[CYCLE_LIGHT].setBrightness(cycling ? 1.f : 0.f);

        float r, g, b;
        chromatone::prism::hslToRgb(hue, saturation, lightness, r, g, b);
        lights[COLOR_LIGHT + 0].setBrightness(r);
        lights[COLOR_LIGHT + 1].setBrightness(g);
        lights[COLOR_LIGHT + 2].setBrightness(b);
    }
};

struct PrismWidget : ModuleWidget {
    PrismWidget(Prism* module) {
        setModule(module);
        std::string svgPath = asset::plugin(pluginInstance, "res/panels/Prism.svg");
        setPanel(createPanel(svgPath));

        using chromatone::LayoutHelper;
        LayoutHelper::ScrewPositions::addStandardScrews<ScrewSilver>(this, box.size.x);

        LayoutHelper::PanelSVGParser parser(svgPath);
        auto centerPx = [&](const std::string& id, float defx, float defy) {
            return parser.centerPx(id, defx, defy);
        };

        // Colour section
        addParam(createParamCentered<RoundHugeBlackKnob>(centerPx("prism-hue", 30.48f, 26.f), module, Prism::HUE_PARAM));
        addChild(createLightCentered<LargeLight<RedGreenBlueLight>>(centerPx("prism-color-light", 30.48f, 12.f), module, Prism::COLOR_LIGHT));
        addParam(createParamCentered<RoundLargeBlackKnob>(centerPx("prism-saturation", 15.24f, 46.f), module, Prism::SATURATION_PARAM));
        addParam(createParamCentered<RoundLargeBlackKnob>(centerPx("prism-lightness", 45.72f, 46.f), module, Prism::LIGHTNESS_PARAM));

        addInput(createInputCentered<PJ301MPort>(centerPx("prism-hue-cv", 30.48f, 46.f), module, Prism::HUE_INPUT));
        addInput(createInputCentered<PJ301MPort>(centerPx("prism-saturation-cv", 15.24f, 58.f), module, Prism::SATURATION_INPUT));
        addInput(createInputCentered<PJ301MPort>(centerPx("prism-lightness-cv", 45.72f, 58.f), module, Prism::LIGHTNESS_INPUT));

        // Mix section
        addParam(createParamCentered<RoundBlackKnob>(centerPx("prism-wobble", 12.f, 74.f), module, Prism::WOBBLE_PARAM));
        addParam(createParamCentered<RoundBlackKnob>(centerPx("prism-wobble-rate", 24.32f, 74.f), module, Prism::WOBBLE_RATE_PARAM));
        addParam(createParamCentered<RoundBlackKnob>(centerPx("prism-reverb", 36.64f, 74.f), module, Prism::REVERB_PARAM));
        addParam(createParamCentered<RoundBlackKnob>(centerPx("prism-volume", 48.96f, 74.f), module, Prism::VOLUME_PARAM));

        // Chord section
        addParam(createParamCentered<RoundBlackKnob>(centerPx("prism-duration", 45.72f, 90.f), module, Prism::DURATION_PARAM));
        addParam(createLightParamCentered<VCVLightLatch<MediumSimpleLight<WhiteLight>>>(
            centerPx("prism-chords", 15.24f, 90.f), module, Prism::CHORDS_PARAM, Prism::CHORDS_LIGHT));
        addParam(createLightParamCentered<VCVLightLatch<MediumSimpleLight<WhiteLight>>>(
            centerPx("prism-cycle", 30.48f, 90.f), module, Prism::CYCLE_PARAM, Prism::CYCLE_LIGHT));

        // Transport and output
        addParam(createLightParamCentered<VCVLightLatch<MediumSimpleLight<GreenLight>>>(
            centerPx("prism-play", 15.24f, 110.f), module, Prism::PLAY_PARAM, Prism::PLAY_LIGHT));
        addOutput(createOutputCentered<PJ301MPort>(centerPx("prism-output", 45.72f, 110.f), module, Prism::AUDIO_OUTPUT));
    }

    void appendContextMenu(Menu* menu) override {
        Prism* module = dynamic_cast<Prism*>(this->module);
        if (!module) return;

        menu->addChild(new MenuSeparator);
        menu->addChild(createMenuItem("Clear colour drift", "", [=]() {
            module->clearDriftRequested = true;
        }));
    }
};

Model* modelPrism = createModel<Prism, PrismWidget>("Prism");
