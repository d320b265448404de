// Prism: sound engine facade
#include <rack.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include "sound_manager.hpp"

namespace chromatone { namespace prism {

SoundManager::SoundManager(const SoundSettings& settings)
    : settings(settings), scheduler(settings) {
    this->settings.chordDuration = scheduler.getChordDuration();
}

SoundManager::~SoundManager() {
    timer.stop();

    std::vector<std::future<void>> loads;
    {
        std::lock_guard<std::mutex> lock(mutex);
        loads.swap(pendingLoads);
    }
    for (std::future<void>& load : loads) {
        try {
            load.get();
        }
        catch (const std::exception& e) {
            WARN("Chromatone: asset load failed: %s", e.what());
        }
    }
}

void SoundManager::play() {
    bool startTimer = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!graph) {
            graph::GraphOptions options;
            options.sampleRate = sampleRate;
            options.volume = settings.volume;
            options.lfoFrequency = settings.lfoFrequency;
            options.lfoIntensity = settings.lfoIntensity;
            options.initialFrequency = lightnessToFrequency(settings.lightness, settings.lightnessSemitoneBound);
            graph = graph::buildSignalGraph(options);
            if (convolver) {
                graph->reverb->setConvolver(convolver);
            }
            applyWaveTables();
            applyAll(graph->getCurrentTime());
        }
        if (!playing.exchange(true)) {
            INFO("Chromatone: playback started at %.3f s", graph->getCurrentTime());
        }
        startTimer = scheduler.isEnabled();
    }
    if (startTimer) {
        startScheduler();
    }
}

void SoundManager::pause() {
    if (playing.exchange(false)) {
        INFO("Chromatone: playback paused");
    }
}

void SoundManager::changeHue(float hue) {
    if (!std::isfinite(hue)) return;
    std::lock_guard<std::mutex> lock(mutex);
    settings.hue = normalizeHue(hue);
    if (graph) applyHue(graph->getCurrentTime());
}

void SoundManager::changeSaturation(float saturation) {
    if (!std::isfinite(saturation)) return;
    std::lock_guard<std::mutex> lock(mutex);
    settings.saturation = rack::math::clamp(saturation, 0.f, 100.f);
    if (graph) applySaturation(graph->getCurrentTime());
}

void SoundManager::changeLightness(float lightness) {
    if (!std::isfinite(lightness)) return;
    std::lock_guard<std::mutex> lock(mutex);
    settings.lightness = rack::math::clamp(lightness, 0.f, 100.f);
    if (graph) applyLightness(graph->getCurrentTime());
}

void SoundManager::changeVolume(float volume) {
    if (!std::isfinite(volume)) return;
    std::lock_guard<std::mutex> lock(mutex);
    settings.volume = rack::math::clamp(volume, 0.f, 1.f);
    if (graph) applyVolume(graph->getCurrentTime());
}

void SoundManager::changeReverbIntensity(float intensity) {
    if (!std::isfinite(intensity)) return;
    std::lock_guard<std::mutex> lock(mutex);
    settings.reverbIntensity = rack::math::clamp(intensity, 0.f, 1.f);
    if (graph) applyReverb(graph->getCurrentTime());
}

void SoundManager::changeLfoIntensity(float intensity) {
    if (!std::isfinite(intensity)) return;
    std::lock_guard<std::mutex> lock(mutex);
    settings.lfoIntensity = rack::math::clamp(intensity, 0.f, 1.f);
    if (graph) applyLfoIntensity(graph->getCurrentTime());
}

void SoundManager::changeLfoFrequency(float frequency) {
    if (!std::isfinite(frequency)) return;
    std::lock_guard<std::mutex> lock(mutex);
    settings.lfoFrequency = rack::math::clamp(frequency, Limits::LFO_FREQUENCY_MIN, Limits::LFO_FREQUENCY_MAX);
    if (graph) applyLfoFrequency(graph->getCurrentTime());
}

void SoundManager::changeChordProgression(bool enabled) {
    bool startTimer = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (enabled) {
            scheduler.enable();
            startTimer = (bool)graph;
        }
        else {
            scheduler.disable();
            // Pending chords must not fire after this point
            if (graph) ChordScheduler::resetVoices(*graph, graph->getCurrentTime());
        }
    }
    if (startTimer) {
        startScheduler();
    }
}

void SoundManager::changeChordDuration(float seconds) {
    if (!std::isfinite(seconds)) return;
    std::lock_guard<std::mutex> lock(mutex);
    scheduler.setChordDuration(seconds);
    settings.chordDuration = scheduler.getChordDuration();
}

void SoundManager::setSampleRate(float rate) {
    if (!std::isfinite(rate) || rate <= 0.f) return;
    std::lock_guard<std::mutex> lock(mutex);
    if (rate == sampleRate) return;
    sampleRate = rate;
    if (graph) graph->setSampleRate(rate);
    if (!impulse) return;

    // Re-partition off the engine thread; the old convolver plays until the new one is ready
    std::shared_ptr<const ImpulseResponse> ir = impulse;
    reapFinishedLoads();
    pendingLoads.push_back(std::async(std::launch::async, [this, ir, rate]() {
        installConvolver(prepareConvolver(*ir, rate), rate);
    }));
}

float SoundManager::process() {
    if (!isPlaying()) {
        return 0.f;
    }
    if (quantumIndex >= graph::RENDER_QUANTUM) {
        renderQuantum(quantum);
        quantumIndex = 0;
    }
    return quantum[quantumIndex++];
}

void SoundManager::renderQuantum(float* out) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!graph) {
        std::fill(out, out + graph::RENDER_QUANTUM, 0.f);
        return;
    }
    graph->render(out);
}

bool SoundManager::pollScheduler() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!graph) {
        return false;
    }
    return scheduler.check(*graph, graph->getCurrentTime());
}

void SoundManager::loadAssets(const AssetPaths& paths) {
    std::vector<std::future<void>> loads;
    if (!paths.squareWave.empty()) {
        std::string path = paths.squareWave;
        loads.push_back(std::async(std::launch::async, [this, path]() {
            WaveTable table;
            if (loadWaveTableFromFile(path, table)) applyWaveTable(dsp::Waveform::SQUARE, table);
        }));
    }
    if (!paths.sawtoothWave.empty()) {
        std::string path = paths.sawtoothWave;
        loads.push_back(std::async(std::launch::async, [this, path]() {
            WaveTable table;
            if (loadWaveTableFromFile(path, table)) applyWaveTable(dsp::Waveform::SAWTOOTH, table);
        }));
    }
    if (!paths.impulseResponse.empty()) {
        std::string path = paths.impulseResponse;
        loads.push_back(std::async(std::launch::async, [this, path]() {
            ImpulseResponse ir;
            if (loadImpulseResponseFromFile(path, ir)) applyImpulseResponse(ir);
        }));
    }

    std::lock_guard<std::mutex> lock(mutex);
    reapFinishedLoads();
    for (std::future<void>& load : loads) {
        pendingLoads.push_back(std::move(load));
    }
}

void SoundManager::reapFinishedLoads() {
    auto finished = [](std::future<void>& load) {
        return load.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    };
    for (std::future<void>& load : pendingLoads) {
        if (!finished(load)) continue;
        try {
            load.get();
        }
        catch (const std::exception& e) {
            WARN("Chromatone: asset load failed: %s", e.what());
        }
    }
    pendingLoads.erase(std::remove_if(pendingLoads.begin(), pendingLoads.end(),
        [](const std::future<void>& load) { return !load.valid(); }), pendingLoads.end());
}

void SoundManager::applyWaveTable(dsp::Waveform waveform, const WaveTable& table) {
    if (waveform == dsp::Waveform::SINE) {
        return;
    }
    std::shared_ptr<const dsp::PeriodicWave> wave = std::make_shared<dsp::PeriodicWave>(table.real, table.imag);
    if (wave->empty()) {
        WARN("Chromatone: ignoring empty wave table");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (waveform == dsp::Waveform::SQUARE) squareWave = wave;
    else sawtoothWave = wave;
    if (graph) applyWaveTables();
    INFO("Chromatone: %s wave table applied (%d harmonics)",
        waveform == dsp::Waveform::SQUARE ? "square" : "sawtooth", wave->harmonicCount());
}

void SoundManager::applyImpulseResponse(const ImpulseResponse& ir) {
    if (ir.samples.empty() || ir.sampleRate <= 0.f) {
        WARN("Chromatone: ignoring empty impulse response");
        return;
    }
    std::shared_ptr<const ImpulseResponse> stored = std::make_shared<ImpulseResponse>(ir);
    float rate;
    {
        std::lock_guard<std::mutex> lock(mutex);
        impulse = stored;
        rate = sampleRate;
    }
    installConvolver(prepareConvolver(*stored, rate), rate);
}

bool SoundManager::hasGraph() const {
    std::lock_guard<std::mutex> lock(mutex);
    return (bool)graph;
}

bool SoundManager::isReverbReady() const {
    std::lock_guard<std::mutex> lock(mutex);
    return convolver && convolver->hasImpulse();
}

double SoundManager::currentTime() const {
    std::lock_guard<std::mutex> lock(mutex);
    return graph ? graph->getCurrentTime() : 0.0;
}

SoundSettings SoundManager::getSettings() const {
    std::lock_guard<std::mutex> lock(mutex);
    return settings;
}

ChordScheduler::Status SoundManager::getSchedulerStatus() const {
    std::lock_guard<std::mutex> lock(mutex);
    return scheduler.getStatus();
}

void SoundManager::seedScheduler(uint32_t seed) {
    std::lock_guard<std::mutex> lock(mutex);
    scheduler.seed(seed);
}

void SoundManager::applyHue(double now) {
    WaveformWeights weights = hueToWaveformWeights(settings.hue);
    for (graph::FrequencyVoice& voice : graph->voices) {
        for (int w = 0; w < graph::WAVEFORM_COUNT; w++) {
            dsp::Waveform waveform = (dsp::Waveform)w;
            voice.chain.gain(waveform)->gain.setValueAtTime(weights.get(waveform), now);
        }
    }
}

void SoundManager::applySaturation(double now) {
    float gain = saturationToChordGain(settings.saturation);
    for (graph::FrequencyVoice& voice : graph->voices) {
        if (voice.role == graph::VOICE_ROOT) continue;
        voice.output->gain.setValueAtTime(gain, now);
    }
}

void SoundManager::applyLightness(double now) {
    float frequency = lightnessToFrequency(settings.lightness, settings.lightnessSemitoneBound);
    graph->forEachOscillator([frequency, now](const graph::FrequencyVoice&, graph::OscillatorNode* osc) {
        osc->frequency.setValueAtTime(frequency, now);
    });
}

void SoundManager::applyVolume(double now) {
    graph->volume->gain.setValueAtTime(settings.volume, now);
}

void SoundManager::applyReverb(double now) {
    // Fully dry until an impulse response is in place
    float intensity = graph->reverb->hasImpulse() ? settings.reverbIntensity : 0.f;
    graph::applyWetDry(graph->reverbPath, intensity, graph->curve, now);
}

void SoundManager::applyLfoIntensity(double now) {
    graph::applyWetDry(graph->lfoPath, settings.lfoIntensity, graph->curve, now);
}

void SoundManager::applyLfoFrequency(double now) {
    graph->lfo->frequency.setValueAtTime(settings.lfoFrequency, now);
}

void SoundManager::applyWaveTables() {
    for (graph::FrequencyVoice& voice : graph->voices) {
        if (squareWave) voice.chain.oscillator(dsp::Waveform::SQUARE)->setPeriodicWave(squareWave);
        if (sawtoothWave) voice.chain.oscillator(dsp::Waveform::SAWTOOTH)->setPeriodicWave(sawtoothWave);
    }
}

void SoundManager::applyAll(double now) {
    applyHue(now);
    applySaturation(now);
    applyLightness(now);
    applyVolume(now);
    applyReverb(now);
    applyLfoIntensity(now);
    applyLfoFrequency(now);
}

void SoundManager::startScheduler() {
    if (!settings.schedulerTimer) {
        return;
    }
    timer.start(settings.lookaheadSeconds, [this]() { return pollScheduler(); });
}

void SoundManager::installConvolver(std::shared_ptr<dsp::PartitionedConvolver> next, float preparedRate) {
    std::lock_guard<std::mutex> lock(mutex);
    // A sample-rate change raced this preparation; its own preparation wins
    if (preparedRate != sampleRate) {
        return;
    }
    convolver = next;
    if (graph) {
        graph->reverb->setConvolver(convolver);
        applyReverb(graph->getCurrentTime());
    }
    INFO("Chromatone: impulse response ready (%d partitions)", convolver->partitionCount());
}

std::shared_ptr<dsp::PartitionedConvolver> SoundManager::prepareConvolver(const ImpulseResponse& ir, float rate) {
    std::shared_ptr<dsp::PartitionedConvolver> prepared = std::make_shared<dsp::PartitionedConvolver>(graph::RENDER_QUANTUM);
    prepared->setImpulse(resampleLinear(ir.samples, ir.sampleRate, rate));
    return prepared;
}

}} // namespace chromatone::prism
