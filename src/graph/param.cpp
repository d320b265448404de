// Chromatone: automation timeline evaluation
#include <algorithm>
#include <cmath>
#include "param.hpp"
#include "nodes.hpp"

namespace chromatone { namespace graph {

void AudioParam::insertEvent(const Event& e) {
    auto pos = std::upper_bound(events.begin(), events.end(), e.time,
        [](double t, const Event& other) { return t < other.time; });
    events.insert(pos, e);
}

void AudioParam::setValueAtTime(float v, double time) {
    insertEvent({EventType::SET_VALUE, time, v, 0.0});
}

void AudioParam::linearRampToValueAtTime(float v, double endTime) {
    insertEvent({EventType::LINEAR_RAMP, endTime, v, 0.0});
}

void AudioParam::setTargetAtTime(float target, double startTime, double timeConstant) {
    if (timeConstant <= 0.0) {
        // Degenerates to a step
        setValueAtTime(target, startTime);
        return;
    }
    insertEvent({EventType::SET_TARGET, startTime, target, timeConstant});
}

void AudioParam::cancelScheduledValues(double time) {
    events.erase(std::remove_if(events.begin(), events.end(),
        [time](const Event& e) { return e.time >= time; }), events.end());
}

float AudioParam::approach(float start, const Event& target, double time) {
    double elapsed = std::max(0.0, time - target.time);
    return target.value + (start - target.value) * (float)std::exp(-elapsed / target.timeConstant);
}

float AudioParam::valueAt(double time) const {
    float current = value;
    double currentTime = valueTime;
    const Event* target = nullptr;

    for (const Event& e : events) {
        if (e.type == EventType::LINEAR_RAMP) {
            // A ramp replaces a running exponential approach; it starts from the last settled point
            target = nullptr;
            if (e.time <= time) {
                current = e.value;
                currentTime = e.time;
                continue;
            }
            double span = e.time - currentTime;
            if (span <= 0.0) {
                return e.value;
            }
            double frac = (time - currentTime) / span;
            return current + (e.value - current) * (float)std::max(0.0, frac);
        }

        if (e.time > time) {
            break;
        }
        if (target) {
            current = approach(current, *target, e.time);
            currentTime = e.time;
            target = nullptr;
        }
        if (e.type == EventType::SET_VALUE) {
            current = e.value;
            currentTime = e.time;
        }
        else {
            target = &e;
            currentTime = e.time;
        }
    }

    if (target) {
        return approach(current, *target, time);
    }
    return current;
}

void AudioParam::commit(double time) {
    int last = -1;
    for (int i = 0; i < (int)events.size(); i++) {
        if (events[i].time > time) break;
        last = i;
    }
    if (last < 0) {
        return;
    }

    const Event& e = events[last];
    if (e.type == EventType::SET_TARGET) {
        // Keep the approach alive, anchored on the value it started from
        value = valueAt(e.time);
        valueTime = e.time;
        events.erase(events.begin(), events.begin() + last);
    }
    else {
        value = e.value;
        valueTime = e.time;
        events.erase(events.begin(), events.begin() + last + 1);
    }
}

bool AudioParam::computeValues(double startTime, float sampleRate, int frames, float* out) {
    commit(startTime);

    double endTime = startTime + frames / (double)sampleRate;
    bool constant = events.empty()
        || (events.front().type != EventType::LINEAR_RAMP && events.front().time >= endTime);
    if (constant) {
        float v = valueAt(startTime);
        std::fill(out, out + frames, v);
    }
    else {
        for (int i = 0; i < frames; i++) {
            out[i] = valueAt(startTime + i / (double)sampleRate);
        }
    }

    for (AudioNode* node : modulators) {
        const float* mod = node->output();
        for (int i = 0; i < frames; i++) {
            out[i] += mod[i];
        }
        constant = false;
    }
    return constant;
}

}} // namespace chromatone::graph
