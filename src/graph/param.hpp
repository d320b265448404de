// Chromatone: timestamped parameter automation
#pragma once
#include <vector>

namespace chromatone { namespace graph {

class AudioNode;

/**
 * A node parameter driven by a timeline of automation events on the audio clock.
 * Writers add events with absolute timestamps; the renderer evaluates the
 * timeline once per frame. Connected nodes are summed on top of the automation.
 */
class AudioParam {
public:
    enum class EventType {
        SET_VALUE,
        LINEAR_RAMP,
        SET_TARGET
    };

    struct Event {
        EventType type;
        double time;
        float value;
        double timeConstant;
    };

    explicit AudioParam(float defaultValue = 0.f)
        : value(defaultValue) {}

    void setValueAtTime(float v, double time);
    void linearRampToValueAtTime(float v, double endTime);
    void setTargetAtTime(float target, double startTime, double timeConstant);
    // Drop every event at or after the given time
    void cancelScheduledValues(double time);

    float valueAt(double time) const;

    // Collapse events that are fully in the past
    void commit(double time);

    // Fill one block of values starting at startTime; returns true when the block is constant
    bool computeValues(double startTime, float sampleRate, int frames, float* out);

    void addModulator(AudioNode* node) { modulators.push_back(node); }

    const std::vector<Event>& getEvents() const { return events; }

private:
    float value;               // settled value before the first event
    double valueTime = 0.0;    // time at which value was settled
    std::vector<Event> events; // sorted by time
    std::vector<AudioNode*> modulators;

    void insertEvent(const Event& e);
    static float approach(float start, const Event& target, double time);
};

}} // namespace chromatone::graph
