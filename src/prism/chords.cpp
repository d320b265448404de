// Prism: chord and progression tables
#include <rack.hpp>
#include "chords.hpp"

namespace chromatone { namespace prism {

const std::vector<ChordDefinition>& chordTable() {
    static const std::vector<ChordDefinition> table = {
        // Major key triads
        {"I",     0,  {{0, 4, 7, 0}}},
        {"ii",    2,  {{0, 3, 7, 0}}},
        {"iii",   4,  {{0, 3, 7, 0}}},
        {"IV",    5,  {{0, 4, 7, 0}}},
        {"V",     7,  {{0, 4, 7, 0}}},
        {"vi",    9,  {{0, 3, 7, 0}}},
        {"vii°",  11, {{0, 3, 6, 0}}},
        // Sevenths
        {"Imaj7", 0,  {{0, 4, 7, 11}}},
        {"ii7",   2,  {{0, 3, 7, 10}}},
        {"iii7",  4,  {{0, 3, 7, 10}}},
        {"IVmaj7", 5, {{0, 4, 7, 11}}},
        {"V7",    7,  {{0, 4, 7, 10}}},
        {"vi7",   9,  {{0, 3, 7, 10}}},
        {"viiø7", 11, {{0, 3, 6, 10}}},
    };
    return table;
}

const std::vector<Progression>& progressionTable() {
    static const std::vector<Progression> table = {
        {"pop",          {"I", "V", "vi", "IV"}},
        {"doo-wop",      {"I", "vi", "IV", "V"}},
        {"sensitive",    {"vi", "IV", "I", "V"}},
        {"blues cadence", {"I", "IV", "V"}},
        {"jazz ii-V-I",  {"ii7", "V7", "Imaj7"}},
        {"plagal",       {"I", "IV", "I", "V"}},
        {"canon",        {"I", "V", "vi", "iii", "IV", "I", "IV", "V"}},
        {"circle",       {"vi7", "ii7", "V7", "Imaj7"}},
        {"lift",         {"IV", "V", "iii", "vi"}},
        {"dreamy",       {"Imaj7", "IVmaj7"}},
        {"descent",      {"I", "viiø7", "vi", "V"}},
    };
    return table;
}

const ChordDefinition* findChord(const std::string& name) {
    for (const ChordDefinition& chord : chordTable()) {
        if (chord.name == name) {
            return &chord;
        }
    }
    return nullptr;
}

std::vector<const ChordDefinition*> resolveProgression(const Progression& progression) {
    std::vector<const ChordDefinition*> chords;
    chords.reserve(progression.chords.size());
    for (const std::string& name : progression.chords) {
        const ChordDefinition* chord = findChord(name);
        if (!chord) {
            WARN("Chromatone: progression '%s' names unknown chord '%s'", progression.name.c_str(), name.c_str());
            continue;
        }
        chords.push_back(chord);
    }
    return chords;
}

float chordVoiceCents(const ChordDefinition& chord, int voice) {
    voice = rack::math::clamp(voice, 0, 3);
    return (chord.scaleDegreeSemitones + chord.intervalSemitones[voice]) * 100.f;
}

}} // namespace chromatone::prism
