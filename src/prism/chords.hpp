// Prism: chord and progression tables
#pragma once
#include <array>
#include <string>
#include <vector>

namespace chromatone { namespace prism {

struct ChordDefinition {
    std::string name;                     // roman numeral
    int scaleDegreeSemitones;             // chord root above the tonic
    std::array<int, 4> intervalSemitones; // root, third, fifth, seventh (triads repeat the root)
};

struct Progression {
    std::string name;
    std::vector<std::string> chords;
};

// Immutable tables, built once on first use
const std::vector<ChordDefinition>& chordTable();
const std::vector<Progression>& progressionTable();

// nullptr when the numeral is unknown
const ChordDefinition* findChord(const std::string& name);

// Resolve a progression to chord definitions, skipping unknown numerals
std::vector<const ChordDefinition*> resolveProgression(const Progression& progression);

// Detune of one voice for a chord, in cents
float chordVoiceCents(const ChordDefinition& chord, int voice);

}} // namespace chromatone::prism
