#pragma once

#include <optional>
#include <JuceHeader.h>

// Musical time values as used by the sampler's transport:
//   "4n"  quarter note, "8t" eighth-note triplet, "4n." dotted quarter,
//   "2m"  two measures, "0.5" seconds, "+4n" relative to now.
namespace TimeNotation
{

struct Tempo
{
    double bpm = 120.0;
    int beatsPerMeasure = 4;  // beats are quarter notes
};

struct Value
{
    double seconds = 0.0;
    bool relative = false;
};

/** nullopt when the text is not a time value. */
std::optional<Value> parse (const juce::String& text, const Tempo& tempo);

/** Absolute seconds; relative values are added to now. Throws
 *  std::invalid_argument for text that is not a time value. */
double toSeconds (const juce::String& text, const Tempo& tempo, double now);

double beatsToSeconds (double beats, const Tempo& tempo);

} // namespace TimeNotation
