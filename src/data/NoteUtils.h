#pragma once

#include <cmath>
#include <cstdlib>
#include <optional>
#include <JuceHeader.h>
#include "SamplerErrors.h"

namespace NoteUtils
{

// Pitches the sampler accepts, as MIDI note numbers.
constexpr int kMinPitch = -128;
constexpr int kMaxPitch = 255;

inline bool isPitchInRange (int pitch)
{
    return pitch >= kMinPitch && pitch <= kMaxPitch;
}

// Scientific pitch notation with C4 = 60. Accepts one accidental: '#', 'b',
// 'x' (double sharp) or "bb". The octave may be negative ("C-1" = 0).
inline std::optional<int> noteNameToMidi (const juce::String& name)
{
    auto text = name.trim();
    if (text.isEmpty())
        return std::nullopt;

    static const int semitones[] = { 9, 11, 0, 2, 4, 5, 7 }; // A..G

    auto letter = juce::CharacterFunctions::toLowerCase (text[0]);
    if (letter < 'a' || letter > 'g')
        return std::nullopt;

    int midi = semitones[letter - 'a'];
    int pos = 1;

    auto rest = text.substring (1).toLowerCase();
    if (rest.startsWith ("bb"))       { midi -= 2; pos += 2; }
    else if (rest.startsWith ("b"))   { midi -= 1; pos += 1; }
    else if (rest.startsWith ("#"))   { midi += 1; pos += 1; }
    else if (rest.startsWith ("x"))   { midi += 2; pos += 1; }

    auto octaveText = text.substring (pos);
    auto digits = octaveText.startsWithChar ('-') ? octaveText.substring (1) : octaveText;

    if (digits.isEmpty() || digits.length() > 2 || ! digits.containsOnly ("0123456789"))
        return std::nullopt;

    return midi + (octaveText.getIntValue() + 1) * 12;
}

inline juce::String midiToNoteName (int midi)
{
    static const char* noteNames[] = { "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B" };

    auto octave = static_cast<int> (std::floor (midi / 12.0)) - 1;
    auto noteIndex = ((midi % 12) + 12) % 12;
    return juce::String (noteNames[noteIndex]) + juce::String (octave);
}

inline std::optional<double> parseNumber (const juce::String& text)
{
    auto trimmed = text.trim();
    if (trimmed.isEmpty())
        return std::nullopt;

    auto utf8 = trimmed.toStdString();
    char* end = nullptr;
    auto value = std::strtod (utf8.c_str(), &end);

    if (end == utf8.c_str() || *end != '\0' || ! std::isfinite (value))
        return std::nullopt;

    return value;
}

// Pitch-map key: a note name or a number (rounded to the nearest semitone),
// within [kMinPitch, kMaxPitch].
inline int parsePitchKey (const juce::String& key)
{
    if (auto midi = noteNameToMidi (key))
        if (isPitchInRange (*midi))
            return *midi;

    if (auto number = parseNumber (key))
        if (*number > kMinPitch - 0.5 && *number < kMaxPitch + 0.5)
            return juce::roundToInt (*number);

    throw InvalidPitchKey (key.toStdString());
}

} // namespace NoteUtils
