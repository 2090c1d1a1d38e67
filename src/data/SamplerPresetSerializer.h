#pragma once

#include <JuceHeader.h>
#include "SamplerPreset.h"

// Load functions return an empty string on success, or an error message.
namespace SamplerPresetSerializer
{
    juce::ValueTree toValueTree (const SamplerPreset& preset);
    juce::String fromValueTree (const juce::ValueTree& root, SamplerPreset& preset);

    juce::String saveToFile (const juce::File& file, const SamplerPreset& preset);
    juce::String loadFromFile (const juce::File& file, SamplerPreset& preset);

    juce::String curveToString (FadeCurve curve);
    FadeCurve curveFromString (const juce::String& text);
}
