#pragma once

#include <map>
#include <JuceHeader.h>
#include "Sampler.h"

// A sampler setup as stored on disk: sample locations per pitch key plus the
// envelope. Locations may use fallback extensions ("C4.[ogg|wav]").
struct SamplerPreset
{
    std::map<juce::String, juce::String> samples;  // pitch key -> location
    juce::String baseUrl;

    double attack = 0.0;
    double release = 0.1;
    FadeCurve curve = FadeCurve::exponential;

    bool operator== (const SamplerPreset& other) const
    {
        return samples == other.samples && baseUrl == other.baseUrl
            && attack == other.attack && release == other.release && curve == other.curve;
    }

    bool operator!= (const SamplerPreset& other) const   { return ! (*this == other); }

    SamplerOptions toOptions() const
    {
        SamplerOptions options;
        for (auto& [key, location] : samples)
            options.pitchMap[key] = location;

        options.baseUrl = baseUrl;
        options.attack = attack;
        options.release = release;
        options.curve = curve;
        return options;
    }
};
