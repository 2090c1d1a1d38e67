#pragma once

#include <memory>
#include <JuceHeader.h>

// Decoded sample frames. Buffers hold this through a shared pointer so that
// adopting another buffer's data never copies it.
struct SampleData
{
    juce::AudioBuffer<float> channels;
    double sampleRate = 44100.0;

    int getNumChannels() const  { return channels.getNumChannels(); }
    int getNumSamples() const   { return channels.getNumSamples(); }

    double getDuration() const
    {
        return sampleRate > 0.0 ? static_cast<double> (getNumSamples()) / sampleRate : 0.0;
    }
};

using SampleDataPtr = std::shared_ptr<SampleData>;
