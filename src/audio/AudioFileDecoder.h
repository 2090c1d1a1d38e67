#pragma once

#include <JuceHeader.h>
#include "SampleDecoder.h"

/**
 * SampleDecoder backed by juce::AudioFormatManager.
 *
 * Reading and decoding happen on a small juce::ThreadPool; results are posted
 * back to the message thread. Locations may be absolute paths, paths relative
 * to the base directory, file:// URLs or http(s):// URLs.
 */
class AudioFileDecoder : public SampleDecoder
{
public:
    explicit AudioFileDecoder (int numThreads = 2);
    ~AudioFileDecoder() override;

    bool supportsExtension (const juce::String& extension) const override;
    void decode (const juce::String& location, DecodeCallback onComplete) override;

    /** Directory used to resolve relative paths (defaults to the working directory). */
    void setBaseDirectory (const juce::File& dir)  { baseDirectory = dir; }
    juce::File getBaseDirectory() const            { return baseDirectory; }

    /** Synchronous decode used by the worker jobs; also handy for tools. */
    DecodeResult decodeNow (const juce::String& location);

private:
    std::unique_ptr<juce::InputStream> openStream (const juce::String& location, juce::String& error) const;

    juce::AudioFormatManager formatManager;
    juce::File baseDirectory;
    juce::ThreadPool pool;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (AudioFileDecoder)
};
