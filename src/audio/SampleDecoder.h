#pragma once

#include <functional>
#include <JuceHeader.h>
#include "SampleData.h"

/** Outcome of one decode request: data on success, an error message otherwise. */
struct DecodeResult
{
    SampleDataPtr data;
    juce::String error;

    bool wasOk() const  { return data != nullptr && error.isEmpty(); }

    static DecodeResult success (SampleDataPtr d)        { return { std::move (d), {} }; }
    static DecodeResult failure (const juce::String& e)  { return { nullptr, e }; }
};

/**
 * Turns a location into decoded sample frames.
 *
 * decode() must not block the caller and must invoke the callback exactly
 * once, on the message thread.
 */
class SampleDecoder
{
public:
    using DecodeCallback = std::function<void (DecodeResult)>;

    virtual ~SampleDecoder() = default;

    /** True if files with this extension (no leading dot, any case) can be decoded. */
    virtual bool supportsExtension (const juce::String& extension) const = 0;

    virtual void decode (const juce::String& location, DecodeCallback onComplete) = 0;
};
