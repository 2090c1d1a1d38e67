#pragma once

#include <functional>
#include <JuceHeader.h>
#include "LoadRegistry.h"
#include "PendingLoad.h"
#include "SampleDecoder.h"

/**
 * Front door for every sample load.
 *
 * Expands fallback-extension locations such as "piano/C4.[ogg|mp3|wav]" into
 * ordered candidates, picks the first one the decoder supports, and records
 * each request in the LoadRegistry it owns. Buffers and stores created with
 * the same loader share that registry.
 */
class SampleLoader
{
public:
    using DataCallback  = std::function<void (SampleDataPtr)>;
    using ErrorCallback = std::function<void (const juce::String&)>;

    explicit SampleLoader (SampleDecoder& decoder);

    /** "name.[a|b]" -> { "name.a", "name.b" }; anything else -> { location }. */
    static juce::StringArray expandCandidates (const juce::String& location);

    /** Extension of a location, ignoring any path, query string or fragment.
     *  A bare extension ("wav") is returned as is. */
    static juce::String getExtension (const juce::String& location);

    bool supportsType (const juce::String& location) const;

    /** The first supported candidate, or an empty string if none is. */
    juce::String resolveCandidate (const juce::String& location) const;

    /** Starts an asynchronous load. Exactly one of the callbacks fires, on the
     *  message thread, before the returned PendingLoad settles. */
    PendingLoad load (const juce::String& location, DataCallback onLoad, ErrorCallback onError);

    LoadRegistry& getRegistry()      { return registry; }

private:
    SampleDecoder& decoder;
    LoadRegistry registry;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SampleLoader)
};
