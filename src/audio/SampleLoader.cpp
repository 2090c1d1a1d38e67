#include "SampleLoader.h"

SampleLoader::SampleLoader (SampleDecoder& d)
    : decoder (d)
{
}

juce::StringArray SampleLoader::expandCandidates (const juce::String& location)
{
    auto trimmed = location.trim();

    if (trimmed.endsWithChar (']'))
    {
        auto open = trimmed.lastIndexOfChar ('[');
        if (open >= 0)
        {
            auto inner = trimmed.substring (open + 1, trimmed.length() - 1);

            if (inner.containsChar ('|') && ! inner.containsChar ('['))
            {
                auto base = trimmed.substring (0, open);

                juce::StringArray candidates;
                for (auto& ext : juce::StringArray::fromTokens (inner, "|", {}))
                    if (ext.trim().isNotEmpty())
                        candidates.add (base + ext.trim());

                if (! candidates.isEmpty())
                    return candidates;
            }
        }
    }

    return { trimmed };
}

juce::String SampleLoader::getExtension (const juce::String& location)
{
    auto path = location.upToFirstOccurrenceOf ("?", false, false).trim();

    auto name = path.fromLastOccurrenceOf ("/", false, false)
                    .fromLastOccurrenceOf ("\\", false, false);

    // '#' is legal in file names ("C#4.wav"), so a fragment is only cut from the extension.
    auto extension = name.containsChar ('.') ? name.fromLastOccurrenceOf (".", false, false) : name;
    return extension.upToFirstOccurrenceOf ("#", false, false);
}

bool SampleLoader::supportsType (const juce::String& location) const
{
    return decoder.supportsExtension (getExtension (location));
}

juce::String SampleLoader::resolveCandidate (const juce::String& location) const
{
    for (auto& candidate : expandCandidates (location))
        if (supportsType (candidate))
            return candidate;

    return {};
}

PendingLoad SampleLoader::load (const juce::String& location, DataCallback onLoad, ErrorCallback onError)
{
    PendingLoad pending;
    registry.track (pending);

    auto candidate = resolveCandidate (location);

    if (candidate.isEmpty())
    {
        auto error = "None of the extensions are supported: " + location;
        DBG (error);

        juce::MessageManager::callAsync ([pending, onError, error]() mutable
        {
            if (onError != nullptr)
                onError (error);
            pending.settle (juce::Result::fail (error));
        });

        return pending;
    }

    decoder.decode (candidate, [pending, onLoad, onError] (DecodeResult result) mutable
    {
        if (result.wasOk())
        {
            if (onLoad != nullptr)
                onLoad (result.data);
            pending.settle (juce::Result::ok());
        }
        else
        {
            DBG ("Sample load failed: " + result.error);

            if (onError != nullptr)
                onError (result.error);
            pending.settle (juce::Result::fail (result.error));
        }
    });

    return pending;
}
