#pragma once

#include <functional>
#include <map>
#include <memory>
#include <variant>
#include <JuceHeader.h>
#include "PendingLoad.h"
#include "SampleBuffer.h"

class SampleLoader;

/**
 * A keyed set of sample buffers that load independently.
 *
 * Each entry moves unloaded -> loading -> loaded | errored and never retries.
 * loaded() aggregates the entries present at call time; it always settles
 * successfully, since it reports "all settled" rather than "all succeeded".
 * Everything runs on the message thread.
 */
class SampleBufferStore
{
public:
    enum class LoadState
    {
        unloaded,
        loading,
        loaded,
        errored
    };

    using LoadCallback  = std::function<void()>;
    using ErrorCallback = std::function<void (const juce::String&)>;

    /** A location string (fallback extensions allowed), decoded data, or
     *  another buffer whose data is adopted without copying. */
    using EntrySource = std::variant<juce::String, SampleDataPtr, const SampleBuffer*>;

    /** The base URL is a plain prefix for relative locations, so a directory
     *  needs its trailing separator. */
    SampleBufferStore (SampleLoader& loader,
                       const std::map<juce::String, EntrySource>& sources = {},
                       LoadCallback onload = nullptr,
                       const juce::String& baseUrl = {});
    ~SampleBufferStore();

    void add (const juce::String& key, EntrySource source,
              LoadCallback onload = nullptr, ErrorCallback onerror = nullptr);

    bool has (const juce::String& key) const;

    /** Throws BufferNotAvailable unless the entry exists and has loaded. */
    SampleBuffer& get (const juce::String& key) const;

    /** unloaded for keys that were never added. */
    LoadState getState (const juce::String& key) const;

    juce::StringArray getCandidates (const juce::String& key) const;

    PendingLoad loaded() const;
    bool isLoaded() const;

    bool supportsType (const juce::String& location) const;

    const juce::String& getBaseUrl() const   { return baseUrl; }
    juce::String resolveLocation (const juce::String& location) const;

    void dispose();
    bool isDisposed() const                  { return disposed; }

private:
    struct Entry
    {
        juce::StringArray candidates;
        LoadState state = LoadState::unloaded;
        std::unique_ptr<SampleBuffer> buffer;
        PendingLoad pending;
        juce::String error;
        LoadCallback onload;
        ErrorCallback onerror;
    };

    void throwIfDisposed() const;

    SampleLoader& loader;
    juce::String baseUrl;
    std::map<juce::String, std::shared_ptr<Entry>> entries;
    LoadCallback onAllLoaded;
    bool disposed = false;

    JUCE_DECLARE_WEAK_REFERENCEABLE (SampleBufferStore)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SampleBufferStore)
};
