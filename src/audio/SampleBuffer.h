#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include <vector>
#include <JuceHeader.h>
#include "PendingLoad.h"
#include "SampleData.h"

class SampleLoader;

/** Read-only view over one channel of a buffer. Empty when there is no data. */
struct ChannelView
{
    const float* samples = nullptr;
    int numSamples = 0;

    bool isEmpty() const                 { return samples == nullptr || numSamples == 0; }
    int size() const                     { return numSamples; }
    float operator[] (int index) const   { return samples[index]; }
    const float* begin() const           { return samples; }
    const float* end() const             { return samples + numSamples; }
};

/**
 * Multi-channel sample data plus the transforms the sampler needs.
 *
 * The frames live in a SampleData shared between buffers that adopt each
 * other; reverse() and toMono() copy first when the data is shared, slice()
 * always returns an independent buffer. A buffer constructed from a location
 * loads asynchronously through the SampleLoader, which must outlive it.
 */
class SampleBuffer
{
public:
    using LoadCallback  = std::function<void()>;
    using ErrorCallback = std::function<void (const juce::String&)>;

    struct FromLocation { juce::String location; };
    struct FromData     { SampleDataPtr data; };
    struct FromBuffer   { const SampleBuffer* buffer = nullptr; };

    using Url = std::variant<FromLocation, FromData, FromBuffer>;

    struct FromOptions
    {
        Url url;
        LoadCallback onload;
        ErrorCallback onerror;
        bool reverse = false;
    };

    /** Every way a buffer can be constructed, resolved in one place. */
    using Source = std::variant<FromLocation, FromData, FromBuffer, FromOptions>;

    static constexpr double kDefaultSampleRate = 44100.0;

    SampleBuffer();
    SampleBuffer (SampleLoader& loader, Source source);
    ~SampleBuffer();

    //==============================================================================
    // Loading

    /** Loads a location (fallback extensions allowed) into this buffer.
     *  A later load or set() supersedes this one: its data and callbacks are dropped. */
    PendingLoad load (const juce::String& location);

    /** The most recent load of this buffer; settled when nothing is loading. */
    PendingLoad getPendingLoad() const;

    bool isLoaded() const;

    static PendingLoad load (SampleLoader& loader, const juce::String& location,
                             std::function<void (SampleDataPtr)> onLoad, ErrorCallback onError = nullptr);

    static std::unique_ptr<SampleBuffer> fromUrl (SampleLoader& loader, const juce::String& location,
                                                  LoadCallback onload = nullptr, ErrorCallback onerror = nullptr);

    /** Static forms take the sample rate explicitly; the one-argument forms
     *  are the instance methods below. */
    static std::unique_ptr<SampleBuffer> fromArray (const std::vector<float>& mono, double sampleRate);
    static std::unique_ptr<SampleBuffer> fromArray (const std::vector<std::vector<float>>& channels,
                                                    double sampleRate);

    static bool supportsType (const SampleLoader& loader, const juce::String& location);

    /** Settles once every load started through the loader so far has settled. */
    static PendingLoad loaded (SampleLoader& loader);

    //==============================================================================
    // Data access

    /** The shared data handle, or nullptr when nothing is loaded. */
    SampleDataPtr get() const;

    /** Adopts another buffer's data. If it is still loading, adopts it once loaded. */
    void set (const SampleBuffer& other);
    void set (SampleDataPtr data);

    double getSampleRate() const;
    void setSampleRate (double newRate);

    int getLength() const;
    double getDuration() const;
    int getNumChannels() const;

    void fromArray (const std::vector<float>& mono);
    void fromArray (const std::vector<std::vector<float>>& channels);

    std::vector<std::vector<float>> toArray() const;
    std::vector<float> toArray (int channel) const;

    ChannelView getChannelData (int channel) const;

    //==============================================================================
    // Transforms

    bool isReversed() const;
    void setReverse (bool shouldBeReversed);

    /** Copies [startSeconds, endSeconds) into a new buffer. */
    std::unique_ptr<SampleBuffer> slice (double startSeconds, std::optional<double> endSeconds = std::nullopt) const;

    /** Averages all channels, or keeps only the given channel. */
    void toMono (std::optional<int> channel = std::nullopt);

    void dispose();
    bool isDisposed() const;

private:
    struct State;

    void adoptWhenLoaded (const SampleBuffer& other);
    static void adoptData (State& s, SampleDataPtr data);
    static void reverseChannels (State& s);
    static void makeUnique (State& s);

    std::shared_ptr<State> state;
    SampleLoader* loader = nullptr;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SampleBuffer)
};
