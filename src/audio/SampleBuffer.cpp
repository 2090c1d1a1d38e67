#include "SampleBuffer.h"
#include "SampleLoader.h"
#include "SamplerErrors.h"
#include <cmath>
#include <stdexcept>

struct SampleBuffer::State
{
    SampleDataPtr data;
    double sampleRate = kDefaultSampleRate;
    bool reversed = false;
    bool disposed = false;
    int loadGeneration = 0;  // only the latest load may deliver
    PendingLoad pending = PendingLoad::alreadySettled (juce::Result::ok());
    LoadCallback onload;
    ErrorCallback onerror;
};

namespace
{
    SampleBuffer::FromOptions toOptions (SampleBuffer::Source source)
    {
        if (auto* options = std::get_if<SampleBuffer::FromOptions> (&source))
            return std::move (*options);

        SampleBuffer::FromOptions options;

        if (auto* location = std::get_if<SampleBuffer::FromLocation> (&source))
            options.url = std::move (*location);
        else if (auto* data = std::get_if<SampleBuffer::FromData> (&source))
            options.url = std::move (*data);
        else if (auto* buffer = std::get_if<SampleBuffer::FromBuffer> (&source))
            options.url = *buffer;

        return options;
    }
}

SampleBuffer::SampleBuffer()
    : state (std::make_shared<State>())
{
}

SampleBuffer::SampleBuffer (SampleLoader& l, Source source)
    : state (std::make_shared<State>()), loader (&l)
{
    auto options = toOptions (std::move (source));

    state->onload = std::move (options.onload);
    state->onerror = std::move (options.onerror);

    // Nothing is loaded yet, so the flag only takes effect when data arrives.
    state->reversed = options.reverse;

    if (auto* location = std::get_if<FromLocation> (&options.url))
    {
        if (location->location.isNotEmpty())
            load (location->location);
    }
    else if (auto* data = std::get_if<FromData> (&options.url))
    {
        set (data->data);
    }
    else if (auto* buffer = std::get_if<FromBuffer> (&options.url))
    {
        if (buffer->buffer != nullptr)
            set (*buffer->buffer);
    }
}

SampleBuffer::~SampleBuffer() = default;

//==============================================================================
// Loading
//==============================================================================

PendingLoad SampleBuffer::load (const juce::String& location)
{
    if (state->disposed)
        return PendingLoad::alreadySettled (juce::Result::fail ("Buffer was disposed: " + location));

    if (loader == nullptr)
        return PendingLoad::alreadySettled (juce::Result::fail ("Buffer has no loader: " + location));

    std::weak_ptr<State> weak = state;
    const auto generation = ++state->loadGeneration;

    state->pending = loader->load (location,
        [weak, generation] (SampleDataPtr data)
        {
            auto s = weak.lock();
            if (s == nullptr || s->disposed || s->loadGeneration != generation)
                return;

            adoptData (*s, std::move (data));

            if (s->onload != nullptr)
                s->onload();
        },
        [weak, generation] (const juce::String& error)
        {
            auto s = weak.lock();
            if (s == nullptr || s->disposed || s->loadGeneration != generation)
                return;

            if (s->onerror != nullptr)
                s->onerror (error);
        });

    return state->pending;
}

PendingLoad SampleBuffer::getPendingLoad() const
{
    return state->pending;
}

bool SampleBuffer::isLoaded() const
{
    return state->data != nullptr && state->data->getNumSamples() > 0;
}

PendingLoad SampleBuffer::load (SampleLoader& loader, const juce::String& location,
                                std::function<void (SampleDataPtr)> onLoad, ErrorCallback onError)
{
    return loader.load (location, std::move (onLoad), std::move (onError));
}

std::unique_ptr<SampleBuffer> SampleBuffer::fromUrl (SampleLoader& loader, const juce::String& location,
                                                     LoadCallback onload, ErrorCallback onerror)
{
    FromOptions options;
    options.url = FromLocation { location };
    options.onload = std::move (onload);
    options.onerror = std::move (onerror);

    return std::make_unique<SampleBuffer> (loader, std::move (options));
}

std::unique_ptr<SampleBuffer> SampleBuffer::fromArray (const std::vector<float>& mono, double sampleRate)
{
    auto buffer = std::make_unique<SampleBuffer>();
    buffer->setSampleRate (sampleRate);
    buffer->fromArray (mono);
    return buffer;
}

std::unique_ptr<SampleBuffer> SampleBuffer::fromArray (const std::vector<std::vector<float>>& channels,
                                                       double sampleRate)
{
    auto buffer = std::make_unique<SampleBuffer>();
    buffer->setSampleRate (sampleRate);
    buffer->fromArray (channels);
    return buffer;
}

bool SampleBuffer::supportsType (const SampleLoader& loader, const juce::String& location)
{
    return loader.supportsType (location);
}

PendingLoad SampleBuffer::loaded (SampleLoader& loader)
{
    return loader.getRegistry().whenAllSettled();
}

//==============================================================================
// Data access
//==============================================================================

SampleDataPtr SampleBuffer::get() const
{
    return state->data;
}

void SampleBuffer::set (const SampleBuffer& other)
{
    if (state->disposed || &other == this)
        return;

    ++state->loadGeneration;

    if (other.isLoaded())
        adoptData (*state, other.state->data);
    else if (! other.state->pending.isSettled())
        adoptWhenLoaded (other);
}

void SampleBuffer::set (SampleDataPtr data)
{
    if (state->disposed)
        return;

    ++state->loadGeneration;
    adoptData (*state, std::move (data));
}

void SampleBuffer::adoptWhenLoaded (const SampleBuffer& other)
{
    std::weak_ptr<State> weak = state;
    std::weak_ptr<State> weakSource = other.state;

    PendingLoad adopted;
    state->pending = adopted;
    const auto generation = state->loadGeneration;

    other.state->pending.onSettled ([weak, weakSource, adopted, generation] (const juce::Result& result) mutable
    {
        auto s = weak.lock();
        auto source = weakSource.lock();

        if (s == nullptr || s->disposed)
        {
            adopted.settle (juce::Result::fail ("Buffer was released before its source loaded"));
            return;
        }

        if (s->loadGeneration != generation)
        {
            adopted.settle (result);
            return;
        }

        if (result.wasOk() && source != nullptr && source->data != nullptr)
        {
            adoptData (*s, source->data);

            if (s->onload != nullptr)
                s->onload();

            adopted.settle (juce::Result::ok());
            return;
        }

        auto error = result.failed() ? result.getErrorMessage()
                                     : juce::String ("Source buffer was released before it loaded");

        if (s->onerror != nullptr)
            s->onerror (error);

        adopted.settle (juce::Result::fail (error));
    });
}

void SampleBuffer::adoptData (State& s, SampleDataPtr data)
{
    s.data = std::move (data);

    if (s.reversed)
        reverseChannels (s);
}

double SampleBuffer::getSampleRate() const
{
    return state->data != nullptr ? state->data->sampleRate : state->sampleRate;
}

void SampleBuffer::setSampleRate (double newRate)
{
    jassert (newRate > 0.0);
    if (newRate > 0.0)
        state->sampleRate = newRate;
}

int SampleBuffer::getLength() const
{
    return state->data != nullptr ? state->data->getNumSamples() : 0;
}

double SampleBuffer::getDuration() const
{
    return state->data != nullptr ? state->data->getDuration() : 0.0;
}

int SampleBuffer::getNumChannels() const
{
    return state->data != nullptr ? state->data->getNumChannels() : 0;
}

void SampleBuffer::fromArray (const std::vector<float>& mono)
{
    fromArray (std::vector<std::vector<float>> { mono });
}

void SampleBuffer::fromArray (const std::vector<std::vector<float>>& channels)
{
    if (state->disposed)
        return;

    const auto length = channels.empty() ? size_t (0) : channels.front().size();

    for (auto& channel : channels)
        if (channel.size() != length)
            throw std::invalid_argument ("all channels passed to fromArray must have the same length");

    if (length == 0)
    {
        state->data = nullptr;
        return;
    }

    auto data = std::make_shared<SampleData>();
    data->sampleRate = getSampleRate();
    data->channels.setSize (static_cast<int> (channels.size()), static_cast<int> (length));

    for (size_t ch = 0; ch < channels.size(); ++ch)
        data->channels.copyFrom (static_cast<int> (ch), 0, channels[ch].data(), static_cast<int> (length));

    state->data = std::move (data);
}

std::vector<std::vector<float>> SampleBuffer::toArray() const
{
    std::vector<std::vector<float>> result;

    for (int ch = 0; ch < getNumChannels(); ++ch)
        result.push_back (toArray (ch));

    return result;
}

std::vector<float> SampleBuffer::toArray (int channel) const
{
    auto view = getChannelData (channel);
    return { view.begin(), view.end() };
}

ChannelView SampleBuffer::getChannelData (int channel) const
{
    if (state->data == nullptr || channel < 0 || channel >= state->data->getNumChannels())
        return {};

    return { state->data->channels.getReadPointer (channel), state->data->getNumSamples() };
}

//==============================================================================
// Transforms
//==============================================================================

bool SampleBuffer::isReversed() const
{
    return state->reversed;
}

void SampleBuffer::setReverse (bool shouldBeReversed)
{
    if (state->reversed == shouldBeReversed)
        return;

    state->reversed = shouldBeReversed;
    reverseChannels (*state);
}

void SampleBuffer::reverseChannels (State& s)
{
    if (s.data == nullptr || s.data->getNumSamples() == 0)
        return;

    makeUnique (s);

    for (int ch = 0; ch < s.data->getNumChannels(); ++ch)
        s.data->channels.reverse (ch, 0, s.data->getNumSamples());
}

void SampleBuffer::makeUnique (State& s)
{
    if (s.data != nullptr && s.data.use_count() > 1)
        s.data = std::make_shared<SampleData> (*s.data);
}

std::unique_ptr<SampleBuffer> SampleBuffer::slice (double startSeconds, std::optional<double> endSeconds) const
{
    const auto duration = getDuration();
    auto endTime = endSeconds.value_or (duration);

    if (startSeconds > duration || endTime < startSeconds)
        throw SliceOutOfRange (startSeconds, endTime, duration);

    startSeconds = juce::jlimit (0.0, duration, startSeconds);
    endTime = juce::jlimit (0.0, duration, endTime);

    const auto rate = getSampleRate();
    const auto length = getLength();
    const auto startSample = juce::jlimit (0, length, static_cast<int> (std::floor (startSeconds * rate)));
    const auto endSample = juce::jlimit (startSample, length, static_cast<int> (std::floor (endTime * rate)));
    const auto numSamples = endSample - startSample;

    auto sliced = std::make_unique<SampleBuffer>();
    sliced->loader = loader;
    sliced->setSampleRate (rate);

    if (numSamples > 0)
    {
        auto data = std::make_shared<SampleData>();
        data->sampleRate = rate;
        data->channels.setSize (getNumChannels(), numSamples);

        for (int ch = 0; ch < getNumChannels(); ++ch)
            data->channels.copyFrom (ch, 0, state->data->channels, ch, startSample, numSamples);

        sliced->state->data = std::move (data);
    }

    return sliced;
}

void SampleBuffer::toMono (std::optional<int> channel)
{
    const auto numChannels = getNumChannels();

    if (channel.has_value() && (*channel < 0 || *channel >= numChannels))
        throw std::out_of_range ("channel " + std::to_string (*channel) + " is out of range for a buffer with "
                                 + std::to_string (numChannels) + " channels");

    if (! isLoaded())
        return;

    const auto& source = state->data->channels;
    const auto numSamples = source.getNumSamples();

    auto mono = std::make_shared<SampleData>();
    mono->sampleRate = state->data->sampleRate;
    mono->channels.setSize (1, numSamples);

    if (channel.has_value())
    {
        mono->channels.copyFrom (0, 0, source, *channel, 0, numSamples);
    }
    else
    {
        mono->channels.clear();
        const auto gain = 1.0f / static_cast<float> (numChannels);

        for (int ch = 0; ch < numChannels; ++ch)
            mono->channels.addFrom (0, 0, source, ch, 0, numSamples, gain);
    }

    state->data = std::move (mono);
}

void SampleBuffer::dispose()
{
    state->disposed = true;
    state->data = nullptr;
    state->onload = nullptr;
    state->onerror = nullptr;
}

bool SampleBuffer::isDisposed() const
{
    return state->disposed;
}
