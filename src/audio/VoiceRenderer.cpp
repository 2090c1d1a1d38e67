#include "VoiceRenderer.h"
#include <algorithm>

// Handle given out by createVoice(). The renderer must outlive it.
class VoiceRenderer::Voice : public SamplerVoice
{
public:
    Voice (VoiceRenderer& r, std::shared_ptr<VoiceState> s)
        : renderer (r), state (std::move (s))
    {
    }

    ~Voice() override
    {
        renderer.detachVoice (state->id);
    }

    Id getId() const override   { return state->id; }

    void start (double time, double offset, double duration, float velocity) override
    {
        renderer.startVoice (state, time, offset, duration, velocity);
    }

    void stop (double time) override    { renderer.stopVoice (*state, time); }
    void dispose() override             { renderer.removeVoice (*state); }

    // Must be the last thing done with this handle: the registry may delete it.
    void ended()                        { notifyEnded(); }

private:
    VoiceRenderer& renderer;
    std::shared_ptr<VoiceState> state;
};

//==============================================================================

VoiceRenderer::VoiceRenderer()
{
    playing.reserve (64);
    finishedIds.reserve (64);
}

VoiceRenderer::~VoiceRenderer()
{
    cancelPendingUpdate();
    jassert (liveVoices.empty());
}

void VoiceRenderer::prepare (double sampleRate, int)
{
    jassert (sampleRate > 0.0);
    if (sampleRate > 0.0)
        outputSampleRate.store (sampleRate);
}

double VoiceRenderer::getCurrentTime() const
{
    return static_cast<double> (samplesRendered.load()) / outputSampleRate.load();
}

std::unique_ptr<SamplerVoice> VoiceRenderer::createVoice (const VoiceParameters& params)
{
    auto state = std::make_shared<VoiceState>();
    state->id = nextId++;
    state->params = params;

    auto voice = std::make_unique<Voice> (*this, state);
    liveVoices[state->id] = voice.get();
    return voice;
}

int VoiceRenderer::getNumPlayingVoices() const
{
    const juce::SpinLock::ScopedLockType lock (voiceLock);
    return static_cast<int> (playing.size());
}

//==============================================================================
// Message-thread control
//==============================================================================

void VoiceRenderer::startVoice (const std::shared_ptr<VoiceState>& v, double time, double offset,
                                double duration, float velocity)
{
    if (v->params.data == nullptr || v->params.data->getNumSamples() == 0)
    {
        DBG ("Voice " + juce::String (v->id) + " has no sample data, not started");
        return;
    }

    const juce::SpinLock::ScopedLockType lock (voiceLock);

    if (v->started || v->finished)
        return;

    v->startTime = time;
    v->offset = juce::jmax (0.0, offset);
    v->duration = juce::jmax (0.0, duration);
    v->velocity = velocity;
    v->started = true;
    playing.push_back (v);
}

void VoiceRenderer::stopVoice (VoiceState& v, double time)
{
    const juce::SpinLock::ScopedLockType lock (voiceLock);
    v.stopTime = juce::jmin (v.stopTime, time);
}

void VoiceRenderer::removeVoice (VoiceState& v)
{
    const juce::SpinLock::ScopedLockType lock (voiceLock);
    v.finished = true;

    playing.erase (std::remove_if (playing.begin(), playing.end(),
                                   [&v] (const std::shared_ptr<VoiceState>& p) { return p.get() == &v; }),
                   playing.end());
}

void VoiceRenderer::detachVoice (SamplerVoice::Id id)
{
    liveVoices.erase (id);
}

void VoiceRenderer::handleAsyncUpdate()
{
    std::vector<SamplerVoice::Id> ids;

    {
        const juce::SpinLock::ScopedLockType lock (voiceLock);
        ids = finishedIds;
        finishedIds.clear();
    }

    for (auto id : ids)
    {
        auto it = liveVoices.find (id);
        if (it != liveVoices.end())
            it->second->ended();
    }
}

//==============================================================================
// Rendering
//==============================================================================

void VoiceRenderer::renderNextBlock (juce::AudioBuffer<float>& buffer, int startSample, int numSamples)
{
    const auto firstSampleIndex = samplesRendered.load();
    const auto sampleRate = outputSampleRate.load();
    bool anyFinished = false;

    {
        const juce::SpinLock::ScopedLockType lock (voiceLock);

        for (auto it = playing.begin(); it != playing.end();)
        {
            auto& v = **it;

            if (renderVoice (v, buffer, startSample, numSamples, firstSampleIndex, sampleRate))
            {
                ++it;
                continue;
            }

            v.finished = true;
            finishedIds.push_back (v.id);
            it = playing.erase (it);
            anyFinished = true;
        }
    }

    samplesRendered += numSamples;

    if (anyFinished)
        triggerAsyncUpdate();
}

bool VoiceRenderer::renderVoice (VoiceState& v, juce::AudioBuffer<float>& buffer, int startSample, int numSamples,
                                 juce::int64 firstSampleIndex, double sampleRate)
{
    const auto& data = *v.params.data;
    const int lastSourceIndex = data.getNumSamples() - 1;

    auto endTime = juce::jmin (v.startTime + v.duration, v.stopTime + v.params.fadeOut);
    if (v.stopTime <= v.startTime)
        endTime = v.startTime;

    // Source samples advanced per second of output.
    const double sourceRate = data.sampleRate * v.params.playbackRate;
    const double startPos = v.offset * data.sampleRate;

    for (int i = 0; i < numSamples; ++i)
    {
        const double t = static_cast<double> (firstSampleIndex + i) / sampleRate;

        if (t >= endTime)
            return false;

        if (t < v.startTime)
            continue;

        const double elapsed = t - v.startTime;
        const double pos = startPos + elapsed * sourceRate;

        if (pos > lastSourceIndex)
            return false;

        const float gain = v.velocity * getFadeGain (v, elapsed, t);

        for (int ch = 0; ch < buffer.getNumChannels(); ++ch)
            buffer.addSample (ch, startSample + i, interpolateSample (data, ch, pos) * gain);
    }

    const double blockEnd = static_cast<double> (firstSampleIndex + numSamples) / sampleRate;
    return blockEnd < endTime;
}

float VoiceRenderer::getFadeGain (const VoiceState& v, double elapsed, double timeNow) const
{
    double gain = 1.0;

    if (v.params.fadeIn > 0.0 && elapsed < v.params.fadeIn)
        gain = elapsed / v.params.fadeIn;

    if (v.params.fadeOut > 0.0)
    {
        const double releaseStart = juce::jmin (v.stopTime, v.startTime + v.duration - v.params.fadeOut);

        if (timeNow >= releaseStart)
            gain *= juce::jlimit (0.0, 1.0, 1.0 - (timeNow - releaseStart) / v.params.fadeOut);
    }

    if (v.params.curve == FadeCurve::exponential)
        gain *= gain;

    return static_cast<float> (gain);
}

float VoiceRenderer::interpolateSample (const SampleData& data, int channel, double pos)
{
    if (data.getNumSamples() <= 0 || data.getNumChannels() <= 0)
        return 0.0f;

    int idx0 = static_cast<int> (pos);
    int idx1 = idx0 + 1;
    float frac = static_cast<float> (pos - idx0);

    int maxIdx = data.getNumSamples() - 1;
    idx0 = juce::jlimit (0, maxIdx, idx0);
    idx1 = juce::jlimit (0, maxIdx, idx1);

    int ch = juce::jmin (channel, data.getNumChannels() - 1);

    return data.channels.getSample (ch, idx0) * (1.0f - frac)
         + data.channels.getSample (ch, idx1) * frac;
}
