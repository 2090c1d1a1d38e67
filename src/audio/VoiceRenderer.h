#pragma once

#include <atomic>
#include <limits>
#include <map>
#include <memory>
#include <vector>
#include <JuceHeader.h>
#include "SamplerVoice.h"

/**
 * Mixes sampler voices into an output buffer.
 *
 * Voices are created and controlled on the message thread and rendered on
 * the audio thread; the two share per-voice state under a SpinLock. The
 * clock is the number of samples rendered so far, so an offline render
 * advances time exactly as fast as it is pulled. Voices that finish on their
 * own are reported back to their registry through an AsyncUpdater.
 */
class VoiceRenderer : public VoicePlayer,
                      private juce::AsyncUpdater
{
public:
    VoiceRenderer();
    ~VoiceRenderer() override;

    void prepare (double sampleRate, int maxBlockSize);

    /** Adds every voice sounding in [startSample, startSample + numSamples)
     *  to the buffer and advances the clock. Audio thread. */
    void renderNextBlock (juce::AudioBuffer<float>& buffer, int startSample, int numSamples);

    double getCurrentTime() const override;
    std::unique_ptr<SamplerVoice> createVoice (const VoiceParameters& params) override;

    double getSampleRate() const    { return outputSampleRate.load(); }
    int getNumPlayingVoices() const;

private:
    struct VoiceState
    {
        SamplerVoice::Id id = 0;
        VoiceParameters params;

        double startTime = 0.0;
        double offset = 0.0;
        double duration = 0.0;
        double stopTime = std::numeric_limits<double>::infinity();
        float velocity = 1.0f;

        bool started = false;
        bool finished = false;
    };

    class Voice;
    friend class Voice;

    void startVoice (const std::shared_ptr<VoiceState>& v, double time, double offset, double duration, float velocity);
    void stopVoice (VoiceState& v, double time);
    void removeVoice (VoiceState& v);
    void detachVoice (SamplerVoice::Id id);

    bool renderVoice (VoiceState& v, juce::AudioBuffer<float>& buffer, int startSample, int numSamples,
                      juce::int64 firstSampleIndex, double sampleRate);
    float getFadeGain (const VoiceState& v, double elapsed, double timeNow) const;
    static float interpolateSample (const SampleData& data, int channel, double pos);

    void handleAsyncUpdate() override;

    juce::SpinLock voiceLock;
    std::vector<std::shared_ptr<VoiceState>> playing;
    std::vector<SamplerVoice::Id> finishedIds;

    // Message thread only: handles still owned by someone.
    std::map<SamplerVoice::Id, Voice*> liveVoices;

    std::atomic<double> outputSampleRate { 44100.0 };
    std::atomic<juce::int64> samplesRendered { 0 };
    std::atomic<int> nextId { 1 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (VoiceRenderer)
};
