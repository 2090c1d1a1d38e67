#pragma once

#include <memory>
#include <JuceHeader.h>
#include "SampleData.h"

class ActiveVoiceRegistry;

enum class FadeCurve
{
    linear,
    exponential
};

struct VoiceParameters
{
    SampleDataPtr data;
    double playbackRate = 1.0;
    double fadeIn = 0.0;    // seconds
    double fadeOut = 0.1;   // seconds
    FadeCurve curve = FadeCurve::exponential;
};

// Non-owning link from a voice back to the registry slot it was filed under.
struct VoiceRegistryLink
{
    juce::WeakReference<ActiveVoiceRegistry> registry;
    int key = 0;
};

/**
 * One scheduled playback of a buffer, owned by an ActiveVoiceRegistry.
 *
 * Destroying a voice only detaches it: a scheduled stop still plays out.
 * dispose() silences it immediately. Implementations call notifyEnded() on the
 * message thread once playback has finished on its own.
 */
class SamplerVoice
{
public:
    using Id = int;

    virtual ~SamplerVoice() = default;

    virtual Id getId() const = 0;

    /** Times are on the player's clock in seconds; offset is into the sample. */
    virtual void start (double time, double offset, double duration, float velocity) = 0;
    virtual void stop (double time) = 0;
    virtual void dispose() = 0;

    void setRegistryLink (VoiceRegistryLink newLink)    { link = std::move (newLink); }
    const VoiceRegistryLink& getRegistryLink() const    { return link; }

protected:
    /** Sends voiceEnded to the linked registry. The registry may delete this
     *  voice before the call returns. */
    void notifyEnded();

private:
    VoiceRegistryLink link;
};

/** The playback service voices are created from. */
class VoicePlayer
{
public:
    virtual ~VoicePlayer() = default;

    virtual double getCurrentTime() const = 0;
    virtual std::unique_ptr<SamplerVoice> createVoice (const VoiceParameters& params) = 0;
};
