#pragma once

#include <map>
#include <memory>
#include <vector>
#include <JuceHeader.h>
#include "SamplerVoice.h"

/**
 * Owns the sampler's sounding voices, filed under the pitch that was
 * requested (not the pitch of the sample that plays).
 *
 * Message thread only. Voices reach back through a WeakReference, so a
 * completion delivered after the registry is gone is dropped.
 */
class ActiveVoiceRegistry
{
public:
    ActiveVoiceRegistry() = default;
    ~ActiveVoiceRegistry();

    void add (int key, std::unique_ptr<SamplerVoice> voice);

    /** Stops every voice under key at time and drops them now. Returns how
     *  many were released; zero is not an error. */
    int releaseKey (int key, double time);
    int releaseAll (double time);

    /** Completion message from a voice that finished on its own. */
    void voiceEnded (int key, SamplerVoice::Id id);

    /** Hard-stops and drops everything. */
    void disposeAll();

    int getNumVoices (int key) const;
    int getNumVoices() const;

private:
    std::map<int, std::vector<std::unique_ptr<SamplerVoice>>> voices;

    JUCE_DECLARE_WEAK_REFERENCEABLE (ActiveVoiceRegistry)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ActiveVoiceRegistry)
};
