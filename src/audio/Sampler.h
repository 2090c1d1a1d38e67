#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <vector>
#include <JuceHeader.h>
#include "ActiveVoiceRegistry.h"
#include "NoteSource.h"
#include "SampleBufferStore.h"
#include "SamplerVoice.h"

class SampleLoader;
class Transport;

struct SamplerOptions
{
    // Keys are note names ("C4", "F#2") or numbers ("60").
    std::map<juce::String, SampleBufferStore::EntrySource> pitchMap;
    std::function<void()> onload;
    juce::String baseUrl;

    double attack = 0.0;    // seconds
    double release = 0.1;   // seconds
    FadeCurve curve = FadeCurve::exponential;

    // Log every attack and release through juce::Logger.
    bool debug = false;
};

/**
 * Plays a handful of recorded pitches across the whole keyboard.
 *
 * A requested pitch is served by the nearest loaded sample (searching up to
 * eight octaves, preferring the sample above on a tie) played back at
 * 2^(offset / 12). Voices are filed under the requested pitch until they are
 * released or finish on their own.
 *
 * Unsynced, times are on the VoicePlayer's clock. After sync(), attack and
 * release times are transport times and are dispatched by the Transport.
 *
 * Message thread only. The loader, player and transport must outlive it.
 */
class Sampler : public NoteSource
{
public:
    static constexpr int kMaxSearchInterval = 96;

    Sampler (const SamplerOptions& options, SampleLoader& loader, VoicePlayer& player,
             Transport* transport = nullptr);
    ~Sampler() override;

    /** Signed semitone offset to the nearest loaded sample:
     *  the sample used is pitch - offset. Throws NoBufferAvailable. */
    int findClosest (int pitch) const;

    static double intervalToFrequencyRatio (double semitones);

    //==============================================================================
    void triggerAttack (const std::vector<int>& pitches,
                        std::optional<double> time = std::nullopt,
                        float velocity = 1.0f) override;
    void triggerAttack (int pitch, std::optional<double> time = std::nullopt, float velocity = 1.0f);

    void triggerRelease (const std::vector<int>& pitches, std::optional<double> time = std::nullopt) override;
    void triggerRelease (int pitch, std::optional<double> time = std::nullopt);

    void releaseAll (std::optional<double> time = std::nullopt) override;

    /** Durations in seconds; the last one is reused for any remaining pitches. */
    void triggerAttackRelease (const std::vector<int>& pitches, const std::vector<double>& durations,
                               std::optional<double> time = std::nullopt, float velocity = 1.0f);
    void triggerAttackRelease (int pitch, double duration,
                               std::optional<double> time = std::nullopt, float velocity = 1.0f);

    //==============================================================================
    void add (const juce::String& pitchKey, SampleBufferStore::EntrySource source,
              std::function<void()> onload = nullptr);

    void sync();
    void unsync();
    bool isSynced() const                   { return synced; }

    bool isLoaded() const;
    PendingLoad loaded() const;

    void dispose() override;
    bool isDisposed() const                 { return disposed; }

    int getNumActiveVoices (int pitch) const;
    int getNumActiveVoices() const;

    double getAttack() const                { return attack; }
    double getRelease() const               { return release; }
    FadeCurve getCurve() const              { return curve; }
    void setAttack (double seconds)         { attack = juce::jmax (0.0, seconds); }
    void setRelease (double seconds)        { release = juce::jmax (0.0, seconds); }
    void setCurve (FadeCurve newCurve)      { curve = newCurve; }

private:
    static std::map<juce::String, SampleBufferStore::EntrySource>
        normalisePitchMap (const std::map<juce::String, SampleBufferStore::EntrySource>& pitchMap);

    bool hasLoadedSample (int pitch) const;
    double resolveTime (std::optional<double> time) const;

    void attackNow (const std::vector<int>& pitches, double time, float velocity);
    void releaseNow (const std::vector<int>& pitches, double time);
    void scheduleOnTransport (double transportTime, std::function<void (Sampler&, double)> action);

    void log (const juce::String& message) const;
    void throwIfDisposed (const char* operation) const;

    VoicePlayer& player;
    Transport* transport = nullptr;

    SampleBufferStore store;
    ActiveVoiceRegistry registry;
    std::set<int> scheduledEvents;

    double attack = 0.0;
    double release = 0.1;
    FadeCurve curve = FadeCurve::exponential;
    bool debug = false;

    bool synced = false;
    bool disposed = false;

    JUCE_DECLARE_WEAK_REFERENCEABLE (Sampler)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (Sampler)
};
