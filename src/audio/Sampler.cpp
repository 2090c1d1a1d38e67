#include "Sampler.h"
#include "NoteUtils.h"
#include "SampleLoader.h"
#include "SamplerErrors.h"
#include "Transport.h"
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>

namespace
{
    juce::String describePitches (const std::vector<int>& pitches)
    {
        juce::StringArray names;
        for (auto p : pitches)
            names.add (NoteUtils::midiToNoteName (p));
        return "[" + names.joinIntoString (", ") + "]";
    }
}

Sampler::Sampler (const SamplerOptions& options, SampleLoader& loader, VoicePlayer& p, Transport* t)
    : player (p),
      transport (t),
      store (loader, normalisePitchMap (options.pitchMap), options.onload, options.baseUrl),
      attack (juce::jmax (0.0, options.attack)),
      release (juce::jmax (0.0, options.release)),
      curve (options.curve),
      debug (options.debug)
{
}

Sampler::~Sampler()
{
    dispose();
    masterReference.clear();
}

std::map<juce::String, SampleBufferStore::EntrySource>
Sampler::normalisePitchMap (const std::map<juce::String, SampleBufferStore::EntrySource>& pitchMap)
{
    std::map<juce::String, SampleBufferStore::EntrySource> normalised;

    for (auto& [key, source] : pitchMap)
        normalised[juce::String (NoteUtils::parsePitchKey (key))] = source;

    return normalised;
}

//==============================================================================
// Pitch search
//==============================================================================

bool Sampler::hasLoadedSample (int pitch) const
{
    return store.getState (juce::String (pitch)) == SampleBufferStore::LoadState::loaded;
}

int Sampler::findClosest (int pitch) const
{
    throwIfDisposed ("findClosest");

    if (! NoteUtils::isPitchInRange (pitch))
        throw NoBufferAvailable (pitch);

    for (int interval = 0; interval < kMaxSearchInterval; ++interval)
    {
        if (hasLoadedSample (pitch + interval))
            return -interval;

        if (hasLoadedSample (pitch - interval))
            return interval;
    }

    throw NoBufferAvailable (pitch);
}

double Sampler::intervalToFrequencyRatio (double semitones)
{
    return std::pow (2.0, semitones / 12.0);
}

//==============================================================================
// Attack / release
//==============================================================================

void Sampler::triggerAttack (const std::vector<int>& pitches, std::optional<double> time, float velocity)
{
    throwIfDisposed ("triggerAttack");

    if (synced)
    {
        scheduleOnTransport (time.value_or (transport->getTransportTime()),
                             [pitches, velocity] (Sampler& s, double audioTime)
                             {
                                 s.attackNow (pitches, audioTime, velocity);
                             });
        return;
    }

    attackNow (pitches, resolveTime (time), velocity);
}

void Sampler::triggerAttack (int pitch, std::optional<double> time, float velocity)
{
    triggerAttack (std::vector<int> { pitch }, time, velocity);
}

void Sampler::attackNow (const std::vector<int>& pitches, double time, float velocity)
{
    log ("triggerAttack " + describePitches (pitches) + " at " + juce::String (time, 3)
         + " velocity " + juce::String (velocity, 2));

    std::optional<int> firstFailure;

    for (auto pitch : pitches)
    {
        int offset = 0;

        try
        {
            offset = findClosest (pitch);
        }
        catch (const NoBufferAvailable&)
        {
            DBG ("Sampler: no buffer within range of pitch " + juce::String (pitch));

            if (! firstFailure.has_value())
                firstFailure = pitch;

            continue;
        }

        auto& buffer = store.get (juce::String (pitch - offset));
        const auto ratio = intervalToFrequencyRatio (offset);

        VoiceParameters params;
        params.data = buffer.get();
        params.playbackRate = ratio;
        params.fadeIn = attack;
        params.fadeOut = release;
        params.curve = curve;

        auto voice = player.createVoice (params);
        jassert (voice != nullptr);
        if (voice == nullptr)
            continue;

        // Filed before starting so a voice that ends immediately can deregister.
        auto* started = voice.get();
        registry.add (pitch, std::move (voice));
        started->start (time, 0.0, buffer.getDuration() / ratio, velocity);
    }

    if (firstFailure.has_value())
        throw NoBufferAvailable (*firstFailure);
}

void Sampler::triggerRelease (const std::vector<int>& pitches, std::optional<double> time)
{
    throwIfDisposed ("triggerRelease");

    if (synced)
    {
        scheduleOnTransport (time.value_or (transport->getTransportTime()),
                             [pitches] (Sampler& s, double audioTime)
                             {
                                 s.releaseNow (pitches, audioTime);
                             });
        return;
    }

    releaseNow (pitches, resolveTime (time));
}

void Sampler::triggerRelease (int pitch, std::optional<double> time)
{
    triggerRelease (std::vector<int> { pitch }, time);
}

void Sampler::releaseNow (const std::vector<int>& pitches, double time)
{
    log ("triggerRelease " + describePitches (pitches) + " at " + juce::String (time, 3));

    for (auto pitch : pitches)
        registry.releaseKey (pitch, time);
}

void Sampler::releaseAll (std::optional<double> time)
{
    throwIfDisposed ("releaseAll");

    auto released = registry.releaseAll (resolveTime (time));
    log ("releaseAll stopped " + juce::String (released) + " voices");
}

void Sampler::triggerAttackRelease (const std::vector<int>& pitches, const std::vector<double>& durations,
                                    std::optional<double> time, float velocity)
{
    throwIfDisposed ("triggerAttackRelease");

    if (durations.empty())
        throw std::invalid_argument ("triggerAttackRelease needs at least one duration");

    const auto start = synced ? time.value_or (transport->getTransportTime()) : resolveTime (time);

    // Pitches that did sound still get their release.
    std::exception_ptr failure;

    try
    {
        triggerAttack (pitches, start, velocity);
    }
    catch (const NoBufferAvailable&)
    {
        failure = std::current_exception();
    }

    for (size_t i = 0; i < pitches.size(); ++i)
    {
        const auto duration = durations[juce::jmin (i, durations.size() - 1)];
        triggerRelease (pitches[i], start + duration);
    }

    if (failure != nullptr)
        std::rethrow_exception (failure);
}

void Sampler::triggerAttackRelease (int pitch, double duration, std::optional<double> time, float velocity)
{
    triggerAttackRelease (std::vector<int> { pitch }, std::vector<double> { duration }, time, velocity);
}

//==============================================================================
// Transport sync
//==============================================================================

void Sampler::sync()
{
    throwIfDisposed ("sync");

    if (transport == nullptr)
        throw std::logic_error ("Sampler::sync() needs a Transport");

    synced = true;
}

void Sampler::unsync()
{
    throwIfDisposed ("unsync");

    synced = false;

    if (transport != nullptr)
        for (auto id : scheduledEvents)
            transport->cancel (id);

    scheduledEvents.clear();
}

void Sampler::scheduleOnTransport (double transportTime, std::function<void (Sampler&, double)> action)
{
    jassert (transport != nullptr);

    juce::WeakReference<Sampler> weak (this);
    auto eventId = std::make_shared<int> (0);

    *eventId = transport->schedule ([weak, eventId, action] (double audioTime)
    {
        auto* sampler = weak.get();
        if (sampler == nullptr || sampler->disposed)
            return;

        sampler->scheduledEvents.erase (*eventId);

        try
        {
            action (*sampler, audioTime);
        }
        catch (const NoBufferAvailable& e)
        {
            // Nobody is left to rethrow to once the transport dispatches.
            DBG ("Scheduled sampler event dropped: " << e.what());
        }
    }, transportTime);

    scheduledEvents.insert (*eventId);
}

//==============================================================================

void Sampler::add (const juce::String& pitchKey, SampleBufferStore::EntrySource source,
                   std::function<void()> onload)
{
    throwIfDisposed ("add");

    auto pitch = NoteUtils::parsePitchKey (pitchKey);
    store.add (juce::String (pitch), std::move (source), std::move (onload));
}

bool Sampler::isLoaded() const
{
    throwIfDisposed ("isLoaded");
    return store.isLoaded();
}

PendingLoad Sampler::loaded() const
{
    throwIfDisposed ("loaded");
    return store.loaded();
}

void Sampler::dispose()
{
    if (disposed)
        return;

    disposed = true;

    if (transport != nullptr)
        for (auto id : scheduledEvents)
            transport->cancel (id);

    scheduledEvents.clear();
    store.dispose();
    registry.disposeAll();
}

int Sampler::getNumActiveVoices (int pitch) const
{
    throwIfDisposed ("getNumActiveVoices");
    return registry.getNumVoices (pitch);
}

int Sampler::getNumActiveVoices() const
{
    throwIfDisposed ("getNumActiveVoices");
    return registry.getNumVoices();
}

double Sampler::resolveTime (std::optional<double> time) const
{
    return time.value_or (player.getCurrentTime());
}

void Sampler::log (const juce::String& message) const
{
    if (debug)
        juce::Logger::writeToLog ("Sampler " + message);
}

void Sampler::throwIfDisposed (const char* operation) const
{
    if (disposed)
        throw InstanceDisposed (std::string ("Sampler::") + operation + "()");
}
