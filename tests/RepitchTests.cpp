#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <vector>

#include <JuceHeader.h>

#include "ActiveVoiceRegistry.h"
#include "AudioFileDecoder.h"
#include "NoteUtils.h"
#include "SampleBuffer.h"
#include "SampleBufferStore.h"
#include "SampleLoader.h"
#include "Sampler.h"
#include "SamplerErrors.h"
#include "SamplerPresetSerializer.h"
#include "TimeNotation.h"
#include "Transport.h"
#include "TransportEventQueue.h"
#include "VoiceRenderer.h"

namespace
{

bool floatsClose (double a, double b, double eps = 1.0e-6)
{
    return std::abs (a - b) <= eps;
}

bool pumpUntil (const std::function<bool()>& done, int timeoutMs = 5000)
{
    const auto deadline = juce::Time::getMillisecondCounter() + static_cast<juce::uint32> (timeoutMs);

    while (! done())
    {
        if (juce::Time::getMillisecondCounter() > deadline)
            return false;

        juce::MessageManager::getInstance()->runDispatchLoopUntil (5);
    }

    return true;
}

SampleDataPtr makeData (int numChannels, int numSamples, double sampleRate, float value = 1.0f)
{
    auto data = std::make_shared<SampleData>();
    data->sampleRate = sampleRate;
    data->channels.setSize (numChannels, numSamples);

    for (int ch = 0; ch < numChannels; ++ch)
        for (int i = 0; i < numSamples; ++i)
            data->channels.setSample (ch, i, value);

    return data;
}

juce::File writeTestWav (const juce::String& stem, int numChannels, int numSamples, double sampleRate)
{
    auto file = juce::File::getSpecialLocation (juce::File::tempDirectory)
                    .getNonexistentChildFile (stem, ".wav", false);

    juce::AudioBuffer<float> audio (numChannels, numSamples);
    for (int ch = 0; ch < numChannels; ++ch)
        for (int i = 0; i < numSamples; ++i)
            audio.setSample (ch, i, 0.5f);

    auto stream = file.createOutputStream();
    if (stream == nullptr)
        return {};

    juce::WavAudioFormat wav;
    std::unique_ptr<juce::AudioFormatWriter> writer (wav.createWriterFor (stream.get(), sampleRate,
                                                                          static_cast<unsigned int> (numChannels),
                                                                          16, {}, 0));
    if (writer == nullptr)
        return {};

    stream.release();
    writer->writeFromAudioSampleBuffer (audio, 0, numSamples);
    return file;
}

//==============================================================================
// Test doubles
//==============================================================================

// Holds decode requests until the test completes them, in any order.
class ManualDecoder : public SampleDecoder
{
public:
    bool supportsExtension (const juce::String& extension) const override
    {
        auto ext = extension.trim().toLowerCase();
        return ext == "wav" || ext == "ogg";
    }

    void decode (const juce::String& location, DecodeCallback onComplete) override
    {
        requested.add (location);
        pending.push_back ({ location, std::move (onComplete) });
    }

    bool complete (const juce::String& location, DecodeResult result)
    {
        for (auto it = pending.begin(); it != pending.end(); ++it)
        {
            if (it->location != location)
                continue;

            auto callback = std::move (it->callback);
            pending.erase (it);
            callback (std::move (result));
            return true;
        }

        std::cerr << "no pending decode for " << location << "\n";
        return false;
    }

    int getNumPending() const   { return static_cast<int> (pending.size()); }

    juce::StringArray requested;

private:
    struct Request
    {
        juce::String location;
        DecodeCallback callback;
    };

    std::vector<Request> pending;
};

struct VoiceRecord
{
    VoiceParameters params;
    double startTime = -1.0;
    double duration = 0.0;
    float velocity = 0.0f;
    std::vector<double> stops;
    bool disposed = false;
    SamplerVoice* alive = nullptr;
};

class FakeVoice : public SamplerVoice
{
public:
    FakeVoice (Id voiceId, std::shared_ptr<VoiceRecord> r)
        : id (voiceId), record (std::move (r))
    {
        record->alive = this;
    }

    ~FakeVoice() override
    {
        record->alive = nullptr;
    }

    Id getId() const override   { return id; }

    void start (double time, double, double duration, float velocity) override
    {
        record->startTime = time;
        record->duration = duration;
        record->velocity = velocity;
    }

    void stop (double time) override    { record->stops.push_back (time); }
    void dispose() override             { record->disposed = true; }

    void finish()                       { notifyEnded(); }

private:
    Id id;
    std::shared_ptr<VoiceRecord> record;
};

class FakeVoicePlayer : public VoicePlayer
{
public:
    double getCurrentTime() const override  { return now; }

    std::unique_ptr<SamplerVoice> createVoice (const VoiceParameters& params) override
    {
        auto record = std::make_shared<VoiceRecord>();
        record->params = params;
        records.push_back (record);
        return std::make_unique<FakeVoice> (static_cast<int> (records.size()), record);
    }

    FakeVoice* liveVoice (size_t index) const
    {
        return static_cast<FakeVoice*> (records[index]->alive);
    }

    double now = 0.0;
    std::vector<std::shared_ptr<VoiceRecord>> records;
};

// Fixed-tempo transport whose clock only moves when the test advances it.
// Player time and transport time are the same clock here.
class FakeTransport : public Transport
{
public:
    double toSeconds (const juce::String& notation) const override
    {
        return TimeNotation::toSeconds (notation, tempo, now);
    }

    double getTransportTime() const override    { return now; }

    int schedule (Callback callback, double transportTime) override
    {
        return events.add (std::move (callback), transportTime);
    }

    void cancel (int eventId) override  { events.remove (eventId); }

    // Dispatches the way EditTransport does: one batch per poll, plus any
    // events the batch schedules that are already due.
    void advanceTo (double time)
    {
        now = time;

        for (auto due = events.takeDue (now); ! due.empty(); due = events.takeDue (now))
            for (auto& event : due)
                event.callback (event.transportTime);
    }

    int getNumScheduled() const  { return events.size(); }

    TimeNotation::Tempo tempo;

private:
    double now = 0.0;
    TransportEventQueue events;
};

SamplerOptions optionsWith (const std::map<juce::String, SampleDataPtr>& samples)
{
    SamplerOptions options;
    for (auto& [key, data] : samples)
        options.pitchMap[key] = data;
    return options;
}

//==============================================================================
// SampleBuffer
//==============================================================================

bool testBufferFromArrayToArray()
{
    auto buffer = SampleBuffer::fromArray (std::vector<std::vector<float>> { { 0.1f, 0.2f, 0.3f, 0.4f },
                                                                             { -0.1f, -0.2f, -0.3f, -0.4f } },
                                           22050.0);

    if (buffer->getNumChannels() != 2 || buffer->getLength() != 4 || ! buffer->isLoaded())
    {
        std::cerr << "fromArray produced wrong shape\n";
        return false;
    }

    if (! floatsClose (buffer->getDuration(), 4.0 / 22050.0) || ! floatsClose (buffer->getSampleRate(), 22050.0))
    {
        std::cerr << "fromArray lost the sample rate\n";
        return false;
    }

    auto channels = buffer->toArray();
    if (channels.size() != 2 || ! floatsClose (channels[1][2], -0.3f) || ! floatsClose (buffer->toArray (0)[3], 0.4f))
    {
        std::cerr << "toArray does not match the input\n";
        return false;
    }

    if (! buffer->getChannelData (5).isEmpty())
    {
        std::cerr << "missing channel should give an empty view\n";
        return false;
    }

    try
    {
        buffer->fromArray (std::vector<std::vector<float>> { { 1.0f, 2.0f }, { 1.0f } });
        std::cerr << "unequal channel lengths were accepted\n";
        return false;
    }
    catch (const std::invalid_argument&) {}

    return buffer->getLength() == 4;
}

bool testBufferReverseTwiceRestoresAndCopiesShared()
{
    auto original = SampleBuffer::fromArray (std::vector<float> { 1.0f, 2.0f, 3.0f }, 44100.0);

    SampleBuffer copy;
    copy.set (*original);

    if (copy.get() != original->get())
    {
        std::cerr << "set() should share the data\n";
        return false;
    }

    copy.setReverse (true);

    if (copy.toArray (0) != std::vector<float> { 3.0f, 2.0f, 1.0f })
    {
        std::cerr << "reverse did not reverse\n";
        return false;
    }

    if (original->toArray (0) != std::vector<float> { 1.0f, 2.0f, 3.0f })
    {
        std::cerr << "reversing a copy changed the original\n";
        return false;
    }

    copy.setReverse (true);
    copy.setReverse (false);

    return copy.toArray (0) == original->toArray (0) && ! copy.isReversed();
}

bool testBufferSliceClampsAndThrows()
{
    std::vector<float> ramp;
    for (int i = 0; i < 30; ++i)
        ramp.push_back (static_cast<float> (i));

    auto buffer = SampleBuffer::fromArray (ramp, 10.0);

    auto middle = buffer->slice (1.0, 2.0);
    if (middle->getLength() != 10 || middle->toArray (0).front() != 10.0f || ! floatsClose (middle->getDuration(), 1.0))
    {
        std::cerr << "slice(1, 2) returned the wrong frames\n";
        return false;
    }

    auto tail = middle->slice (0.5);
    if (tail->getLength() != 5 || tail->toArray (0).front() != 15.0f)
    {
        std::cerr << "slice(0.5) of a slice returned the wrong frames\n";
        return false;
    }

    auto clamped = buffer->slice (1.0, 100.0);
    if (clamped->getLength() != 20)
    {
        std::cerr << "end past the duration should clamp\n";
        return false;
    }

    if (buffer->getLength() != 30)
    {
        std::cerr << "slice changed the source\n";
        return false;
    }

    try
    {
        buffer->slice (4.0);
        std::cerr << "start past the duration did not throw\n";
        return false;
    }
    catch (const SliceOutOfRange&) {}

    try
    {
        buffer->slice (2.0, 1.0);
        std::cerr << "end before start did not throw\n";
        return false;
    }
    catch (const SliceOutOfRange&) {}

    return true;
}

bool testBufferToMono()
{
    auto buffer = SampleBuffer::fromArray (std::vector<std::vector<float>> { { 1.0f, 1.0f, 1.0f },
                                                                             { -0.5f, -0.5f, -0.5f } },
                                           44100.0);
    buffer->toMono();

    if (buffer->getNumChannels() != 1 || ! floatsClose (buffer->toArray (0)[1], 0.25f))
    {
        std::cerr << "summed mono should average the channels\n";
        return false;
    }

    auto opposite = SampleBuffer::fromArray (std::vector<std::vector<float>> { { 1.0f }, { -1.0f } }, 44100.0);
    opposite->toMono();
    if (! floatsClose (opposite->toArray (0)[0], 0.0f))
    {
        std::cerr << "opposite channels should cancel\n";
        return false;
    }

    auto picked = SampleBuffer::fromArray (std::vector<std::vector<float>> { { 1.0f, 2.0f }, { 3.0f, 4.0f } }, 44100.0);
    picked->toMono (1);
    if (picked->toArray (0) != std::vector<float> { 3.0f, 4.0f })
    {
        std::cerr << "toMono(1) should keep the second channel\n";
        return false;
    }

    try
    {
        picked->toMono (2);
        std::cerr << "out of range channel did not throw\n";
        return false;
    }
    catch (const std::out_of_range&) {}

    return true;
}

bool testBufferLoadsThroughDecoder()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);

    bool loadedFlag = false;
    auto buffer = SampleBuffer::fromUrl (loader, "kick.wav", [&] { loadedFlag = true; });

    if (buffer->isLoaded() || buffer->getPendingLoad().isSettled() || decoder.getNumPending() != 1)
    {
        std::cerr << "load should be pending until the decoder answers\n";
        return false;
    }

    decoder.complete ("kick.wav", DecodeResult::success (makeData (1, 100, 48000.0)));

    if (! loadedFlag || ! buffer->isLoaded() || ! buffer->getPendingLoad().getResult().wasOk())
    {
        std::cerr << "successful decode did not load the buffer\n";
        return false;
    }

    SampleBuffer::FromOptions options;
    options.url = SampleBuffer::FromLocation { "ramp.wav" };
    options.reverse = true;
    SampleBuffer reversed (loader, options);

    auto ramp = std::make_shared<SampleData>();
    ramp->channels.setSize (1, 3);
    ramp->channels.setSample (0, 0, 1.0f);
    ramp->channels.setSample (0, 1, 2.0f);
    ramp->channels.setSample (0, 2, 3.0f);
    decoder.complete ("ramp.wav", DecodeResult::success (ramp));

    if (reversed.toArray (0) != std::vector<float> { 3.0f, 2.0f, 1.0f })
    {
        std::cerr << "reverse option was not applied on load\n";
        return false;
    }

    return floatsClose (buffer->getSampleRate(), 48000.0);
}

bool testBufferLoadFailureRejects()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);

    juce::String reported;
    auto buffer = SampleBuffer::fromUrl (loader, "missing.wav", nullptr,
                                         [&] (const juce::String& error) { reported = error; });

    decoder.complete ("missing.wav", DecodeResult::failure ("File not found: missing.wav"));

    auto result = buffer->getPendingLoad().getResult();
    if (! result.failed() || result.getErrorMessage() != "File not found: missing.wav")
    {
        std::cerr << "failed decode should reject the load\n";
        return false;
    }

    if (reported != "File not found: missing.wav" || buffer->isLoaded())
    {
        std::cerr << "error callback not called with the decoder's message\n";
        return false;
    }

    return true;
}

bool testBufferReloadKeepsLatestRequest()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);

    int loads = 0;
    auto buffer = SampleBuffer::fromUrl (loader, "first.wav", [&] { ++loads; });
    decoder.complete ("first.wav", DecodeResult::success (makeData (1, 10, 44100.0)));

    auto slow = buffer->load ("slow.wav");
    auto fast = buffer->load ("fast.wav");

    auto fastData = makeData (1, 30, 44100.0);
    decoder.complete ("fast.wav", DecodeResult::success (fastData));
    decoder.complete ("slow.wav", DecodeResult::success (makeData (1, 20, 44100.0)));

    if (! slow.isSettled() || ! fast.isSettled())
    {
        std::cerr << "both loads should settle\n";
        return false;
    }

    if (buffer->get() != fastData || buffer->getLength() != 30)
    {
        std::cerr << "a superseded load replaced the latest one\n";
        return false;
    }

    auto failing = buffer->load ("gone.wav");
    buffer->load ("fast.wav");
    decoder.complete ("gone.wav", DecodeResult::failure ("File not found: gone.wav"));

    if (loads != 2 || buffer->get() != fastData || ! failing.getResult().failed()
        || buffer->getPendingLoad().isSettled())
    {
        std::cerr << "a superseded failure reached the buffer\n";
        return false;
    }

    auto replacement = makeData (1, 5, 44100.0);
    buffer->set (replacement);
    decoder.complete ("fast.wav", DecodeResult::success (fastData));

    return buffer->get() == replacement;
}

bool testUnsupportedExtensionsReject()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);

    juce::String reported;
    auto pending = loader.load ("pad.[mp3|flac]", nullptr, [&] (const juce::String& e) { reported = e; });

    if (pending.isSettled())
    {
        std::cerr << "rejection must not happen inside load()\n";
        return false;
    }

    if (! pumpUntil ([&] { return pending.isSettled(); }))
    {
        std::cerr << "unsupported load never settled\n";
        return false;
    }

    return pending.getResult().failed()
        && reported.startsWith ("None of the extensions are supported")
        && decoder.requested.isEmpty();
}

bool testBracketFallbackPicksFirstSupported()
{
    auto candidates = SampleLoader::expandCandidates ("piano/C4.[mp3|ogg|wav]");
    if (candidates.size() != 3 || candidates[0] != "piano/C4.mp3" || candidates[2] != "piano/C4.wav")
    {
        std::cerr << "bracket expansion is wrong\n";
        return false;
    }

    if (SampleLoader::expandCandidates ("plain.wav").size() != 1)
    {
        std::cerr << "plain location should be its own candidate\n";
        return false;
    }

    ManualDecoder decoder;
    SampleLoader loader (decoder);
    auto buffer = SampleBuffer::fromUrl (loader, "piano/C4.[mp3|ogg|wav]");

    if (decoder.requested.size() != 1 || decoder.requested[0] != "piano/C4.ogg")
    {
        std::cerr << "expected the ogg candidate to be decoded\n";
        return false;
    }

    return decoder.complete ("piano/C4.ogg", DecodeResult::success (makeData (1, 10, 44100.0)))
        && buffer->isLoaded();
}

bool testSupportsTypeWithAudioFileDecoder()
{
    AudioFileDecoder decoder (1);
    SampleLoader loader (decoder);

    if (! SampleBuffer::supportsType (loader, "test.wav")
        || ! SampleBuffer::supportsType (loader, "wav")
        || ! SampleBuffer::supportsType (loader, "path/to/test.wav")
        || ! SampleBuffer::supportsType (loader, "http://example.com/a/b.WAV?take=2"))
    {
        std::cerr << "wav locations should be supported\n";
        return false;
    }

    if (SampleBuffer::supportsType (loader, ".nope") || SampleBuffer::supportsType (loader, "test.nope")
        || SampleBuffer::supportsType (loader, "path/to/test.nope"))
    {
        std::cerr << "unknown extension reported as supported\n";
        return false;
    }

    return true;
}

bool testLoadedWaitsForMixedOutcomes()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);

    auto a = SampleBuffer::fromUrl (loader, "a.wav");
    auto b = SampleBuffer::fromUrl (loader, "b.wav");
    auto c = SampleBuffer::fromUrl (loader, "c.wav");

    auto all = SampleBuffer::loaded (loader);

    decoder.complete ("b.wav", DecodeResult::failure ("corrupt"));
    decoder.complete ("a.wav", DecodeResult::success (makeData (1, 10, 44100.0)));

    if (all.isSettled())
    {
        std::cerr << "loaded() settled with a load outstanding\n";
        return false;
    }

    decoder.complete ("c.wav", DecodeResult::success (makeData (1, 10, 44100.0)));

    auto& registry = loader.getRegistry();
    if (! all.isSettled() || ! all.getResult().wasOk())
    {
        std::cerr << "loaded() should settle ok once everything settled\n";
        return false;
    }

    return registry.getNumRequested() == 3 && registry.getNumSettled() == 3
        && floatsClose (registry.getProgress(), 1.0f);
}

bool testLoadedSnapshotIgnoresLaterLoads()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);

    auto first = SampleBuffer::fromUrl (loader, "first.wav");
    auto snapshot = SampleBuffer::loaded (loader);
    auto second = SampleBuffer::fromUrl (loader, "second.wav");

    decoder.complete ("first.wav", DecodeResult::success (makeData (1, 10, 44100.0)));

    if (! snapshot.isSettled())
    {
        std::cerr << "a load started later held up an earlier loaded()\n";
        return false;
    }

    if (SampleBuffer::loaded (loader).isSettled())
    {
        std::cerr << "a fresh loaded() should wait for the second load\n";
        return false;
    }

    return loader.getRegistry().getNumOutstanding() == 1;
}

//==============================================================================
// SampleBufferStore
//==============================================================================

bool testStoreTracksEntryStates()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);

    bool storeLoaded = false;
    SampleBufferStore store (loader,
                             { { "a", juce::String ("a.[mp3|wav]") }, { "b", makeData (1, 10, 44100.0) } },
                             [&] { storeLoaded = true; },
                             "samples/");

    if (store.getCandidates ("a") != juce::StringArray { "samples/a.mp3", "samples/a.wav" })
    {
        std::cerr << "base url not applied to candidates\n";
        return false;
    }

    if (store.getState ("a") != SampleBufferStore::LoadState::loading
        || store.getState ("b") != SampleBufferStore::LoadState::loaded
        || store.getState ("zzz") != SampleBufferStore::LoadState::unloaded)
    {
        std::cerr << "unexpected entry states before decoding\n";
        return false;
    }

    try
    {
        store.get ("a");
        std::cerr << "get() returned a loading entry\n";
        return false;
    }
    catch (const BufferNotAvailable&) {}

    decoder.complete ("samples/a.wav", DecodeResult::failure ("corrupt"));

    if (store.getState ("a") != SampleBufferStore::LoadState::errored || store.isLoaded())
    {
        std::cerr << "failed entry should be errored\n";
        return false;
    }

    if (! store.loaded().isSettled() || store.get ("b").getLength() != 10)
    {
        std::cerr << "loaded() should settle once every entry settled\n";
        return false;
    }

    if (! pumpUntil ([&] { return storeLoaded; }))
    {
        std::cerr << "store onload never fired\n";
        return false;
    }

    return store.resolveLocation ("http://host/x.wav") == "http://host/x.wav"
        && store.resolveLocation ("x.wav") == "samples/x.wav";
}

bool testStoreAdoptsLoadingBuffer()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    SampleBufferStore store (loader);

    auto source = SampleBuffer::fromUrl (loader, "snare.wav");

    bool entryLoaded = false;
    store.add ("copy", source.get(), [&] { entryLoaded = true; });

    if (store.getState ("copy") != SampleBufferStore::LoadState::loading)
    {
        std::cerr << "entry should wait for its loading source\n";
        return false;
    }

    decoder.complete ("snare.wav", DecodeResult::success (makeData (2, 64, 44100.0)));

    if (! entryLoaded || store.getState ("copy") != SampleBufferStore::LoadState::loaded)
    {
        std::cerr << "entry did not follow its source\n";
        return false;
    }

    return store.get ("copy").get() == source->get();
}

bool testStoreReplacesExistingKey()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;

    auto first = makeData (1, 100, 44100.0);
    auto second = makeData (1, 200, 44100.0);
    Sampler sampler (optionsWith ({ { "C4", first } }), loader, player);

    sampler.triggerAttack (60, 0.0);
    sampler.add ("C4", second);
    sampler.triggerAttack (60, 0.1);

    if (player.records.size() != 2 || player.records[0]->params.data != first
        || player.records[1]->params.data != second || first->getNumSamples() != 100)
    {
        std::cerr << "playing voice lost its data or the new entry was not used\n";
        return false;
    }

    // A load still in flight for the replaced entry must not touch the new one.
    SampleBufferStore store (loader, { { "x", juce::String ("x.wav") } });
    store.add ("x", second);
    decoder.complete ("x.wav", DecodeResult::success (first));

    return store.getState ("x") == SampleBufferStore::LoadState::loaded
        && store.get ("x").get() == second;
}

bool testStoreDisposeRejectsUse()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    SampleBufferStore store (loader, { { "x", makeData (1, 4, 44100.0) } });

    store.dispose();
    store.dispose();

    try
    {
        store.has ("x");
        std::cerr << "has() worked after dispose\n";
        return false;
    }
    catch (const InstanceDisposed&) {}

    try
    {
        store.add ("y", makeData (1, 4, 44100.0));
        std::cerr << "add() worked after dispose\n";
        return false;
    }
    catch (const InstanceDisposed&) {}

    return store.isDisposed();
}

//==============================================================================
// Sampler
//==============================================================================

bool testSamplerFindsClosestPitch()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;

    auto data = makeData (1, 441, 44100.0);
    Sampler sampler (optionsWith ({ { "C4", data }, { "C5", data } }), loader, player);

    if (sampler.findClosest (61) != 1 || sampler.findClosest (60) != 0 || sampler.findClosest (71) != -1)
    {
        std::cerr << "wrong nearest-sample offsets\n";
        return false;
    }

    // Six semitones from both samples: the one above wins.
    if (sampler.findClosest (66) != -6)
    {
        std::cerr << "tie should prefer the higher sample\n";
        return false;
    }

    sampler.triggerAttack (61, 0.0);

    if (player.records.size() != 1)
        return false;

    const auto ratio = std::pow (2.0, 1.0 / 12.0);
    auto& record = *player.records[0];

    if (! floatsClose (record.params.playbackRate, ratio) || ! floatsClose (record.duration, 0.01 / ratio))
    {
        std::cerr << "voice not repitched from C4\n";
        return false;
    }

    return sampler.getNumActiveVoices (61) == 1 && sampler.getNumActiveVoices (60) == 0;
}

bool testSamplerSearchIsBounded()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;

    Sampler sampler (optionsWith ({ { "60", makeData (1, 100, 44100.0) } }), loader, player);

    if (sampler.findClosest (155) != 95 || sampler.findClosest (-35) != -95)
    {
        std::cerr << "pitches within the search range were not found\n";
        return false;
    }

    try
    {
        sampler.findClosest (156);
        std::cerr << "search went past its bound\n";
        return false;
    }
    catch (const NoBufferAvailable&) {}

    try
    {
        sampler.triggerAttack (200);
        std::cerr << "attack on an unreachable pitch did not throw\n";
        return false;
    }
    catch (const NoBufferAvailable& e)
    {
        if (e.requestedPitch != 200)
            return false;
    }

    return player.records.empty();
}

bool testSamplerSkipsUnloadedSamples()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;

    SamplerOptions options = optionsWith ({ { "48", makeData (1, 100, 44100.0) } });
    options.pitchMap["61"] = juce::String ("C#4.wav");
    Sampler sampler (options, loader, player);

    // 61 is still loading, so 48 serves it.
    if (sampler.findClosest (61) != 13 || sampler.isLoaded())
    {
        std::cerr << "a loading sample was used\n";
        return false;
    }

    decoder.complete ("C#4.wav", DecodeResult::success (makeData (1, 100, 44100.0)));

    return sampler.findClosest (61) == 0 && sampler.isLoaded();
}

bool testSamplerReleaseWithoutVoicesIsNoOp()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    Sampler sampler (optionsWith ({ { "C4", makeData (1, 100, 44100.0) } }), loader, player);

    sampler.triggerRelease (60);
    sampler.triggerRelease (std::vector<int> { 1, 2, 3 }, 4.0);
    sampler.releaseAll();

    return sampler.getNumActiveVoices() == 0;
}

bool testSamplerReleaseStopsOnlyCurrentVoices()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    Sampler sampler (optionsWith ({ { "C4", makeData (1, 44100, 44100.0) } }), loader, player);

    sampler.triggerAttack (60, 0.0);
    sampler.triggerAttack (60, 0.1);

    if (sampler.getNumActiveVoices (60) != 2)
    {
        std::cerr << "both attacks should be active\n";
        return false;
    }

    sampler.triggerRelease (60, 1.0);
    sampler.triggerAttack (60, 1.0);

    if (player.records[0]->stops != std::vector<double> { 1.0 } || player.records[1]->stops != std::vector<double> { 1.0 })
    {
        std::cerr << "release did not stop the earlier voices\n";
        return false;
    }

    if (! player.records[2]->stops.empty() || sampler.getNumActiveVoices (60) != 1)
    {
        std::cerr << "a later attack was affected by the earlier release\n";
        return false;
    }

    return player.records[0]->alive == nullptr;
}

bool testSamplerAttackReleaseReusesLastDuration()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    Sampler sampler (optionsWith ({ { "C4", makeData (1, 44100, 44100.0) } }), loader, player);

    sampler.triggerAttackRelease ({ 60, 62, 64 }, { 0.5, 1.0 }, 2.0, 0.8f);

    if (player.records.size() != 3)
        return false;

    if (player.records[0]->stops != std::vector<double> { 2.5 }
        || player.records[1]->stops != std::vector<double> { 3.0 }
        || player.records[2]->stops != std::vector<double> { 3.0 })
    {
        std::cerr << "durations not applied per pitch\n";
        return false;
    }

    if (! floatsClose (player.records[0]->velocity, 0.8f) || ! floatsClose (player.records[0]->startTime, 2.0))
        return false;

    try
    {
        sampler.triggerAttackRelease (std::vector<int> { 60 }, std::vector<double> {}, 0.0);
        std::cerr << "empty durations were accepted\n";
        return false;
    }
    catch (const std::invalid_argument&) {}

    return true;
}

bool testSamplerAttackReleaseStillReleasesOnFailure()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    Sampler sampler (optionsWith ({ { "C4", makeData (1, 44100, 44100.0) } }), loader, player);

    try
    {
        sampler.triggerAttackRelease ({ 60, 300 }, { 1.0 }, 0.0);
        std::cerr << "unreachable pitch did not throw\n";
        return false;
    }
    catch (const NoBufferAvailable& e)
    {
        if (e.requestedPitch != 300)
            return false;
    }

    return player.records.size() == 1 && player.records[0]->stops == std::vector<double> { 1.0 }
        && sampler.getNumActiveVoices() == 0;
}

bool testVoiceCompletionDeregisters()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    Sampler sampler (optionsWith ({ { "C4", makeData (1, 100, 44100.0) } }), loader, player);

    sampler.triggerAttack ({ 60, 60 }, 0.0);
    player.liveVoice (0)->finish();

    if (sampler.getNumActiveVoices (60) != 1 || player.records[0]->alive != nullptr)
    {
        std::cerr << "finished voice was not dropped\n";
        return false;
    }

    // A registry that is already gone must be tolerated.
    auto registry = std::make_unique<ActiveVoiceRegistry>();
    auto record = std::make_shared<VoiceRecord>();
    FakeVoice orphan (99, record);
    orphan.setRegistryLink ({ registry.get(), 60 });
    registry.reset();
    orphan.finish();

    ActiveVoiceRegistry empty;
    empty.voiceEnded (60, 12345);

    return empty.getNumVoices() == 0;
}

bool testSamplerDisposeRejectsUse()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    Sampler sampler (optionsWith ({ { "C4", makeData (1, 44100, 44100.0) } }), loader, player);

    sampler.triggerAttack (60, 0.0);
    sampler.dispose();
    sampler.dispose();

    if (! player.records[0]->disposed || player.records[0]->alive != nullptr)
    {
        std::cerr << "dispose should silence and drop active voices\n";
        return false;
    }

    try
    {
        sampler.triggerAttack (60);
        std::cerr << "attack worked after dispose\n";
        return false;
    }
    catch (const InstanceDisposed&) {}

    try
    {
        sampler.loaded();
        std::cerr << "loaded() worked after dispose\n";
        return false;
    }
    catch (const InstanceDisposed&) {}

    return sampler.isDisposed();
}

bool testSamplerSyncSchedulesOnTransport()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    FakeTransport transport;

    {
        Sampler unsyncable (optionsWith ({ { "C4", makeData (1, 44100, 44100.0) } }), loader, player);
        try
        {
            unsyncable.sync();
            std::cerr << "sync without a transport was accepted\n";
            return false;
        }
        catch (const std::logic_error&) {}
    }

    Sampler sampler (optionsWith ({ { "C4", makeData (1, 44100, 44100.0) } }), loader, player, &transport);
    sampler.sync();

    sampler.triggerAttack (60, transport.toSeconds ("2n"));
    if (! player.records.empty())
    {
        std::cerr << "synced attack should wait for the transport\n";
        return false;
    }

    transport.advanceTo (1.0);
    if (player.records.size() != 1 || ! floatsClose (player.records[0]->startTime, 1.0))
    {
        std::cerr << "scheduled attack did not fire at its time\n";
        return false;
    }

    sampler.triggerAttackRelease (62, 0.5, 2.0);
    transport.advanceTo (2.6);
    if (player.records.size() != 2 || player.records[1]->stops != std::vector<double> { 2.5 })
    {
        std::cerr << "scheduled release did not fire\n";
        return false;
    }

    sampler.triggerAttack (64, 5.0);
    sampler.unsync();
    transport.advanceTo (6.0);

    return player.records.size() == 2 && transport.getNumScheduled() == 0 && ! sampler.isSynced();
}

bool testTransportEventsRunInTimeOrder()
{
    TransportEventQueue queue;
    std::vector<int> ran;

    queue.add ([&] (double) { ran.push_back (1); }, 3.0);
    queue.add ([&] (double) { ran.push_back (2); }, 1.0);
    auto cancelled = queue.add ([&] (double) { ran.push_back (3); }, 0.5);
    queue.add ([&] (double) { ran.push_back (4); }, 2.0);
    queue.add ([&] (double) { ran.push_back (5); }, 1.0);
    queue.remove (cancelled);

    for (auto& event : queue.takeDue (2.5))
        event.callback (event.transportTime);

    if (ran != std::vector<int> { 2, 5, 4 } || queue.size() != 1)
    {
        std::cerr << "due events not taken in time order\n";
        return false;
    }

    // A later note whose attack is filed first must not be cut by an earlier release.
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;
    FakeTransport transport;

    Sampler sampler (optionsWith ({ { "C4", makeData (1, 44100, 44100.0) } }), loader, player, &transport);
    sampler.sync();

    sampler.triggerAttack (60, 0.03);
    sampler.triggerAttackRelease (60, 0.01, 0.0);
    transport.advanceTo (0.05);

    if (player.records.size() != 2)
    {
        std::cerr << "expected two voices\n";
        return false;
    }

    return floatsClose (player.records[0]->startTime, 0.0)
        && player.records[0]->stops == std::vector<double> { 0.01 }
        && floatsClose (player.records[1]->startTime, 0.03)
        && player.records[1]->stops.empty();
}

bool testInvalidPitchKeysThrow()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    FakeVoicePlayer player;

    try
    {
        Sampler sampler (optionsWith ({ { "H4", makeData (1, 10, 44100.0) } }), loader, player);
        std::cerr << "note name H4 was accepted\n";
        return false;
    }
    catch (const InvalidPitchKey&) {}

    Sampler sampler (optionsWith ({ { "A4", makeData (1, 10, 44100.0) } }), loader, player);

    try
    {
        sampler.add ("loud", makeData (1, 10, 44100.0));
        std::cerr << "add() accepted a bad key\n";
        return false;
    }
    catch (const InvalidPitchKey&) {}

    for (const char* key : { "1e300", "256", "-129", "C99" })
    {
        try
        {
            sampler.add (key, makeData (1, 10, 44100.0));
            std::cerr << "out of range key " << key << " was accepted\n";
            return false;
        }
        catch (const InvalidPitchKey&) {}
    }

    for (int pitch : { std::numeric_limits<int>::max(), std::numeric_limits<int>::min(), 256 })
    {
        try
        {
            sampler.findClosest (pitch);
            std::cerr << "findClosest accepted pitch " << pitch << "\n";
            return false;
        }
        catch (const NoBufferAvailable& e)
        {
            if (e.requestedPitch != pitch)
                return false;
        }
    }

    sampler.add ("72.2", makeData (1, 10, 44100.0));
    sampler.add ("255", makeData (1, 10, 44100.0));
    return sampler.findClosest (72) == 0 && sampler.findClosest (69) == 0
        && sampler.findClosest (255) == 0;
}

bool testVoiceRendererPlaysRepitchedSample()
{
    ManualDecoder decoder;
    SampleLoader loader (decoder);
    VoiceRenderer renderer;
    renderer.prepare (100.0, 100);

    SamplerOptions options = optionsWith ({ { "C4", makeData (1, 50, 100.0) } });
    options.release = 0.0;
    options.curve = FadeCurve::linear;
    Sampler sampler (options, loader, renderer);

    sampler.triggerAttack (60, 0.0, 0.5f);
    sampler.triggerAttack (72, 0.0);

    juce::AudioBuffer<float> output (1, 100);
    output.clear();
    renderer.renderNextBlock (output, 0, 100);

    // Both voices up to 0.25 s, only the unpitched one until 0.5 s.
    if (! floatsClose (output.getSample (0, 10), 1.5f) || ! floatsClose (output.getSample (0, 30), 0.5f)
        || ! floatsClose (output.getSample (0, 60), 0.0f))
    {
        std::cerr << "rendered levels are wrong: " << output.getSample (0, 10) << " "
                  << output.getSample (0, 30) << " " << output.getSample (0, 60) << "\n";
        return false;
    }

    if (! floatsClose (renderer.getCurrentTime(), 1.0) || renderer.getNumPlayingVoices() != 0)
        return false;

    if (! pumpUntil ([&] { return sampler.getNumActiveVoices() == 0; }))
    {
        std::cerr << "finished voices were not deregistered\n";
        return false;
    }

    return true;
}

//==============================================================================
// Decoding, notation and presets
//==============================================================================

bool testAudioFileDecoderReportsFailures()
{
    AudioFileDecoder decoder (1);

    auto missing = decoder.decodeNow ("/definitely/not/here.wav");
    if (missing.wasOk() || ! missing.error.startsWith ("File not found"))
    {
        std::cerr << "missing file not reported\n";
        return false;
    }

    auto corrupt = juce::File::getSpecialLocation (juce::File::tempDirectory)
                       .getNonexistentChildFile ("repitch_corrupt", ".wav", false);
    corrupt.replaceWithText ("this is not audio");

    auto garbage = decoder.decodeNow (corrupt.getFullPathName());
    corrupt.deleteFile();

    if (garbage.wasOk())
    {
        std::cerr << "corrupt file decoded\n";
        return false;
    }

    SampleLoader loader (decoder);
    auto buffer = SampleBuffer::fromUrl (loader, "/definitely/not/here.wav");

    if (! pumpUntil ([&] { return buffer->getPendingLoad().isSettled(); }))
        return false;

    return buffer->getPendingLoad().getResult().failed() && ! buffer->isLoaded();
}

bool testAudioFileDecoderLoadsWav()
{
    auto file = writeTestWav ("repitch_tone", 2, 1000, 22050.0);
    if (file == juce::File())
        return false;

    AudioFileDecoder decoder (1);
    decoder.setBaseDirectory (file.getParentDirectory());
    SampleLoader loader (decoder);

    SampleBufferStore store (loader, { { "60", file.getFileNameWithoutExtension() + ".[mp3x|wav]" } });

    auto pending = store.loaded();
    auto settled = pumpUntil ([&] { return pending.isSettled(); });
    file.deleteFile();

    if (! settled || store.getState ("60") != SampleBufferStore::LoadState::loaded)
    {
        std::cerr << "wav file did not load through the store\n";
        return false;
    }

    auto& buffer = store.get ("60");
    return buffer.getLength() == 1000 && buffer.getNumChannels() == 2
        && floatsClose (buffer.getSampleRate(), 22050.0) && floatsClose (buffer.toArray (1)[500], 0.5f, 1.0e-3);
}

bool testTimeNotation()
{
    TimeNotation::Tempo tempo;

    if (! floatsClose (TimeNotation::toSeconds ("4n", tempo, 0.0), 0.5)
        || ! floatsClose (TimeNotation::toSeconds ("1m", tempo, 0.0), 2.0)
        || ! floatsClose (TimeNotation::toSeconds ("8t", tempo, 0.0), 1.0 / 6.0)
        || ! floatsClose (TimeNotation::toSeconds ("4n.", tempo, 0.0), 0.75)
        || ! floatsClose (TimeNotation::toSeconds ("+4n", tempo, 1.0), 1.5)
        || ! floatsClose (TimeNotation::toSeconds ("0.25", tempo, 3.0), 0.25))
    {
        std::cerr << "notation at 120 bpm is wrong\n";
        return false;
    }

    TimeNotation::Tempo waltz { 60.0, 3 };
    if (! floatsClose (TimeNotation::toSeconds ("1m", waltz, 0.0), 3.0))
        return false;

    try
    {
        TimeNotation::toSeconds ("soon", tempo, 0.0);
        std::cerr << "nonsense notation was accepted\n";
        return false;
    }
    catch (const std::invalid_argument&) {}

    return ! TimeNotation::parse ("4x", tempo).has_value();
}

bool testNoteNames()
{
    return NoteUtils::parsePitchKey ("C4") == 60
        && NoteUtils::parsePitchKey ("A4") == 69
        && NoteUtils::parsePitchKey ("C#4") == 61
        && NoteUtils::parsePitchKey ("Db4") == 61
        && NoteUtils::parsePitchKey ("Cbb4") == 58
        && NoteUtils::parsePitchKey ("Cx4") == 62
        && NoteUtils::parsePitchKey ("C-1") == 0
        && NoteUtils::parsePitchKey ("60") == 60
        && NoteUtils::parsePitchKey ("60.4") == 60
        && NoteUtils::midiToNoteName (61) == "C#4"
        && NoteUtils::midiToNoteName (-1) == "B-2";
}

bool testPresetRoundTrip()
{
    SamplerPreset preset;
    preset.samples["C4"] = "C4.[ogg|wav]";
    preset.samples["69"] = "A4.wav";
    preset.baseUrl = "piano/";
    preset.attack = 0.25;
    preset.release = 1.5;
    preset.curve = FadeCurve::linear;

    auto file = juce::File::getSpecialLocation (juce::File::tempDirectory)
                    .getNonexistentChildFile ("repitch_preset", ".xml", false);

    auto saveErr = SamplerPresetSerializer::saveToFile (file, preset);
    SamplerPreset loaded;
    auto loadErr = SamplerPresetSerializer::loadFromFile (file, loaded);
    file.deleteFile();

    if (saveErr.isNotEmpty() || loadErr.isNotEmpty() || loaded != preset)
    {
        std::cerr << "preset round trip failed: " << saveErr << loadErr << "\n";
        return false;
    }

    auto tree = SamplerPresetSerializer::toValueTree (preset);
    tree.getChildWithName ("Samples").getChild (0).setProperty ("pitch", "H2", nullptr);

    SamplerPreset rejected;
    if (SamplerPresetSerializer::fromValueTree (tree, rejected).isEmpty())
    {
        std::cerr << "bad pitch key was loaded\n";
        return false;
    }

    return SamplerPresetSerializer::fromValueTree (juce::ValueTree ("Other"), rejected).isNotEmpty()
        && rejected == SamplerPreset();
}

} // namespace

int main()
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    struct TestCase
    {
        const char* name;
        bool (*fn)();
    };

    const std::vector<TestCase> tests = {
        { "BufferFromArrayToArray", &testBufferFromArrayToArray },
        { "BufferReverseTwiceRestoresAndCopiesShared", &testBufferReverseTwiceRestoresAndCopiesShared },
        { "BufferSliceClampsAndThrows", &testBufferSliceClampsAndThrows },
        { "BufferToMono", &testBufferToMono },
        { "BufferLoadsThroughDecoder", &testBufferLoadsThroughDecoder },
        { "BufferLoadFailureRejects", &testBufferLoadFailureRejects },
        { "BufferReloadKeepsLatestRequest", &testBufferReloadKeepsLatestRequest },
        { "UnsupportedExtensionsReject", &testUnsupportedExtensionsReject },
        { "BracketFallbackPicksFirstSupported", &testBracketFallbackPicksFirstSupported },
        { "SupportsTypeWithAudioFileDecoder", &testSupportsTypeWithAudioFileDecoder },
        { "LoadedWaitsForMixedOutcomes", &testLoadedWaitsForMixedOutcomes },
        { "LoadedSnapshotIgnoresLaterLoads", &testLoadedSnapshotIgnoresLaterLoads },
        { "StoreTracksEntryStates", &testStoreTracksEntryStates },
        { "StoreAdoptsLoadingBuffer", &testStoreAdoptsLoadingBuffer },
        { "StoreReplacesExistingKey", &testStoreReplacesExistingKey },
        { "StoreDisposeRejectsUse", &testStoreDisposeRejectsUse },
        { "SamplerFindsClosestPitch", &testSamplerFindsClosestPitch },
        { "SamplerSearchIsBounded", &testSamplerSearchIsBounded },
        { "SamplerSkipsUnloadedSamples", &testSamplerSkipsUnloadedSamples },
        { "SamplerReleaseWithoutVoicesIsNoOp", &testSamplerReleaseWithoutVoicesIsNoOp },
        { "SamplerReleaseStopsOnlyCurrentVoices", &testSamplerReleaseStopsOnlyCurrentVoices },
        { "SamplerAttackReleaseReusesLastDuration", &testSamplerAttackReleaseReusesLastDuration },
        { "SamplerAttackReleaseStillReleasesOnFailure", &testSamplerAttackReleaseStillReleasesOnFailure },
        { "VoiceCompletionDeregisters", &testVoiceCompletionDeregisters },
        { "SamplerDisposeRejectsUse", &testSamplerDisposeRejectsUse },
        { "SamplerSyncSchedulesOnTransport", &testSamplerSyncSchedulesOnTransport },
        { "TransportEventsRunInTimeOrder", &testTransportEventsRunInTimeOrder },
        { "InvalidPitchKeysThrow", &testInvalidPitchKeysThrow },
        { "VoiceRendererPlaysRepitchedSample", &testVoiceRendererPlaysRepitchedSample },
        { "AudioFileDecoderReportsFailures", &testAudioFileDecoderReportsFailures },
        { "AudioFileDecoderLoadsWav", &testAudioFileDecoderLoadsWav },
        { "TimeNotation", &testTimeNotation },
        { "NoteNames", &testNoteNames },
        { "PresetRoundTrip", &testPresetRoundTrip },
    };

    int failures = 0;
    for (const auto& test : tests)
    {
        bool ok = false;

        try
        {
            ok = test.fn();
        }
        catch (const std::exception& e)
        {
            std::cerr << "unexpected exception: " << e.what() << "\n";
        }

        std::cout << (ok ? "[PASS] " : "[FAIL] ") << test.name << "\n";
        if (! ok)
            ++failures;
    }

    if (failures != 0)
        std::cout << failures << " test(s) failed\n";

    return failures == 0 ? 0 : 1;
}
