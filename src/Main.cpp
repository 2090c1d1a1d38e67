#include <cmath>
#include <iostream>

#include <JuceHeader.h>
#include "AudioFileDecoder.h"
#include "GlobalPreferences.h"
#include "NoteUtils.h"
#include "SampleLoader.h"
#include "Sampler.h"
#include "SamplerEngine.h"
#include "SamplerErrors.h"
#include "SamplerPresetSerializer.h"
#include "TimeNotation.h"
#include "VoiceRenderer.h"

namespace
{

constexpr double kRenderSampleRate = 44100.0;
constexpr int kRenderBlockSize = 512;

struct NoteRequest
{
    std::vector<int> pitches;
    double noteSeconds = 0.5;
    TimeNotation::Tempo tempo;
};

SamplerPreset loadPreset (const juce::File& presetFile)
{
    SamplerPreset preset;
    auto error = SamplerPresetSerializer::loadFromFile (presetFile, preset);
    if (error.isNotEmpty())
        juce::ConsoleApplication::fail (error);

    GlobalPreferences::saveLastPresetFile (presetFile);
    return preset;
}

// Returns the preset named at index, or the last one used when that argument is a note.
juce::File resolvePresetFile (const juce::ArgumentList& args, int index, bool& consumed)
{
    consumed = args.size() > index && args[index].text.endsWithIgnoreCase (".xml");
    if (consumed)
        return args[index].resolveAsExistingFile();

    auto last = GlobalPreferences::loadLastPresetFile();
    if (last == juce::File() || ! last.existsAsFile())
        juce::ConsoleApplication::fail ("No preset given and no previous preset remembered");

    return last;
}

NoteRequest parseNotes (const juce::ArgumentList& args, int firstNote)
{
    NoteRequest request;

    auto bpmText = args.getValueForOption ("--bpm");
    if (bpmText.isNotEmpty())
        request.tempo.bpm = juce::jmax (1.0, bpmText.getDoubleValue());

    auto durationText = args.getValueForOption ("--duration");
    if (durationText.isEmpty())
        durationText = "2n";

    try
    {
        request.noteSeconds = TimeNotation::toSeconds (durationText, request.tempo, 0.0);

        for (int i = firstNote; i < args.size(); ++i)
        {
            auto text = args[i].text;
            if (text.startsWith ("--"))
                break;

            request.pitches.push_back (NoteUtils::parsePitchKey (text));
        }
    }
    catch (const std::invalid_argument& e)
    {
        juce::ConsoleApplication::fail (e.what());
    }

    if (request.pitches.empty())
        juce::ConsoleApplication::fail ("No notes given");

    return request;
}

void waitForSamples (Sampler& sampler, SampleLoader& loader)
{
    auto pending = sampler.loaded();
    while (! pending.isSettled())
        juce::MessageManager::getInstance()->runDispatchLoopUntil (10);

    auto& registry = loader.getRegistry();
    std::cout << "Loaded " << registry.getNumSettled() << " of " << registry.getNumRequested()
              << " samples" << std::endl;

    if (! sampler.isLoaded())
        std::cout << "Some samples failed to load, nearest loaded pitches will be used" << std::endl;
}

void triggerSequence (Sampler& sampler, const NoteRequest& request, double start)
{
    for (size_t i = 0; i < request.pitches.size(); ++i)
    {
        auto at = start + static_cast<double> (i) * request.noteSeconds;

        try
        {
            sampler.triggerAttackRelease (request.pitches[i], request.noteSeconds, at);
        }
        catch (const NoBufferAvailable& e)
        {
            std::cout << "Skipping " << NoteUtils::midiToNoteName (e.requestedPitch) << ": " << e.what() << std::endl;
        }
    }
}

//==============================================================================

void renderToFile (const juce::ArgumentList& args)
{
    args.checkMinNumArguments (4);

    auto presetFile = args[1].resolveAsExistingFile();
    auto outFile = args[2].resolveAsFile();
    auto preset = loadPreset (presetFile);
    auto request = parseNotes (args, 3);

    AudioFileDecoder decoder;
    decoder.setBaseDirectory (presetFile.getParentDirectory());
    SampleLoader loader (decoder);

    VoiceRenderer renderer;
    renderer.prepare (kRenderSampleRate, kRenderBlockSize);

    Sampler sampler (preset.toOptions(), loader, renderer);
    waitForSamples (sampler, loader);

    triggerSequence (sampler, request, 0.0);

    auto totalSeconds = request.noteSeconds * static_cast<double> (request.pitches.size()) + preset.release + 0.05;
    auto totalSamples = static_cast<int> (std::ceil (totalSeconds * kRenderSampleRate));

    juce::AudioBuffer<float> output (2, totalSamples);
    output.clear();

    for (int pos = 0; pos < totalSamples; pos += kRenderBlockSize)
        renderer.renderNextBlock (output, pos, juce::jmin (kRenderBlockSize, totalSamples - pos));

    outFile.deleteFile();
    auto stream = outFile.createOutputStream();
    if (stream == nullptr)
        juce::ConsoleApplication::fail ("Failed to open output file: " + outFile.getFullPathName());

    juce::WavAudioFormat wav;
    std::unique_ptr<juce::AudioFormatWriter> writer (wav.createWriterFor (stream.get(), kRenderSampleRate,
                                                                          2, 24, {}, 0));
    if (writer == nullptr)
        juce::ConsoleApplication::fail ("Failed to create WAV writer");

    stream.release(); // owned by the writer now

    if (! writer->writeFromAudioSampleBuffer (output, 0, totalSamples))
        juce::ConsoleApplication::fail ("Failed to write audio to " + outFile.getFullPathName());

    std::cout << "Rendered " << request.pitches.size() << " notes to " << outFile.getFullPathName() << std::endl;
}

void playThroughEdit (const juce::ArgumentList& args)
{
    args.checkMinNumArguments (2);

    bool presetGiven = false;
    auto presetFile = resolvePresetFile (args, 1, presetGiven);
    auto preset = loadPreset (presetFile);
    auto request = parseNotes (args, presetGiven ? 2 : 1);

    AudioFileDecoder decoder;
    decoder.setBaseDirectory (presetFile.getParentDirectory());
    SampleLoader loader (decoder);

    SamplerEngine engine;
    engine.initialise();
    engine.setBpm (request.tempo.bpm);

    {
        auto options = preset.toOptions();
        options.debug = args.containsOption ("--debug");

        Sampler sampler (options, loader, engine.getRenderer(), &engine.getTransport());
        waitForSamples (sampler, loader);

        sampler.sync();
        triggerSequence (sampler, request, 0.0);

        auto endTime = request.noteSeconds * static_cast<double> (request.pitches.size()) + preset.release + 0.25;

        engine.play();
        while (engine.isPlaying() && engine.getTransport().getTransportTime() < endTime)
            juce::MessageManager::getInstance()->runDispatchLoopUntil (20);

        engine.stop();
    }
}

} // namespace

//==============================================================================
int main (int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI juceInitialiser;

    juce::ConsoleApplication app;
    app.addHelpCommand ("--help|-h", "Usage:", true);
    app.addVersionCommand ("--version|-v", "Repitch 0.1.0");

    app.addCommand ({ "--render",
                      "--render <preset.xml> <out.wav> <note> [note...] [--duration=2n] [--bpm=120]",
                      "Renders the notes one after another into a WAV file.",
                      "Each note is played by the nearest loaded sample of the preset, repitched.",
                      renderToFile });

    app.addCommand ({ "--play",
                      "--play [preset.xml] <note> [note...] [--duration=2n] [--bpm=120] [--debug]",
                      "Plays the notes through the audio device in time with the edit transport.",
                      "Without a preset the last one used is loaded again.",
                      playThroughEdit });

    return app.findAndRunCommand (argc, argv);
}
