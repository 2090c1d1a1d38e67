#include "SamplerEngine.h"
#include <stdexcept>

SamplerEngine::SamplerEngine()
{
}

SamplerEngine::~SamplerEngine()
{
    transport = nullptr;

    if (edit != nullptr)
    {
        auto& editTransport = edit->getTransport();
        if (editTransport.isPlaying())
            editTransport.stop (false, false);
    }

    if (samplerPlugin != nullptr)
        samplerPlugin->setRenderer (nullptr);

    edit = nullptr;
    engine = nullptr;
}

void SamplerEngine::initialise()
{
    engine = std::make_unique<te::Engine> ("Repitch");
    engine->getPluginManager().createBuiltInType<SamplerPlugin>();

    auto editFile = juce::File::getSpecialLocation (juce::File::tempDirectory)
                        .getChildFile ("Repitch")
                        .getChildFile ("session.tracktionedit");
    editFile.getParentDirectory().createDirectory();

    edit = te::createEmptyEdit (*engine, editFile);

    // Keep rendering while stopped so released voices finish their fades.
    edit->playInStopEnabled = true;
    edit->ensureNumberOfAudioTracks (1);

    if (auto* track = getTrack())
        samplerPlugin = getOrCreateSamplerPlugin (*track);

    if (samplerPlugin != nullptr)
        samplerPlugin->setRenderer (&renderer);
    else
        DBG ("SamplerEngine: could not create the sampler plugin");

    transport = std::make_unique<EditTransport> (*edit, renderer);

    edit->getTransport().ensureContextAllocated();
}

te::AudioTrack* SamplerEngine::getTrack()
{
    if (edit == nullptr)
        return nullptr;

    auto tracks = te::getAudioTracks (*edit);
    return tracks.isEmpty() ? nullptr : tracks.getFirst();
}

SamplerPlugin* SamplerEngine::getOrCreateSamplerPlugin (te::AudioTrack& track)
{
    if (auto* existing = track.pluginList.findFirstPluginOfType<SamplerPlugin>())
        return existing;

    if (auto plugin = dynamic_cast<SamplerPlugin*> (
            track.edit.getPluginCache().createNewPlugin (SamplerPlugin::xmlTypeName, {}).get()))
    {
        track.pluginList.insertPlugin (*plugin, 0, nullptr);
        return plugin;
    }

    return nullptr;
}

EditTransport& SamplerEngine::getTransport()
{
    if (transport == nullptr)
        throw std::logic_error ("SamplerEngine::initialise() has not been called");

    return *transport;
}

void SamplerEngine::play()
{
    if (edit == nullptr)
        return;

    auto& editTransport = edit->getTransport();
    editTransport.setPosition (te::TimePosition::fromSeconds (0.0));
    editTransport.play (false);
}

void SamplerEngine::stop()
{
    if (edit == nullptr)
        return;

    edit->getTransport().stop (false, false);
}

bool SamplerEngine::isPlaying() const
{
    if (edit == nullptr)
        return false;

    return edit->getTransport().isPlaying();
}

void SamplerEngine::setBpm (double bpm)
{
    if (edit == nullptr)
        return;

    edit->tempoSequence.getTempos()[0]->setBpm (bpm);
}

double SamplerEngine::getBpm() const
{
    if (edit == nullptr)
        return 120.0;

    return edit->tempoSequence.getTempos()[0]->getBpm();
}
