#pragma once

#include <memory>
#include <JuceHeader.h>
#include <tracktion_engine/tracktion_engine.h>
#include "EditTransport.h"
#include "SamplerPlugin.h"
#include "VoiceRenderer.h"

namespace te = tracktion;

/**
 * Live playback host: a Tracktion engine with one edit whose single track
 * carries a SamplerPlugin rendering this engine's VoiceRenderer.
 *
 * Samplers built on getRenderer() and synced to getTransport() play in time
 * with the edit.
 */
class SamplerEngine
{
public:
    SamplerEngine();
    ~SamplerEngine();

    void initialise();

    // Transport control
    void play();
    void stop();
    bool isPlaying() const;

    void setBpm (double bpm);
    double getBpm() const;

    VoiceRenderer& getRenderer()            { return renderer; }
    EditTransport& getTransport();

private:
    te::AudioTrack* getTrack();
    SamplerPlugin* getOrCreateSamplerPlugin (te::AudioTrack& track);

    VoiceRenderer renderer;

    std::unique_ptr<te::Engine> engine;
    std::unique_ptr<te::Edit> edit;
    std::unique_ptr<EditTransport> transport;
    SamplerPlugin* samplerPlugin = nullptr;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SamplerEngine)
};
