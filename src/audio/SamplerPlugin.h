#pragma once

#include <JuceHeader.h>
#include <tracktion_engine/tracktion_engine.h>

namespace te = tracktion;

class VoiceRenderer;

// Renders a VoiceRenderer's voices on an edit track.
class SamplerPlugin : public te::Plugin
{
public:
    SamplerPlugin (te::PluginCreationInfo);
    ~SamplerPlugin() override;

    static const char* getPluginName()  { return "RepitchSampler"; }
    static const char* xmlTypeName;

    juce::String getName() const override               { return getPluginName(); }
    juce::String getPluginType() override               { return xmlTypeName; }
    bool takesMidiInput() override                      { return false; }
    bool takesAudioInput() override                     { return false; }
    bool isSynth() override                             { return true; }
    bool producesAudioWhenNoAudioInput() override       { return true; }
    int getNumOutputChannelsGivenInputs (int) override  { return 2; }

    void initialise (const te::PluginInitialisationInfo&) override;
    void deinitialise() override;
    void applyToBuffer (const te::PluginRenderContext&) override;

    juce::String getSelectableDescription() override    { return getName(); }
    bool needsConstantBufferSize() override             { return false; }

    // Message thread. The renderer must outlive the plugin or be cleared first.
    void setRenderer (VoiceRenderer* newRenderer);

private:
    juce::SpinLock rendererLock;
    VoiceRenderer* renderer = nullptr;

    double outputSampleRate = 44100.0;
    int maxBlockSize = 512;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SamplerPlugin)
};
