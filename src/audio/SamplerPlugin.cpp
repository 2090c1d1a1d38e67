#include "SamplerPlugin.h"
#include "VoiceRenderer.h"

const char* SamplerPlugin::xmlTypeName = "RepitchSampler";

SamplerPlugin::SamplerPlugin (te::PluginCreationInfo info)
    : te::Plugin (info)
{
}

SamplerPlugin::~SamplerPlugin()
{
    setRenderer (nullptr);
}

void SamplerPlugin::initialise (const te::PluginInitialisationInfo& info)
{
    outputSampleRate = info.sampleRate;
    maxBlockSize = info.blockSizeSamples;

    const juce::SpinLock::ScopedLockType lock (rendererLock);
    if (renderer != nullptr)
        renderer->prepare (outputSampleRate, maxBlockSize);
}

void SamplerPlugin::deinitialise()
{
}

void SamplerPlugin::setRenderer (VoiceRenderer* newRenderer)
{
    const juce::SpinLock::ScopedLockType lock (rendererLock);
    renderer = newRenderer;

    if (renderer != nullptr)
        renderer->prepare (outputSampleRate, maxBlockSize);
}

void SamplerPlugin::applyToBuffer (const te::PluginRenderContext& rc)
{
    if (rc.destBuffer == nullptr)
        return;

    rc.destBuffer->clear (rc.bufferStartSample, rc.bufferNumSamples);

    const juce::SpinLock::ScopedLockType lock (rendererLock);

    if (renderer != nullptr)
        renderer->renderNextBlock (*rc.destBuffer, rc.bufferStartSample, rc.bufferNumSamples);
}
