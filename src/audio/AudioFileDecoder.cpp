#include <limits>
#include "AudioFileDecoder.h"

AudioFileDecoder::AudioFileDecoder (int numThreads)
    : baseDirectory (juce::File::getCurrentWorkingDirectory()),
      pool (juce::jmax (1, numThreads))
{
    formatManager.registerBasicFormats();
}

AudioFileDecoder::~AudioFileDecoder()
{
    pool.removeAllJobs (true, 10000);
}

bool AudioFileDecoder::supportsExtension (const juce::String& extension) const
{
    auto ext = extension.trim();
    if (ext.isEmpty())
        return false;

    return formatManager.findFormatForFileExtension (ext) != nullptr;
}

void AudioFileDecoder::decode (const juce::String& location, DecodeCallback onComplete)
{
    pool.addJob ([this, location, onComplete]
    {
        auto result = decodeNow (location);

        juce::MessageManager::callAsync ([onComplete, result]
        {
            if (onComplete != nullptr)
                onComplete (result);
        });
    });
}

//==============================================================================
// Decoding
//==============================================================================

DecodeResult AudioFileDecoder::decodeNow (const juce::String& location)
{
    juce::String error;
    auto stream = openStream (location, error);
    if (stream == nullptr)
        return DecodeResult::failure (error);

    std::unique_ptr<juce::AudioFormatReader> reader (formatManager.createReaderFor (std::move (stream)));
    if (reader == nullptr)
        return DecodeResult::failure ("Failed to read audio file: " + location);

    if (reader->numChannels == 0 || reader->lengthInSamples <= 0)
        return DecodeResult::failure ("Audio file contains no samples: " + location);

    if (reader->lengthInSamples > std::numeric_limits<int>::max())
        return DecodeResult::failure ("Audio file is too long: " + location);

    auto numSamples = static_cast<int> (reader->lengthInSamples);

    auto data = std::make_shared<SampleData>();
    data->sampleRate = reader->sampleRate;
    data->channels.setSize (static_cast<int> (reader->numChannels), numSamples);

    if (! reader->read (&data->channels, 0, numSamples, 0, true, true))
        return DecodeResult::failure ("Failed to decode audio data: " + location);

    return DecodeResult::success (std::move (data));
}

std::unique_ptr<juce::InputStream> AudioFileDecoder::openStream (const juce::String& location,
                                                                 juce::String& error) const
{
    juce::File file;

    if (location.startsWithIgnoreCase ("http://") || location.startsWithIgnoreCase ("https://")
        || location.startsWithIgnoreCase ("file://"))
    {
        juce::URL url (location);

        if (url.isLocalFile())
        {
            file = url.getLocalFile();
        }
        else
        {
            auto remote = url.createInputStream (juce::URL::InputStreamOptions (juce::URL::ParameterHandling::inAddress)
                                                     .withConnectionTimeoutMs (10000));
            if (remote == nullptr)
            {
                error = "Failed to open URL: " + location;
                return nullptr;
            }

            // Readers need to seek, so network data is buffered in memory first.
            juce::MemoryBlock block;
            remote->readIntoMemoryBlock (block);
            if (block.isEmpty())
            {
                error = "No data received from URL: " + location;
                return nullptr;
            }

            return std::make_unique<juce::MemoryInputStream> (block, true);
        }
    }
    else
    {
        file = juce::File::isAbsolutePath (location) ? juce::File (location)
                                                     : baseDirectory.getChildFile (location);
    }

    if (! file.existsAsFile())
    {
        error = "File not found: " + file.getFullPathName();
        return nullptr;
    }

    auto stream = file.createInputStream();
    if (stream == nullptr || stream->failedToOpen())
    {
        error = "Failed to open file: " + file.getFullPathName();
        return nullptr;
    }

    return stream;
}
