#include "SamplerPresetSerializer.h"
#include "NoteUtils.h"

namespace SamplerPresetSerializer
{

static constexpr int kVersion = 1;

juce::String curveToString (FadeCurve curve)
{
    return curve == FadeCurve::linear ? "linear" : "exponential";
}

FadeCurve curveFromString (const juce::String& text)
{
    return text.trim().equalsIgnoreCase ("linear") ? FadeCurve::linear : FadeCurve::exponential;
}

juce::ValueTree toValueTree (const SamplerPreset& preset)
{
    juce::ValueTree root ("RepitchPreset");
    root.setProperty ("version", kVersion, nullptr);

    juce::ValueTree envelope ("Envelope");
    envelope.setProperty ("attack", preset.attack, nullptr);
    envelope.setProperty ("release", preset.release, nullptr);
    envelope.setProperty ("curve", curveToString (preset.curve), nullptr);
    root.addChild (envelope, -1, nullptr);

    juce::ValueTree samples ("Samples");
    if (preset.baseUrl.isNotEmpty())
        samples.setProperty ("baseUrl", preset.baseUrl, nullptr);

    for (auto& [key, location] : preset.samples)
    {
        juce::ValueTree sample ("Sample");
        sample.setProperty ("pitch", key, nullptr);
        sample.setProperty ("location", location, nullptr);
        samples.addChild (sample, -1, nullptr);
    }
    root.addChild (samples, -1, nullptr);

    return root;
}

juce::String fromValueTree (const juce::ValueTree& root, SamplerPreset& preset)
{
    if (! root.hasType ("RepitchPreset"))
        return "Not a valid Repitch preset";

    int version = root.getProperty ("version", 1);
    if (version > kVersion)
        return "Preset version " + juce::String (version) + " is newer than this build supports";

    SamplerPreset loaded;

    auto envelope = root.getChildWithName ("Envelope");
    if (envelope.isValid())
    {
        loaded.attack = juce::jmax (0.0, static_cast<double> (envelope.getProperty ("attack", 0.0)));
        loaded.release = juce::jmax (0.0, static_cast<double> (envelope.getProperty ("release", 0.1)));
        loaded.curve = curveFromString (envelope.getProperty ("curve", "exponential").toString());
    }

    auto samples = root.getChildWithName ("Samples");
    if (samples.isValid())
    {
        loaded.baseUrl = samples.getProperty ("baseUrl", "").toString();

        for (int i = 0; i < samples.getNumChildren(); ++i)
        {
            auto sample = samples.getChild (i);
            if (! sample.hasType ("Sample"))
                continue;

            auto key = sample.getProperty ("pitch", "").toString();
            auto location = sample.getProperty ("location", "").toString();

            if (location.isEmpty())
                return "Sample " + juce::String (i) + " has no location";

            try
            {
                NoteUtils::parsePitchKey (key);
            }
            catch (const InvalidPitchKey& e)
            {
                return juce::String (e.what());
            }

            loaded.samples[key] = location;
        }
    }

    preset = std::move (loaded);
    return {};
}

juce::String saveToFile (const juce::File& file, const SamplerPreset& preset)
{
    auto xml = toValueTree (preset).createXml();
    if (xml == nullptr)
        return "Failed to create XML";

    if (! xml->writeTo (file))
        return "Failed to write file: " + file.getFullPathName();

    return {};
}

juce::String loadFromFile (const juce::File& file, SamplerPreset& preset)
{
    if (! file.existsAsFile())
        return "File not found: " + file.getFullPathName();

    auto xml = juce::XmlDocument::parse (file);
    if (xml == nullptr)
        return "Failed to parse XML file";

    return fromValueTree (juce::ValueTree::fromXml (*xml), preset);
}

} // namespace SamplerPresetSerializer
