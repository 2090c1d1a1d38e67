#include "GlobalPreferences.h"

namespace GlobalPreferences
{

static juce::ValueTree loadPrefsTree()
{
    juce::ValueTree root ("RepitchPrefs");

    auto prefsFile = getPrefsFile();
    if (! prefsFile.existsAsFile())
        return root;

    auto xml = juce::XmlDocument::parse (prefsFile);
    if (xml == nullptr)
        return root;

    auto loaded = juce::ValueTree::fromXml (*xml);
    return loaded.isValid() ? loaded : root;
}

static void setPref (const juce::Identifier& name, const juce::String& value)
{
    auto prefsFile = getPrefsFile();
    if (! prefsFile.getParentDirectory().createDirectory())
        return;

    auto root = loadPrefsTree();
    root.setProperty (name, value, nullptr);

    if (auto xml = root.createXml())
        if (! xml->writeTo (prefsFile))
            DBG ("Failed to write preferences: " + prefsFile.getFullPathName());
}

//==============================================================================

juce::File getPrefsFile()
{
    return juce::File::getSpecialLocation (juce::File::userApplicationDataDirectory)
               .getChildFile ("Repitch")
               .getChildFile ("prefs.xml");
}

void saveLastPresetFile (const juce::File& file)
{
    setPref ("lastPreset", file.getFullPathName());
}

juce::File loadLastPresetFile()
{
    auto path = loadPrefsTree().getProperty ("lastPreset", "").toString();
    if (path.isEmpty() || ! juce::File::isAbsolutePath (path))
        return {};

    return juce::File (path);
}

} // namespace GlobalPreferences
