#pragma once

#include <JuceHeader.h>

namespace GlobalPreferences
{
    juce::File getPrefsFile();
    void saveLastPresetFile (const juce::File& file);
    juce::File loadLastPresetFile();
}
