#include "ActiveVoiceRegistry.h"
#include <algorithm>

void SamplerVoice::notifyEnded()
{
    auto target = link;

    if (auto* registry = target.registry.get())
        registry->voiceEnded (target.key, getId());
}

//==============================================================================

ActiveVoiceRegistry::~ActiveVoiceRegistry()
{
    masterReference.clear();
}

void ActiveVoiceRegistry::add (int key, std::unique_ptr<SamplerVoice> voice)
{
    jassert (voice != nullptr);
    if (voice == nullptr)
        return;

    voice->setRegistryLink ({ this, key });
    voices[key].push_back (std::move (voice));
}

int ActiveVoiceRegistry::releaseKey (int key, double time)
{
    auto it = voices.find (key);
    if (it == voices.end())
        return 0;

    // Take the slot out first: stop() may complete synchronously and call back.
    auto released = std::move (it->second);
    voices.erase (it);

    for (auto& voice : released)
        voice->stop (time);

    return static_cast<int> (released.size());
}

int ActiveVoiceRegistry::releaseAll (double time)
{
    auto released = std::move (voices);
    voices.clear();

    int count = 0;
    for (auto& [key, list] : released)
    {
        for (auto& voice : list)
            voice->stop (time);

        count += static_cast<int> (list.size());
    }

    return count;
}

void ActiveVoiceRegistry::voiceEnded (int key, SamplerVoice::Id id)
{
    auto it = voices.find (key);
    if (it == voices.end())
        return;

    auto& list = it->second;
    auto found = std::find_if (list.begin(), list.end(),
                               [id] (const std::unique_ptr<SamplerVoice>& v) { return v->getId() == id; });

    if (found == list.end())
        return;

    // Keep the voice alive until it has left the container.
    auto finished = std::move (*found);
    list.erase (found);

    if (list.empty())
        voices.erase (it);
}

void ActiveVoiceRegistry::disposeAll()
{
    auto disposed = std::move (voices);
    voices.clear();

    for (auto& [key, list] : disposed)
        for (auto& voice : list)
            voice->dispose();
}

int ActiveVoiceRegistry::getNumVoices (int key) const
{
    auto it = voices.find (key);
    return it != voices.end() ? static_cast<int> (it->second.size()) : 0;
}

int ActiveVoiceRegistry::getNumVoices() const
{
    int count = 0;
    for (auto& [key, list] : voices)
        count += static_cast<int> (list.size());
    return count;
}
