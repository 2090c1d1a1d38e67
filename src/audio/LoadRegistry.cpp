#include <algorithm>
#include "LoadRegistry.h"

LoadRegistry::LoadRegistry()
    : state (std::make_shared<State>())
{
}

void LoadRegistry::track (const PendingLoad& load)
{
    {
        const juce::ScopedLock sl (state->lock);
        ++state->requested;
        state->outstanding.push_back (load);
    }

    std::weak_ptr<State> weakState = state;

    load.onSettled ([weakState, load] (const juce::Result&)
    {
        auto s = weakState.lock();
        if (s == nullptr)
            return;

        const juce::ScopedLock sl (s->lock);
        auto& pending = s->outstanding;
        auto it = std::find (pending.begin(), pending.end(), load);
        if (it != pending.end())
        {
            pending.erase (it);
            ++s->settled;
        }
    });
}

PendingLoad LoadRegistry::whenAllSettled() const
{
    std::vector<PendingLoad> snapshot;
    {
        const juce::ScopedLock sl (state->lock);
        snapshot = state->outstanding;
    }

    return PendingLoad::whenAll (snapshot);
}

int LoadRegistry::getNumRequested() const
{
    const juce::ScopedLock sl (state->lock);
    return state->requested;
}

int LoadRegistry::getNumSettled() const
{
    const juce::ScopedLock sl (state->lock);
    return state->settled;
}

int LoadRegistry::getNumOutstanding() const
{
    const juce::ScopedLock sl (state->lock);
    return static_cast<int> (state->outstanding.size());
}

float LoadRegistry::getProgress() const
{
    const juce::ScopedLock sl (state->lock);
    if (state->requested == 0)
        return 1.0f;
    return static_cast<float> (state->settled) / static_cast<float> (state->requested);
}
