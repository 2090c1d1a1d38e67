#include <atomic>
#include "PendingLoad.h"

struct PendingLoad::State
{
    juce::CriticalSection lock;
    bool settled = false;
    juce::Result result = juce::Result::ok();
    std::vector<Callback> callbacks;
    juce::WaitableEvent settledEvent { true };
};

PendingLoad::PendingLoad()
    : state (std::make_shared<State>())
{
}

PendingLoad PendingLoad::alreadySettled (const juce::Result& result)
{
    PendingLoad load;
    load.settle (result);
    return load;
}

PendingLoad PendingLoad::whenAll (const std::vector<PendingLoad>& loads)
{
    if (loads.empty())
        return alreadySettled (juce::Result::ok());

    PendingLoad aggregate;
    auto remaining = std::make_shared<std::atomic<int>> (static_cast<int> (loads.size()));

    for (auto& load : loads)
    {
        load.onSettled ([aggregate, remaining] (const juce::Result&) mutable
        {
            if (remaining->fetch_sub (1) == 1)
                aggregate.settle (juce::Result::ok());
        });
    }

    return aggregate;
}

bool PendingLoad::isSettled() const
{
    const juce::ScopedLock sl (state->lock);
    return state->settled;
}

juce::Result PendingLoad::getResult() const
{
    const juce::ScopedLock sl (state->lock);
    if (! state->settled)
        return juce::Result::fail ("load is still pending");
    return state->result;
}

void PendingLoad::onSettled (Callback callback) const
{
    if (callback == nullptr)
        return;

    juce::Result result = juce::Result::ok();
    {
        const juce::ScopedLock sl (state->lock);
        if (! state->settled)
        {
            state->callbacks.push_back (std::move (callback));
            return;
        }
        result = state->result;
    }

    callback (result);
}

bool PendingLoad::wait (int timeoutMs) const
{
    return state->settledEvent.wait (timeoutMs);
}

bool PendingLoad::settle (const juce::Result& result)
{
    std::vector<Callback> toCall;
    {
        const juce::ScopedLock sl (state->lock);
        if (state->settled)
            return false;

        state->settled = true;
        state->result = result;
        toCall.swap (state->callbacks);
    }

    state->settledEvent.signal();

    for (auto& callback : toCall)
        callback (result);

    return true;
}
