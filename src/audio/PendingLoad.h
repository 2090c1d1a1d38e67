#pragma once

#include <functional>
#include <memory>
#include <vector>
#include <JuceHeader.h>

/**
 * Deferred outcome of one or more sample loads.
 *
 * Copies share the same state. The producer calls settle() exactly once;
 * consumers either register onSettled() callbacks (message thread) or block in
 * wait() (any other thread). Callbacks run on the thread that settles, or
 * immediately when registered after settling.
 */
class PendingLoad
{
public:
    using Callback = std::function<void (const juce::Result&)>;

    PendingLoad();

    static PendingLoad alreadySettled (const juce::Result& result);

    /** Settles successfully once every given load has settled, whether it
     *  succeeded or failed. Settles immediately for an empty list. */
    static PendingLoad whenAll (const std::vector<PendingLoad>& loads);

    bool isSettled() const;

    /** The settled result, or a failed result while still pending. */
    juce::Result getResult() const;

    void onSettled (Callback callback) const;

    /** Blocks until settled. Returns false on timeout. Never call this on the
     *  message thread while the load is delivered there. */
    bool wait (int timeoutMs = -1) const;

    /** Returns false if this load had already settled. */
    bool settle (const juce::Result& result);

    bool operator== (const PendingLoad& other) const noexcept  { return state == other.state; }
    bool operator!= (const PendingLoad& other) const noexcept  { return state != other.state; }

private:
    struct State;
    std::shared_ptr<State> state;
};
