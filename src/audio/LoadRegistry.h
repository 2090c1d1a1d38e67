#pragma once

#include <memory>
#include <JuceHeader.h>
#include "PendingLoad.h"

/**
 * Counts requested vs. settled sample loads for everything created through
 * one SampleLoader.
 *
 * whenAllSettled() snapshots the loads outstanding at call time: a load
 * tracked afterwards is not added to a result that was already handed out.
 */
class LoadRegistry
{
public:
    LoadRegistry();

    void track (const PendingLoad& load);

    PendingLoad whenAllSettled() const;

    int getNumRequested() const;
    int getNumSettled() const;
    int getNumOutstanding() const;

    /** Fraction of tracked loads that have settled, 1.0 when nothing was requested. */
    float getProgress() const;

private:
    struct State
    {
        juce::CriticalSection lock;
        std::vector<PendingLoad> outstanding;
        int requested = 0;
        int settled = 0;
    };

    std::shared_ptr<State> state;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (LoadRegistry)
};
