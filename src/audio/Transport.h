#pragma once

#include <functional>
#include <JuceHeader.h>

/**
 * Shared musical clock a sampler can be synced to.
 *
 * Transport time is the position on the timeline in seconds. A scheduled
 * callback runs on the message thread once the transport reaches its time
 * and receives the player-clock time the event should sound at. Callbacks
 * are never run from inside schedule().
 */
class Transport
{
public:
    using Callback = std::function<void (double audioTime)>;

    virtual ~Transport() = default;

    /** Converts notation such as "4n", "1m" or "+0.5" to seconds. */
    virtual double toSeconds (const juce::String& notation) const = 0;

    virtual double getTransportTime() const = 0;

    /** Returns an id that can be passed to cancel(). */
    virtual int schedule (Callback callback, double transportTime) = 0;

    virtual void cancel (int eventId) = 0;
};
