#pragma once

#include <JuceHeader.h>
#include <tracktion_engine/tracktion_engine.h>
#include "TimeNotation.h"
#include "Transport.h"
#include "TransportEventQueue.h"

namespace te = tracktion;

class VoicePlayer;

/**
 * Transport over a Tracktion edit.
 *
 * Notation is converted with the edit's first tempo and time signature.
 * Scheduled events are polled on a timer while the edit is playing and
 * handed a start time on the VoicePlayer's clock, a short lookahead ahead of
 * the playhead.
 */
class EditTransport : public Transport,
                      private juce::Timer
{
public:
    EditTransport (te::Edit& edit, const VoicePlayer& clock);
    ~EditTransport() override;

    double toSeconds (const juce::String& notation) const override;
    double getTransportTime() const override;

    int schedule (Callback callback, double transportTime) override;
    void cancel (int eventId) override;

    static constexpr int kPollIntervalMs = 10;
    static constexpr double kLookaheadSeconds = 0.05;

private:
    TimeNotation::Tempo getTempo() const;
    void timerCallback() override;

    te::Edit& edit;
    const VoicePlayer& clock;

    TransportEventQueue events;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (EditTransport)
};
