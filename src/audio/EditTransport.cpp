#include "EditTransport.h"
#include "SamplerVoice.h"

EditTransport::EditTransport (te::Edit& e, const VoicePlayer& c)
    : edit (e), clock (c)
{
}

EditTransport::~EditTransport()
{
    stopTimer();
}

TimeNotation::Tempo EditTransport::getTempo() const
{
    TimeNotation::Tempo tempo;

    const auto& tempos = edit.tempoSequence.getTempos();
    if (tempos.size() > 0)
        tempo.bpm = tempos[0]->getBpm();

    const auto& timeSigs = edit.tempoSequence.getTimeSigs();
    if (timeSigs.size() > 0)
        tempo.beatsPerMeasure = timeSigs[0]->numerator;

    return tempo;
}

double EditTransport::toSeconds (const juce::String& notation) const
{
    return TimeNotation::toSeconds (notation, getTempo(), getTransportTime());
}

double EditTransport::getTransportTime() const
{
    return edit.getTransport().getPosition().inSeconds();
}

int EditTransport::schedule (Callback callback, double transportTime)
{
    auto id = events.add (std::move (callback), transportTime);

    if (! isTimerRunning())
        startTimer (kPollIntervalMs);

    return id;
}

void EditTransport::cancel (int eventId)
{
    events.remove (eventId);
}

void EditTransport::timerCallback()
{
    if (events.isEmpty())
    {
        stopTimer();
        return;
    }

    if (! edit.getTransport().isPlaying())
        return;

    const auto now = getTransportTime();
    const auto audioNow = clock.getCurrentTime();

    for (auto& event : events.takeDue (now + kLookaheadSeconds))
        if (event.callback != nullptr)
            event.callback (audioNow + juce::jmax (0.0, event.transportTime - now));
}
