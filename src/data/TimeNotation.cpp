#include "TimeNotation.h"
#include "NoteUtils.h"
#include <stdexcept>

namespace TimeNotation
{

double beatsToSeconds (double beats, const Tempo& tempo)
{
    return beats * 60.0 / tempo.bpm;
}

std::optional<Value> parse (const juce::String& text, const Tempo& tempo)
{
    if (tempo.bpm <= 0.0)
        return std::nullopt;

    Value value;
    auto body = text.trim();

    if (body.startsWithChar ('+'))
    {
        value.relative = true;
        body = body.substring (1).trim();
    }

    if (body.isEmpty())
        return std::nullopt;

    bool dotted = false;
    if (body.endsWithChar ('.') && (body.containsChar ('n') || body.containsChar ('t')))
    {
        dotted = true;
        body = body.dropLastCharacters (1);
    }

    auto unit = body.getLastCharacter();
    auto count = NoteUtils::parseNumber (body.dropLastCharacters (1));

    if ((unit == 'n' || unit == 't') && count.has_value() && *count > 0.0)
    {
        // "Nn" is a 1/N note; four of "4n" make a 4/4 measure.
        auto beats = 4.0 / *count;

        if (unit == 't')
            beats *= 2.0 / 3.0;

        if (dotted)
            beats *= 1.5;

        value.seconds = beatsToSeconds (beats, tempo);
        return value;
    }

    if (dotted)
        return std::nullopt;

    if (unit == 'm' && count.has_value() && *count >= 0.0)
    {
        value.seconds = beatsToSeconds (*count * tempo.beatsPerMeasure, tempo);
        return value;
    }

    if (auto seconds = NoteUtils::parseNumber (body))
    {
        value.seconds = *seconds;
        return value;
    }

    return std::nullopt;
}

double toSeconds (const juce::String& text, const Tempo& tempo, double now)
{
    auto value = parse (text, tempo);

    if (! value.has_value())
        throw std::invalid_argument ("not a time value: '" + text.toStdString() + "'");

    return value->relative ? now + value->seconds : value->seconds;
}

} // namespace TimeNotation
