#pragma once

#include <optional>
#include <vector>

// Something that plays pitches on request. Times are seconds on the player's
// clock; std::nullopt means now.
class NoteSource
{
public:
    virtual ~NoteSource() = default;

    virtual void triggerAttack (const std::vector<int>& pitches,
                                std::optional<double> time = std::nullopt,
                                float velocity = 1.0f) = 0;

    virtual void triggerRelease (const std::vector<int>& pitches,
                                 std::optional<double> time = std::nullopt) = 0;

    virtual void releaseAll (std::optional<double> time = std::nullopt) = 0;

    virtual void dispose() = 0;
};
