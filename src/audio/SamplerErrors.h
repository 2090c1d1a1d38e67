#pragma once

#include <stdexcept>
#include <string>

// Exceptions thrown by the buffer and sampler layers.
// Load failures are never thrown: they are reported through error callbacks
// and the failed juce::Result of the request's PendingLoad.

/** A pitch-map key that is neither a note name nor a number. */
struct InvalidPitchKey : public std::invalid_argument
{
    explicit InvalidPitchKey (const std::string& key)
        : std::invalid_argument ("pitch keys must be a note name or a number, got '" + key + "'") {}
};

/** The nearest-pitch search found no stored sample within range. */
struct NoBufferAvailable : public std::out_of_range
{
    explicit NoBufferAvailable (int pitch)
        : std::out_of_range ("no buffer available for pitch " + std::to_string (pitch)),
          requestedPitch (pitch) {}

    int requestedPitch;
};

/** A store lookup for a key that is missing or has not finished loading. */
struct BufferNotAvailable : public std::out_of_range
{
    explicit BufferNotAvailable (const std::string& key)
        : std::out_of_range ("buffer '" + key + "' is not available") {}
};

struct SliceOutOfRange : public std::out_of_range
{
    SliceOutOfRange (double start, double end, double duration)
        : std::out_of_range ("slice [" + std::to_string (start) + ", " + std::to_string (end)
                             + ") is outside the buffer duration " + std::to_string (duration)) {}
};

/** Any call other than dispose() on an instance that has been disposed. */
struct InstanceDisposed : public std::logic_error
{
    explicit InstanceDisposed (const std::string& what)
        : std::logic_error (what + " was used after dispose()") {}
};
