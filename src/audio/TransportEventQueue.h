#pragma once

#include <map>
#include <vector>
#include "Transport.h"

/**
 * Events waiting for a transport position.
 *
 * takeDue() hands back everything at or before the horizon ordered by
 * transport time, with events at the same time kept in the order they were
 * added. The caller runs the callbacks after taking them, so callbacks are
 * free to add or remove events.
 */
class TransportEventQueue
{
public:
    struct DueEvent
    {
        int id = 0;
        double transportTime = 0.0;
        Transport::Callback callback;
    };

    int add (Transport::Callback callback, double transportTime);
    void remove (int eventId);
    void clear()                    { events.clear(); }

    std::vector<DueEvent> takeDue (double horizon);

    bool isEmpty() const            { return events.empty(); }
    int size() const                { return static_cast<int> (events.size()); }

private:
    struct Event
    {
        double transportTime = 0.0;
        Transport::Callback callback;
    };

    std::map<int, Event> events;
    int nextEventId = 1;
};
