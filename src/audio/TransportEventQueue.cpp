#include "TransportEventQueue.h"
#include <algorithm>

int TransportEventQueue::add (Transport::Callback callback, double transportTime)
{
    auto id = nextEventId++;
    events[id] = { transportTime, std::move (callback) };
    return id;
}

void TransportEventQueue::remove (int eventId)
{
    events.erase (eventId);
}

std::vector<TransportEventQueue::DueEvent> TransportEventQueue::takeDue (double horizon)
{
    std::vector<DueEvent> due;

    for (auto it = events.begin(); it != events.end();)
    {
        if (it->second.transportTime <= horizon)
        {
            due.push_back ({ it->first, it->second.transportTime, std::move (it->second.callback) });
            it = events.erase (it);
        }
        else
        {
            ++it;
        }
    }

    // The map is walked in id order, so a stable sort keeps ties in that order.
    std::stable_sort (due.begin(), due.end(),
                      [] (const DueEvent& a, const DueEvent& b) { return a.transportTime < b.transportTime; });

    return due;
}
