#pragma once

#include <queue>
#include <vector>

#include "../core/event.hpp"

// Pending events ordered by (time, seq). seq is the insertion counter, so two
// events at the same simulated time always dispatch in the order they were
// scheduled.
class EventQueue {
public:
    // returns the sequence number given to the event
    uint64_t schedule(Event event, SimTime at);

    // throws EmptyQueueError when nothing is pending
    Event pop_next();

    // time of the next event; throws EmptyQueueError when nothing is pending
    SimTime next_time() const;

    bool is_empty() const {
        return queue_.empty();
    }

    size_t size() const {
        return queue_.size();
    }

    uint64_t scheduled_count() const {
        return next_seq_;
    }

private:
    struct Later {
        bool operator()(const Event& a, const Event& b) const {
            if (a.time != b.time) {
                return a.time > b.time;
            }
            return a.seq > b.seq;
        }
    };

    uint64_t next_seq_{0};
    std::priority_queue<Event, std::vector<Event>, Later> queue_;
};
