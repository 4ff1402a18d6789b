#include "event_queue.hpp"

#include <glog/logging.h>

#include "../core/errors.hpp"

uint64_t EventQueue::schedule(Event event, SimTime at) {
    event.time = at;
    event.seq = next_seq_++;
    DVLOG(7) << "schedule " << event;
    queue_.push(std::move(event));
    return next_seq_ - 1;
}

Event EventQueue::pop_next() {
    if (queue_.empty()) {
        throw EmptyQueueError();
    }

    Event event = queue_.top();
    queue_.pop();
    return event;
}

SimTime EventQueue::next_time() const {
    if (queue_.empty()) {
        throw EmptyQueueError();
    }
    return queue_.top().time;
}
