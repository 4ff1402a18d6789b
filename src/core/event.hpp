#pragma once

#include <iostream>
#include <optional>
#include <string>

#include "block.hpp"

enum class EventKind {
    MineAttempt,
    BlockArrival,
    ForkCheck,
    ParentRequest,
};

inline std::string to_string(EventKind kind) {
    switch (kind) {
        case EventKind::MineAttempt:
            return "MineAttempt";
        case EventKind::BlockArrival:
            return "BlockArrival";
        case EventKind::ForkCheck:
            return "ForkCheck";
        case EventKind::ParentRequest:
            return "ParentRequest";
    }
    return "Unknown";
}

// Mining trial token. Attempts from a node's own loop carry its current
// epoch and are dropped once the loop restarts or stops; injected attempts
// are one-shot and may pin the lottery draw.
struct MiningToken {
    uint64_t epoch{0};
    bool one_shot{false};
    std::optional<double> draw;
};

class Event {
public:
    EventKind kind{EventKind::MineAttempt};
    SimTime time{0};
    uint64_t seq{0}; // set by EventQueue::schedule
    NodeId target{kNoNode};
    NodeId sender{kNoNode};
    BlockPtr block;
    BlockId requested{kNoBlock};
    MiningToken token;

    Event() {
    }
    Event(EventKind _kind, NodeId _target) : kind(_kind), target(_target) {
    }

    static Event mine_attempt(NodeId target, MiningToken token) {
        Event event(EventKind::MineAttempt, target);
        event.token = token;
        return event;
    }

    static Event block_arrival(NodeId target, NodeId sender, BlockPtr block) {
        Event event(EventKind::BlockArrival, target);
        event.sender = sender;
        event.block = std::move(block);
        return event;
    }

    static Event fork_check(NodeId target) {
        return Event(EventKind::ForkCheck, target);
    }

    static Event parent_request(NodeId target, NodeId requester, BlockId requested) {
        Event event(EventKind::ParentRequest, target);
        event.sender = requester;
        event.requested = requested;
        return event;
    }

    friend std::ostream& operator<<(std::ostream& out, const Event& event) {
        out << "{" << to_string(event.kind) << " t=" << event.time << " #" << event.seq
            << " -> " << event.target;
        if (event.sender != kNoNode) {
            out << " from " << event.sender;
        }
        if (event.block) {
            out << " " << *event.block;
        }
        if (event.requested != kNoBlock) {
            out << " wants " << event.requested;
        }
        out << "}";
        return out;
    }
};
