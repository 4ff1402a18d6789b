#pragma once

#include <stdexcept>
#include <string>

// invalid topology parameters, disconnected graph, bad consensus parameters;
// always raised before the first event is dispatched
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {
    }
};

class DisconnectedTopologyError : public ConfigurationError {
public:
    explicit DisconnectedTopologyError(const std::string& what) : ConfigurationError(what) {
    }
};

// pop_next() on an empty queue: the dispatch loop did not check its terminal condition
class EmptyQueueError : public std::logic_error {
public:
    EmptyQueueError() : std::logic_error("pop_next() called on an empty event queue") {
    }
};
