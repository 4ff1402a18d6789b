#pragma once

#include <functional>
#include <random>

#include "../core/types.hpp"

enum class LatencyKind {
    Fixed,
    Uniform,
    Exponential,
};

// One-way link delay. With per_message == false a delay is drawn once per
// directed link when the topology is built and reused for every message on
// it; with per_message == true every message draws a fresh delay.
struct LatencyModel {
    LatencyKind kind{LatencyKind::Fixed};
    double value{1.0};   // Fixed
    double min{0.1};     // Uniform
    double max{0.5};     // Uniform
    double mean{1.0};    // Exponential, added on top of min
    bool per_message{false};

    // overrides kind when set
    std::function<SimTime(NodeId from, NodeId to, std::mt19937_64& rng)> sampler;
};

SimTime sample_latency(const LatencyModel& model, NodeId from, NodeId to, std::mt19937_64& rng);

// throws ConfigurationError
void validate_latency(const LatencyModel& model);
