#pragma once

#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../consensus/consensus.hpp"
#include "../network/latency.hpp"
#include "../network/topology.hpp"

using json = nlohmann::json;

enum class WeightKind {
    Equal,
    Uniform,
    Exponential,
    Explicit,
};

// Hash power (PoW, GHOST) or stake (PoS) handed to each node at start.
struct WeightModel {
    WeightKind kind{WeightKind::Equal};
    double min{1.0};    // Uniform
    double max{10.0};   // Uniform
    double mean{1.0};   // Exponential
    std::vector<double> values;  // Explicit, one per node in id order

    // overrides kind when set
    std::function<double(NodeId node, std::mt19937_64& rng)> sampler;
};

// A run stops at whichever limit is hit first; at least one must be set.
struct Horizon {
    std::optional<SimTime> max_time;
    // no new blocks once this many were mined; in-flight blocks still propagate.
    // 0 = no limit
    size_t max_blocks{0};
};

struct SimulationConfig {
    TopologyKind topology_kind{TopologyKind::FullyConnected};
    size_t node_count{4};
    TopologyParams topology;
    // when non-empty replaces topology_kind with this exact graph
    std::vector<Topology::Edge> edges;

    ConsensusParams consensus;
    WeightModel weights;
    LatencyModel latency;
    Horizon horizon;
    uint64_t seed{0};

    double drop_rate{0};
    bool fetch_missing_parents{false};
    // 0 disables periodic fork checks
    SimTime fork_check_interval{0};

    bool autostart_mining{true};
    // random subset of miners; 0 = every node with positive weight
    size_t miner_count{0};
    // first attempts are spread over [0, start_jitter)
    SimTime start_jitter{0};
};

// throws ConfigurationError
void validate_config(const SimulationConfig& config);

// keys absent from the document keep their defaults;
// throws ConfigurationError on malformed input
SimulationConfig config_from_json(const json& j);
SimulationConfig load_config(const std::string& path);

void to_json(json& j, const SimulationConfig& config);

NLOHMANN_JSON_SERIALIZE_ENUM(TopologyKind, {
    {TopologyKind::Random, "random"},
    {TopologyKind::Ring, "ring"},
    {TopologyKind::Star, "star"},
    {TopologyKind::FullyConnected, "fully_connected"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ConsensusKind, {
    {ConsensusKind::PoW, "pow"},
    {ConsensusKind::PoS, "pos"},
    {ConsensusKind::GHOST, "ghost"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(LatencyKind, {
    {LatencyKind::Fixed, "fixed"},
    {LatencyKind::Uniform, "uniform"},
    {LatencyKind::Exponential, "exponential"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(WeightKind, {
    {WeightKind::Equal, "equal"},
    {WeightKind::Uniform, "uniform"},
    {WeightKind::Exponential, "exponential"},
    {WeightKind::Explicit, "explicit"},
})
