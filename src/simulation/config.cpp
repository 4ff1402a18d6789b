#include "config.hpp"

#include <cmath>
#include <fstream>

#include "../core/errors.hpp"

namespace {

// NLOHMANN_JSON_SERIALIZE_ENUM maps unknown names to the first enumerator,
// so every enum is checked by converting it back
template <typename Enum>
void read_enum(const json& j, const char* key, Enum& out) {
    if (!j.contains(key)) {
        return;
    }
    Enum value = j.at(key).get<Enum>();
    if (json(value) != j.at(key)) {
        throw ConfigurationError(std::string("unknown value for \"") + key + "\": " + j.at(key).dump());
    }
    out = value;
}

template <typename T>
void read(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

void read_topology(const json& j, SimulationConfig& config) {
    read_enum(j, "kind", config.topology_kind);
    read(j, "edge_probability", config.topology.edge_probability);
    read(j, "expected_peers", config.topology.expected_peers);
    read(j, "max_attempts", config.topology.max_attempts);
    read(j, "hub", config.topology.hub);

    if (j.contains("edges")) {
        for (const auto& edge : j.at("edges")) {
            if (!edge.is_array() || edge.size() != 2) {
                throw ConfigurationError("topology edges are [a, b] pairs, got " + edge.dump());
            }
            config.edges.emplace_back(edge[0].get<NodeId>(), edge[1].get<NodeId>());
        }
    }
}

void read_consensus(const json& j, ConsensusParams& params) {
    read_enum(j, "kind", params.kind);
    read(j, "block_rate", params.block_rate);
    read(j, "mine_interval", params.mine_interval);
    read(j, "slot_duration", params.slot_duration);
}

void read_latency(const json& j, LatencyModel& latency) {
    read_enum(j, "kind", latency.kind);
    read(j, "value", latency.value);
    read(j, "min", latency.min);
    read(j, "max", latency.max);
    read(j, "mean", latency.mean);
    read(j, "per_message", latency.per_message);
}

void read_weights(const json& j, WeightModel& weights) {
    read_enum(j, "kind", weights.kind);
    read(j, "min", weights.min);
    read(j, "max", weights.max);
    read(j, "mean", weights.mean);
    read(j, "values", weights.values);
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationError(message);
    }
}

} // namespace

void validate_config(const SimulationConfig& config) {
    require(config.node_count > 0, "node_count must be positive");
    require(config.horizon.max_time.has_value() || config.horizon.max_blocks > 0,
            "a horizon is required: set max_time, max_blocks or both");
    if (config.horizon.max_time.has_value()) {
        require(*config.horizon.max_time >= 0, "max_time must be non-negative");
    } else {
        // with only a block horizon the run ends once enough blocks exist
        require(config.consensus.block_rate > 0, "block_rate must be positive without max_time");
    }

    require(config.drop_rate >= 0 && config.drop_rate < 1, "drop_rate must lie in [0, 1)");
    require(config.fork_check_interval >= 0, "fork_check_interval must be non-negative");
    require(config.start_jitter >= 0, "start_jitter must be non-negative");
    require(config.miner_count <= config.node_count, "miner_count cannot exceed node_count");

    for (const auto& [a, b] : config.edges) {
        require(a < config.node_count && b < config.node_count,
                "edge (" + std::to_string(a) + ", " + std::to_string(b) + ") names an unknown node");
    }

    const WeightModel& weights = config.weights;
    if (!weights.sampler) {
        switch (weights.kind) {
            case WeightKind::Equal:
                break;
            case WeightKind::Uniform:
                require(weights.min >= 0 && weights.max >= weights.min, "uniform weights need 0 <= min <= max");
                break;
            case WeightKind::Exponential:
                require(weights.mean > 0, "exponential weights need mean > 0");
                break;
            case WeightKind::Explicit:
                require(weights.values.size() == config.node_count,
                        "explicit weights need one value per node, got " + std::to_string(weights.values.size()));
                for (double w : weights.values) {
                    require(w >= 0 && std::isfinite(w), "explicit weights must be non-negative");
                }
                break;
        }
    }

    validate_latency(config.latency);
}

SimulationConfig config_from_json(const json& j) {
    SimulationConfig config;

    try {
        read(j, "node_count", config.node_count);
        read(j, "seed", config.seed);
        read(j, "drop_rate", config.drop_rate);
        read(j, "fetch_missing_parents", config.fetch_missing_parents);
        read(j, "fork_check_interval", config.fork_check_interval);
        read(j, "autostart_mining", config.autostart_mining);
        read(j, "miner_count", config.miner_count);
        read(j, "start_jitter", config.start_jitter);

        if (j.contains("topology")) {
            read_topology(j.at("topology"), config);
        }
        if (j.contains("consensus")) {
            read_consensus(j.at("consensus"), config.consensus);
        }
        if (j.contains("latency")) {
            read_latency(j.at("latency"), config.latency);
        }
        if (j.contains("weights")) {
            read_weights(j.at("weights"), config.weights);
        }
        if (j.contains("horizon")) {
            const json& horizon = j.at("horizon");
            if (horizon.contains("max_time")) {
                config.horizon.max_time = horizon.at("max_time").get<SimTime>();
            }
            read(horizon, "max_blocks", config.horizon.max_blocks);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("malformed configuration: ") + e.what());
    }

    return config;
}

SimulationConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("cannot open configuration file " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return config_from_json(j);
}

void to_json(json& j, const SimulationConfig& config) {
    j = json{
        {"node_count", config.node_count},
        {"seed", config.seed},
        {"drop_rate", config.drop_rate},
        {"fetch_missing_parents", config.fetch_missing_parents},
        {"fork_check_interval", config.fork_check_interval},
        {"autostart_mining", config.autostart_mining},
        {"miner_count", config.miner_count},
        {"start_jitter", config.start_jitter},
        {"topology", {
            {"kind", config.topology_kind},
            {"edge_probability", config.topology.edge_probability},
            {"expected_peers", config.topology.expected_peers},
            {"max_attempts", config.topology.max_attempts},
            {"hub", config.topology.hub},
        }},
        {"consensus", {
            {"kind", config.consensus.kind},
            {"block_rate", config.consensus.block_rate},
            {"mine_interval", config.consensus.mine_interval},
            {"slot_duration", config.consensus.slot_duration},
        }},
        {"latency", {
            {"kind", config.latency.kind},
            {"value", config.latency.value},
            {"min", config.latency.min},
            {"max", config.latency.max},
            {"mean", config.latency.mean},
            {"per_message", config.latency.per_message},
        }},
        {"weights", {
            {"kind", config.weights.kind},
            {"min", config.weights.min},
            {"max", config.weights.max},
            {"mean", config.weights.mean},
            {"values", config.weights.values},
        }},
    };

    if (!config.edges.empty()) {
        json edges = json::array();
        for (const auto& [a, b] : config.edges) {
            edges.push_back({a, b});
        }
        j["topology"]["edges"] = edges;
    }

    json horizon = {{"max_blocks", config.horizon.max_blocks}};
    if (config.horizon.max_time.has_value()) {
        horizon["max_time"] = *config.horizon.max_time;
    }
    j["horizon"] = horizon;
}
