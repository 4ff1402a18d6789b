#pragma once

#include <fstream>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../consensus/consensus.hpp"
#include "../network/netmanager.hpp"
#include "../network/network.hpp"
#include "../network/topology.hpp"
#include "../node/node.hpp"
#include "config.hpp"
#include "context.hpp"

// Read-only view of one node after (or during) a run.
struct NodeSnapshot {
    NodeId id{kNoNode};
    double weight{0};
    bool miner{false};
    BlockId head{kNoBlock};
    uint64_t head_height{0};
    size_t pending{0};
    // in local arrival order, genesis first
    std::vector<BlockId> blocks;
    NodeMetrics metrics;
};


class Simulation {
public:
    // validates the configuration and builds topology, weights, consensus,
    // network and nodes; throws ConfigurationError
    explicit Simulation(SimulationConfig config);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // seeds mining, dispatches until the horizon or an empty queue, then finish()
    void run();

    // start() if needed, then dispatches every event with time <= t (capped by
    // max_time); does not finish()
    void run_until(SimTime t);

    // start() if needed, then dispatches a single event; false once the run has halted
    bool step();

    // one-shot mining trial at `node`; with `draw` set the PoW/GHOST trial
    // uses it instead of the RNG
    void schedule_mine(NodeId node, SimTime at, std::optional<double> draw = std::nullopt);

    // schedules first mining attempts and fork checks; later calls do nothing
    void start();

    // records still-buffered blocks as Unresolved; later calls do nothing
    void finish();

    bool halted() const;

    SimTime now() const {
        return ctx_.now();
    }

    const Trace& trace() const {
        return ctx_.trace;
    }

    std::vector<NodeSnapshot> snapshot() const;
    std::vector<TraceRecord> unresolved_orphans() const;

    // throws std::out_of_range for an unknown id
    Node& node(NodeId id);
    const Node& node(NodeId id) const;

    const std::vector<NodeId>& node_ids() const {
        return ids_;
    }

    const std::vector<NodeId>& miners() const {
        return miners_;
    }

    const Topology& topology() const {
        return topology_;
    }

    const Network& network() const {
        return *network_;
    }

    const ConsensusEngine& consensus() const {
        return *consensus_;
    }

    const SimulationConfig& config() const {
        return config_;
    }

    SimContext& context() {
        return ctx_;
    }

    void write_results(std::ofstream& file, size_t run_id);

private:
    static SimulationConfig validated(SimulationConfig config);
    static Topology build_topology(const SimulationConfig& config,
                                   const std::vector<NodeId>& ids,
                                   std::mt19937_64& rng);

    std::unordered_map<NodeId, double> generate_weights();
    void pick_miners(const std::unordered_map<NodeId, double>& weights);
    void generate_nodes();
    void dispatch(const Event& event);

private:
    SimulationConfig config_;
    SimContext ctx_;
    std::vector<NodeId> ids_;
    Topology topology_;

    std::unique_ptr<ConsensusEngine> consensus_;
    std::unique_ptr<Network> network_;
    std::vector<std::unique_ptr<NetManager>> managers_;
    std::vector<std::unique_ptr<Node>> nodes_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<NodeId> miners_;

    bool started_{false};
    bool finished_{false};
};
