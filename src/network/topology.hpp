#pragma once

#include <random>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../core/types.hpp"
#include "latency.hpp"

enum class TopologyKind {
    Random,
    Ring,
    Star,
    FullyConnected,
};

struct TopologyParams {
    // Random: probability of each undirected edge; when negative it is
    // derived from expected_peers as expected_peers / (n - 1)
    double edge_probability{-1};
    double expected_peers{3};
    // Random: graphs resampled before DisconnectedTopologyError is raised
    size_t max_attempts{1};
    // Star: centre node
    NodeId hub{0};
};

// Undirected neighbour graph with a one-way latency on each direction of
// every edge. All shapes reduce to the same neighbour map.
class Topology {
public:
    struct Link {
        NodeId peer;
        SimTime latency;
    };

    using Edge = std::pair<NodeId, NodeId>;

    // throws ConfigurationError on bad parameters and
    // DisconnectedTopologyError when the result is not connected
    static Topology build(TopologyKind kind,
                          const std::vector<NodeId>& node_ids,
                          const TopologyParams& params,
                          const LatencyModel& latency,
                          std::mt19937_64& rng);

    static Topology from_edges(const std::vector<NodeId>& node_ids,
                               const std::vector<Edge>& edges,
                               const LatencyModel& latency,
                               std::mt19937_64& rng);

    const std::vector<NodeId>& nodes() const {
        return nodes_;
    }

    size_t node_count() const {
        return nodes_.size();
    }

    size_t edge_count() const;

    bool contains(NodeId id) const {
        return index_.contains(id);
    }

    const std::vector<Link>& neighbors(NodeId id) const;
    bool has_link(NodeId a, NodeId b) const;

    // delay of a message from a to its neighbour b;
    // throws std::out_of_range when a and b are not linked
    SimTime latency(NodeId a, NodeId b) const;
    void set_latency(NodeId a, NodeId b, SimTime latency);

    bool is_connected() const;
    // longest shortest path in hops; requires a connected graph
    size_t diameter_hops() const;
    SimTime max_latency() const;

private:
    explicit Topology(const std::vector<NodeId>& node_ids);

    size_t index_of(NodeId id) const;
    void add_edge(NodeId a, NodeId b);
    void assign_latencies(const LatencyModel& latency, std::mt19937_64& rng);
    std::vector<size_t> hops_from(size_t source) const;
    void require_connected(const char* shape) const;

private:
    std::vector<NodeId> nodes_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<std::vector<Link>> adjacency_;
};
