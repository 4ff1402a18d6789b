#include "topology.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <stdexcept>
#include <string>
#include <boost/dynamic_bitset.hpp>
#include <glog/logging.h>

#include "../core/errors.hpp"

namespace {

const size_t UNREACHED = std::numeric_limits<size_t>::max();

void check_node_ids(const std::vector<NodeId>& node_ids) {
    if (node_ids.empty()) {
        throw ConfigurationError("topology needs at least one node");
    }

    std::vector<NodeId> sorted(node_ids);
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw ConfigurationError("topology node ids must be unique");
    }
    if (sorted.back() == kNoNode) {
        throw ConfigurationError("node id " + std::to_string(kNoNode) + " is reserved");
    }
}

} // namespace

Topology::Topology(const std::vector<NodeId>& node_ids)
    : nodes_(node_ids), adjacency_(node_ids.size()) {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        index_[nodes_[i]] = i;
    }
}

Topology Topology::build(TopologyKind kind,
                         const std::vector<NodeId>& node_ids,
                         const TopologyParams& params,
                         const LatencyModel& latency,
                         std::mt19937_64& rng) {
    check_node_ids(node_ids);
    validate_latency(latency);
    size_t n = node_ids.size();

    switch (kind) {
        case TopologyKind::FullyConnected: {
            Topology topology(node_ids);
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = i + 1; j < n; ++j) {
                    topology.add_edge(node_ids[i], node_ids[j]);
                }
            }
            topology.require_connected("fully connected");
            topology.assign_latencies(latency, rng);
            return topology;
        }

        case TopologyKind::Ring: {
            if (n < 3) {
                throw ConfigurationError("ring topology needs at least 3 nodes, got " + std::to_string(n));
            }
            Topology topology(node_ids);
            for (size_t i = 0; i < n; ++i) {
                topology.add_edge(node_ids[i], node_ids[(i + 1) % n]);
            }
            topology.require_connected("ring");
            topology.assign_latencies(latency, rng);
            return topology;
        }

        case TopologyKind::Star: {
            if (std::find(node_ids.begin(), node_ids.end(), params.hub) == node_ids.end()) {
                throw ConfigurationError("star hub " + std::to_string(params.hub) + " is not a node");
            }
            Topology topology(node_ids);
            for (NodeId id : node_ids) {
                if (id != params.hub) {
                    topology.add_edge(params.hub, id);
                }
            }
            topology.require_connected("star");
            topology.assign_latencies(latency, rng);
            return topology;
        }

        case TopologyKind::Random: {
            double p = params.edge_probability;
            if (p < 0) {
                if (params.expected_peers < 0) {
                    throw ConfigurationError("expected_peers must be non-negative");
                }
                p = n > 1 ? std::min(1.0, params.expected_peers / static_cast<double>(n - 1)) : 1.0;
            }
            if (p > 1) {
                throw ConfigurationError("edge probability must lie in [0, 1], got " + std::to_string(p));
            }
            if (params.max_attempts == 0) {
                throw ConfigurationError("random topology needs max_attempts >= 1");
            }

            std::bernoulli_distribution coin(p);
            for (size_t attempt = 1; attempt <= params.max_attempts; ++attempt) {
                Topology topology(node_ids);
                for (size_t i = 0; i < n; ++i) {
                    for (size_t j = i + 1; j < n; ++j) {
                        if (coin(rng)) {
                            topology.add_edge(node_ids[i], node_ids[j]);
                        }
                    }
                }

                if (topology.is_connected()) {
                    DVLOG(2) << "random topology: " << topology.edge_count() << " edges after "
                             << attempt << " attempt(s), p = " << p;
                    topology.assign_latencies(latency, rng);
                    return topology;
                }
                DVLOG(2) << "random topology attempt " << attempt << " is disconnected";
            }

            throw DisconnectedTopologyError(
                "random topology with n = " + std::to_string(n) + " and p = " + std::to_string(p)
                + " stayed disconnected after " + std::to_string(params.max_attempts) + " attempt(s)");
        }
    }

    throw ConfigurationError("unknown topology kind");
}

Topology Topology::from_edges(const std::vector<NodeId>& node_ids,
                              const std::vector<Edge>& edges,
                              const LatencyModel& latency,
                              std::mt19937_64& rng) {
    check_node_ids(node_ids);
    validate_latency(latency);

    Topology topology(node_ids);
    for (const auto& [a, b] : edges) {
        if (!topology.contains(a) || !topology.contains(b)) {
            throw ConfigurationError("edge " + std::to_string(a) + "-" + std::to_string(b)
                                     + " references an unknown node");
        }
        if (a == b) {
            throw ConfigurationError("self loop on node " + std::to_string(a));
        }
        if (!topology.has_link(a, b)) {
            topology.add_edge(a, b);
        }
    }
    topology.require_connected("explicit");
    topology.assign_latencies(latency, rng);
    return topology;
}

size_t Topology::edge_count() const {
    size_t directed = 0;
    for (const auto& links : adjacency_) {
        directed += links.size();
    }
    return directed / 2;
}

const std::vector<Topology::Link>& Topology::neighbors(NodeId id) const {
    return adjacency_[index_of(id)];
}

bool Topology::has_link(NodeId a, NodeId b) const {
    for (const Link& link : neighbors(a)) {
        if (link.peer == b) {
            return true;
        }
    }
    return false;
}

SimTime Topology::latency(NodeId a, NodeId b) const {
    for (const Link& link : neighbors(a)) {
        if (link.peer == b) {
            return link.latency;
        }
    }
    throw std::out_of_range("no link " + std::to_string(a) + " -> " + std::to_string(b));
}

void Topology::set_latency(NodeId a, NodeId b, SimTime latency) {
    if (!std::isfinite(latency) || latency < 0) {
        throw std::invalid_argument("latency must be finite and non-negative");
    }
    for (Link& link : adjacency_[index_of(a)]) {
        if (link.peer == b) {
            link.latency = latency;
            return;
        }
    }
    throw std::out_of_range("no link " + std::to_string(a) + " -> " + std::to_string(b));
}

bool Topology::is_connected() const {
    std::vector<size_t> hops = hops_from(0);
    return std::find(hops.begin(), hops.end(), UNREACHED) == hops.end();
}

size_t Topology::diameter_hops() const {
    size_t diameter = 0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (size_t h : hops_from(i)) {
            if (h == UNREACHED) {
                throw std::logic_error("diameter of a disconnected topology");
            }
            diameter = std::max(diameter, h);
        }
    }
    return diameter;
}

SimTime Topology::max_latency() const {
    SimTime result = 0;
    for (const auto& links : adjacency_) {
        for (const Link& link : links) {
            result = std::max(result, link.latency);
        }
    }
    return result;
}

size_t Topology::index_of(NodeId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("node " + std::to_string(id) + " is not in the topology");
    }
    return it->second;
}

void Topology::add_edge(NodeId a, NodeId b) {
    adjacency_[index_of(a)].push_back({b, 0});
    adjacency_[index_of(b)].push_back({a, 0});
}

void Topology::assign_latencies(const LatencyModel& latency, std::mt19937_64& rng) {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (Link& link : adjacency_[i]) {
            link.latency = sample_latency(latency, nodes_[i], link.peer, rng);
        }
    }
}

std::vector<size_t> Topology::hops_from(size_t source) const {
    std::vector<size_t> hops(nodes_.size(), UNREACHED);
    boost::dynamic_bitset<> visited(nodes_.size());
    std::deque<size_t> frontier;

    hops[source] = 0;
    visited[source] = 1;
    frontier.push_back(source);
    while (!frontier.empty()) {
        size_t cur = frontier.front();
        frontier.pop_front();
        for (const Link& link : adjacency_[cur]) {
            size_t next = index_.at(link.peer);
            if (!visited[next]) {
                visited[next] = 1;
                hops[next] = hops[cur] + 1;
                frontier.push_back(next);
            }
        }
    }
    return hops;
}

void Topology::require_connected(const char* shape) const {
    if (!is_connected()) {
        throw DisconnectedTopologyError(std::string(shape) + " topology over "
                                        + std::to_string(nodes_.size()) + " nodes is disconnected");
    }
}
