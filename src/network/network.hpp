#pragma once

#include "../core/block.hpp"
#include "../simulation/context.hpp"
#include "latency.hpp"
#include "topology.hpp"

class INetwork {
public:
    // schedules a BlockArrival at `to` after the link delay
    virtual void send_block(NodeId from, NodeId to, BlockPtr block, SimContext& ctx) = 0;
    // schedules a ParentRequest at `to`
    virtual void send_request(NodeId from, NodeId to, BlockId requested, SimContext& ctx) = 0;
    virtual const Topology& topology() const = 0;
    virtual ~INetwork() = default;
};


// Point-to-point delivery over the topology's links with optional message
// loss. Messages only travel along existing links.
class Network : public INetwork {
public:
    Network(const Topology& topology, LatencyModel latency, double drop_rate = 0);

    void send_block(NodeId from, NodeId to, BlockPtr block, SimContext& ctx) override;
    void send_request(NodeId from, NodeId to, BlockId requested, SimContext& ctx) override;

    const Topology& topology() const override {
        return topology_;
    }

    SimTime delay(NodeId from, NodeId to, SimContext& ctx) const;

    size_t sent() const {
        return sent_;
    }

    size_t dropped() const {
        return dropped_;
    }

private:
    bool lost(SimContext& ctx) const;

private:
    const Topology& topology_;
    LatencyModel latency_;
    double drop_rate_;
    size_t sent_{0};
    size_t dropped_{0};
};
