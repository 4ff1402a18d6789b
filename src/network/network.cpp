#include "network.hpp"

#include <string>
#include <glog/logging.h>

#include "../core/errors.hpp"

Network::Network(const Topology& topology, LatencyModel latency, double drop_rate)
    : topology_(topology), latency_(std::move(latency)), drop_rate_(drop_rate) {
    if (drop_rate_ < 0 || drop_rate_ >= 1) {
        throw ConfigurationError("drop_rate must lie in [0, 1), got " + std::to_string(drop_rate_));
    }
    validate_latency(latency_);
}

void Network::send_block(NodeId from, NodeId to, BlockPtr block, SimContext& ctx) {
    SimTime link_delay = delay(from, to, ctx);
    ++sent_;

    if (lost(ctx)) {
        ++dropped_;
        DVLOG(5) << from << " -x-> " << to << " dropped " << *block;

        TraceRecord record;
        record.time = ctx.now();
        record.node = to;
        record.sender = from;
        record.block_id = block->id;
        record.parent_id = block->parent_id;
        record.block_height = block->height;
        record.kind = TraceKind::Dropped;
        ctx.trace.append(std::move(record));
        return;
    }

    DVLOG(6) << from << " --> " << to << " " << *block << " in " << link_delay;
    ctx.schedule_after(Event::block_arrival(to, from, std::move(block)), link_delay);
}

void Network::send_request(NodeId from, NodeId to, BlockId requested, SimContext& ctx) {
    SimTime link_delay = delay(from, to, ctx);
    ++sent_;

    if (lost(ctx)) {
        ++dropped_;
        DVLOG(5) << from << " -x-> " << to << " dropped request for " << requested;
        return;
    }

    DVLOG(6) << from << " --> " << to << " request " << requested;
    ctx.schedule_after(Event::parent_request(to, from, requested), link_delay);
}

SimTime Network::delay(NodeId from, NodeId to, SimContext& ctx) const {
    // throws std::out_of_range when the nodes are not linked
    SimTime link_delay = topology_.latency(from, to);
    if (latency_.per_message) {
        link_delay = sample_latency(latency_, from, to, ctx.rng);
    }
    return link_delay;
}

bool Network::lost(SimContext& ctx) const {
    if (drop_rate_ <= 0) {
        return false;
    }
    return std::bernoulli_distribution(drop_rate_)(ctx.rng);
}
