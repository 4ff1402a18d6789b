#pragma once

#include <vector>
#include <glog/logging.h>

#include "network.hpp"

// A node's handle on the network: who its neighbours are and how to reach them.
class INetManager {
public:
    virtual NodeId get_id() const = 0;
    virtual void send(NodeId to, BlockPtr block, SimContext& ctx) = 0;
    // to every neighbour except `except`; returns the number of sends
    virtual size_t broadcast(BlockPtr block, NodeId except, SimContext& ctx) = 0;
    virtual void request(NodeId to, BlockId requested, SimContext& ctx) = 0;
    virtual ~INetManager() = default;
};


class NetManager : public INetManager {
public:
    NetManager(NodeId id, INetwork& net) : id_(id), net_(net) {
        for (const auto& link : net_.topology().neighbors(id_)) {
            neighbors_.push_back(link.peer);
        }
        DVLOG(3) << id_ << " NEIGHBORS: " << neighbors_.size();
    }

    NodeId get_id() const override {
        return id_;
    }

    void send(NodeId to, BlockPtr block, SimContext& ctx) override {
        net_.send_block(id_, to, std::move(block), ctx);
    }

    size_t broadcast(BlockPtr block, NodeId except, SimContext& ctx) override {
        size_t sends = 0;
        for (NodeId peer : neighbors_) {
            if (peer == except) {
                continue;
            }
            net_.send_block(id_, peer, block, ctx);
            ++sends;
        }
        return sends;
    }

    void request(NodeId to, BlockId requested, SimContext& ctx) override {
        net_.send_request(id_, to, requested, ctx);
    }

private:
    NodeId id_;
    INetwork& net_;
    std::vector<NodeId> neighbors_;
};
