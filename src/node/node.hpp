#pragma once
#include <glog/logging.h>

#include <map>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/event.hpp"
#include "../core/ledger.hpp"
#include "../consensus/consensus.hpp"
#include "../consensus/metrics.hpp"
#include "../network/netmanager.hpp"
#include "../simulation/context.hpp"

enum class NodeState {
    Idle,
    Mining,
    AwaitingAncestor,
};

std::string to_string(NodeState state);


class Node {
public:
    Node(NodeId id,
         const ConsensusEngine& engine,
         INetManager& net,
         BlockPtr genesis,
         bool fetch_missing_parents = false)
        : id_(id), engine_(engine), net_(net), ledger_(std::move(genesis)),
          fetch_missing_parents_(fetch_missing_parents) {
        if (net_.get_id() != id_) {
            throw std::invalid_argument("node " + std::to_string(id_) + " bound to the net manager of "
                                        + std::to_string(net_.get_id()));
        }
    }

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    void handle_event(const Event& event, SimContext& ctx);

    // (re)starts the mining loop; attempts left over from an earlier loop become no-ops
    void start_mining(SimContext& ctx, SimTime at);
    void stop_mining();

    // periodic ForkCheck events every `interval` while mining is open
    void start_fork_checks(SimContext& ctx, SimTime interval);

    // one trial; returns the new block or nullptr when the trial failed
    BlockPtr mine(const MiningToken& token, SimContext& ctx);

    void receive_block(BlockPtr block, NodeId sender, SimContext& ctx);

    NodeId get_id() const {
        return id_;
    }

    const Ledger& get_ledger() const {
        return ledger_;
    }

    BlockId head() const {
        return ledger_.head();
    }

    double get_weight() const {
        return engine_.weight(id_);
    }

    NodeState state() const;

    bool is_mining() const {
        return mining_;
    }

    const NodeMetrics& get_metrics() const {
        return metrics_;
    }

    size_t pending_count() const {
        return pending_ids_.size();
    }

    // buffered blocks in parent-id order, oldest first within one parent
    std::vector<BlockPtr> pending_blocks() const;

private:
    struct Pending {
        BlockPtr block;
        NodeId sender;
    };

    void on_mine_attempt(const Event& event, SimContext& ctx);
    void on_parent_request(const Event& event, SimContext& ctx);
    void on_fork_check(SimContext& ctx);

    // validate, insert, flood; false when the block was rejected
    bool accept(BlockPtr block, NodeId sender, SimContext& ctx);
    void buffer(BlockPtr block, NodeId sender, SimContext& ctx);
    void reject(const Block& block, NodeId sender, const std::string& reason, SimContext& ctx);
    // buffered blocks below a rejected one are rejected with it
    void reject_descendants(BlockId root, SimContext& ctx);
    void request_parent(BlockId parent_id, NodeId from, SimContext& ctx);
    void release_pending(BlockId parent_id, SimContext& ctx);
    void update_head();
    void schedule_next_attempt(SimContext& ctx);
    TraceRecord make_record(TraceKind kind, const Block& block, SimContext& ctx) const;

private:
    NodeId id_;
    const ConsensusEngine& engine_;
    INetManager& net_;
    Ledger ledger_;
    bool fetch_missing_parents_;

    bool mining_{false};
    uint64_t epoch_{0};
    SimTime fork_check_interval_{0};

    // blocks waiting for the key (their parent) to arrive
    std::map<BlockId, std::vector<Pending>> pending_;
    std::unordered_set<BlockId> pending_ids_;
    std::unordered_set<BlockId> rejected_;
    std::unordered_set<BlockId> requested_;

    NodeMetrics metrics_;
};
