#include "node.hpp"

#include <algorithm>
#include <stdexcept>

std::string to_string(NodeState state) {
    switch (state) {
        case NodeState::Idle:
            return "Idle";
        case NodeState::Mining:
            return "Mining";
        case NodeState::AwaitingAncestor:
            return "AwaitingAncestor";
    }
    return "Unknown";
}

void Node::handle_event(const Event& event, SimContext& ctx) {
    DVLOG(5) << id_ << " <-- " << event;

    switch (event.kind) {
        case EventKind::MineAttempt:
            on_mine_attempt(event, ctx);
            break;
        case EventKind::BlockArrival:
            receive_block(event.block, event.sender, ctx);
            break;
        case EventKind::ParentRequest:
            on_parent_request(event, ctx);
            break;
        case EventKind::ForkCheck:
            on_fork_check(ctx);
            break;
    }
}

void Node::start_mining(SimContext& ctx, SimTime at) {
    ++epoch_;
    mining_ = true;
    ctx.schedule(Event::mine_attempt(id_, MiningToken{epoch_, false, std::nullopt}), at);
}

void Node::stop_mining() {
    ++epoch_;
    mining_ = false;
}

void Node::start_fork_checks(SimContext& ctx, SimTime interval) {
    if (interval <= 0) {
        throw std::invalid_argument("fork check interval must be positive");
    }
    fork_check_interval_ = interval;
    ctx.schedule_after(Event::fork_check(id_), interval);
}

NodeState Node::state() const {
    if (!pending_ids_.empty()) {
        return NodeState::AwaitingAncestor;
    }
    return mining_ ? NodeState::Mining : NodeState::Idle;
}

std::vector<BlockPtr> Node::pending_blocks() const {
    std::vector<BlockPtr> blocks;
    for (const auto& [parent_id, waiting] : pending_) {
        for (const Pending& p : waiting) {
            blocks.push_back(p.block);
        }
    }
    return blocks;
}

void Node::on_mine_attempt(const Event& event, SimContext& ctx) {
    const MiningToken& token = event.token;
    if (!token.one_shot && (!mining_ || token.epoch != epoch_)) {
        DVLOG(6) << id_ << " stale mine attempt, epoch " << token.epoch << " != " << epoch_;
        return;
    }

    if (!ctx.mining_open()) {
        if (!token.one_shot) {
            mining_ = false;
        }
        return;
    }

    mine(token, ctx);

    if (!token.one_shot) {
        schedule_next_attempt(ctx);
    }
}

void Node::schedule_next_attempt(SimContext& ctx) {
    if (!ctx.mining_open()) {
        mining_ = false;
        return;
    }

    SimTime next = engine_.kind() == ConsensusKind::PoS
                       ? engine_.next_slot_start(ctx.now())
                       : ctx.now() + engine_.attempt_period();
    ctx.schedule(Event::mine_attempt(id_, MiningToken{epoch_, false, std::nullopt}), next);
}

BlockPtr Node::mine(const MiningToken& token, SimContext& ctx) {
    ++metrics_.mine_attempts;

    const Block& parent = ledger_.head_block();
    std::optional<Proof> proof = engine_.try_produce(id_, ctx.now(), parent, token, ctx.rng);
    if (!proof.has_value()) {
        return nullptr;
    }

    json payload = {{"miner", id_}, {"seq", metrics_.blocks_mined}};
    BlockPtr block = make_block(parent, id_, ctx.now(), engine_.credit_for(id_), *proof, std::move(payload));

    ValidationResult check = engine_.validate(*block, ledger_);
    if (check != ValidationResult::Valid) {
        throw std::logic_error("node " + std::to_string(id_) + " produced an invalid block: " + to_string(check));
    }

    block = ctx.blocks.intern(block);
    ledger_.insert(block, ctx.now());
    ctx.count_mined();
    ++metrics_.blocks_mined;
    update_head();

    DVLOG(2) << id_ << " MINED " << *block;
    ctx.trace.append(make_record(TraceKind::Mined, *block, ctx));

    metrics_.forwarded += net_.broadcast(block, kNoNode, ctx);
    return block;
}

void Node::receive_block(BlockPtr block, NodeId sender, SimContext& ctx) {
    if (ledger_.contains(block->id) || pending_ids_.contains(block->id) || rejected_.contains(block->id)) {
        ++metrics_.duplicates;
        return;
    }

    if (rejected_.contains(block->parent_id)) {
        reject(*block, sender, "RejectedAncestor", ctx);
        return;
    }

    if (block->is_genesis() || !ledger_.contains(block->parent_id)) {
        buffer(std::move(block), sender, ctx);
        return;
    }

    BlockId id = block->id;
    if (accept(std::move(block), sender, ctx)) {
        release_pending(id, ctx);
    }
}

bool Node::accept(BlockPtr block, NodeId sender, SimContext& ctx) {
    ValidationResult result = engine_.validate(*block, ledger_);
    if (result != ValidationResult::Valid) {
        reject(*block, sender, to_string(result), ctx);
        reject_descendants(block->id, ctx);
        return false;
    }

    block = ctx.blocks.intern(block);
    ledger_.insert(block, ctx.now());
    ++metrics_.blocks_accepted;
    update_head();

    DVLOG(4) << id_ << " ACCEPTED " << *block << " head " << ledger_.head();
    TraceRecord record = make_record(TraceKind::Accepted, *block, ctx);
    record.sender = sender;
    ctx.trace.append(std::move(record));

    // first insert is the only time this node forwards the block
    metrics_.forwarded += net_.broadcast(block, sender, ctx);
    return true;
}

void Node::reject(const Block& block, NodeId sender, const std::string& reason, SimContext& ctx) {
    ++metrics_.blocks_rejected;
    rejected_.insert(block.id);
    DVLOG(3) << id_ << " REJECTED " << block << ": " << reason;

    TraceRecord record = make_record(TraceKind::Rejected, block, ctx);
    record.sender = sender;
    record.detail = reason;
    ctx.trace.append(std::move(record));
}

void Node::reject_descendants(BlockId root, SimContext& ctx) {
    std::vector<BlockId> bad{root};

    while (!bad.empty()) {
        BlockId id = bad.back();
        bad.pop_back();

        auto it = pending_.find(id);
        if (it == pending_.end()) {
            continue;
        }
        std::vector<Pending> waiting = std::move(it->second);
        pending_.erase(it);

        for (const Pending& p : waiting) {
            pending_ids_.erase(p.block->id);
            reject(*p.block, p.sender, "RejectedAncestor", ctx);
            bad.push_back(p.block->id);
        }
    }
}

void Node::buffer(BlockPtr block, NodeId sender, SimContext& ctx) {
    ++metrics_.buffered;
    BlockId parent_id = block->parent_id;
    DVLOG(4) << id_ << " BUFFERED " << *block << " waiting for " << parent_id;

    TraceRecord record = make_record(TraceKind::Buffered, *block, ctx);
    record.sender = sender;
    ctx.trace.append(std::move(record));

    pending_ids_.insert(block->id);
    pending_[parent_id].push_back({std::move(block), sender});

    if (fetch_missing_parents_ && sender != kNoNode && !requested_.contains(parent_id)) {
        request_parent(parent_id, sender, ctx);
    }
}

void Node::request_parent(BlockId parent_id, NodeId from, SimContext& ctx) {
    requested_.insert(parent_id);
    ++metrics_.parent_requests;
    net_.request(from, parent_id, ctx);
}

void Node::release_pending(BlockId parent_id, SimContext& ctx) {
    std::vector<BlockId> ready{parent_id};

    while (!ready.empty()) {
        BlockId id = ready.back();
        ready.pop_back();

        auto it = pending_.find(id);
        if (it == pending_.end()) {
            continue;
        }
        std::vector<Pending> waiting = std::move(it->second);
        pending_.erase(it);

        for (Pending& p : waiting) {
            pending_ids_.erase(p.block->id);
            if (ledger_.contains(p.block->id)) {
                continue;
            }
            BlockId child = p.block->id;
            if (accept(std::move(p.block), p.sender, ctx)) {
                ready.push_back(child);
            }
        }
    }
}

void Node::on_parent_request(const Event& event, SimContext& ctx) {
    BlockPtr block = ledger_.get(event.requested);
    if (!block) {
        DVLOG(4) << id_ << " cannot serve request for " << event.requested;
        return;
    }
    net_.send(event.sender, block, ctx);
    ++metrics_.forwarded;
}

void Node::on_fork_check(SimContext& ctx) {
    std::vector<BlockId> unblocked;
    for (const auto& [parent_id, waiting] : pending_) {
        if (ledger_.contains(parent_id)) {
            unblocked.push_back(parent_id);
        }
    }
    for (BlockId parent_id : unblocked) {
        release_pending(parent_id, ctx);
    }

    // a lost request is never answered; ask the latest sender again
    if (fetch_missing_parents_) {
        for (const auto& [parent_id, waiting] : pending_) {
            if (pending_ids_.contains(parent_id) || rejected_.contains(parent_id)) {
                continue;
            }
            auto from = std::find_if(waiting.rbegin(), waiting.rend(),
                                     [](const Pending& p) { return p.sender != kNoNode; });
            if (from != waiting.rend()) {
                request_parent(parent_id, from->sender, ctx);
            }
        }
    }

    update_head();

    const Block& head = ledger_.head_block();
    TraceRecord record = make_record(TraceKind::ForkCheck, head, ctx);
    record.detail = "tips=" + std::to_string(ledger_.tips().size());
    ctx.trace.append(std::move(record));

    if (fork_check_interval_ > 0 && ctx.mining_open()) {
        ctx.schedule_after(Event::fork_check(id_), fork_check_interval_);
    }
}

void Node::update_head() {
    BlockId old_head = ledger_.head();
    BlockId new_head = engine_.select_head(ledger_);
    if (new_head == old_head) {
        return;
    }

    ++metrics_.head_changes;
    if (!ledger_.is_ancestor(old_head, new_head)) {
        BlockId fork_point = ledger_.common_ancestor(old_head, new_head);
        size_t depth = ledger_.get(old_head)->height - ledger_.get(fork_point)->height;
        ++metrics_.reorgs;
        metrics_.max_reorg_depth = std::max(metrics_.max_reorg_depth, depth);
        DVLOG(3) << id_ << " REORG depth " << depth << " " << old_head << " -> " << new_head;
    }
    ledger_.set_head(new_head);
}

TraceRecord Node::make_record(TraceKind kind, const Block& block, SimContext& ctx) const {
    TraceRecord record;
    record.time = ctx.now();
    record.node = id_;
    record.block_id = block.id;
    record.parent_id = block.parent_id;
    record.block_height = block.height;
    record.kind = kind;
    record.head = ledger_.head();
    record.head_height = ledger_.head_block().height;
    return record;
}
