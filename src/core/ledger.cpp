#include "ledger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

Ledger::Ledger(BlockPtr genesis) : genesis_(std::move(genesis)), head_(genesis_->id) {
    Entry root;
    root.block = genesis_;
    root.subtree_weight = genesis_->weight;
    root.arrival_index = next_arrival_++;
    entries_.emplace(genesis_->id, std::move(root));
    tips_.insert(genesis_->id);
}

Ledger::InsertStatus Ledger::insert(BlockPtr block, SimTime arrival_time) {
    if (entries_.contains(block->id)) {
        return Duplicate;
    }

    auto parent_it = entries_.find(block->parent_id);
    if (block->is_genesis() || parent_it == entries_.end()) {
        return MissingParent;
    }

    parent_it->second.children.push_back(block->id);
    tips_.erase(block->parent_id);
    tips_.insert(block->id);

    double weight = block->weight;
    BlockId ancestor = block->parent_id;
    while (ancestor != kNoBlock) {
        Entry& e = entries_.at(ancestor);
        e.subtree_weight += weight;
        ancestor = e.block->parent_id;
    }

    Entry e;
    e.subtree_weight = weight;
    e.arrival_index = next_arrival_++;
    e.arrival_time = arrival_time;
    e.block = std::move(block);
    BlockId id = e.block->id;
    entries_.emplace(id, std::move(e));
    return Inserted;
}

BlockPtr Ledger::get(BlockId id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.block;
}

const Block& Ledger::head_block() const {
    return *entry(head_).block;
}

void Ledger::set_head(BlockId id) {
    entry(id);
    head_ = id;
}

const std::vector<BlockId>& Ledger::children(BlockId id) const {
    return entry(id).children;
}

double Ledger::subtree_weight(BlockId id) const {
    return entry(id).subtree_weight;
}

uint64_t Ledger::arrival_index(BlockId id) const {
    return entry(id).arrival_index;
}

SimTime Ledger::arrival_time(BlockId id) const {
    return entry(id).arrival_time;
}

std::vector<BlockId> Ledger::block_ids() const {
    std::vector<BlockId> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end(), [this](BlockId a, BlockId b) {
        return entries_.at(a).arrival_index < entries_.at(b).arrival_index;
    });
    return ids;
}

std::vector<BlockId> Ledger::path_from_genesis(BlockId id) const {
    std::vector<BlockId> path;
    for (BlockId cur = id; cur != kNoBlock; cur = entry(cur).block->parent_id) {
        path.push_back(cur);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

bool Ledger::is_ancestor(BlockId ancestor, BlockId descendant) const {
    const Block& a = *entry(ancestor).block;
    BlockId cur = descendant;
    while (cur != kNoBlock) {
        const Block& b = *entry(cur).block;
        if (b.id == a.id) {
            return true;
        }
        if (b.height <= a.height) {
            return false;
        }
        cur = b.parent_id;
    }
    return false;
}

BlockId Ledger::common_ancestor(BlockId a, BlockId b) const {
    const Block* x = entry(a).block.get();
    const Block* y = entry(b).block.get();
    while (x->height > y->height) {
        x = entry(x->parent_id).block.get();
    }
    while (y->height > x->height) {
        y = entry(y->parent_id).block.get();
    }
    while (x->id != y->id) {
        x = entry(x->parent_id).block.get();
        y = entry(y->parent_id).block.get();
    }
    return x->id;
}

const Ledger::Entry& Ledger::entry(BlockId id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw std::out_of_range("block " + std::to_string(id) + " is not in the ledger");
    }
    return it->second;
}
