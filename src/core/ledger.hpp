#pragma once

#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "block.hpp"

// One node's view of the block tree. Blocks enter only through insert(),
// which refuses anything whose parent is not already present, so every
// ancestor of every stored block is stored as well.
class Ledger {
public:
    enum InsertStatus {
        Inserted,
        Duplicate,
        MissingParent,
    };

    explicit Ledger(BlockPtr genesis);

    InsertStatus insert(BlockPtr block, SimTime arrival_time);

    bool contains(BlockId id) const {
        return entries_.contains(id);
    }

    // nullptr when absent
    BlockPtr get(BlockId id) const;

    const BlockPtr& genesis() const {
        return genesis_;
    }

    BlockId head() const {
        return head_;
    }

    const Block& head_block() const;

    // throws std::out_of_range for a block this ledger has not seen
    void set_head(BlockId id);

    const std::vector<BlockId>& children(BlockId id) const;

    // inclusive sum of block weights over the subtree rooted at id
    double subtree_weight(BlockId id) const;

    // local insertion order; smaller means seen earlier
    uint64_t arrival_index(BlockId id) const;
    SimTime arrival_time(BlockId id) const;

    const std::unordered_set<BlockId>& tips() const {
        return tips_;
    }

    size_t size() const {
        return entries_.size();
    }

    std::vector<BlockId> block_ids() const;

    // genesis first, id last
    std::vector<BlockId> path_from_genesis(BlockId id) const;

    bool is_ancestor(BlockId ancestor, BlockId descendant) const;
    BlockId common_ancestor(BlockId a, BlockId b) const;

private:
    struct Entry {
        BlockPtr block;
        std::vector<BlockId> children;
        double subtree_weight{0};
        uint64_t arrival_index{0};
        SimTime arrival_time{0};
    };

    const Entry& entry(BlockId id) const;

private:
    BlockPtr genesis_;
    BlockId head_;
    uint64_t next_arrival_{0};
    std::unordered_map<BlockId, Entry> entries_;
    std::unordered_set<BlockId> tips_;
};
