#include "fork_choice.hpp"

BlockId longest_chain_head(const Ledger& ledger) {
    BlockId best = ledger.genesis()->id;
    uint64_t best_height = 0;
    uint64_t best_arrival = ledger.arrival_index(best);

    for (BlockId tip : ledger.tips()) {
        uint64_t height = ledger.get(tip)->height;
        uint64_t arrival = ledger.arrival_index(tip);
        if (height > best_height || (height == best_height && arrival < best_arrival)) {
            best = tip;
            best_height = height;
            best_arrival = arrival;
        }
    }

    return best;
}

BlockId ghost_head(const Ledger& ledger) {
    BlockId current = ledger.genesis()->id;

    while (!ledger.children(current).empty()) {
        const auto& children = ledger.children(current);
        BlockId best = children.front();
        for (size_t i = 1; i < children.size(); ++i) {
            BlockId child = children[i];
            double weight = ledger.subtree_weight(child);
            double best_weight = ledger.subtree_weight(best);
            if (weight > best_weight
                || (weight == best_weight && ledger.arrival_index(child) < ledger.arrival_index(best))) {
                best = child;
            }
        }
        current = best;
    }

    return current;
}
