#include "summary.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <set>
#include <unordered_map>
#include <boost/dynamic_bitset.hpp>

namespace {

struct BlockTree {
    std::unordered_map<BlockId, BlockId> parent;
    std::unordered_map<BlockId, uint64_t> height;

    BlockId ancestor_at(BlockId id, uint64_t target) const {
        while (true) {
            auto h = height.find(id);
            if (h == height.end() || h->second <= target) {
                return id;
            }
            id = parent.at(id);
        }
    }
};

bool changes_head(TraceKind kind) {
    return kind == TraceKind::Mined || kind == TraceKind::Accepted || kind == TraceKind::ForkCheck;
}

bool heads_agree(const std::map<NodeId, BlockId>& heads, const BlockTree& tree, size_t tolerance) {
    auto height_of = [&tree](BlockId id) {
        auto h = tree.height.find(id);
        return h == tree.height.end() ? uint64_t{0} : h->second;
    };

    uint64_t highest = 0;
    for (const auto& [node, head] : heads) {
        highest = std::max(highest, height_of(head));
    }
    uint64_t cut = highest > tolerance ? highest - tolerance : 0;

    std::optional<BlockId> common;
    for (const auto& [node, head] : heads) {
        if (height_of(head) < cut) {
            return false;
        }
        BlockId at_cut = tree.ancestor_at(head, cut);
        if (common.has_value() && *common != at_cut) {
            return false;
        }
        common = at_cut;
    }
    return true;
}

} // namespace

RunSummary summarize(const Trace& trace, const std::vector<NodeSnapshot>& nodes, size_t tolerance) {
    RunSummary summary;
    summary.rejected = trace.count(TraceKind::Rejected);
    summary.dropped = trace.count(TraceKind::Dropped);
    summary.unresolved = trace.count(TraceKind::Unresolved);

    if (nodes.empty() || nodes.front().blocks.empty()) {
        return summary;
    }
    BlockId genesis = nodes.front().blocks.front();

    BlockTree tree;
    tree.height[genesis] = 0;
    std::unordered_map<BlockId, SimTime> mined_at;
    std::unordered_map<BlockId, size_t> mined_index;
    std::unordered_map<BlockId, size_t> children;

    for (const auto& record : trace.records()) {
        if (record.kind != TraceKind::Mined) {
            continue;
        }
        mined_at[record.block_id] = record.time;
        mined_index[record.block_id] = mined_index.size();
        tree.parent[record.block_id] = record.parent_id;
        tree.height[record.block_id] = record.block_height;
        ++children[record.parent_id];
    }
    summary.blocks_mined = mined_at.size();

    for (const auto& [parent, count] : children) {
        summary.forks += count - 1;
    }

    for (const auto& record : trace.of_kind(TraceKind::Accepted)) {
        auto it = mined_at.find(record.block_id);
        if (it != mined_at.end()) {
            summary.propagation_delays.push_back(record.time - it->second);
        }
    }
    if (!summary.propagation_delays.empty()) {
        const auto& delays = summary.propagation_delays;
        summary.mean_propagation_delay =
            std::accumulate(delays.begin(), delays.end(), 0.0) / static_cast<double>(delays.size());
        summary.max_propagation_delay = *std::max_element(delays.begin(), delays.end());
    }

    std::vector<boost::dynamic_bitset<>> seen_by(mined_index.size(), boost::dynamic_bitset<>(nodes.size()));
    std::set<BlockId> heads;
    for (size_t i = 0; i < nodes.size(); ++i) {
        heads.insert(nodes[i].head);
        for (BlockId id : nodes[i].blocks) {
            auto it = mined_index.find(id);
            if (it != mined_index.end()) {
                seen_by[it->second].set(i);
            }
        }
    }
    summary.distinct_heads = heads.size();
    summary.fully_replicated = std::count_if(seen_by.begin(), seen_by.end(), [](const auto& marks) {
        return marks.all();
    });

    std::map<NodeId, BlockId> current;
    for (const auto& node : nodes) {
        current[node.id] = genesis;
    }

    std::optional<SimTime> since = 0.0;
    const auto& records = trace.records();
    for (size_t i = 0; i < records.size(); ++i) {
        const TraceRecord& record = records[i];
        if (changes_head(record.kind) && current.contains(record.node)) {
            current[record.node] = record.head;
        }

        // judge agreement once every record at this instant is applied
        bool last_at_time = i + 1 == records.size() || records[i + 1].time != record.time;
        if (!last_at_time) {
            continue;
        }
        if (heads_agree(current, tree, tolerance)) {
            if (!since.has_value()) {
                since = record.time;
            }
        } else {
            since.reset();
        }
    }
    summary.convergence_time = since;

    return summary;
}
