#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../core/types.hpp"

using json = nlohmann::json;

enum class TraceKind {
    Mined,       // block created and inserted by its miner
    Accepted,    // block validated and inserted into a peer's ledger
    Rejected,    // failed validation; dropped, not forwarded
    Buffered,    // parent missing, held in the pending buffer
    Dropped,     // message lost on a link
    ForkCheck,   // periodic head re-evaluation
    Unresolved,  // still buffered when the run halted
};

std::string to_string(TraceKind kind);

struct TraceRecord {
    SimTime time{0};
    NodeId node{kNoNode};
    BlockId block_id{kNoBlock};
    BlockId parent_id{kNoBlock};
    TraceKind kind{TraceKind::Mined};
    NodeId sender{kNoNode};
    // head of the node after the record was produced
    BlockId head{kNoBlock};
    uint64_t head_height{0};
    uint64_t block_height{0};
    // rejection reason, tip count for fork checks
    std::string detail;

    friend std::ostream& operator<<(std::ostream& out, const TraceRecord& record);
};

void to_json(json& j, const TraceRecord& record);

// Append-only record of what every node saw, in dispatch order.
class Trace {
public:
    void append(TraceRecord record) {
        records_.push_back(std::move(record));
    }

    const std::vector<TraceRecord>& records() const {
        return records_;
    }

    size_t size() const {
        return records_.size();
    }

    size_t count(TraceKind kind) const;
    std::vector<TraceRecord> of_kind(TraceKind kind) const;

    // one JSON object per line
    void dump(std::ostream& out) const;
    std::string dump() const;

private:
    std::vector<TraceRecord> records_;
};
