#pragma once

#include <iostream>
#include <memory>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "types.hpp"

using json = nlohmann::json;

enum class ProofKind {
    Genesis,
    Work,   // mining trial
    Stake,  // slot lottery
};

// logical proof token recorded at creation; there is no hash puzzle behind it
struct Proof {
    ProofKind kind{ProofKind::Genesis};
    double draw{0};
    double threshold{0};
    uint64_t slot{0};

    bool operator==(const Proof& other) const = default;
};

struct Block {
    BlockId id{kNoBlock};
    BlockId parent_id{kNoBlock};
    NodeId creator{kNoNode};
    SimTime timestamp{0};
    uint64_t height{0};
    double weight{0};
    Proof proof;
    json payload;

    bool is_genesis() const {
        return parent_id == kNoBlock;
    }

    friend std::ostream& operator<<(std::ostream& out, const Block& block);
};

using BlockPtr = std::shared_ptr<const Block>;

// FNV-1a over every field except the id itself
BlockId compute_block_id(const Block& block);

BlockPtr make_genesis();

// fills in height from the parent and the id from the content
BlockPtr make_block(const Block& parent,
                    NodeId creator,
                    SimTime timestamp,
                    double weight,
                    Proof proof,
                    json payload = {});

// Append-only arena of validated blocks. The first copy interned under an id
// becomes canonical; per-node ledgers hold references into it.
class BlockStore {
public:
    BlockPtr intern(BlockPtr block);
    BlockPtr get(BlockId id) const;

    bool contains(BlockId id) const {
        return blocks_.contains(id);
    }

    size_t size() const {
        return blocks_.size();
    }

private:
    std::unordered_map<BlockId, BlockPtr> blocks_;
};
