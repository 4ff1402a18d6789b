#include "block.hpp"

#include <cstring>
#include <string>

namespace {

const uint64_t FNV_OFFSET = 14695981039346656037ULL;
const uint64_t FNV_PRIME = 1099511628211ULL;

class Fnv1a {
public:
    void add_bytes(const void* data, size_t size) {
        const unsigned char* bytes = static_cast<const unsigned char*>(data);
        for (size_t i = 0; i < size; ++i) {
            hash_ ^= bytes[i];
            hash_ *= FNV_PRIME;
        }
    }

    template <typename T>
    void add(const T& value) {
        unsigned char raw[sizeof(T)];
        std::memcpy(raw, &value, sizeof(T));
        add_bytes(raw, sizeof(T));
    }

    void add(const std::string& value) {
        add(value.size());
        add_bytes(value.data(), value.size());
    }

    uint64_t get() const {
        return hash_;
    }

private:
    uint64_t hash_{FNV_OFFSET};
};

} // namespace

BlockId compute_block_id(const Block& block) {
    Fnv1a h;
    h.add(block.parent_id);
    h.add(block.creator);
    h.add(block.timestamp);
    h.add(block.height);
    h.add(block.weight);
    h.add(static_cast<int>(block.proof.kind));
    h.add(block.proof.draw);
    h.add(block.proof.threshold);
    h.add(block.proof.slot);
    h.add(block.payload.dump());

    BlockId id = h.get();
    return id == kNoBlock ? 1 : id;
}

BlockPtr make_genesis() {
    Block genesis;
    genesis.payload = json{{"genesis", true}};
    genesis.id = compute_block_id(genesis);
    return std::make_shared<const Block>(std::move(genesis));
}

BlockPtr make_block(const Block& parent,
                    NodeId creator,
                    SimTime timestamp,
                    double weight,
                    Proof proof,
                    json payload) {
    Block block;
    block.parent_id = parent.id;
    block.creator = creator;
    block.timestamp = timestamp;
    block.height = parent.height + 1;
    block.weight = weight;
    block.proof = proof;
    block.payload = std::move(payload);
    block.id = compute_block_id(block);
    return std::make_shared<const Block>(std::move(block));
}

std::ostream& operator<<(std::ostream& out, const Block& block) {
    out << "{#" << block.id << " h=" << block.height << " parent=" << block.parent_id;
    if (block.creator != kNoNode) {
        out << " by " << block.creator;
    }
    out << " t=" << block.timestamp << "}";
    return out;
}

BlockPtr BlockStore::intern(BlockPtr block) {
    return blocks_.emplace(block->id, block).first->second;
}

BlockPtr BlockStore::get(BlockId id) const {
    auto it = blocks_.find(id);
    if (it == blocks_.end()) {
        return nullptr;
    }
    return it->second;
}
