#include "consensus.hpp"

#include <algorithm>
#include <cmath>

#include "../core/errors.hpp"
#include "fork_choice.hpp"
#include "lottery.hpp"

namespace {

const double THRESHOLD_EPS = 1e-12;
const double SLOT_EPS = 1e-9;

bool same(double a, double b) {
    return std::fabs(a - b) <= THRESHOLD_EPS;
}

} // namespace

std::string to_string(ConsensusKind kind) {
    switch (kind) {
        case ConsensusKind::PoW:
            return "PoW";
        case ConsensusKind::PoS:
            return "PoS";
        case ConsensusKind::GHOST:
            return "GHOST";
    }
    return "Unknown";
}

std::string to_string(ValidationResult result) {
    switch (result) {
        case ValidationResult::Valid:
            return "Valid";
        case ValidationResult::Duplicate:
            return "Duplicate";
        case ValidationResult::MissingParent:
            return "MissingParent";
        case ValidationResult::BadId:
            return "BadId";
        case ValidationResult::BadHeight:
            return "BadHeight";
        case ValidationResult::BadTimestamp:
            return "BadTimestamp";
        case ValidationResult::UnknownCreator:
            return "UnknownCreator";
        case ValidationResult::WrongProofKind:
            return "WrongProofKind";
        case ValidationResult::BadWeight:
            return "BadWeight";
        case ValidationResult::BadSlot:
            return "BadSlot";
        case ValidationResult::BadProof:
            return "BadProof";
    }
    return "Unknown";
}

ConsensusEngine::ConsensusEngine(ConsensusParams params,
                                 std::unordered_map<NodeId, double> weights,
                                 uint64_t seed)
    : params_(params), weights_(std::move(weights)), seed_(seed) {
    if (params_.block_rate < 0 || !std::isfinite(params_.block_rate)) {
        throw ConfigurationError("block_rate must be a non-negative number");
    }
    if (params_.mine_interval <= 0) {
        throw ConfigurationError("mine_interval must be positive");
    }
    if (params_.slot_duration <= 0) {
        throw ConfigurationError("slot_duration must be positive");
    }

    for (const auto& [node, w] : weights_) {
        if (w < 0 || !std::isfinite(w)) {
            throw ConfigurationError("node " + std::to_string(node) + " has an invalid weight");
        }
        total_weight_ += w;
    }
    if (total_weight_ <= 0) {
        throw ConfigurationError("total " + std::string(params_.kind == ConsensusKind::PoS ? "stake" : "hash power")
                                 + " must be positive");
    }
}

ValidationResult ConsensusEngine::validate(const Block& block, const Ledger& ledger) const {
    if (ledger.contains(block.id)) {
        return ValidationResult::Duplicate;
    }

    BlockPtr parent = block.is_genesis() ? nullptr : ledger.get(block.parent_id);
    if (!parent) {
        return ValidationResult::MissingParent;
    }
    if (compute_block_id(block) != block.id) {
        return ValidationResult::BadId;
    }
    if (block.height != parent->height + 1) {
        return ValidationResult::BadHeight;
    }
    if (block.timestamp < parent->timestamp) {
        return ValidationResult::BadTimestamp;
    }
    if (!knows(block.creator)) {
        return ValidationResult::UnknownCreator;
    }
    if (!same(block.weight, credit_for(block.creator))) {
        return ValidationResult::BadWeight;
    }

    switch (params_.kind) {
        case ConsensusKind::PoW:
        case ConsensusKind::GHOST:
            return validate_work(block);
        case ConsensusKind::PoS:
            return validate_stake(block, *parent);
    }
    return ValidationResult::WrongProofKind;
}

ValidationResult ConsensusEngine::validate_work(const Block& block) const {
    if (block.proof.kind != ProofKind::Work) {
        return ValidationResult::WrongProofKind;
    }
    if (!same(block.proof.threshold, threshold_for(block.creator))) {
        return ValidationResult::BadProof;
    }
    if (block.proof.draw < 0 || block.proof.draw >= block.proof.threshold) {
        return ValidationResult::BadProof;
    }
    return ValidationResult::Valid;
}

ValidationResult ConsensusEngine::validate_stake(const Block& block, const Block& parent) const {
    if (block.proof.kind != ProofKind::Stake) {
        return ValidationResult::WrongProofKind;
    }
    if (block.proof.slot <= parent.proof.slot || block.proof.slot != slot_at(block.timestamp)) {
        return ValidationResult::BadSlot;
    }
    if (!same(block.proof.threshold, threshold_for(block.creator))) {
        return ValidationResult::BadProof;
    }
    double expected = lottery_draw(seed_, block.proof.slot, block.creator);
    if (block.proof.draw != expected || block.proof.draw >= block.proof.threshold) {
        return ValidationResult::BadProof;
    }
    return ValidationResult::Valid;
}

BlockId ConsensusEngine::select_head(const Ledger& ledger) const {
    switch (params_.kind) {
        case ConsensusKind::PoW:
        case ConsensusKind::PoS:
            return longest_chain_head(ledger);
        case ConsensusKind::GHOST:
            return ghost_head(ledger);
    }
    return ledger.head();
}

double ConsensusEngine::weight_of(const Block& block) const {
    // credited at creation and checked by validate(); genesis carries none
    return block.is_genesis() ? 0 : block.weight;
}

std::optional<Proof> ConsensusEngine::try_produce(NodeId creator,
                                                  SimTime now,
                                                  const Block& parent,
                                                  const MiningToken& token,
                                                  std::mt19937_64& rng) const {
    double threshold = threshold_for(creator);

    switch (params_.kind) {
        case ConsensusKind::PoW:
        case ConsensusKind::GHOST: {
            double draw = token.draw.has_value()
                              ? *token.draw
                              : std::uniform_real_distribution<double>(0.0, 1.0)(rng);
            if (draw < 0 || draw >= threshold) {
                return std::nullopt;
            }
            return Proof{ProofKind::Work, draw, threshold, 0};
        }

        case ConsensusKind::PoS: {
            // the lottery is a function of (seed, slot, creator); a pinned draw
            // would not verify, so it is ignored here
            uint64_t slot = slot_at(now);
            if (slot <= parent.proof.slot) {
                return std::nullopt;
            }
            double draw = lottery_draw(seed_, slot, creator);
            if (draw >= threshold) {
                return std::nullopt;
            }
            return Proof{ProofKind::Stake, draw, threshold, slot};
        }
    }
    return std::nullopt;
}

double ConsensusEngine::credit_for(NodeId creator) const {
    switch (params_.kind) {
        case ConsensusKind::PoW:
        case ConsensusKind::GHOST:
            // constant difficulty: every block is one unit of work
            return 1.0;
        case ConsensusKind::PoS:
            return weight(creator);
    }
    return 0;
}

double ConsensusEngine::threshold_for(NodeId creator) const {
    double share = weight(creator) / total_weight_;
    return std::min(1.0, params_.block_rate * attempt_period() * share);
}

SimTime ConsensusEngine::attempt_period() const {
    return params_.kind == ConsensusKind::PoS ? params_.slot_duration : params_.mine_interval;
}

uint64_t ConsensusEngine::slot_at(SimTime t) const {
    // slot starts are computed as k * slot_duration; absorb the rounding of that product
    return static_cast<uint64_t>(std::floor(t / params_.slot_duration + SLOT_EPS)) + 1;
}

SimTime ConsensusEngine::next_slot_start(SimTime t) const {
    // slot_at(t) = k + 1 covers [k * d, (k + 1) * d)
    return static_cast<double>(slot_at(t)) * params_.slot_duration;
}

double ConsensusEngine::weight(NodeId node) const {
    auto it = weights_.find(node);
    return it == weights_.end() ? 0 : it->second;
}
