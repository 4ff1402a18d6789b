#pragma once

#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "../core/event.hpp"
#include "../core/ledger.hpp"

enum class ConsensusKind {
    PoW,
    PoS,
    GHOST,
};

std::string to_string(ConsensusKind kind);

struct ConsensusParams {
    ConsensusKind kind{ConsensusKind::PoW};
    // expected blocks per simulated time unit over the whole network
    double block_rate{0.1};
    // PoW / GHOST: time between two mining trials of one node
    double mine_interval{1.0};
    // PoS: slot length; every slot is one eligibility trial per node
    double slot_duration{1.0};
};

enum class ValidationResult {
    Valid,
    Duplicate,
    MissingParent,
    BadId,
    BadHeight,
    BadTimestamp,
    UnknownCreator,
    WrongProofKind,
    BadWeight,
    BadSlot,
    BadProof,
};

std::string to_string(ValidationResult result);

// Fork-choice and validity rules of one protocol. The protocol set is closed:
// every capability switches over ConsensusKind.
class ConsensusEngine {
public:
    // weights are hash power (PoW, GHOST) or stake (PoS) per node;
    // throws ConfigurationError on invalid parameters
    ConsensusEngine(ConsensusParams params, std::unordered_map<NodeId, double> weights, uint64_t seed);

    ValidationResult validate(const Block& block, const Ledger& ledger) const;

    // pure: the caller commits the result with Ledger::set_head
    BlockId select_head(const Ledger& ledger) const;

    double weight_of(const Block& block) const;

    // Runs one mining trial (PoW, GHOST) or slot lottery (PoS) for creator
    // on top of parent. Returns the proof to embed in the new block on success.
    std::optional<Proof> try_produce(NodeId creator,
                                     SimTime now,
                                     const Block& parent,
                                     const MiningToken& token,
                                     std::mt19937_64& rng) const;

    // weight credited to a block created by this node
    double credit_for(NodeId creator) const;

    // success probability of one trial
    double threshold_for(NodeId creator) const;

    // PoW / GHOST: mine_interval, PoS: slot_duration
    SimTime attempt_period() const;

    // PoS slot containing time t; genesis owns slot 0
    uint64_t slot_at(SimTime t) const;

    // next slot boundary strictly after t
    SimTime next_slot_start(SimTime t) const;

    ConsensusKind kind() const {
        return params_.kind;
    }

    const ConsensusParams& params() const {
        return params_;
    }

    double weight(NodeId node) const;

    bool knows(NodeId node) const {
        return weights_.contains(node);
    }

private:
    ValidationResult validate_work(const Block& block) const;
    ValidationResult validate_stake(const Block& block, const Block& parent) const;

private:
    ConsensusParams params_;
    std::unordered_map<NodeId, double> weights_;
    double total_weight_{0};
    uint64_t seed_;
};
