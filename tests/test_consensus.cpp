#include <gtest/gtest.h>
#include <glog/logging.h>

#include <random>

#include <../src/core/errors.hpp>
#include <../src/consensus/consensus.hpp>
#include <../src/consensus/fork_choice.hpp>
#include <../src/consensus/lottery.hpp>


ConsensusParams params_of(ConsensusKind kind, double block_rate = 0.5) {
    ConsensusParams params;
    params.kind = kind;
    params.block_rate = block_rate;
    params.mine_interval = 1.0;
    params.slot_duration = 1.0;
    return params;
}

const std::unordered_map<NodeId, double> WEIGHTS = {{0, 1.0}, {1, 1.0}, {2, 2.0}};

// pinned draw 0 always wins a PoW / GHOST trial
BlockPtr mine_on(const ConsensusEngine& engine, const Block& parent, NodeId creator, SimTime t) {
    std::mt19937_64 rng(0);
    auto proof = engine.try_produce(creator, t, parent, MiningToken{0, true, 0.0}, rng);
    EXPECT_TRUE(proof.has_value());
    return make_block(parent, creator, t, engine.credit_for(creator), *proof);
}

Block tampered(const Block& block) {
    Block copy = block;
    copy.id = compute_block_id(copy);
    return copy;
}

TEST(ConsensusEngine, RejectsBadParameters) {
    EXPECT_THROW(ConsensusEngine(params_of(ConsensusKind::PoW), {{0, 0.0}}, 1), ConfigurationError);
    EXPECT_THROW(ConsensusEngine(params_of(ConsensusKind::PoW), {{0, -1.0}, {1, 2.0}}, 1), ConfigurationError);
    EXPECT_THROW(ConsensusEngine(params_of(ConsensusKind::PoW, -0.1), WEIGHTS, 1), ConfigurationError);

    ConsensusParams params = params_of(ConsensusKind::PoS);
    params.slot_duration = 0;
    EXPECT_THROW(ConsensusEngine(params, WEIGHTS, 1), ConfigurationError);
}

TEST(PoW, Threshold) {
    ConsensusEngine engine(params_of(ConsensusKind::PoW), WEIGHTS, 1);
    EXPECT_DOUBLE_EQ(engine.threshold_for(0), 0.125);
    EXPECT_DOUBLE_EQ(engine.threshold_for(2), 0.25);
    EXPECT_DOUBLE_EQ(engine.threshold_for(7), 0.0);
    EXPECT_EQ(engine.credit_for(2), 1.0);

    ConsensusEngine saturated(params_of(ConsensusKind::PoW, 100), WEIGHTS, 1);
    EXPECT_DOUBLE_EQ(saturated.threshold_for(0), 1.0);
}

TEST(PoW, PinnedDraw) {
    ConsensusEngine engine(params_of(ConsensusKind::PoW), WEIGHTS, 1);
    BlockPtr genesis = make_genesis();
    std::mt19937_64 rng(0);

    auto win = engine.try_produce(2, 1.0, *genesis, MiningToken{0, true, 0.1}, rng);
    ASSERT_TRUE(win.has_value());
    EXPECT_EQ(win->kind, ProofKind::Work);
    EXPECT_EQ(win->draw, 0.1);
    EXPECT_DOUBLE_EQ(win->threshold, 0.25);

    EXPECT_FALSE(engine.try_produce(2, 1.0, *genesis, MiningToken{0, true, 0.3}, rng).has_value());
    EXPECT_FALSE(engine.try_produce(7, 1.0, *genesis, MiningToken{0, true, 0.0}, rng).has_value());
}

TEST(PoW, SuccessRateFollowsWeight) {
    ConsensusEngine engine(params_of(ConsensusKind::PoW), WEIGHTS, 1);
    BlockPtr genesis = make_genesis();
    std::mt19937_64 rng(17);

    int wins = 0;
    const int trials = 20000;
    for (int i = 0; i < trials; ++i) {
        if (engine.try_produce(2, 1.0, *genesis, MiningToken{}, rng).has_value()) {
            ++wins;
        }
    }
    EXPECT_NEAR(static_cast<double>(wins) / trials, 0.25, 0.02);
}

TEST(PoW, Validation) {
    ConsensusEngine engine(params_of(ConsensusKind::PoW), WEIGHTS, 1);
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);

    BlockPtr a = mine_on(engine, *genesis, 2, 5.0);
    EXPECT_EQ(engine.validate(*a, ledger), ValidationResult::Valid);

    BlockPtr orphan = mine_on(engine, *a, 1, 6.0);
    EXPECT_EQ(engine.validate(*orphan, ledger), ValidationResult::MissingParent);

    ledger.insert(a, 5.0);
    EXPECT_EQ(engine.validate(*a, ledger), ValidationResult::Duplicate);
    EXPECT_EQ(engine.validate(*orphan, ledger), ValidationResult::Valid);

    Block bad_id = *orphan;
    bad_id.id += 1;
    EXPECT_EQ(engine.validate(bad_id, ledger), ValidationResult::BadId);

    Block bad_height = *orphan;
    bad_height.height = 7;
    EXPECT_EQ(engine.validate(tampered(bad_height), ledger), ValidationResult::BadHeight);

    Block bad_time = *orphan;
    bad_time.timestamp = 4.0;
    EXPECT_EQ(engine.validate(tampered(bad_time), ledger), ValidationResult::BadTimestamp);

    Block stranger = *orphan;
    stranger.creator = 9;
    EXPECT_EQ(engine.validate(tampered(stranger), ledger), ValidationResult::UnknownCreator);

    Block heavy = *orphan;
    heavy.weight = 2.0;
    EXPECT_EQ(engine.validate(tampered(heavy), ledger), ValidationResult::BadWeight);

    Block staked = *orphan;
    staked.proof.kind = ProofKind::Stake;
    EXPECT_EQ(engine.validate(tampered(staked), ledger), ValidationResult::WrongProofKind);

    Block lucky = *orphan;
    lucky.proof.draw = 0.5;
    EXPECT_EQ(engine.validate(tampered(lucky), ledger), ValidationResult::BadProof);

    Block inflated = *orphan;
    inflated.proof.threshold = 1.0;
    inflated.proof.draw = 0.9;
    EXPECT_EQ(engine.validate(tampered(inflated), ledger), ValidationResult::BadProof);
}

TEST(PoS, Slots) {
    ConsensusEngine engine(params_of(ConsensusKind::PoS), WEIGHTS, 1);
    EXPECT_EQ(engine.slot_at(0.0), 1);
    EXPECT_EQ(engine.slot_at(0.5), 1);
    EXPECT_EQ(engine.slot_at(1.0), 2);
    EXPECT_EQ(engine.slot_at(2.5), 3);
    EXPECT_DOUBLE_EQ(engine.next_slot_start(2.5), 3.0);
    EXPECT_DOUBLE_EQ(engine.next_slot_start(3.0), 4.0);
    EXPECT_DOUBLE_EQ(engine.attempt_period(), 1.0);
    EXPECT_EQ(engine.credit_for(2), 2.0);
}

TEST(PoS, LotteryIsVerifiable) {
    EXPECT_EQ(lottery_draw(5, 10, 2), lottery_draw(5, 10, 2));
    EXPECT_NE(lottery_draw(5, 10, 2), lottery_draw(5, 11, 2));
    EXPECT_NE(lottery_draw(5, 10, 2), lottery_draw(6, 10, 2));
    for (uint64_t slot = 0; slot < 1000; ++slot) {
        double draw = lottery_draw(3, slot, 1);
        EXPECT_GE(draw, 0.0);
        EXPECT_LT(draw, 1.0);
    }
}

TEST(PoS, ProduceAndValidate) {
    ConsensusEngine engine(params_of(ConsensusKind::PoS, 1.0), WEIGHTS, 7);
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    std::mt19937_64 rng(0);

    size_t produced = 0;
    for (uint64_t slot = 1; slot <= 60; ++slot) {
        SimTime t = static_cast<double>(slot - 1) + 0.5;
        auto proof = engine.try_produce(2, t, *genesis, MiningToken{}, rng);
        bool eligible = lottery_draw(7, slot, 2) < engine.threshold_for(2);
        ASSERT_EQ(proof.has_value(), eligible);

        // a pinned draw does not change the outcome of a lottery
        auto pinned = engine.try_produce(2, t, *genesis, MiningToken{0, true, 0.0}, rng);
        ASSERT_EQ(pinned.has_value(), eligible);

        if (!proof) {
            continue;
        }
        ++produced;
        EXPECT_EQ(proof->kind, ProofKind::Stake);
        EXPECT_EQ(proof->slot, slot);

        BlockPtr block = make_block(*genesis, 2, t, engine.credit_for(2), *proof);
        EXPECT_EQ(engine.validate(*block, ledger), ValidationResult::Valid);

        Block forged = *block;
        forged.proof.draw = 0.0;
        EXPECT_EQ(engine.validate(tampered(forged), ledger), ValidationResult::BadProof);

        Block wrong_slot = *block;
        wrong_slot.timestamp = t + 1.0;
        EXPECT_EQ(engine.validate(tampered(wrong_slot), ledger), ValidationResult::BadSlot);

        Block light = *block;
        light.weight = 1.0;
        EXPECT_EQ(engine.validate(tampered(light), ledger), ValidationResult::BadWeight);

        Block worked = *block;
        worked.proof.kind = ProofKind::Work;
        EXPECT_EQ(engine.validate(tampered(worked), ledger), ValidationResult::WrongProofKind);
    }
    // threshold 0.5 over 60 slots
    EXPECT_GT(produced, 10);
    EXPECT_LT(produced, 50);
}

TEST(PoS, OneBlockPerSlotPerChain) {
    ConsensusEngine engine(params_of(ConsensusKind::PoS, 100.0), WEIGHTS, 7);
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    std::mt19937_64 rng(0);

    auto proof = engine.try_produce(0, 0.2, *genesis, MiningToken{}, rng);
    ASSERT_TRUE(proof.has_value());
    BlockPtr a = make_block(*genesis, 0, 0.2, engine.credit_for(0), *proof);
    ledger.insert(a, 0.2);

    // same slot as the parent
    EXPECT_FALSE(engine.try_produce(1, 0.7, *a, MiningToken{}, rng).has_value());
    EXPECT_TRUE(engine.try_produce(1, 1.2, *a, MiningToken{}, rng).has_value());

    Block same_slot;
    same_slot.parent_id = a->id;
    same_slot.creator = 1;
    same_slot.timestamp = 0.7;
    same_slot.height = 2;
    same_slot.weight = engine.credit_for(1);
    same_slot.proof = Proof{ProofKind::Stake, lottery_draw(7, 1, 1), engine.threshold_for(1), 1};
    EXPECT_EQ(engine.validate(tampered(same_slot), ledger), ValidationResult::BadSlot);
}

TEST(ForkChoice, LongestChainPrefersEarlierArrival) {
    ConsensusEngine engine(params_of(ConsensusKind::PoW), WEIGHTS, 1);
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);

    BlockPtr a = mine_on(engine, *genesis, 0, 1.0);
    BlockPtr b = mine_on(engine, *genesis, 1, 1.0);
    ledger.insert(b, 1.0);
    ledger.insert(a, 1.0);

    EXPECT_EQ(engine.select_head(ledger), b->id);
    // select_head is pure
    EXPECT_EQ(ledger.head(), genesis->id);

    BlockPtr a1 = mine_on(engine, *a, 0, 2.0);
    ledger.insert(a1, 2.0);
    EXPECT_EQ(engine.select_head(ledger), a1->id);
}

// genesis -> A -> A1 -> A2 against genesis -> B -> {B1, B2, B3}
TEST(ForkChoice, GhostDisagreesWithLongestChain) {
    ConsensusEngine ghost(params_of(ConsensusKind::GHOST), WEIGHTS, 1);
    ConsensusEngine pow(params_of(ConsensusKind::PoW), WEIGHTS, 1);
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);

    BlockPtr a = mine_on(ghost, *genesis, 0, 1.0);
    BlockPtr a1 = mine_on(ghost, *a, 0, 2.0);
    BlockPtr a2 = mine_on(ghost, *a1, 0, 3.0);
    BlockPtr b = mine_on(ghost, *genesis, 1, 1.0);
    BlockPtr b1 = mine_on(ghost, *b, 1, 2.0);
    BlockPtr b2 = mine_on(ghost, *b, 2, 2.0);
    BlockPtr b3 = mine_on(ghost, *b, 0, 2.0);

    for (const auto& block : {a, a1, a2, b, b1, b2, b3}) {
        ASSERT_EQ(ghost.validate(*block, ledger), ValidationResult::Valid);
        ASSERT_EQ(ledger.insert(block, block->timestamp), Ledger::Inserted);
    }

    EXPECT_DOUBLE_EQ(ledger.subtree_weight(a->id), 3.0);
    EXPECT_DOUBLE_EQ(ledger.subtree_weight(b->id), 4.0);

    EXPECT_EQ(pow.select_head(ledger), a2->id);
    EXPECT_EQ(ghost.select_head(ledger), b1->id);
}

TEST(ForkChoice, GhostCountsBlockWeight) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    Proof proof{ProofKind::Stake, 0.0, 1.0, 1};

    BlockPtr a = make_block(*genesis, 0, 1.0, 1.0, proof);
    BlockPtr a1 = make_block(*a, 0, 2.0, 1.0, proof);
    BlockPtr b = make_block(*genesis, 1, 1.0, 3.0, proof);
    for (const auto& block : {a, a1, b}) {
        ledger.insert(block, 1.0);
    }

    EXPECT_EQ(longest_chain_head(ledger), a1->id);
    EXPECT_EQ(ghost_head(ledger), b->id);
}

TEST(ForkChoice, GhostTieGoesToFirstSeen) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    Proof proof{ProofKind::Work, 0.0, 1.0, 0};

    BlockPtr a = make_block(*genesis, 0, 1.0, 1.0, proof);
    BlockPtr b = make_block(*genesis, 1, 1.0, 1.0, proof);
    ledger.insert(b, 1.0);
    ledger.insert(a, 1.0);

    EXPECT_EQ(ghost_head(ledger), b->id);
    EXPECT_EQ(longest_chain_head(ledger), b->id);
}

TEST(ConsensusEngine, WeightOf) {
    ConsensusEngine engine(params_of(ConsensusKind::PoS), WEIGHTS, 1);
    BlockPtr genesis = make_genesis();
    EXPECT_EQ(engine.weight_of(*genesis), 0.0);

    Block block;
    block.parent_id = genesis->id;
    block.weight = 2.0;
    EXPECT_EQ(engine.weight_of(block), 2.0);
}

int main(int argc, char **argv) {
    FLAGS_v = -1;
    FLAGS_minloglevel = -1;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
