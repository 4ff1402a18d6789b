#include <gtest/gtest.h>
#include <glog/logging.h>

#include <../src/core/block.hpp>
#include <../src/core/ledger.hpp>


BlockPtr child_of(const BlockPtr& parent, NodeId creator, double weight = 1.0, SimTime t = 1.0) {
    return make_block(*parent, creator, t, weight, Proof{ProofKind::Work, 0.0, 1.0, 0});
}

TEST(Block, IdsFollowContent) {
    BlockPtr genesis = make_genesis();
    EXPECT_NE(genesis->id, kNoBlock);
    EXPECT_TRUE(genesis->is_genesis());
    EXPECT_EQ(make_genesis()->id, genesis->id);

    BlockPtr a = child_of(genesis, 1);
    BlockPtr b = child_of(genesis, 2);
    BlockPtr a_again = child_of(genesis, 1);

    EXPECT_EQ(a->id, a_again->id);
    EXPECT_NE(a->id, b->id);
    EXPECT_EQ(a->height, 1);
    EXPECT_EQ(a->parent_id, genesis->id);
    EXPECT_EQ(compute_block_id(*a), a->id);

    BlockPtr with_payload = make_block(*genesis, 1, 1.0, 1.0, a->proof, json{{"tx", 5}});
    EXPECT_NE(with_payload->id, a->id);
}

TEST(BlockStore, FirstCopyIsCanonical) {
    BlockStore store;
    BlockPtr genesis = make_genesis();
    BlockPtr a = child_of(genesis, 1);
    BlockPtr copy = child_of(genesis, 1);
    ASSERT_NE(a.get(), copy.get());

    EXPECT_EQ(store.intern(a), a);
    EXPECT_EQ(store.intern(copy), a);
    EXPECT_EQ(store.size(), 1);
    EXPECT_TRUE(store.contains(a->id));
    EXPECT_EQ(store.get(a->id), a);
    EXPECT_EQ(store.get(12345), nullptr);
}

TEST(Ledger, StartsWithGenesis) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);

    EXPECT_EQ(ledger.size(), 1);
    EXPECT_EQ(ledger.head(), genesis->id);
    EXPECT_EQ(ledger.head_block().height, 0);
    EXPECT_EQ(ledger.tips().size(), 1);
    EXPECT_TRUE(ledger.contains(genesis->id));
    EXPECT_EQ(ledger.get(999), nullptr);
}

TEST(Ledger, InsertStatus) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    BlockPtr a = child_of(genesis, 1);
    BlockPtr a1 = child_of(a, 1);

    EXPECT_EQ(ledger.insert(a1, 1.0), Ledger::MissingParent);
    EXPECT_FALSE(ledger.contains(a1->id));

    EXPECT_EQ(ledger.insert(a, 1.0), Ledger::Inserted);
    EXPECT_EQ(ledger.insert(a, 2.0), Ledger::Duplicate);
    EXPECT_EQ(ledger.insert(a1, 3.0), Ledger::Inserted);
    EXPECT_EQ(ledger.insert(make_genesis(), 3.0), Ledger::Duplicate);

    EXPECT_EQ(ledger.size(), 3);
    EXPECT_EQ(ledger.arrival_time(a->id), 1.0);
    EXPECT_LT(ledger.arrival_index(a->id), ledger.arrival_index(a1->id));
}

TEST(Ledger, NoDanglingAncestors) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);

    std::vector<BlockPtr> chain{genesis};
    for (NodeId i = 0; i < 20; ++i) {
        chain.push_back(child_of(chain.back(), i % 3));
    }
    // deliver in reverse: only the block whose parent is present may enter
    for (int round = 0; round < 25; ++round) {
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            ledger.insert(*it, round);
        }
    }

    EXPECT_EQ(ledger.size(), chain.size());
    for (BlockId id : ledger.block_ids()) {
        BlockPtr block = ledger.get(id);
        if (!block->is_genesis()) {
            EXPECT_TRUE(ledger.contains(block->parent_id));
        }
        EXPECT_EQ(ledger.path_from_genesis(id).front(), genesis->id);
    }
}

TEST(Ledger, TipsAndChildren) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    BlockPtr a = child_of(genesis, 1);
    BlockPtr b = child_of(genesis, 2);
    BlockPtr a1 = child_of(a, 1);

    ledger.insert(a, 1);
    ledger.insert(b, 2);
    ledger.insert(a1, 3);

    EXPECT_EQ(ledger.children(genesis->id), (std::vector<BlockId>{a->id, b->id}));
    EXPECT_EQ(ledger.tips(), (std::unordered_set<BlockId>{b->id, a1->id}));
    EXPECT_EQ(ledger.block_ids(), (std::vector<BlockId>{genesis->id, a->id, b->id, a1->id}));
}

TEST(Ledger, SubtreeWeights) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    BlockPtr a = child_of(genesis, 1, 2.0);
    BlockPtr b = child_of(genesis, 2, 0.5);
    BlockPtr a1 = child_of(a, 1, 3.0);
    BlockPtr a2 = child_of(a, 3, 1.0);

    for (const auto& block : {a, b, a1, a2}) {
        ledger.insert(block, 1);
    }

    EXPECT_DOUBLE_EQ(ledger.subtree_weight(a->id), 6.0);
    EXPECT_DOUBLE_EQ(ledger.subtree_weight(b->id), 0.5);
    EXPECT_DOUBLE_EQ(ledger.subtree_weight(a1->id), 3.0);
    EXPECT_DOUBLE_EQ(ledger.subtree_weight(genesis->id), 6.5);
}

TEST(Ledger, Ancestry) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    BlockPtr a = child_of(genesis, 1);
    BlockPtr a1 = child_of(a, 1);
    BlockPtr a2 = child_of(a1, 1);
    BlockPtr b1 = child_of(a, 2);

    for (const auto& block : {a, a1, a2, b1}) {
        ledger.insert(block, 1);
    }

    EXPECT_TRUE(ledger.is_ancestor(genesis->id, a2->id));
    EXPECT_TRUE(ledger.is_ancestor(a->id, b1->id));
    EXPECT_TRUE(ledger.is_ancestor(a2->id, a2->id));
    EXPECT_FALSE(ledger.is_ancestor(a1->id, b1->id));
    EXPECT_FALSE(ledger.is_ancestor(a2->id, a->id));

    EXPECT_EQ(ledger.common_ancestor(a2->id, b1->id), a->id);
    EXPECT_EQ(ledger.common_ancestor(a2->id, a1->id), a1->id);
    EXPECT_EQ(ledger.path_from_genesis(a2->id),
              (std::vector<BlockId>{genesis->id, a->id, a1->id, a2->id}));
}

TEST(Ledger, SetHead) {
    BlockPtr genesis = make_genesis();
    Ledger ledger(genesis);
    BlockPtr a = child_of(genesis, 1);
    ledger.insert(a, 1);

    ledger.set_head(a->id);
    EXPECT_EQ(ledger.head(), a->id);
    EXPECT_EQ(&ledger.head_block(), a.get());

    EXPECT_THROW(ledger.set_head(child_of(a, 1)->id), std::out_of_range);
    EXPECT_EQ(ledger.head(), a->id);
}

int main(int argc, char **argv) {
    FLAGS_v = -1;
    FLAGS_minloglevel = -1;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
