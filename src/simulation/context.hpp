#pragma once

#include <random>

#include "../core/block.hpp"
#include "event_queue.hpp"
#include "trace.hpp"

// Everything one run shares: clock, pending events, RNG, block arena and
// trace. Components receive it explicitly, so independent runs can live side
// by side in one process.
class SimContext {
public:
    explicit SimContext(uint64_t seed, size_t block_limit = 0);

    SimContext(const SimContext&) = delete;
    SimContext& operator=(const SimContext&) = delete;

    SimTime now() const {
        return now_;
    }

    // throws std::logic_error when t is in the past
    void advance_to(SimTime t);

    uint64_t schedule(Event event, SimTime at) {
        return queue.schedule(std::move(event), at);
    }

    uint64_t schedule_after(Event event, SimTime delay) {
        return queue.schedule(std::move(event), now_ + delay);
    }

    // block-count horizon: no new blocks once block_limit have been mined
    bool mining_open() const {
        return block_limit_ == 0 || mined_blocks_ < block_limit_;
    }

    void count_mined() {
        ++mined_blocks_;
    }

    size_t mined_blocks() const {
        return mined_blocks_;
    }

    size_t block_limit() const {
        return block_limit_;
    }

    uint64_t seed() const {
        return seed_;
    }

public:
    EventQueue queue;
    BlockStore blocks;
    Trace trace;
    std::mt19937_64 rng;
    const BlockPtr genesis;

private:
    uint64_t seed_;
    size_t block_limit_;
    size_t mined_blocks_{0};
    SimTime now_{0};
};
