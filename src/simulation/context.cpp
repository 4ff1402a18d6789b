#include "context.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

SimContext::SimContext(uint64_t seed, size_t block_limit)
    : rng(seed), genesis(make_genesis()), seed_(seed), block_limit_(block_limit) {
    blocks.intern(genesis);
}

void SimContext::advance_to(SimTime t) {
    if (!std::isfinite(t)) {
        throw std::logic_error("simulation clock cannot move to a non-finite time");
    }
    if (t < now_) {
        throw std::logic_error("simulation clock cannot go back from " + std::to_string(now_)
                               + " to " + std::to_string(t));
    }
    now_ = t;
}
