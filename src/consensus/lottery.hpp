#pragma once

#include <cstdint>

#include "../core/types.hpp"

uint64_t splitmix64(uint64_t x);

// Verifiable stake lottery: any node recomputes the same value in [0, 1)
// from the run seed, the slot and the claimed leader.
double lottery_draw(uint64_t seed, uint64_t slot, NodeId creator);
