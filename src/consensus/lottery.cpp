#include "lottery.hpp"

uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

double lottery_draw(uint64_t seed, uint64_t slot, NodeId creator) {
    uint64_t mixed = splitmix64(seed ^ splitmix64(slot) ^ splitmix64(0x5eed0000ULL + creator));
    // top 53 bits -> [0, 1)
    return static_cast<double>(mixed >> 11) * 0x1.0p-53;
}
