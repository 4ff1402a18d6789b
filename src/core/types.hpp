#pragma once

#include <cstdint>
#include <limits>

using NodeId = uint32_t;
using BlockId = uint64_t;
using SimTime = double;

constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

// content ids are never zero, so 0 marks "no parent"
constexpr BlockId kNoBlock = 0;
