#pragma once

#include <optional>
#include <vector>

#include "simulation.hpp"
#include "trace.hpp"

// Figures computed after a run from the trace and node snapshots alone.
struct RunSummary {
    size_t blocks_mined{0};
    // extra children over all fork points of the global block tree
    size_t forks{0};
    size_t rejected{0};
    size_t dropped{0};
    size_t unresolved{0};

    // arrival time at a node minus mining time, one sample per (block, node)
    std::vector<SimTime> propagation_delays;
    SimTime mean_propagation_delay{0};
    SimTime max_propagation_delay{0};

    // mined blocks present in every node's ledger
    size_t fully_replicated{0};
    size_t distinct_heads{0};

    // earliest time from which every head stayed within K blocks of the
    // highest one and all heads shared its ancestor K blocks down (K = 0:
    // identical heads); empty if that does not hold at the end
    std::optional<SimTime> convergence_time;
};

RunSummary summarize(const Trace& trace, const std::vector<NodeSnapshot>& nodes, size_t tolerance = 0);
