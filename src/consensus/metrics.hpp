#pragma once

#include <cstddef>

struct NodeMetrics {
    size_t mine_attempts{0};
    size_t blocks_mined{0};
    size_t blocks_accepted{0};  // received from peers, own blocks excluded
    size_t blocks_rejected{0};
    size_t duplicates{0};
    size_t buffered{0};         // arrivals that had to wait for an ancestor
    size_t forwarded{0};        // block sends, flood and replies to requests
    size_t parent_requests{0};
    size_t head_changes{0};
    // head moved to a block that does not descend from the previous head
    size_t reorgs{0};
    size_t max_reorg_depth{0};
};
