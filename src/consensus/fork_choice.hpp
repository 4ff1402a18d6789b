#pragma once

#include "../core/ledger.hpp"

// Deepest block; equal heights go to the block this ledger saw first.
BlockId longest_chain_head(const Ledger& ledger);

// Greedy heaviest-observed-subtree walk from genesis. At every fork the child
// whose whole subtree (the child included) carries the most weight wins;
// equal subtree weights go to the child seen first.
BlockId ghost_head(const Ledger& ledger);
