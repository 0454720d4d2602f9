#pragma once

#include <string>
#include <vector>

#include "chain/transition_table.hpp"

namespace chain {

// Records every adjacent token pair (t[i], t[i+1]) as "t[i+1] follows t[i]".
// The table is pre-sized from the token count to limit rehashing.
TransitionTable build_transition_table(const std::vector<std::string> &tokens,
                                       bool show_progress = false);

}  // namespace chain
