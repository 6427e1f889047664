#pragma once

#include "core/game_state.hpp"
#include <cstdint>
#include <vector>

namespace mcts {

// Replaces what an observer cannot see with a sample consistent with what
// it can: the opponent's hidden unit powers and the order and contents of
// the opponent's draw pile. Counts never change.
class InformationSetSampler {
public:
    static core::GameState sample(const core::GameState& state, core::Player observer, uint64_t seed);

    // Hidden powers the opponent of observer may still have face-down:
    // {2,3,9,10} minus powers the opponent visibly holds in hand or on the board.
    static std::vector<int> hidden_power_candidates(const core::GameState& state, core::Player observer);
};

} // namespace mcts
