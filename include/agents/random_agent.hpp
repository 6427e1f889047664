#pragma once

#include "agents/agent.hpp"
#include <random>

namespace agents {

// Uniformly random legal play. Baseline opponent.
class RandomAgent : public Agent {
public:
    explicit RandomAgent(uint64_t seed, std::string name = "Random");

    int select_action(const core::GameState& state,
                      const std::vector<int>& legal_actions,
                      core::Player player) override;

private:
    std::mt19937 rng_;
};

} // namespace agents
