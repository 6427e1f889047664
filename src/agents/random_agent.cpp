#include "agents/random_agent.hpp"
#include <stdexcept>

namespace agents {

RandomAgent::RandomAgent(uint64_t seed, std::string name)
    : Agent(std::move(name)), rng_(static_cast<std::mt19937::result_type>(seed)) {
}

int RandomAgent::select_action(const core::GameState& /*state*/,
                               const std::vector<int>& legal_actions,
                               core::Player /*player*/) {
    if (legal_actions.empty()) {
        throw std::invalid_argument(name() + ": no legal actions to choose from");
    }
    std::uniform_int_distribution<size_t> dist(0, legal_actions.size() - 1);
    return legal_actions[dist(rng_)];
}

} // namespace agents
