#include "mcts/rollout.hpp"
#include <stdexcept>
#include <string>

namespace mcts {

std::optional<core::Player> RolloutPolicy::play_out(core::Engine& engine) const {
    int steps = 0;

    while (!engine.is_game_over()) {
        if (++steps > MAX_ROLLOUT_STEPS) {
            throw std::runtime_error("rollout exceeded " + std::to_string(MAX_ROLLOUT_STEPS) + " steps");
        }

        if (engine.state().phase() == core::Phase::Placement) {
            int action = engine.random_choice(engine.get_legal_actions());
            if (!engine.apply_action(action)) {
                throw std::runtime_error("rollout placement rejected: " + std::to_string(action));
            }
            continue;
        }

        if (!engine.has_active_dogfight()) {
            engine.begin_dogfight();
            continue;
        }
        if (engine.is_dogfight_complete()) {
            engine.finish_dogfight();
            continue;
        }

        core::Player actor = engine.get_dogfight_actor();
        int action = engine.random_choice(engine.get_dogfight_legal_actions(actor));
        if (!engine.apply_dogfight_turn_action(actor, action)) {
            throw std::runtime_error("rollout dogfight action rejected: " + std::to_string(action));
        }
    }

    return engine.get_winner();
}

double RolloutPolicy::score_for(std::optional<core::Player> winner, core::Player perspective) noexcept {
    if (!winner) {
        return 0.5;
    }
    return *winner == perspective ? 1.0 : 0.0;
}

double RolloutTally::score() const noexcept {
    if (trials_ == 0 || failures_ * 2 > trials_) {
        return 0.5;
    }
    return points_ / trials_;
}

} // namespace mcts
