#pragma once

#include "agents/agent.hpp"
#include "mcts/rollout.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace mcts {

// Flat Monte Carlo agent: scores every candidate by the win rate of random
// playouts from the position it leads to, then plays the best one.
class RolloutAgent : public agents::Agent {
public:
    struct Config {
        int trials = 50;                  // playouts per candidate (per sample)
        bool perfect_information = true;  // false: resample hidden information each trial
        int samples_per_trial = 1;        // only used without perfect information
        bool evaluate_dogfights = false;  // search the underdog's opening dogfight move
        uint64_t tie_break_seed = 0;
        bool verbose = false;

        static Config fast();
        static Config strong();
        static Config very_strong();
        static Config ultra();
    };

    RolloutAgent();
    explicit RolloutAgent(const Config& config, std::string name = "Rollout");

    int select_action(const core::GameState& state,
                      const std::vector<int>& legal_actions,
                      core::Player player) override;

    // Win rate of action for player in [0, 1], draws counting half
    double evaluate_action(const core::GameState& state, int action, core::Player player);

    const Config& config() const noexcept { return config_; }

    // Statistics
    uint64_t total_rollouts() const noexcept { return total_rollouts_; }
    uint64_t failed_rollouts() const noexcept { return failed_rollouts_; }

private:
    bool should_evaluate_dogfight(const core::GameState& state, core::Player player) const;
    int select_best(const core::GameState& state, const std::vector<int>& legal_actions, core::Player player);
    int random_pick(const std::vector<int>& options);
    void apply_candidate(core::Engine& engine, int action) const;

    Config config_;
    RolloutPolicy policy_;
    std::mt19937 rng_;  // tie-breaks and unsearched dogfight moves only

    uint64_t total_rollouts_ = 0;
    uint64_t failed_rollouts_ = 0;
};

} // namespace mcts
