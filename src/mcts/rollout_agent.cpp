#include "mcts/rollout_agent.hpp"
#include "core/seed.hpp"
#include "mcts/information_set.hpp"
#include "utils/profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace mcts {

namespace {

constexpr uint64_t SAMPLER_SALT = 0x5A3C17E2B94D06F1ULL;

} // namespace

// ============================================================================
// Presets
// ============================================================================

RolloutAgent::Config RolloutAgent::Config::fast() {
    Config c;
    c.trials = 10;
    c.evaluate_dogfights = true;
    return c;
}

RolloutAgent::Config RolloutAgent::Config::strong() {
    Config c;
    c.trials = 20;
    return c;
}

RolloutAgent::Config RolloutAgent::Config::very_strong() {
    Config c;
    c.trials = 30;
    return c;
}

RolloutAgent::Config RolloutAgent::Config::ultra() {
    Config c;
    c.trials = 50;
    return c;
}

// ============================================================================
// RolloutAgent
// ============================================================================

RolloutAgent::RolloutAgent() : RolloutAgent(Config()) {
}

RolloutAgent::RolloutAgent(const Config& config, std::string name)
    : agents::Agent(std::move(name))
    , config_(config)
    , rng_(static_cast<std::mt19937::result_type>(config.tie_break_seed)) {
    if (config_.trials < 1) {
        throw std::invalid_argument("RolloutAgent: trials must be at least 1");
    }
    if (config_.samples_per_trial < 1) {
        throw std::invalid_argument("RolloutAgent: samples_per_trial must be at least 1");
    }
}

int RolloutAgent::select_action(const core::GameState& state,
                                const std::vector<int>& legal_actions,
                                core::Player player) {
    if (legal_actions.empty()) {
        throw std::invalid_argument(name() + ": no legal actions to choose from");
    }
    if (legal_actions.size() == 1) {
        return legal_actions.front();
    }

    if (state.phase() == core::Phase::Dogfights && !should_evaluate_dogfight(state, player)) {
        return random_pick(legal_actions);
    }

    return select_best(state, legal_actions, player);
}

bool RolloutAgent::should_evaluate_dogfight(const core::GameState& state, core::Player player) const {
    if (!config_.evaluate_dogfights) return false;

    // Only the underdog's opening move of a fresh dogfight is searched
    std::optional<core::DogfightContext> ctx = state.dogfight_context();
    return ctx && ctx->moves_taken == 0 && ctx->underdog == player;
}

int RolloutAgent::select_best(const core::GameState& state,
                              const std::vector<int>& legal_actions,
                              core::Player player) {
    KAOS9_PROFILE_SCOPE("RolloutAgent::select_best");

    double best_score = -1.0;
    std::vector<int> best_actions;

    for (int action : legal_actions) {
        double score = evaluate_action(state, action, player);
        if (score > best_score) {
            best_score = score;
            best_actions.assign(1, action);
        } else if (score == best_score) {
            best_actions.push_back(action);
        }
    }

    int choice = random_pick(best_actions);

    if (config_.verbose) {
        std::cout << name() << " (" << core::to_string(player) << ") turn " << state.turn_number()
                  << ": " << legal_actions.size() << " candidates, best "
                  << std::fixed << std::setprecision(3) << best_score
                  << " (" << best_actions.size() << " tied), playing "
                  << core::ActionCatalog::instance().get(choice).to_string() << "\n";
    }

    return choice;
}

double RolloutAgent::evaluate_action(const core::GameState& state, int action, core::Player player) {
    KAOS9_PROFILE_FUNCTION();

    const int samples = config_.perfect_information ? 1 : config_.samples_per_trial;
    RolloutTally tally;

    for (int trial = 0; trial < config_.trials; ++trial) {
        for (int sample = 0; sample < samples; ++sample) {
            total_rollouts_++;

            uint64_t trial_seed = core::derive_seed(state.rng_seed(), {
                static_cast<uint64_t>(state.turn_number()),
                static_cast<uint64_t>(state.current_dogfight_index()),
                static_cast<uint64_t>(action),
                static_cast<uint64_t>(trial),
                static_cast<uint64_t>(sample)});

            try {
                core::Engine engine = config_.perfect_information
                    ? core::Engine::from_snapshot(state, trial_seed)
                    : core::Engine::from_snapshot(
                          InformationSetSampler::sample(state, player, core::splitmix64(trial_seed ^ SAMPLER_SALT)),
                          trial_seed);

                apply_candidate(engine, action);
                tally.record(policy_.play_out(engine), player);
            } catch (const std::exception& e) {
                // Unstable trial: neutral outcome
                tally.record_failure();
                failed_rollouts_++;
                if (config_.verbose) {
                    std::cerr << name() << ": trial " << trial << " of action " << action
                              << " failed: " << e.what() << "\n";
                }
            }
        }
    }

    return tally.score();
}

void RolloutAgent::apply_candidate(core::Engine& engine, int action) const {
    if (engine.state().phase() == core::Phase::Placement) {
        if (!engine.apply_action(action)) {
            throw std::runtime_error("candidate placement rejected: " + std::to_string(action));
        }
        return;
    }

    if (!engine.has_active_dogfight()) {
        engine.begin_dogfight();
    }
    if (!engine.apply_dogfight_turn_action(engine.get_dogfight_actor(), action)) {
        throw std::runtime_error("candidate dogfight action rejected: " + std::to_string(action));
    }
}

int RolloutAgent::random_pick(const std::vector<int>& options) {
    std::uniform_int_distribution<size_t> dist(0, options.size() - 1);
    return options[dist(rng_)];
}

} // namespace mcts
