#include "agents/random_agent.hpp"
#include "arena/match_runner.hpp"
#include "core/engine.hpp"
#include "mcts/rollout_agent.hpp"
#include "utils/game_utils.hpp"
#include <cstdlib>
#include <iostream>

// How to run: ./play [seed=42] [trials=20]
// One narrated game, rollout agent (P1) against random play (P2), then a
// replay check of the recorded history.
int main(int argc, char* argv[]) {
    uint64_t seed = (argc >= 2) ? std::strtoull(argv[1], nullptr, 10) : 42;
    int trials = (argc >= 3) ? std::atoi(argv[2]) : 20;

    std::cout << "Playing kaos9 (seed " << seed << ")..." << std::endl;

    try {
        mcts::RolloutAgent::Config config = mcts::RolloutAgent::Config::strong();
        config.trials = trials;
        config.evaluate_dogfights = true;
        config.tie_break_seed = seed;
        config.verbose = true;

        mcts::RolloutAgent rollout(config);
        agents::RandomAgent random(seed);

        arena::MatchRunner runner(true);
        arena::GameRecord record = runner.run_game(rollout, random, seed);

        std::cout << "\nWinner: " << utils::GameUtils::describe_winner(record.winner)
                  << " after " << record.turns << " placements, "
                  << record.history.size() << " recorded actions\n";

        core::Engine replayed = core::Engine::replay(record.seed, record.history);
        std::cout << "Replay check: "
                  << (replayed.get_winner() == record.winner && replayed.is_game_over() ? "ok" : "MISMATCH")
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "play: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
