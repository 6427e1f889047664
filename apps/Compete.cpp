#include "agents/random_agent.hpp"
#include "arena/match_runner.hpp"
#include "mcts/rollout_agent.hpp"
#include "utils/game_utils.hpp"
#include "utils/profiler.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

mcts::RolloutAgent::Config preset_from_name(const std::string& name) {
    if (name == "fast") return mcts::RolloutAgent::Config::fast();
    if (name == "strong") return mcts::RolloutAgent::Config::strong();
    if (name == "very_strong") return mcts::RolloutAgent::Config::very_strong();
    if (name == "ultra") return mcts::RolloutAgent::Config::ultra();
    if (name == "default") return mcts::RolloutAgent::Config();
    throw std::invalid_argument("unknown preset: " + name);
}

} // namespace

// How to run: ./compete [games=20] [seed=1000] [preset=fast] [sampled]
// Balanced match of the rollout agent against uniform random play.
int main(int argc, char* argv[]) {
    try {
        int games = (argc >= 2) ? std::atoi(argv[1]) : 20;
        uint64_t seed = (argc >= 3) ? std::strtoull(argv[2], nullptr, 10) : 1000;
        std::string preset = (argc >= 4) ? argv[3] : "fast";
        bool sampled = (argc >= 5) && std::strcmp(argv[4], "sampled") == 0;

        mcts::RolloutAgent::Config config = preset_from_name(preset);
        config.perfect_information = !sampled;
        config.tie_break_seed = seed;

        mcts::RolloutAgent rollout(config, "Rollout(" + preset + (sampled ? ",sampled" : "") + ")");
        agents::RandomAgent random(seed + 1);

        std::cout << "Competing " << rollout.name() << " vs " << random.name()
                  << ": " << games << " games from seed " << seed << std::endl;

        auto start = std::chrono::steady_clock::now();
        arena::MatchRunner runner;
        arena::MatchResult result = runner.run_balanced_match(rollout, random, games, seed);
        auto elapsed = std::chrono::steady_clock::now() - start;

        std::cout << result.to_string() << "\n";
        std::cout << "Rollouts: " << utils::GameUtils::format_with_commas(static_cast<long long>(rollout.total_rollouts()))
                  << " (" << rollout.failed_rollouts() << " failed)\n";
        std::cout << "Match took: " << utils::GameUtils::format_elapsed(elapsed) << std::endl;

        utils::Profiler::instance().printReport();
    } catch (const std::exception& e) {
        std::cerr << "compete: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
