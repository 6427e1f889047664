#pragma once

#include "agents/agent.hpp"
#include "core/engine.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena {

struct GameRecord {
    std::optional<core::Player> winner;
    int turns = 0;
    uint64_t seed = 0;
    std::string player_one;
    std::string player_two;
    std::vector<core::HistoryEntry> history;  // replays with core::Engine::replay(seed, history)
};

struct MatchResult {
    std::string player_one;
    std::string player_two;
    int num_games = 0;
    int player_one_wins = 0;
    int player_two_wins = 0;
    int draws = 0;
    std::vector<GameRecord> games;

    double player_one_win_rate() const noexcept { return rate(player_one_wins); }
    double player_two_win_rate() const noexcept { return rate(player_two_wins); }
    double draw_rate() const noexcept { return rate(draws); }

    std::string to_string() const;

private:
    double rate(int count) const noexcept {
        return num_games > 0 ? static_cast<double>(count) / num_games : 0.0;
    }
};

// Drives two agents through games. Agents only ever receive snapshots.
class MatchRunner {
public:
    static constexpr int MAX_ATTEMPTS = 3;  // illegal proposals tolerated per decision

    explicit MatchRunner(bool verbose = false) : verbose_(verbose) {}

    GameRecord run_game(agents::Agent& player_one, agents::Agent& player_two, uint64_t seed);

    // Seeds starting_seed, starting_seed + 1, ...
    MatchResult run_match(agents::Agent& player_one, agents::Agent& player_two,
                          int num_games, uint64_t starting_seed);

    // Half the games with each agent in each seat. Counts are reported from
    // first's perspective (player_one_wins are first's wins). Throws
    // std::invalid_argument if num_games is odd.
    MatchResult run_balanced_match(agents::Agent& first, agents::Agent& second,
                                   int num_games, uint64_t starting_seed);

private:
    int request_action(agents::Agent& agent, const core::Engine& engine,
                       const std::vector<int>& legal_actions, core::Player player) const;
    void play_dogfight(core::Engine& engine, agents::Agent& player_one, agents::Agent& player_two) const;

    bool verbose_;
};

} // namespace arena
