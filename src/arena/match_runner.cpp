#include "arena/match_runner.hpp"
#include "utils/game_utils.hpp"
#include "utils/profiler.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace arena {

std::string MatchResult::to_string() const {
    using utils::GameUtils;
    std::ostringstream out;
    out << "Match Results: " << player_one << " vs " << player_two << "\n"
        << "Games: " << num_games << "\n"
        << "P1 Wins: " << player_one_wins << " (" << GameUtils::format_percent(player_one_win_rate()) << ")\n"
        << "P2 Wins: " << player_two_wins << " (" << GameUtils::format_percent(player_two_win_rate()) << ")\n"
        << "Draws: " << draws << " (" << GameUtils::format_percent(draw_rate()) << ")";
    return out.str();
}

int MatchRunner::request_action(agents::Agent& agent, const core::Engine& engine,
                                const std::vector<int>& legal_actions, core::Player player) const {
    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt) {
        // Fresh snapshot for every request
        int action = agent.select_action(engine.snapshot(), legal_actions, player);
        if (std::find(legal_actions.begin(), legal_actions.end(), action) != legal_actions.end()) {
            return action;
        }
        std::cerr << agent.name() << " proposed illegal action " << action
                  << " (attempt " << attempt << "/" << MAX_ATTEMPTS << ")\n";
    }
    throw std::runtime_error(agent.name() + " failed to propose a legal action after " +
                             std::to_string(MAX_ATTEMPTS) + " attempts");
}

void MatchRunner::play_dogfight(core::Engine& engine, agents::Agent& player_one,
                                agents::Agent& player_two) const {
    engine.begin_dogfight();

    if (verbose_) {
        const auto& df = *engine.state().active_dogfight();
        const core::Square& sq = engine.state().square(df.position);
        std::cout << "Dogfight @ " << df.position.to_string() << ": " << sq.to_string()
                  << ", underdog " << core::to_string(df.underdog) << "\n";
    }

    while (!engine.is_dogfight_complete()) {
        core::Player actor = engine.get_dogfight_actor();
        agents::Agent& agent = actor == core::Player::One ? player_one : player_two;

        std::vector<int> legal = engine.get_dogfight_legal_actions(actor);
        int action = request_action(agent, engine, legal, actor);

        if (verbose_) {
            std::cout << "  " << core::to_string(actor) << " plays "
                      << core::ActionCatalog::instance().get(action).to_string() << "\n";
        }
        if (!engine.apply_dogfight_turn_action(actor, action)) {
            throw std::logic_error("engine rejected a dogfight action it listed as legal");
        }
    }

    core::DogfightResult result = engine.finish_dogfight();
    if (verbose_) {
        std::cout << "  " << utils::GameUtils::describe_dogfight(result) << "\n";
    }
}

GameRecord MatchRunner::run_game(agents::Agent& player_one, agents::Agent& player_two, uint64_t seed) {
    KAOS9_PROFILE_FUNCTION();

    core::Engine engine(seed);

    player_one.on_game_start(core::Player::One, seed);
    player_two.on_game_start(core::Player::Two, seed);

    if (verbose_) {
        std::cout << "\n=== Game Start (seed=" << seed << ") ===\n"
                  << "Player 1: " << player_one.name() << "\n"
                  << "Player 2: " << player_two.name() << "\n";
    }

    while (!engine.is_game_over()) {
        if (engine.state().phase() == core::Phase::Placement) {
            core::Player current = engine.state().current_player();
            agents::Agent& agent = current == core::Player::One ? player_one : player_two;

            int action = request_action(agent, engine, engine.get_legal_actions(current), current);

            if (verbose_) {
                std::cout << "Turn " << engine.state().turn_number() << ": " << core::to_string(current) << " "
                          << core::ActionCatalog::instance().get(action).to_string() << "\n";
            }
            if (!engine.apply_action(action)) {
                throw std::logic_error("engine rejected a placement it listed as legal");
            }
        } else {
            play_dogfight(engine, player_one, player_two);
        }
    }

    std::optional<core::Player> winner = engine.get_winner();

    if (verbose_) {
        std::cout << "\n=== Game Over ===\n"
                  << "Winner: " << utils::GameUtils::describe_winner(winner) << "\n";
        utils::GameUtils::print_game_state(engine.state());
    }

    core::GameState final_state = engine.snapshot();
    player_one.on_game_end(final_state, winner);
    player_two.on_game_end(final_state, winner);

    GameRecord record;
    record.winner = winner;
    record.turns = engine.state().turn_number();
    record.seed = seed;
    record.player_one = player_one.name();
    record.player_two = player_two.name();
    record.history = engine.history();
    return record;
}

MatchResult MatchRunner::run_match(agents::Agent& player_one, agents::Agent& player_two,
                                   int num_games, uint64_t starting_seed) {
    if (num_games < 0) {
        throw std::invalid_argument("num_games must not be negative");
    }

    MatchResult result;
    result.player_one = player_one.name();
    result.player_two = player_two.name();
    result.num_games = num_games;

    for (int i = 0; i < num_games; ++i) {
        GameRecord game = run_game(player_one, player_two, starting_seed + static_cast<uint64_t>(i));

        if (game.winner == core::Player::One) {
            result.player_one_wins++;
        } else if (game.winner == core::Player::Two) {
            result.player_two_wins++;
        } else {
            result.draws++;
        }
        result.games.push_back(std::move(game));
    }

    if (verbose_) {
        std::cout << "\n" << result.to_string() << "\n";
    }
    return result;
}

MatchResult MatchRunner::run_balanced_match(agents::Agent& first, agents::Agent& second,
                                            int num_games, uint64_t starting_seed) {
    if (num_games % 2 != 0) {
        throw std::invalid_argument("num_games must be even for a balanced match");
    }
    int half = num_games / 2;

    MatchResult first_seat = run_match(first, second, half, starting_seed);
    MatchResult second_seat = run_match(second, first, half, starting_seed + static_cast<uint64_t>(half));

    MatchResult balanced;
    balanced.player_one = first.name();
    balanced.player_two = second.name();
    balanced.num_games = num_games;
    balanced.player_one_wins = first_seat.player_one_wins + second_seat.player_two_wins;
    balanced.player_two_wins = first_seat.player_two_wins + second_seat.player_one_wins;
    balanced.draws = first_seat.draws + second_seat.draws;
    balanced.games = std::move(first_seat.games);
    balanced.games.insert(balanced.games.end(),
                          std::make_move_iterator(second_seat.games.begin()),
                          std::make_move_iterator(second_seat.games.end()));

    if (verbose_) {
        std::cout << "\n=== BALANCED MATCH ===\n"
                  << half << " games each as P1/P2\n"
                  << balanced.to_string() << "\n";
    }
    return balanced;
}

} // namespace arena
