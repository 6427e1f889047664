#include <gtest/gtest.h>
#include "agents/random_agent.hpp"
#include "arena/match_runner.hpp"
#include "core/engine.hpp"

using namespace core;
using agents::RandomAgent;
using arena::MatchRunner;

namespace {

// Always answers with something the engine never offers
class StubbornAgent : public agents::Agent {
public:
    StubbornAgent() : Agent("Stubborn") {}

    int select_action(const GameState&, const std::vector<int>&, Player) override {
        ++calls;
        return -1;
    }

    int calls = 0;
};

class RecordingAgent : public RandomAgent {
public:
    explicit RecordingAgent(uint64_t seed) : RandomAgent(seed, "Recorder") {}

    void on_game_start(Player player, uint64_t seed) override {
        seat = player;
        start_seed = seed;
    }
    void on_game_end(const GameState& final_state, std::optional<Player> result) override {
        ended = final_state.game_over();
        winner = result;
    }

    std::optional<Player> seat;
    uint64_t start_seed = 0;
    bool ended = false;
    std::optional<Player> winner;
};

} // namespace

class MatchRunnerTest : public ::testing::Test {
protected:
    MatchRunner runner;
    RandomAgent one{1, "RandomA"};
    RandomAgent two{2, "RandomB"};
};

TEST_F(MatchRunnerTest, GameRecordReplays) {
    arena::GameRecord record = runner.run_game(one, two, 314);

    EXPECT_EQ(record.seed, 314u);
    EXPECT_EQ(record.turns, 18);
    EXPECT_EQ(record.player_one, "RandomA");
    EXPECT_EQ(record.player_two, "RandomB");
    EXPECT_GE(record.history.size(), 18u);

    Engine replayed = Engine::replay(record.seed, record.history);
    EXPECT_TRUE(replayed.is_game_over());
    EXPECT_EQ(replayed.get_winner(), record.winner);
    EXPECT_EQ(replayed.history(), record.history);
}

TEST_F(MatchRunnerTest, AgentsAreNotified) {
    RecordingAgent recorder(5);
    arena::GameRecord record = runner.run_game(one, recorder, 21);

    EXPECT_EQ(recorder.seat, Player::Two);
    EXPECT_EQ(recorder.start_seed, 21u);
    EXPECT_TRUE(recorder.ended);
    EXPECT_EQ(recorder.winner, record.winner);
}

TEST_F(MatchRunnerTest, MatchCountsAddUp) {
    arena::MatchResult result = runner.run_match(one, two, 6, 1000);

    EXPECT_EQ(result.num_games, 6);
    EXPECT_EQ(result.player_one_wins + result.player_two_wins + result.draws, 6);
    ASSERT_EQ(result.games.size(), 6u);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(result.games[i].seed, 1000u + i);
    }
    EXPECT_NEAR(result.player_one_win_rate() + result.player_two_win_rate() + result.draw_rate(), 1.0, 1e-9);
    EXPECT_NE(result.to_string().find("RandomA vs RandomB"), std::string::npos);
}

TEST_F(MatchRunnerTest, BalancedMatchSwapsSeats) {
    arena::MatchResult result = runner.run_balanced_match(one, two, 4, 50);

    EXPECT_EQ(result.player_one, "RandomA");
    EXPECT_EQ(result.num_games, 4);
    EXPECT_EQ(result.player_one_wins + result.player_two_wins + result.draws, 4);
    ASSERT_EQ(result.games.size(), 4u);
    EXPECT_EQ(result.games[0].player_one, "RandomA");
    EXPECT_EQ(result.games[2].player_one, "RandomB");
    EXPECT_EQ(result.games[2].seed, 52u);
}

TEST_F(MatchRunnerTest, BalancedMatchNeedsEvenGames) {
    EXPECT_THROW(runner.run_balanced_match(one, two, 3, 0), std::invalid_argument);
}

TEST_F(MatchRunnerTest, IllegalProposalsGiveUpAfterThreeAttempts) {
    StubbornAgent stubborn;
    EXPECT_THROW(runner.run_game(stubborn, two, 9), std::runtime_error);
    EXPECT_EQ(stubborn.calls, MatchRunner::MAX_ATTEMPTS);
}
