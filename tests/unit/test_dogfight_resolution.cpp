#include <gtest/gtest.h>
#include "core/engine.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

using namespace core;
using kaos9_test::IDENTITY_LAYOUT;
using kaos9_test::pass_through_dogfight;
using kaos9_test::place_layout;
using kaos9_test::rig_piles;

namespace {

constexpr int PASS = ActionCatalog::PASS_INDEX;
constexpr int WEAPON_0 = ActionCatalog::FIRST_WEAPON_INDEX;

} // namespace

// Identity layouts: the center is 6 vs 6 and P2 holds the token, so P2 is
// the underdog of the first dogfight.
class DogfightResolutionTest : public ::testing::Test {
protected:
    Engine placed = place_layout(31, IDENTITY_LAYOUT, IDENTITY_LAYOUT);

    Engine begin_with(const std::vector<int>& one_top, const std::vector<int>& two_top) {
        Engine engine = rig_piles(placed, one_top, two_top);
        engine.begin_dogfight();
        EXPECT_EQ(engine.get_dogfight_actor(), Player::Two);
        return engine;
    }

    static void play(Engine& engine, Player player, int action) {
        ASSERT_TRUE(engine.apply_dogfight_turn_action(player, action));
    }
};

TEST_F(DogfightResolutionTest, BothPassComparesPowerPlusCard) {
    Engine engine = begin_with({5}, {1});
    play(engine, Player::Two, PASS);
    play(engine, Player::One, PASS);

    DogfightResult result = engine.finish_dogfight();
    EXPECT_EQ(result.position, Position(1, 1));
    EXPECT_EQ(result.winner, Player::One);
    EXPECT_EQ(result.eliminated, std::vector<Player>{Player::Two});
    EXPECT_EQ(result.draws[0], std::vector<int>{5});
    EXPECT_EQ(result.draws[1], std::vector<int>{1});
    EXPECT_FALSE(result.undefended_hit);

    const GameState& state = engine.state();
    EXPECT_EQ(state.square(1, 1).controller(), Player::One);
    EXPECT_EQ(state.resources(Player::One).discard_pile, std::vector<int>{5});
    EXPECT_EQ(state.resources(Player::Two).discard_pile, std::vector<int>{1});
    EXPECT_EQ(state.resources(Player::One).weapon_count(), 4);
    EXPECT_EQ(state.resources(Player::Two).weapon_count(), 4);
}

TEST_F(DogfightResolutionTest, EqualTotalsEliminateBoth) {
    Engine engine = begin_with({4}, {4});
    play(engine, Player::Two, PASS);
    play(engine, Player::One, PASS);

    DogfightResult result = engine.finish_dogfight();
    EXPECT_FALSE(result.winner.has_value());
    EXPECT_EQ(result.eliminated.size(), 2u);
    EXPECT_TRUE(engine.state().square(1, 1).is_empty());
}

TEST_F(DogfightResolutionTest, UndefendedHitOnSeven) {
    Engine engine = begin_with({1}, {7});
    play(engine, Player::Two, WEAPON_0);
    play(engine, Player::One, PASS);

    DogfightResult result = engine.finish_dogfight();
    EXPECT_TRUE(result.undefended_hit);
    EXPECT_EQ(result.winner, Player::Two);
    EXPECT_EQ(result.eliminated, std::vector<Player>{Player::One});
    EXPECT_EQ(result.total_draws(), 1);
    EXPECT_TRUE(result.draws[0].empty());
    EXPECT_EQ(result.draws[1], std::vector<int>{7});
    EXPECT_EQ(result.roles[1], WeaponRole::Offense);
    EXPECT_EQ(result.roles[0], WeaponRole::None);

    const GameState& state = engine.state();
    EXPECT_EQ(state.square(1, 1).controller(), Player::Two);
    EXPECT_EQ(state.resources(Player::Two).weapons, (std::vector<char>{'K', 'Q', 'J'}));
    EXPECT_EQ(state.resources(Player::One).weapon_count(), 4);
    EXPECT_EQ(state.resources(Player::One).draw_pile.size(), 13u);
}

TEST_F(DogfightResolutionTest, UndefendedMissFallsThroughToBaseStep) {
    Engine engine = begin_with({3}, {6, 2});
    play(engine, Player::Two, WEAPON_0);
    play(engine, Player::One, PASS);

    DogfightResult result = engine.finish_dogfight();
    EXPECT_FALSE(result.undefended_hit);
    EXPECT_EQ(result.draws[1], (std::vector<int>{6, 2}));
    EXPECT_EQ(result.draws[0], std::vector<int>{3});
    EXPECT_EQ(result.total_draws(), 3);
    // 6 + 3 beats 6 + 2
    EXPECT_EQ(result.winner, Player::One);
    EXPECT_EQ(engine.state().resources(Player::Two).weapon_count(), 3);
}

TEST_F(DogfightResolutionTest, DefenseCancelsAttack) {
    Engine engine = begin_with({2}, {9});
    play(engine, Player::Two, WEAPON_0);
    play(engine, Player::One, WEAPON_0 + 3);

    DogfightResult result = engine.finish_dogfight();
    EXPECT_EQ(result.roles[1], WeaponRole::Offense);
    EXPECT_EQ(result.roles[0], WeaponRole::Defense);
    EXPECT_EQ(result.total_draws(), 2);
    EXPECT_EQ(result.winner, Player::Two);

    EXPECT_EQ(engine.state().resources(Player::One).weapons, (std::vector<char>{'A', 'K', 'Q'}));
    EXPECT_EQ(engine.state().resources(Player::Two).weapons, (std::vector<char>{'K', 'Q', 'J'}));
}

TEST_F(DogfightResolutionTest, CounterAttackUndefended) {
    Engine engine = begin_with({13}, {1});
    play(engine, Player::Two, PASS);
    play(engine, Player::One, WEAPON_0 + 1);
    play(engine, Player::Two, PASS);

    DogfightResult result = engine.finish_dogfight();
    EXPECT_TRUE(result.undefended_hit);
    EXPECT_EQ(result.winner, Player::One);
    EXPECT_EQ(result.draws[0], std::vector<int>{13});
    EXPECT_TRUE(result.draws[1].empty());
    EXPECT_EQ(engine.state().resources(Player::One).weapons, (std::vector<char>{'A', 'Q', 'J'}));
}

TEST_F(DogfightResolutionTest, CounterAttackDefended) {
    Engine engine = begin_with({1}, {2});
    play(engine, Player::Two, PASS);
    play(engine, Player::One, WEAPON_0);
    play(engine, Player::Two, WEAPON_0);

    DogfightResult result = engine.finish_dogfight();
    EXPECT_EQ(result.roles[0], WeaponRole::Offense);
    EXPECT_EQ(result.roles[1], WeaponRole::Defense);
    EXPECT_FALSE(result.undefended_hit);
    EXPECT_EQ(result.total_draws(), 2);
    EXPECT_EQ(result.winner, Player::Two);
    EXPECT_EQ(engine.state().resources(Player::One).weapon_count(), 3);
    EXPECT_EQ(engine.state().resources(Player::Two).weapon_count(), 3);
}

TEST_F(DogfightResolutionTest, EmptyPileReshufflesDiscard) {
    GameState state = placed.snapshot();
    PlayerResources& res = state.resources(Player::One);
    res.discard_pile = res.draw_pile;
    res.draw_pile.clear();

    Engine engine = Engine::from_snapshot(state, 9);
    DogfightResult result = pass_through_dogfight(engine);

    ASSERT_EQ(result.draws[0].size(), 1u);
    const PlayerResources& after = engine.state().resources(Player::One);
    EXPECT_EQ(after.draw_pile.size(), 12u);
    EXPECT_EQ(after.discard_pile, result.draws[0]);
    EXPECT_EQ(after.pile_total(), 13);
}

TEST_F(DogfightResolutionTest, EarlyLineEndsGame) {
    // P1 wins the center and the three edges that follow it: row 1 is
    // complete after the fourth dogfight
    Engine engine = rig_piles(placed, {13, 12, 11, 10}, {1, 2, 3, 4});
    for (int i = 0; i < 3; ++i) {
        pass_through_dogfight(engine);
        EXPECT_FALSE(engine.is_game_over());
    }
    pass_through_dogfight(engine);

    const GameState& state = engine.state();
    EXPECT_TRUE(engine.is_game_over());
    EXPECT_EQ(state.phase(), Phase::Ended);
    EXPECT_EQ(engine.get_winner(), Player::One);
    EXPECT_EQ(state.current_dogfight_index(), 4);

    // Later squares stay unresolved
    EXPECT_TRUE(state.square(2, 1).is_contested());
    EXPECT_TRUE(state.square(0, 0).is_contested());
    EXPECT_TRUE(state.square(2, 2).is_contested());

    EXPECT_FALSE(engine.apply_action(0));
    EXPECT_THROW(engine.begin_dogfight(), ProtocolViolation);
    EXPECT_EQ(engine.get_legal_mask(Player::One).count(), 0u);
    EXPECT_TRUE(engine.get_legal_actions().empty());
}

TEST_F(DogfightResolutionTest, DoubleLineGoesToPriorityHolder) {
    GameState state = placed.snapshot();
    for (int col = 0; col < GRID_SIZE; ++col) {
        state.square(0, col).remove_units_of(Player::Two);
        state.square(2, col).remove_units_of(Player::One);
    }
    Engine engine = Engine::from_snapshot(state, 3);

    // The tied center flips the token to P1 before the check
    pass_through_dogfight(engine);

    EXPECT_TRUE(engine.state().has_three_in_row(Player::One));
    EXPECT_TRUE(engine.state().has_three_in_row(Player::Two));
    EXPECT_TRUE(engine.is_game_over());
    EXPECT_EQ(engine.state().priority_holder(), Player::One);
    EXPECT_EQ(engine.get_winner(), Player::One);
}

TEST_F(DogfightResolutionTest, AllDoubleEliminationsIsADraw) {
    std::vector<int> same = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13};
    Engine engine = rig_piles(placed, same, same);
    for (int i = 0; i < NUM_SQUARES; ++i) {
        ASSERT_FALSE(engine.is_game_over());
        pass_through_dogfight(engine);
    }

    EXPECT_TRUE(engine.is_game_over());
    EXPECT_FALSE(engine.get_winner().has_value());
    EXPECT_EQ(engine.state().count_controlled(Player::One), 0);
    EXPECT_EQ(engine.state().count_controlled(Player::Two), 0);
}

TEST_F(DogfightResolutionTest, MoreControlledSquaresWins) {
    Engine engine = rig_piles(placed, {13, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 2, 3, 4, 5, 6, 7, 8, 9});
    for (int i = 0; i < NUM_SQUARES; ++i) {
        pass_through_dogfight(engine);
    }

    EXPECT_TRUE(engine.is_game_over());
    EXPECT_FALSE(engine.state().has_three_in_row(Player::One));
    EXPECT_EQ(engine.state().count_controlled(Player::One), 1);
    EXPECT_EQ(engine.get_winner(), Player::One);
}
