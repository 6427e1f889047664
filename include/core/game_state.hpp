#pragma once

#include "core/types.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace core {

// A grid square holds at most two units: one per player.
class Square {
public:
    Square() = default;

    bool is_empty() const noexcept { return count_ == 0; }
    bool is_controlled() const noexcept { return count_ == 1; }
    bool is_contested() const noexcept { return count_ == 2; }
    int unit_count() const noexcept { return count_; }

    // Owner of the single unit, or nullopt if empty or contested
    std::optional<Player> controller() const noexcept;

    const Unit& unit(int slot) const { return units_.at(slot); }
    Unit& unit(int slot) { return units_.at(slot); }

    bool has_unit_of(Player p) const noexcept;
    const Unit* unit_of(Player p) const noexcept;
    Unit* unit_of(Player p) noexcept;

    // Throws ProtocolViolation if the square already holds two units
    void add(const Unit& u);
    void remove_units_of(Player p) noexcept;
    void reveal_all() noexcept;

    std::string to_string() const;

    bool operator==(const Square& other) const noexcept;
    bool operator!=(const Square& other) const noexcept { return !(*this == other); }

private:
    std::array<Unit, 2> units_{};
    uint8_t count_ = 0;
};

struct PlayerResources {
    std::vector<int> unplaced = {2, 3, 4, 5, 6, 7, 8, 9, 10};
    std::vector<char> weapons = {'A', 'K', 'Q', 'J'};
    std::vector<int> draw_pile;
    std::vector<int> discard_pile;

    bool has_unit(int power) const;
    int weapon_count() const noexcept { return static_cast<int>(weapons.size()); }
    int pile_total() const noexcept {
        return static_cast<int>(draw_pile.size() + discard_pile.size());
    }

    bool operator==(const PlayerResources& other) const;
    bool operator!=(const PlayerResources& other) const { return !(*this == other); }
};

enum class MoveKind : uint8_t { Pass, Weapon };
enum class WeaponRole : uint8_t { None, Offense, Defense };

std::string to_string(WeaponRole role);

// One dogfight turn action. The role of a weapon is decided by the turn
// state machine from who played it and when.
struct TurnMove {
    Player actor = Player::One;
    int action_index = -1;
    MoveKind kind = MoveKind::Pass;
    int weapon_slot = -1;
    WeaponRole role = WeaponRole::None;

    bool operator==(const TurnMove& other) const noexcept;
    bool operator!=(const TurnMove& other) const noexcept { return !(*this == other); }
};

struct DogfightTurnState {
    Position position;
    Player underdog = Player::One;
    Player other = Player::Two;
    Player current_actor = Player::One;
    std::optional<TurnMove> first;   // underdog
    std::optional<TurnMove> second;  // other
    std::optional<TurnMove> third;   // underdog's counter-response
    std::optional<Player> offense_by;
    bool complete = false;

    int moves_taken() const noexcept {
        return (first ? 1 : 0) + (second ? 1 : 0) + (third ? 1 : 0);
    }

    bool operator==(const DogfightTurnState& other) const noexcept;
    bool operator!=(const DogfightTurnState& other) const noexcept { return !(*this == other); }
};

// What agents may consult about the dogfight in progress
struct DogfightContext {
    Position position;
    Player underdog = Player::One;
    Player other = Player::Two;
    std::optional<Player> offense_pending_by;
    int moves_taken = 0;

    bool offense_pending() const noexcept { return offense_pending_by.has_value(); }
};

class GameState {
public:
    using Grid = std::array<std::array<Square, GRID_SIZE>, GRID_SIZE>;

    GameState() = default;

    // Grid access
    const Square& square(int row, int col) const { return grid_.at(row).at(col); }
    Square& square(int row, int col) { return grid_.at(row).at(col); }
    const Square& square(Position pos) const { return square(pos.row, pos.col); }
    Square& square(Position pos) { return square(pos.row, pos.col); }

    const PlayerResources& resources(Player p) const { return resources_[index_of(p)]; }
    PlayerResources& resources(Player p) { return resources_[index_of(p)]; }

    // Game flow
    Phase phase() const noexcept { return phase_; }
    Player current_player() const noexcept { return current_player_; }
    int turn_number() const noexcept { return turn_number_; }
    Player priority_holder() const noexcept { return priority_holder_; }
    bool game_over() const noexcept { return game_over_; }
    // nullopt while the game runs or when it ended in a draw
    std::optional<Player> winner() const noexcept { return winner_; }
    uint64_t rng_seed() const noexcept { return rng_seed_; }

    // Dogfight tracking
    const std::vector<Position>& dogfight_order() const noexcept { return dogfight_order_; }
    int current_dogfight_index() const noexcept { return current_dogfight_index_; }
    std::optional<Position> current_dogfight_square() const;
    const std::optional<DogfightTurnState>& active_dogfight() const noexcept { return active_dogfight_; }
    std::optional<DogfightContext> dogfight_context() const;

    // Scoring
    int count_controlled(Player p) const;
    bool has_three_in_row(Player p) const;
    bool all_units_placed() const;

    std::string to_string() const;

    bool operator==(const GameState& other) const;
    bool operator!=(const GameState& other) const { return !(*this == other); }

private:
    friend class Engine;

    Grid grid_{};
    std::array<PlayerResources, 2> resources_{};

    Phase phase_ = Phase::Placement;
    Player current_player_ = Player::One;
    int turn_number_ = 0;

    std::vector<Position> dogfight_order_;
    int current_dogfight_index_ = 0;
    std::optional<DogfightTurnState> active_dogfight_;
    Player priority_holder_ = Player::Two;  // offsets first-mover advantage

    bool game_over_ = false;
    std::optional<Player> winner_;

    uint64_t rng_seed_ = 0;
};

} // namespace core
