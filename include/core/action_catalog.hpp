#pragma once

#include "core/game_state.hpp"
#include <bitset>
#include <optional>
#include <string>
#include <vector>

namespace core {

enum class ActionType : uint8_t {
    PlaceUnit,
    PlayWeapon,  // offense or defense is decided by dogfight turn order
    Pass
};

struct Action {
    ActionType type = ActionType::Pass;
    int power = 0;         // PlaceUnit
    Position pos;          // PlaceUnit
    int weapon_slot = -1;  // PlayWeapon

    std::string to_string() const;

    bool operator==(const Action& other) const noexcept;
    bool operator!=(const Action& other) const noexcept { return !(*this == other); }
};

// Fixed, fully enumerated action space. Built once per process and never
// mutated afterwards, so it is shared by reference everywhere.
class ActionCatalog {
public:
    static constexpr int NUM_PLACEMENT_ACTIONS = NUM_POWERS * NUM_SQUARES;  // 81
    static constexpr int NUM_WEAPON_ACTIONS = STARTING_WEAPONS;              // 4
    static constexpr int SIZE = NUM_PLACEMENT_ACTIONS + NUM_WEAPON_ACTIONS + 1;
    static constexpr int FIRST_WEAPON_INDEX = NUM_PLACEMENT_ACTIONS;
    static constexpr int PASS_INDEX = SIZE - 1;

    using LegalMask = std::bitset<SIZE>;

    static const ActionCatalog& instance();

    int size() const noexcept { return static_cast<int>(actions_.size()); }

    // Throws ActionIndexOutOfRange
    const Action& get(int index) const;
    std::optional<int> index_of(const Action& action) const;

    static int placement_index(int power, int row, int col) noexcept {
        return (power - MIN_POWER) * NUM_SQUARES + row * GRID_SIZE + col;
    }
    static int weapon_index(int slot) noexcept { return FIRST_WEAPON_INDEX + slot; }
    static bool is_placement(int index) noexcept {
        return index >= 0 && index < NUM_PLACEMENT_ACTIONS;
    }

    LegalMask legal_mask(const GameState& state, Player player) const;
    std::vector<int> legal_indices(const GameState& state, Player player) const;

    ActionCatalog(const ActionCatalog&) = delete;
    ActionCatalog& operator=(const ActionCatalog&) = delete;

private:
    ActionCatalog();

    std::vector<Action> actions_;
};

using LegalMask = ActionCatalog::LegalMask;

} // namespace core
