#pragma once

#include "core/action_catalog.hpp"
#include "core/game_state.hpp"
#include <array>
#include <optional>
#include <random>
#include <vector>

namespace core {

struct HistoryEntry {
    Player player = Player::One;
    int action_index = -1;

    bool operator==(const HistoryEntry& other) const noexcept {
        return player == other.player && action_index == other.action_index;
    }
};

struct DogfightResult {
    Position position;
    std::optional<Player> winner;      // nullopt on double elimination
    std::vector<Player> eliminated;
    std::array<std::vector<int>, 2> draws;  // resolution cards drawn, per player
    std::array<WeaponRole, 2> roles{{WeaponRole::None, WeaponRole::None}};
    bool undefended_hit = false;

    int total_draws() const noexcept {
        return static_cast<int>(draws[0].size() + draws[1].size());
    }
};

// Authoritative game engine. The only mutator of game state and the only
// owner of game randomness: one RNG stream per instance.
class Engine {
public:
    explicit Engine(uint64_t seed);

    // Disposable engine for simulation. Deep-copies the snapshot and runs its
    // own RNG stream seeded with stream_seed; the game seed is kept.
    static Engine from_snapshot(const GameState& snapshot, uint64_t stream_seed);

    // Rebuilds a game from its persisted artifact. Throws std::invalid_argument
    // if the history does not replay legally.
    static Engine replay(uint64_t seed, const std::vector<HistoryEntry>& history);

    uint64_t seed() const noexcept { return state_.rng_seed(); }

    // Read-only view and deep copy of the authoritative state
    const GameState& state() const noexcept { return state_; }
    GameState snapshot() const { return state_; }
    const std::vector<HistoryEntry>& history() const noexcept { return history_; }

    // Placement
    std::vector<int> get_legal_actions() const;
    std::vector<int> get_legal_actions(Player player) const;
    LegalMask get_legal_mask(Player player) const;
    bool apply_action(int action_index);

    // Dogfights
    std::optional<Position> current_dogfight_square() const { return state_.current_dogfight_square(); }
    bool has_active_dogfight() const noexcept { return state_.active_dogfight().has_value(); }
    void begin_dogfight();
    Player get_dogfight_actor() const;
    std::vector<int> get_dogfight_legal_actions(Player player) const;
    bool apply_dogfight_turn_action(Player player, int action_index);
    bool is_dogfight_complete() const noexcept;
    DogfightResult finish_dogfight();

    // Outcome
    bool is_game_over() const noexcept { return state_.game_over(); }
    std::optional<Player> get_winner() const noexcept {
        return state_.game_over() ? state_.winner() : std::nullopt;
    }

    // Uniform pick from options using this engine's stream. Used by
    // simulated play so that rollouts never draw on agent randomness.
    int random_choice(const std::vector<int>& options);

private:
    Engine(const GameState& snapshot, uint64_t stream_seed);

    void initialize_piles();
    void apply_placement(const Action& action, Player player);
    void transition_to_dogfights();
    Player determine_underdog(const Square& square);
    DogfightResult resolve(const DogfightTurnState& df);
    void discard_weapon(Player player, const TurnMove& move);
    int draw_card(Player player);
    void check_line_victory();
    void check_game_end();
    void end_game(std::optional<Player> winner);

    const DogfightTurnState& require_active_dogfight(const char* caller) const;

    GameState state_;
    std::vector<HistoryEntry> history_;
    std::mt19937_64 rng_;
};

} // namespace core
