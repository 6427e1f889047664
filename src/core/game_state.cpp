#include "core/game_state.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <sstream>

namespace core {

std::string to_string(Phase phase) {
    switch (phase) {
        case Phase::Placement: return "placement";
        case Phase::Dogfights: return "dogfights";
        case Phase::Ended:     return "ended";
    }
    return "unknown";
}

std::string to_string(WeaponRole role) {
    switch (role) {
        case WeaponRole::None:    return "none";
        case WeaponRole::Offense: return "offense";
        case WeaponRole::Defense: return "defense";
    }
    return "unknown";
}

std::string Unit::to_string() const {
    std::string owner_label = core::to_string(owner);
    if (hidden) {
        return owner_label + ":??";
    }
    return owner_label + ":" + std::to_string(power);
}

// ============================================================================
// Square
// ============================================================================

std::optional<Player> Square::controller() const noexcept {
    if (count_ == 1) {
        return units_[0].owner;
    }
    return std::nullopt;
}

bool Square::has_unit_of(Player p) const noexcept {
    return unit_of(p) != nullptr;
}

const Unit* Square::unit_of(Player p) const noexcept {
    for (uint8_t i = 0; i < count_; ++i) {
        if (units_[i].owner == p) return &units_[i];
    }
    return nullptr;
}

Unit* Square::unit_of(Player p) noexcept {
    for (uint8_t i = 0; i < count_; ++i) {
        if (units_[i].owner == p) return &units_[i];
    }
    return nullptr;
}

void Square::add(const Unit& u) {
    if (count_ >= 2) {
        throw ProtocolViolation("square already holds two units");
    }
    units_[count_++] = u;
}

void Square::remove_units_of(Player p) noexcept {
    uint8_t kept = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (units_[i].owner != p) {
            units_[kept++] = units_[i];
        }
    }
    for (uint8_t i = kept; i < count_; ++i) {
        units_[i] = Unit();
    }
    count_ = kept;
}

void Square::reveal_all() noexcept {
    for (uint8_t i = 0; i < count_; ++i) {
        units_[i].hidden = false;
    }
}

std::string Square::to_string() const {
    if (count_ == 0) return "[      ]";
    if (count_ == 1) return "[" + units_[0].to_string() + "]";
    return "[" + units_[0].to_string() + " vs " + units_[1].to_string() + "]";
}

bool Square::operator==(const Square& other) const noexcept {
    if (count_ != other.count_) return false;
    for (uint8_t i = 0; i < count_; ++i) {
        if (units_[i] != other.units_[i]) return false;
    }
    return true;
}

// ============================================================================
// PlayerResources / dogfight records
// ============================================================================

bool PlayerResources::has_unit(int power) const {
    return std::find(unplaced.begin(), unplaced.end(), power) != unplaced.end();
}

bool PlayerResources::operator==(const PlayerResources& other) const {
    return unplaced == other.unplaced && weapons == other.weapons &&
           draw_pile == other.draw_pile && discard_pile == other.discard_pile;
}

bool TurnMove::operator==(const TurnMove& other) const noexcept {
    return actor == other.actor && action_index == other.action_index &&
           kind == other.kind && weapon_slot == other.weapon_slot && role == other.role;
}

bool DogfightTurnState::operator==(const DogfightTurnState& o) const noexcept {
    return position == o.position && underdog == o.underdog && other == o.other &&
           current_actor == o.current_actor && first == o.first && second == o.second &&
           third == o.third && offense_by == o.offense_by && complete == o.complete;
}

// ============================================================================
// GameState
// ============================================================================

std::optional<Position> GameState::current_dogfight_square() const {
    if (phase_ == Phase::Dogfights &&
        current_dogfight_index_ < static_cast<int>(dogfight_order_.size())) {
        return dogfight_order_[current_dogfight_index_];
    }
    return std::nullopt;
}

std::optional<DogfightContext> GameState::dogfight_context() const {
    if (!active_dogfight_) {
        return std::nullopt;
    }
    DogfightContext ctx;
    ctx.position = active_dogfight_->position;
    ctx.underdog = active_dogfight_->underdog;
    ctx.other = active_dogfight_->other;
    ctx.offense_pending_by = active_dogfight_->offense_by;
    ctx.moves_taken = active_dogfight_->moves_taken();
    return ctx;
}

int GameState::count_controlled(Player p) const {
    int count = 0;
    for (const auto& row : grid_) {
        for (const auto& sq : row) {
            if (sq.controller() == p) count++;
        }
    }
    return count;
}

bool GameState::has_three_in_row(Player p) const {
    auto owns = [&](int r, int c) { return grid_[r][c].controller() == p; };

    for (int i = 0; i < GRID_SIZE; ++i) {
        if (owns(i, 0) && owns(i, 1) && owns(i, 2)) return true;  // row
        if (owns(0, i) && owns(1, i) && owns(2, i)) return true;  // column
    }
    if (owns(0, 0) && owns(1, 1) && owns(2, 2)) return true;
    return owns(0, 2) && owns(1, 1) && owns(2, 0);
}

bool GameState::all_units_placed() const {
    return resources_[0].unplaced.empty() && resources_[1].unplaced.empty();
}

std::string GameState::to_string() const {
    std::ostringstream out;
    out << "=== kaos9 - " << core::to_string(phase_) << " ===\n";
    out << "Turn " << turn_number_ << ", current player: " << core::to_string(current_player_)
        << ", priority: " << core::to_string(priority_holder_) << "\n\n";

    for (const auto& row : grid_) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            out << (c > 0 ? " " : "") << row[c].to_string();
        }
        out << "\n";
    }
    out << "\n";

    for (Player p : {Player::One, Player::Two}) {
        const PlayerResources& res = resources(p);
        out << core::to_string(p) << ": units {";
        for (size_t i = 0; i < res.unplaced.size(); ++i) {
            out << (i > 0 ? "," : "") << res.unplaced[i];
        }
        out << "} weapons " << std::string(res.weapons.begin(), res.weapons.end())
            << ", pile " << res.draw_pile.size() << ", discard " << res.discard_pile.size() << "\n";
    }

    if (game_over_) {
        out << "\n*** Game over - " << (winner_ ? core::to_string(*winner_) + " wins" : "draw") << " ***\n";
    }
    return out.str();
}

bool GameState::operator==(const GameState& o) const {
    return grid_ == o.grid_ && resources_ == o.resources_ && phase_ == o.phase_ &&
           current_player_ == o.current_player_ && turn_number_ == o.turn_number_ &&
           dogfight_order_ == o.dogfight_order_ &&
           current_dogfight_index_ == o.current_dogfight_index_ &&
           active_dogfight_ == o.active_dogfight_ && priority_holder_ == o.priority_holder_ &&
           game_over_ == o.game_over_ && winner_ == o.winner_ && rng_seed_ == o.rng_seed_;
}

} // namespace core
