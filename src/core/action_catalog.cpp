#include "core/action_catalog.hpp"
#include "core/errors.hpp"

namespace core {

std::string Action::to_string() const {
    switch (type) {
        case ActionType::PlaceUnit:
            return "PLACE(" + std::to_string(power) + " @ " + pos.to_string() + ")";
        case ActionType::PlayWeapon:
            return "WEAPON[" + std::to_string(weapon_slot) + "]";
        case ActionType::Pass:
            return "PASS";
    }
    return "?";
}

bool Action::operator==(const Action& other) const noexcept {
    if (type != other.type) return false;
    switch (type) {
        case ActionType::PlaceUnit:  return power == other.power && pos == other.pos;
        case ActionType::PlayWeapon: return weapon_slot == other.weapon_slot;
        case ActionType::Pass:       return true;
    }
    return false;
}

const ActionCatalog& ActionCatalog::instance() {
    static const ActionCatalog catalog;
    return catalog;
}

ActionCatalog::ActionCatalog() {
    actions_.reserve(SIZE);

    // 9 powers x 9 squares, power-major
    for (int power = MIN_POWER; power <= MAX_POWER; ++power) {
        for (int row = 0; row < GRID_SIZE; ++row) {
            for (int col = 0; col < GRID_SIZE; ++col) {
                Action a;
                a.type = ActionType::PlaceUnit;
                a.power = power;
                a.pos = Position(row, col);
                actions_.push_back(a);
            }
        }
    }

    for (int slot = 0; slot < NUM_WEAPON_ACTIONS; ++slot) {
        Action a;
        a.type = ActionType::PlayWeapon;
        a.weapon_slot = slot;
        actions_.push_back(a);
    }

    actions_.push_back(Action());  // pass
}

const Action& ActionCatalog::get(int index) const {
    if (index < 0 || index >= size()) {
        throw ActionIndexOutOfRange(index);
    }
    return actions_[index];
}

std::optional<int> ActionCatalog::index_of(const Action& action) const {
    for (int i = 0; i < size(); ++i) {
        if (actions_[i] == action) return i;
    }
    return std::nullopt;
}

LegalMask ActionCatalog::legal_mask(const GameState& state, Player player) const {
    LegalMask mask;
    const PlayerResources& res = state.resources(player);

    if (state.phase() == Phase::Placement) {
        for (int i = 0; i < NUM_PLACEMENT_ACTIONS; ++i) {
            const Action& a = actions_[i];
            if (!res.has_unit(a.power)) continue;
            // Contesting an opponent's square is fine, stacking on our own is not
            if (state.square(a.pos).has_unit_of(player)) continue;
            mask.set(i);
        }
    } else if (state.phase() == Phase::Dogfights) {
        for (int slot = 0; slot < NUM_WEAPON_ACTIONS; ++slot) {
            if (slot < res.weapon_count()) {
                mask.set(weapon_index(slot));
            }
        }
        mask.set(PASS_INDEX);
    }

    return mask;
}

std::vector<int> ActionCatalog::legal_indices(const GameState& state, Player player) const {
    LegalMask mask = legal_mask(state, player);
    std::vector<int> indices;
    indices.reserve(mask.count());
    for (int i = 0; i < SIZE; ++i) {
        if (mask.test(i)) indices.push_back(i);
    }
    return indices;
}

} // namespace core
