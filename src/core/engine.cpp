#include "core/engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace core {

namespace {

// Resolution order: center, edges, corners
const std::array<Position, NUM_SQUARES> DOGFIGHT_ORDER = {{
    Position(1, 1),
    Position(0, 1), Position(1, 0), Position(1, 2), Position(2, 1),
    Position(0, 0), Position(0, 2), Position(2, 0), Position(2, 2),
}};

} // namespace

// ============================================================================
// Construction
// ============================================================================

Engine::Engine(uint64_t seed) : rng_(seed) {
    state_.rng_seed_ = seed;
    initialize_piles();
}

Engine::Engine(const GameState& snapshot, uint64_t stream_seed)
    : state_(snapshot), rng_(stream_seed) {
}

Engine Engine::from_snapshot(const GameState& snapshot, uint64_t stream_seed) {
    return Engine(snapshot, stream_seed);
}

Engine Engine::replay(uint64_t seed, const std::vector<HistoryEntry>& history) {
    Engine engine(seed);

    for (size_t i = 0; i < history.size(); ++i) {
        const HistoryEntry& entry = history[i];
        const std::string where = "replay entry " + std::to_string(i) + ": ";

        if (engine.is_game_over()) {
            throw std::invalid_argument(where + "game already over");
        }

        if (engine.state_.phase() == Phase::Placement) {
            if (entry.player != engine.state_.current_player()) {
                throw std::invalid_argument(where + "out-of-turn placement by " + to_string(entry.player));
            }
            if (!engine.apply_action(entry.action_index)) {
                throw std::invalid_argument(where + "illegal placement " + std::to_string(entry.action_index));
            }
            continue;
        }

        if (!engine.has_active_dogfight()) {
            engine.begin_dogfight();
        }
        if (entry.player != engine.get_dogfight_actor()) {
            throw std::invalid_argument(where + "out-of-turn dogfight action by " + to_string(entry.player));
        }
        if (!engine.apply_dogfight_turn_action(entry.player, entry.action_index)) {
            throw std::invalid_argument(where + "illegal dogfight action " + std::to_string(entry.action_index));
        }
        if (engine.is_dogfight_complete()) {
            engine.finish_dogfight();
        }
    }

    return engine;
}

void Engine::initialize_piles() {
    for (Player p : {Player::One, Player::Two}) {
        PlayerResources& res = state_.resources(p);
        res.draw_pile.resize(DECK_SIZE);
        std::iota(res.draw_pile.begin(), res.draw_pile.end(), 1);
        std::shuffle(res.draw_pile.begin(), res.draw_pile.end(), rng_);
        res.discard_pile.clear();
    }
}

// ============================================================================
// Legality
// ============================================================================

std::vector<int> Engine::get_legal_actions() const {
    const auto& df = state_.active_dogfight();
    if (df && !df->complete) {
        return get_legal_actions(df->current_actor);
    }
    return get_legal_actions(state_.current_player());
}

std::vector<int> Engine::get_legal_actions(Player player) const {
    return ActionCatalog::instance().legal_indices(state_, player);
}

LegalMask Engine::get_legal_mask(Player player) const {
    return ActionCatalog::instance().legal_mask(state_, player);
}

// ============================================================================
// Placement
// ============================================================================

bool Engine::apply_action(int action_index) {
    if (state_.phase() == Phase::Dogfights) {
        throw ProtocolViolation("apply_action() called during dogfights; use the dogfight turn protocol");
    }

    Player player = state_.current_player();
    if (!ActionCatalog::is_placement(action_index) || !get_legal_mask(player).test(action_index)) {
        return false;
    }

    history_.push_back({player, action_index});
    apply_placement(ActionCatalog::instance().get(action_index), player);
    return true;
}

void Engine::apply_placement(const Action& action, Player player) {
    PlayerResources& res = state_.resources(player);
    res.unplaced.erase(std::find(res.unplaced.begin(), res.unplaced.end(), action.power));

    state_.square(action.pos).add(Unit(player, action.power, is_hidden_power(action.power)));

    state_.turn_number_++;
    state_.current_player_ = opponent(player);

    if (state_.all_units_placed()) {
        transition_to_dogfights();
    }
}

void Engine::transition_to_dogfights() {
    state_.phase_ = Phase::Dogfights;
    state_.dogfight_order_.clear();
    for (const Position& pos : DOGFIGHT_ORDER) {
        if (state_.square(pos).is_contested()) {
            state_.dogfight_order_.push_back(pos);
        }
    }
    state_.current_dogfight_index_ = 0;

    if (state_.dogfight_order_.empty()) {
        check_game_end();
    }
}

// ============================================================================
// Dogfight turn protocol
// ============================================================================

const DogfightTurnState& Engine::require_active_dogfight(const char* caller) const {
    if (!state_.active_dogfight()) {
        throw ProtocolViolation(std::string(caller) + ": no active dogfight, call begin_dogfight() first");
    }
    return *state_.active_dogfight();
}

void Engine::begin_dogfight() {
    if (state_.phase() != Phase::Dogfights) {
        throw ProtocolViolation("begin_dogfight() outside the dogfight phase");
    }
    if (state_.active_dogfight()) {
        throw ProtocolViolation("begin_dogfight(): a dogfight is already in progress");
    }
    std::optional<Position> pos = state_.current_dogfight_square();
    if (!pos) {
        throw ProtocolViolation("begin_dogfight(): no dogfights remaining");
    }

    Square& square = state_.square(*pos);
    if (!square.is_contested()) {
        throw ProtocolViolation("begin_dogfight(): square " + pos->to_string() + " is not contested");
    }

    // Showdown: hidden units are revealed before anything else is decided
    square.reveal_all();

    DogfightTurnState df;
    df.position = *pos;
    df.underdog = determine_underdog(square);
    df.other = opponent(df.underdog);
    df.current_actor = df.underdog;
    state_.active_dogfight_ = df;
}

Player Engine::determine_underdog(const Square& square) {
    const Unit* one = square.unit_of(Player::One);
    const Unit* two = square.unit_of(Player::Two);
    if (one->hidden || two->hidden) {
        throw ProtocolViolation("underdog computed before showdown");
    }

    if (one->power < two->power) return Player::One;
    if (two->power < one->power) return Player::Two;

    // Equal power: the priority holder acts first and gives the token away
    Player holder = state_.priority_holder_;
    state_.priority_holder_ = opponent(holder);
    return holder;
}

Player Engine::get_dogfight_actor() const {
    const DogfightTurnState& df = require_active_dogfight("get_dogfight_actor");
    if (df.complete) {
        throw ProtocolViolation("get_dogfight_actor(): dogfight complete, call finish_dogfight()");
    }
    return df.current_actor;
}

std::vector<int> Engine::get_dogfight_legal_actions(Player player) const {
    if (player != get_dogfight_actor()) {
        throw ProtocolViolation("get_dogfight_legal_actions(): not " + to_string(player) + "'s turn");
    }
    return get_legal_actions(player);
}

bool Engine::apply_dogfight_turn_action(Player player, int action_index) {
    const DogfightTurnState& current = require_active_dogfight("apply_dogfight_turn_action");
    if (current.complete) {
        throw ProtocolViolation("apply_dogfight_turn_action(): dogfight complete, call finish_dogfight()");
    }
    if (player != current.current_actor) {
        throw ProtocolViolation("apply_dogfight_turn_action(): not " + to_string(player) + "'s turn");
    }
    if (action_index < 0 || action_index >= ActionCatalog::SIZE ||
        !get_legal_mask(player).test(action_index)) {
        return false;
    }

    const Action& action = ActionCatalog::instance().get(action_index);
    TurnMove move;
    move.actor = player;
    move.action_index = action_index;
    move.kind = (action.type == ActionType::PlayWeapon) ? MoveKind::Weapon : MoveKind::Pass;
    move.weapon_slot = action.weapon_slot;

    history_.push_back({player, action_index});

    DogfightTurnState& df = *state_.active_dogfight_;
    bool weapon = move.kind == MoveKind::Weapon;

    if (!df.first) {
        // Underdog opens: a weapon here is always an attack
        if (weapon) {
            move.role = WeaponRole::Offense;
            df.offense_by = df.underdog;
        }
        df.first = move;
        df.current_actor = df.other;
    } else if (!df.second) {
        if (df.offense_by == df.underdog) {
            // Answering the underdog's attack; a pass leaves it undefended
            if (weapon) move.role = WeaponRole::Defense;
            df.complete = true;
        } else if (weapon) {
            move.role = WeaponRole::Offense;
            df.offense_by = df.other;
            df.current_actor = df.underdog;
        } else {
            df.complete = true;  // both passed
        }
        df.second = move;
    } else {
        // Underdog's answer to the other player's attack
        if (weapon) move.role = WeaponRole::Defense;
        df.third = move;
        df.complete = true;
    }

    return true;
}

bool Engine::is_dogfight_complete() const noexcept {
    const auto& df = state_.active_dogfight();
    return df && df->complete;
}

DogfightResult Engine::finish_dogfight() {
    DogfightTurnState df = require_active_dogfight("finish_dogfight");
    if (!df.complete) {
        throw ProtocolViolation("finish_dogfight(): dogfight still waiting for " + to_string(df.current_actor));
    }

    DogfightResult result = resolve(df);

    Square& square = state_.square(df.position);
    for (Player p : result.eliminated) {
        square.remove_units_of(p);
    }

    state_.active_dogfight_.reset();
    state_.current_dogfight_index_++;

    // Lines are checked after every dogfight, not only the last one
    check_line_victory();
    if (!state_.game_over() &&
        state_.current_dogfight_index_ >= static_cast<int>(state_.dogfight_order_.size())) {
        check_game_end();
    }

    return result;
}

// ============================================================================
// Resolution
// ============================================================================

DogfightResult Engine::resolve(const DogfightTurnState& df) {
    DogfightResult result;
    result.position = df.position;

    std::array<TurnMove, 2> final_moves;
    final_moves[index_of(df.underdog)] = df.third ? *df.third : *df.first;
    final_moves[index_of(df.other)] = *df.second;

    std::optional<Player> attacker;
    bool defended = false;
    for (Player p : {Player::One, Player::Two}) {
        const TurnMove& move = final_moves[index_of(p)];
        result.roles[index_of(p)] = move.role;
        if (move.role == WeaponRole::Offense) {
            if (attacker) {
                throw ProtocolViolation("both players attacking in one dogfight");
            }
            attacker = p;
        } else if (move.role == WeaponRole::Defense) {
            defended = true;
        }
    }

    for (Player p : {Player::One, Player::Two}) {
        discard_weapon(p, final_moves[index_of(p)]);
    }

    const Square& square = state_.square(df.position);
    const Unit* unit_one = square.unit_of(Player::One);
    const Unit* unit_two = square.unit_of(Player::Two);
    if (!unit_one || !unit_two) {
        throw ProtocolViolation("dogfight at " + df.position.to_string() + " lost a unit before resolution");
    }

    if (attacker && !defended) {
        int card = draw_card(*attacker);
        result.draws[index_of(*attacker)].push_back(card);
        if (card >= HIT_THRESHOLD) {
            result.eliminated.push_back(opponent(*attacker));
            result.winner = attacker;
            result.undefended_hit = true;
            return result;
        }
        // Miss: fall through to the base step
    }

    int card_one = draw_card(Player::One);
    int card_two = draw_card(Player::Two);
    result.draws[0].push_back(card_one);
    result.draws[1].push_back(card_two);

    int total_one = unit_one->power + card_one;
    int total_two = unit_two->power + card_two;

    if (total_one > total_two) {
        result.eliminated.push_back(Player::Two);
        result.winner = Player::One;
    } else if (total_two > total_one) {
        result.eliminated.push_back(Player::One);
        result.winner = Player::Two;
    } else {
        result.eliminated.push_back(Player::One);
        result.eliminated.push_back(Player::Two);
    }

    return result;
}

void Engine::discard_weapon(Player player, const TurnMove& move) {
    if (move.kind != MoveKind::Weapon) return;
    std::vector<char>& weapons = state_.resources(player).weapons;
    if (move.weapon_slot < 0 || move.weapon_slot >= static_cast<int>(weapons.size())) {
        throw ProtocolViolation("weapon slot " + std::to_string(move.weapon_slot) + " no longer held by " +
                                to_string(player));
    }
    weapons.erase(weapons.begin() + move.weapon_slot);
}

int Engine::draw_card(Player player) {
    PlayerResources& res = state_.resources(player);

    if (res.draw_pile.empty()) {
        res.draw_pile.swap(res.discard_pile);
        std::shuffle(res.draw_pile.begin(), res.draw_pile.end(), rng_);
    }
    if (res.draw_pile.empty()) {
        throw std::runtime_error("resolution pile of " + to_string(player) + " is empty");
    }

    int card = res.draw_pile.front();
    res.draw_pile.erase(res.draw_pile.begin());
    res.discard_pile.push_back(card);
    return card;
}

// ============================================================================
// Game end
// ============================================================================

void Engine::check_line_victory() {
    bool one = state_.has_three_in_row(Player::One);
    bool two = state_.has_three_in_row(Player::Two);

    if (one && two) {
        end_game(state_.priority_holder());
    } else if (one) {
        end_game(Player::One);
    } else if (two) {
        end_game(Player::Two);
    }
}

void Engine::check_game_end() {
    check_line_victory();
    if (state_.game_over()) return;

    int one = state_.count_controlled(Player::One);
    int two = state_.count_controlled(Player::Two);

    if (one > two) {
        end_game(Player::One);
    } else if (two > one) {
        end_game(Player::Two);
    } else {
        end_game(std::nullopt);
    }
}

void Engine::end_game(std::optional<Player> winner) {
    state_.winner_ = winner;
    state_.game_over_ = true;
    state_.phase_ = Phase::Ended;
    state_.active_dogfight_.reset();
}

int Engine::random_choice(const std::vector<int>& options) {
    if (options.empty()) {
        throw std::invalid_argument("random_choice() from an empty option list");
    }
    std::uniform_int_distribution<size_t> dist(0, options.size() - 1);
    return options[dist(rng_)];
}

} // namespace core
