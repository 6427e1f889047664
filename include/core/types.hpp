#pragma once

#include <cstdint>
#include <string>

namespace core {

constexpr int GRID_SIZE = 3;
constexpr int NUM_SQUARES = GRID_SIZE * GRID_SIZE;
constexpr int MIN_POWER = 2;
constexpr int MAX_POWER = 10;
constexpr int NUM_POWERS = MAX_POWER - MIN_POWER + 1;
constexpr int STARTING_WEAPONS = 4;
constexpr int DECK_SIZE = 13;     // resolution cards 1..13
constexpr int HIT_THRESHOLD = 7;  // undefended attack hits on >= 7

enum class Player : uint8_t {
    One = 0,
    Two = 1
};

inline Player opponent(Player p) noexcept {
    return p == Player::One ? Player::Two : Player::One;
}

inline int index_of(Player p) noexcept {
    return static_cast<int>(p);
}

inline std::string to_string(Player p) {
    return p == Player::One ? "P1" : "P2";
}

enum class Phase : uint8_t {
    Placement,
    Dogfights,
    Ended
};

std::string to_string(Phase phase);

struct Position {
    int8_t row = 0;
    int8_t col = 0;

    Position() = default;
    Position(int r, int c) : row(static_cast<int8_t>(r)), col(static_cast<int8_t>(c)) {}

    std::string to_string() const {
        return "[" + std::to_string(row) + "," + std::to_string(col) + "]";
    }

    bool operator==(const Position& other) const noexcept {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Position& other) const noexcept {
        return !(*this == other);
    }
};

// Powers 2, 3, 9 and 10 are placed face-down until showdown.
inline bool is_hidden_power(int power) noexcept {
    return power == 2 || power == 3 || power == 9 || power == 10;
}

struct Unit {
    Player owner = Player::One;
    int8_t power = 0;
    bool hidden = false;

    Unit() = default;
    Unit(Player o, int p, bool h) : owner(o), power(static_cast<int8_t>(p)), hidden(h) {}

    std::string to_string() const;

    bool operator==(const Unit& other) const noexcept {
        return owner == other.owner && power == other.power && hidden == other.hidden;
    }

    bool operator!=(const Unit& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace core
