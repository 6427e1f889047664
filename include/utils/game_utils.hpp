#pragma once

#include "core/engine.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace utils {

// Console formatting shared by the apps and the match runner
class GameUtils {
public:
    static void print_game_state(const core::GameState& state);

    static std::string describe_winner(std::optional<core::Player> winner);
    static std::string describe_dogfight(const core::DogfightResult& result);

    static std::string format_with_commas(long long value);
    static std::string format_percent(double fraction);
    static std::string format_elapsed(std::chrono::steady_clock::duration elapsed);
};

} // namespace utils
