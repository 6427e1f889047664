#include "utils/game_utils.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace utils {

void GameUtils::print_game_state(const core::GameState& state) {
    std::cout << state.to_string();
    if (auto ctx = state.dogfight_context()) {
        std::cout << "Dogfight @ " << ctx->position.to_string()
                  << ", underdog " << core::to_string(ctx->underdog)
                  << ", moves " << ctx->moves_taken;
        if (ctx->offense_pending()) {
            std::cout << ", attack pending by " << core::to_string(*ctx->offense_pending_by);
        }
        std::cout << "\n";
    }
}

std::string GameUtils::describe_winner(std::optional<core::Player> winner) {
    return winner ? core::to_string(*winner) : "Draw";
}

std::string GameUtils::describe_dogfight(const core::DogfightResult& result) {
    std::ostringstream out;
    out << "Dogfight @ " << result.position.to_string() << ": ";

    for (core::Player p : {core::Player::One, core::Player::Two}) {
        const auto& draws = result.draws[core::index_of(p)];
        out << core::to_string(p) << " " << core::to_string(result.roles[core::index_of(p)]);
        if (!draws.empty()) {
            out << " drew";
            for (int card : draws) out << " " << card;
        }
        out << (p == core::Player::One ? "; " : "");
    }

    if (result.undefended_hit) {
        out << " -> undefended hit, ";
    } else {
        out << " -> ";
    }
    if (result.winner) {
        out << core::to_string(*result.winner) << " wins";
    } else {
        out << "both eliminated";
    }
    return out.str();
}

std::string GameUtils::format_with_commas(long long value) {
    unsigned long long magnitude = value < 0 ? 0ULL - static_cast<unsigned long long>(value)
                                             : static_cast<unsigned long long>(value);
    std::string num = std::to_string(magnitude);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0) result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return value < 0 ? "-" + result : result;
}

std::string GameUtils::format_percent(double fraction) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return out.str();
}

std::string GameUtils::format_elapsed(std::chrono::steady_clock::duration elapsed) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() % 1000;
    std::ostringstream out;
    out << seconds / 60 << " min " << seconds % 60 << "." << std::setw(3) << std::setfill('0') << millis << " sec";
    return out.str();
}

} // namespace utils
