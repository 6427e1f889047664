#include "mcts/information_set.hpp"
#include <algorithm>
#include <cstddef>
#include <random>

namespace mcts {

namespace {

const std::vector<int> HIDDEN_POWERS = {2, 3, 9, 10};

} // namespace

std::vector<int> InformationSetSampler::hidden_power_candidates(const core::GameState& state,
                                                                core::Player observer) {
    core::Player opp = core::opponent(observer);
    std::vector<bool> known(core::MAX_POWER + 1, false);

    for (int power : state.resources(opp).unplaced) {
        known[power] = true;
    }
    for (int r = 0; r < core::GRID_SIZE; ++r) {
        for (int c = 0; c < core::GRID_SIZE; ++c) {
            const core::Unit* unit = state.square(r, c).unit_of(opp);
            if (unit && !unit->hidden) {
                known[unit->power] = true;
            }
        }
    }

    std::vector<int> candidates;
    for (int power : HIDDEN_POWERS) {
        if (!known[power]) candidates.push_back(power);
    }
    return candidates;
}

core::GameState InformationSetSampler::sample(const core::GameState& state, core::Player observer, uint64_t seed) {
    std::mt19937_64 rng(seed);
    core::GameState sampled = state;
    core::Player opp = core::opponent(observer);

    std::vector<int> pool = hidden_power_candidates(state, observer);

    for (int r = 0; r < core::GRID_SIZE; ++r) {
        for (int c = 0; c < core::GRID_SIZE; ++c) {
            core::Unit* unit = sampled.square(r, c).unit_of(opp);
            if (!unit || !unit->hidden) continue;

            if (pool.empty()) {
                pool = HIDDEN_POWERS;
            }
            std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
            size_t pick = dist(rng);
            unit->power = static_cast<int8_t>(pool[pick]);
            pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(pick));
        }
    }

    // Draw pile: any order of the cards not yet seen in the discard
    core::PlayerResources& res = sampled.resources(opp);
    std::vector<int> unseen;
    for (int card = 1; card <= core::DECK_SIZE; ++card) {
        if (std::find(res.discard_pile.begin(), res.discard_pile.end(), card) == res.discard_pile.end()) {
            unseen.push_back(card);
        }
    }
    std::shuffle(unseen.begin(), unseen.end(), rng);
    unseen.resize(std::min(unseen.size(), res.draw_pile.size()));
    res.draw_pile = std::move(unseen);

    return sampled;
}

} // namespace mcts
