#pragma once

#include "core/engine.hpp"
#include <optional>

namespace mcts {

// Uniform random playout on a disposable engine. All choices are drawn from
// the engine's own stream, so a playout is fully determined by the engine's
// stream seed.
class RolloutPolicy {
public:
    static constexpr int MAX_ROLLOUT_STEPS = 256;  // guards against a stuck protocol

    // Plays to the end of the game and returns the winner (nullopt on draw).
    // Throws std::runtime_error if the engine refuses a move it offered as legal
    // or the step guard trips.
    std::optional<core::Player> play_out(core::Engine& engine) const;

    // 1 for a win, 0 for a loss, 0.5 for a draw
    static double score_for(std::optional<core::Player> winner, core::Player perspective) noexcept;
};

// Running score of a batch of playouts for one candidate. A failed playout
// counts as a draw; once failures are the majority the batch scores 0.5.
class RolloutTally {
public:
    void record(std::optional<core::Player> winner, core::Player perspective) noexcept {
        ++trials_;
        points_ += RolloutPolicy::score_for(winner, perspective);
    }
    void record_failure() noexcept {
        ++trials_;
        ++failures_;
        points_ += 0.5;
    }

    int trials() const noexcept { return trials_; }
    int failures() const noexcept { return failures_; }
    double score() const noexcept;

private:
    int trials_ = 0;
    int failures_ = 0;
    double points_ = 0.0;
};

} // namespace mcts
