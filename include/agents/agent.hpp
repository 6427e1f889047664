#pragma once

#include "core/game_state.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agents {

// A player seat. Agents only ever see read-only snapshots; every mutation
// goes through the engine.
class Agent {
public:
    explicit Agent(std::string name) : name_(std::move(name)) {}
    virtual ~Agent() = default;

    // Must return one of legal_actions (catalog indices)
    virtual int select_action(const core::GameState& state,
                              const std::vector<int>& legal_actions,
                              core::Player player) = 0;

    virtual void on_game_start(core::Player /*player*/, uint64_t /*seed*/) {}
    virtual void on_game_end(const core::GameState& /*final_state*/,
                             std::optional<core::Player> /*winner*/) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace agents
