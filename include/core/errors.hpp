#pragma once

#include <stdexcept>
#include <string>

namespace core {

// A caller broke the engine's contract: wrong phase, wrong actor, or a
// dogfight API used out of order. Never raised for bad action indices.
class ProtocolViolation : public std::logic_error {
public:
    explicit ProtocolViolation(const std::string& what) : std::logic_error(what) {}
};

class ActionIndexOutOfRange : public std::out_of_range {
public:
    explicit ActionIndexOutOfRange(int index)
        : std::out_of_range("action index out of range: " + std::to_string(index)),
          index_(index) {}

    int index() const noexcept { return index_; }

private:
    int index_;
};

} // namespace core
