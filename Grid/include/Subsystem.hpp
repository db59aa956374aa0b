#pragma once
#include <string>
#include <utility>
#include "TickContext.hpp"

// Anything the node runtime advances once per control cycle. The name
// doubles as the CSV stream the subsystem writes to.
class Subsystem {
public:
    explicit Subsystem(std::string name) : name_(std::move(name)) {}
    virtual ~Subsystem() = default;

    virtual void initialize() = 0;
    // Called in registration order, once per cycle, with monotonic time.
    virtual void tick(const TickContext& ctx) = 0;
    virtual void shutdown() = 0;

    const std::string& name() const { return name_; }

protected:
    std::string name_;
};
