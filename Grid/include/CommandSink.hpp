#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "GridTypes.hpp"

// One actuation command for the physical layer.
struct Command {
    CommandKind kind        = CommandKind::StorageDispatch;
    std::string target;             // tier id, load id, peer id, or "grid_tie"
    double      setpoint_kw = 0.0;
    int         plan_id     = -1;

    bool sameEffect(const Command& o) const {
        return kind == o.kind && target == o.target &&
               setpoint_kw == o.setpoint_kw && plan_id == o.plan_id;
    }
};

// Receives commands from the control cycle. Implementations must be
// idempotent: re-issuing a command already in effect changes nothing and
// returns false.
class CommandSink {
public:
    virtual ~CommandSink() = default;
    virtual bool apply(const Command& cmd) = 0;
};

// Keeps the last command per (kind, target) and logs the ones that took
// effect. Used where no plant is attached and by tests.
class RecordingCommandSink : public CommandSink {
public:
    explicit RecordingCommandSink(std::string log_name = "Commands");

    bool apply(const Command& cmd) override;

    const std::vector<Command>& applied() const { return applied_; }
    std::size_t duplicates() const { return duplicates_; }
    bool breakerOpen() const { return breaker_open_; }

    void setTick(int tick, double time) { tick_ = tick; time_ = time; }

private:
    std::string log_name_;
    std::map<std::pair<int, std::string>, Command> in_effect_;
    std::vector<Command> applied_;
    std::size_t duplicates_ = 0;
    bool breaker_open_ = false;
    int tick_ = 0;
    double time_ = 0.0;
};
