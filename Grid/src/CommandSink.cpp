#include "CommandSink.hpp"
#include "Logger.hpp"

RecordingCommandSink::RecordingCommandSink(std::string log_name)
    : log_name_(std::move(log_name)) {}

bool RecordingCommandSink::apply(const Command& cmd) {
    // Breaker commands act on breaker position, not on the issuing plan.
    if (cmd.kind == CommandKind::BreakerOpen || cmd.kind == CommandKind::GridTieClose) {
        const bool want_open = cmd.kind == CommandKind::BreakerOpen;
        if (breaker_open_ == want_open) {
            ++duplicates_;
            return false;
        }
        breaker_open_ = want_open;
    } else {
        const auto key = std::make_pair(static_cast<int>(cmd.kind), cmd.target);
        auto it = in_effect_.find(key);
        if (it != in_effect_.end() && it->second.sameEffect(cmd)) {
            ++duplicates_;
            return false;
        }
        in_effect_[key] = cmd;
    }

    applied_.push_back(cmd);
    Logger::instance().log(
        log_name_, tick_, time_,
        {{std::string(toString(cmd.kind)) + ":" + cmd.target, cmd.setpoint_kw}}
    );
    return true;
}
