#include "NodeRuntime.hpp"
#include "LocalController.hpp"
#include "Logger.hpp"
#include "PlantSimulator.hpp"

#include <string>
#include <utility>

void NodeRuntime::addSubsystem(Subsystem* subsystem) {
    subsystems_.push_back(subsystem);
}

void NodeRuntime::setAfterTick(TickHook hook) {
    after_tick_ = std::move(hook);
}

void NodeRuntime::initialize() {
    for (auto* s : subsystems_) {
        if (auto* c = dynamic_cast<LocalController*>(s)) controller_ = c;
        if (auto* p = dynamic_cast<PlantSimulator*>(s))  plant_      = p;
    }

    std::string names;
    for (auto* s : subsystems_) {
        s->initialize();
        names += (names.empty() ? "" : ", ") + s->name();
    }
    Logger::instance().message("[info] runtime: " + std::to_string(subsystems_.size()) +
                               " subsystem(s): " + names + "\n");

    logRow_(/*tick*/0, /*time*/0.0);

    tick_count_ = 1;
    sim_time_   = tick_step_;
}

void NodeRuntime::tick() {
    const TickContext ctx{ tick_count_, sim_time_, tick_step_ };

    for (auto* s : subsystems_) s->tick(ctx);
    if (after_tick_) after_tick_(ctx);

    logRow_(tick_count_, sim_time_);

    tick_count_ += 1;
    sim_time_   += tick_step_;
}

void NodeRuntime::setTickStep(double dt) {
    tick_step_ = dt;
}

void NodeRuntime::shutdown() {
    for (auto* s : subsystems_) s->shutdown();
}

void NodeRuntime::logRow_(int tick, double time) {
    double state     = 0.0;
    double residual  = 0.0;
    double cycle_ms  = 0.0;
    double emitted   = 0.0;
    double withheld  = 0.0;

    double grid_kw   = 0.0;
    double unserved  = 0.0;
    double breaker   = 0.0;

    if (controller_) {
        state    = stateCode(controller_->state());
        residual = controller_->lastPlan().residual_kw;
        cycle_ms = controller_->lastCycleMs();
        emitted  = static_cast<double>(controller_->emittedCommands());
        withheld = static_cast<double>(controller_->withheldCommands());
    }

    if (plant_) {
        grid_kw  = plant_->gridExchangeKw();
        unserved = plant_->unservedKw();
        breaker  = plant_->breakerOpen() ? 1.0 : 0.0;
    }

    Logger::instance().log_wide(
        "NodeRuntime",
        tick,
        time,
        {"state","residual_kw","cycle_ms","emitted","withheld",
         "grid_kw","unserved_kw","breaker_open"},
        {state, residual, cycle_ms, emitted, withheld,
         grid_kw, unserved, breaker}
    );
}
