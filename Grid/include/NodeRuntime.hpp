#pragma once
#include <functional>
#include <vector>
#include "Subsystem.hpp"
#include "TickContext.hpp"

class LocalController;
class PlantSimulator;

// Drives the subsystems of one node at a fixed tick and writes one
// summary row per tick.
class NodeRuntime {
public:
    using TickHook = std::function<void(const TickContext&)>;

    void addSubsystem(Subsystem* subsystem);
    void initialize();
    void tick();
    void setTickStep(double dt);
    void shutdown();

    // Runs after every subsystem has ticked (slow-cadence kick, events).
    void setAfterTick(TickHook hook);

    int tickCount() const { return tick_count_; }
    double time() const { return sim_time_; }

private:
    std::vector<Subsystem*> subsystems_;
    TickHook after_tick_;

    LocalController* controller_ = nullptr;
    PlantSimulator*  plant_      = nullptr;

    int    tick_count_ = 0;
    double sim_time_   = 0.0;
    double tick_step_  = 1.0;   // seconds per control cycle

    void logRow_(int tick, double time);
};
