#pragma once

// Passed to every subsystem once per control cycle.
struct TickContext {
    int    tick_index = 0;   // cycle number, 1-based after initialize()
    double time       = 0.0; // node time (s)
    double dt         = 1.0; // cycle period (s)
};
