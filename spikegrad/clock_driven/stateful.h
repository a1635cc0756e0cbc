// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Lifecycle contracts shared by every module that carries state across
// simulation steps.

#ifndef SPIKEGRAD_CLOCK_DRIVEN_STATEFUL_H
#define SPIKEGRAD_CLOCK_DRIVEN_STATEFUL_H

namespace spikegrad {

// A module whose output depends on previous calls. reset() must be called
// between independent simulation runs; state silently leaks into the next
// run otherwise.
class StatefulModule {
public:
    virtual ~StatefulModule() = default;

    // Restores the state the module had right after construction. Learned
    // parameters are kept.
    virtual void reset() = 0;
};

// A module that can record its internal state step by step.
class MonitoredModule {
public:
    virtual ~MonitoredModule() = default;

    // Enabling always starts from empty records.
    virtual void set_monitor(bool enabled) = 0;
};

}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_STATEFUL_H
