// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include "spikegrad/clock_driven/functional.h"

#include "spikegrad/clock_driven/stateful.h"

namespace spikegrad {
namespace functional {

namespace {

// `net` first, then its descendants in registration order.
template <typename Interface, typename Fn>
int64_t for_each(torch::nn::Module& net, Fn&& fn) {
    int64_t count = 0;
    if (auto* self = dynamic_cast<Interface*>(&net)) {
        fn(*self);
        ++count;
    }
    for (const auto& module : net.modules(/*include_self=*/false)) {
        if (auto* child = dynamic_cast<Interface*>(module.get())) {
            fn(*child);
            ++count;
        }
    }
    return count;
}

}  // anonymous namespace

int64_t reset_net(torch::nn::Module& net) {
    return for_each<StatefulModule>(net, [](StatefulModule& m) { m.reset(); });
}

int64_t set_monitor(torch::nn::Module& net, bool enabled) {
    return for_each<MonitoredModule>(net, [enabled](MonitoredModule& m) { m.set_monitor(enabled); });
}

}  // namespace functional
}  // namespace spikegrad
