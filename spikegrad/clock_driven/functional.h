// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Operations over a whole network of clock-driven modules.

#ifndef SPIKEGRAD_CLOCK_DRIVEN_FUNCTIONAL_H
#define SPIKEGRAD_CLOCK_DRIVEN_FUNCTIONAL_H

#include <torch/torch.h>

namespace spikegrad {
namespace functional {

// Calls reset() on `net` and every stateful submodule. Returns how many
// modules were reset.
int64_t reset_net(torch::nn::Module& net);

// Turns monitoring on or off for `net` and every submodule that supports it.
// Returns how many modules were switched.
int64_t set_monitor(torch::nn::Module& net, bool enabled);

}  // namespace functional
}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_FUNCTIONAL_H
