// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Arithmetic specialised for spike tensors.
//
// The forward passes exploit that `spike` holds only 0 and 1 (a multiply
// becomes a mask, a reset becomes a masked fill); the backward passes are
// those of the general formulas, so gradients match the unfused arithmetic.
// On CUDA tensors of matching shape the work runs in the spike kernels.
//
// Passing a non-binary `spike` gives wrong forward values. Callers only use
// these functions when the spike comes from a surrogate in spiking mode.

#ifndef SPIKEGRAD_CLOCK_DRIVEN_ACCELERATING_H
#define SPIKEGRAD_CLOCK_DRIVEN_ACCELERATING_H

#include <torch/torch.h>

namespace spikegrad {
namespace accelerating {

// x * spike. With spike_mul_spike both operands are spikes and the forward
// is a logical AND.
torch::Tensor mul(const torch::Tensor& x, const torch::Tensor& spike, bool spike_mul_spike = false);

// v * (1 - spike) + v_reset * spike
torch::Tensor hard_voltage_transform(const torch::Tensor& v, const torch::Tensor& spike, double v_reset);

// v - spike * v_threshold
torch::Tensor soft_voltage_transform(const torch::Tensor& v, const torch::Tensor& spike, double v_threshold);

// True when every element of t is exactly 0 or 1.
bool is_spike(const torch::Tensor& t);

}  // namespace accelerating
}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_ACCELERATING_H
