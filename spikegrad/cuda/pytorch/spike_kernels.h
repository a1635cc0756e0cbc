// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// ATen entry points for the spike kernels. Every function expects CUDA
// tensors; callers route CPU tensors through plain ATen arithmetic instead.

#pragma once

#include <torch/torch.h>

#include <vector>

namespace spikegrad {
namespace cuda {

// True when `tensors` are all defined CUDA tensors of one supported dtype and
// one shape, i.e. when the element-wise kernels below can be used directly.
bool can_fuse(std::initializer_list<torch::Tensor> tensors);

torch::Tensor surrogate_spike_forward(const torch::Tensor& x);

torch::Tensor surrogate_spike_backward(
    const torch::Tensor& x,
    const torch::Tensor& grad_spike,
    int64_t kind,
    double p0,
    double p1,
    double p2);

torch::Tensor hard_voltage_transform_forward(
    const torch::Tensor& v,
    const torch::Tensor& spike,
    double v_reset);

// Returns {grad_v, grad_spike}.
std::vector<torch::Tensor> hard_voltage_transform_backward(
    const torch::Tensor& v,
    const torch::Tensor& spike,
    const torch::Tensor& grad_v_next,
    double v_reset);

torch::Tensor soft_voltage_transform_forward(
    const torch::Tensor& v,
    const torch::Tensor& spike,
    double v_threshold);

// Returns grad_spike; grad_v equals grad_v_next.
torch::Tensor soft_voltage_transform_backward(
    const torch::Tensor& grad_v_next,
    double v_threshold);

torch::Tensor spike_mul_forward(
    const torch::Tensor& x,
    const torch::Tensor& spike,
    bool spike_mul_spike);

// Returns {grad_x, grad_spike}.
std::vector<torch::Tensor> spike_mul_backward(
    const torch::Tensor& x,
    const torch::Tensor& spike,
    const torch::Tensor& grad_out);

// x: [T, B, I], h0/c0: [B, H]. b_ih/b_hh may be undefined.
// Returns {h, c}, each [T+1, B, H] with index 0 holding h0/c0.
std::vector<torch::Tensor> spiking_lstm_inference(
    const torch::Tensor& x,
    const torch::Tensor& h0,
    const torch::Tensor& c0,
    const torch::Tensor& w_ih,
    const torch::Tensor& w_hh,
    const torch::Tensor& b_ih,
    const torch::Tensor& b_hh,
    double v_threshold);

}  // namespace cuda
}  // namespace spikegrad
