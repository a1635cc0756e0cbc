// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include "spikegrad/clock_driven/accelerating.h"

#include <ATen/ExpandUtils.h>

#include "spikegrad/cuda/pytorch/spike_kernels.h"

namespace spikegrad {
namespace accelerating {

namespace {

using torch::Tensor;
using torch::autograd::AutogradContext;
using torch::autograd::tensor_list;

// Reduces a broadcast gradient back to the shape of the input it belongs to.
Tensor reduce_to(const Tensor& grad, const Tensor& like) {
    if (grad.sizes() == like.sizes()) {
        return grad;
    }
    return at::sum_to(grad, like.sizes());
}

class SpikeMul : public torch::autograd::Function<SpikeMul> {
public:
    static Tensor forward(
        AutogradContext* ctx,
        const Tensor& x,
        const Tensor& spike,
        bool spike_mul_spike) {

        ctx->save_for_backward({x, spike});
        if (cuda::can_fuse({x, spike})) {
            return cuda::spike_mul_forward(x, spike, spike_mul_spike);
        }
        if (spike_mul_spike) {
            return torch::logical_and(x, spike).to(x.scalar_type());
        }
        return torch::where(spike != 0, x, torch::zeros_like(x));
    }

    static tensor_list backward(AutogradContext* ctx, tensor_list grad_outputs) {
        auto saved = ctx->get_saved_variables();
        const Tensor& x = saved[0];
        const Tensor& spike = saved[1];
        const Tensor& grad_out = grad_outputs[0];

        if (cuda::can_fuse({x, spike, grad_out})) {
            auto grads = cuda::spike_mul_backward(x, spike, grad_out);
            return {grads[0], grads[1], Tensor()};
        }
        return {
            reduce_to(grad_out * spike, x),
            reduce_to(grad_out * x, spike),
            Tensor()};
    }
};

class HardVoltageTransform : public torch::autograd::Function<HardVoltageTransform> {
public:
    static Tensor forward(
        AutogradContext* ctx,
        const Tensor& v,
        const Tensor& spike,
        double v_reset) {

        ctx->save_for_backward({v, spike});
        ctx->saved_data["v_reset"] = v_reset;
        if (cuda::can_fuse({v, spike})) {
            return cuda::hard_voltage_transform_forward(v, spike, v_reset);
        }
        return torch::where(spike != 0, torch::full_like(v, v_reset), v);
    }

    static tensor_list backward(AutogradContext* ctx, tensor_list grad_outputs) {
        auto saved = ctx->get_saved_variables();
        const Tensor& v = saved[0];
        const Tensor& spike = saved[1];
        const Tensor& grad_v_next = grad_outputs[0];
        const double v_reset = ctx->saved_data["v_reset"].toDouble();

        if (cuda::can_fuse({v, spike, grad_v_next})) {
            auto grads = cuda::hard_voltage_transform_backward(v, spike, grad_v_next, v_reset);
            return {grads[0], grads[1], Tensor()};
        }
        return {
            reduce_to(grad_v_next * (1 - spike), v),
            reduce_to(grad_v_next * (v_reset - v), spike),
            Tensor()};
    }
};

class SoftVoltageTransform : public torch::autograd::Function<SoftVoltageTransform> {
public:
    static Tensor forward(
        AutogradContext* ctx,
        const Tensor& v,
        const Tensor& spike,
        double v_threshold) {

        ctx->save_for_backward({v, spike});
        ctx->saved_data["v_threshold"] = v_threshold;
        if (cuda::can_fuse({v, spike})) {
            return cuda::soft_voltage_transform_forward(v, spike, v_threshold);
        }
        return torch::where(spike != 0, v - v_threshold, v);
    }

    static tensor_list backward(AutogradContext* ctx, tensor_list grad_outputs) {
        auto saved = ctx->get_saved_variables();
        const Tensor& v = saved[0];
        const Tensor& spike = saved[1];
        const Tensor& grad_v_next = grad_outputs[0];
        const double v_threshold = ctx->saved_data["v_threshold"].toDouble();

        Tensor grad_spike;
        if (cuda::can_fuse({spike, grad_v_next})) {
            grad_spike = cuda::soft_voltage_transform_backward(grad_v_next, v_threshold);
        } else {
            grad_spike = reduce_to(-v_threshold * grad_v_next, spike);
        }
        return {reduce_to(grad_v_next, v), grad_spike, Tensor()};
    }
};

}  // anonymous namespace

Tensor mul(const Tensor& x, const Tensor& spike, bool spike_mul_spike) {
    return SpikeMul::apply(x, spike, spike_mul_spike);
}

Tensor hard_voltage_transform(const Tensor& v, const Tensor& spike, double v_reset) {
    return HardVoltageTransform::apply(v, spike, v_reset);
}

Tensor soft_voltage_transform(const Tensor& v, const Tensor& spike, double v_threshold) {
    return SoftVoltageTransform::apply(v, spike, v_threshold);
}

bool is_spike(const Tensor& t) {
    torch::NoGradGuard no_grad;
    return torch::logical_or(t == 0, t == 1).all().item<bool>();
}

}  // namespace accelerating
}  // namespace spikegrad
