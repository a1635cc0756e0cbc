// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// ATen glue for the spike kernels.

#include "spikegrad/cuda/pytorch/spike_kernels.h"

#include <ATen/cuda/CUDAContext.h>
#include <c10/cuda/CUDAException.h>
#include <c10/cuda/CUDAGuard.h>
#include <limits>
#include <vector>

#include "spikegrad/spike_kernels.h"
#include "support.h"

namespace spikegrad {
namespace cuda {

namespace {

using torch::Tensor;
namespace kernels = ::spikegrad::v0::spike_kernels;

int checked_size(const Tensor& t) {
    TORCH_CHECK(t.numel() <= std::numeric_limits<int>::max(),
                "spike kernels support at most INT_MAX elements, got ", t.numel());
    return static_cast<int>(t.numel());
}

bool supported_dtype(at::ScalarType type) {
    return type == at::ScalarType::Float ||
           type == at::ScalarType::Double ||
           type == at::ScalarType::Half;
}

}  // anonymous namespace

bool can_fuse(std::initializer_list<Tensor> tensors) {
    const Tensor* first = nullptr;
    for (const Tensor& t : tensors) {
        if (!t.defined() || !t.is_cuda() || !supported_dtype(t.scalar_type())) {
            return false;
        }
        if (first == nullptr) {
            first = &t;
            continue;
        }
        if (t.sizes() != first->sizes() ||
            t.scalar_type() != first->scalar_type() ||
            t.device() != first->device()) {
            return false;
        }
    }
    return first != nullptr;
}

// =============================================================================
// Surrogate spike
// =============================================================================

Tensor surrogate_spike_forward(const Tensor& x_in) {
    Tensor x = x_in.contiguous();
    CHECK_INPUT(x);

    const auto options = x.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor spike = torch::empty_like(x);
    const int size = checked_size(x);

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(x.scalar_type(), "surrogate_spike_forward", ([&] {
        using namespace kernels;
        SurrogateSpikeForward<typename native_type<scalar_t>::T> forward(
            size,
            at::cuda::getCurrentCUDAStream());

        forward.Run(
            ptr<scalar_t>(x),
            ptr<scalar_t>(spike));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return spike;
}

Tensor surrogate_spike_backward(
    const Tensor& x_in,
    const Tensor& grad_in,
    int64_t kind,
    double p0,
    double p1,
    double p2) {

    Tensor x = x_in.contiguous();
    Tensor grad_spike = grad_in.contiguous();
    CHECK_INPUT(x);
    CHECK_INPUT(grad_spike);
    CHECK_SAME_SIZE(x, grad_spike);

    const auto options = x.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor grad_x = torch::empty_like(x);
    const int size = checked_size(x);
    const kernels::SurrogateParams params{
        static_cast<int>(kind),
        p0,
        p1,
        p2};

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(x.scalar_type(), "surrogate_spike_backward", ([&] {
        using namespace kernels;
        SurrogateSpikeBackward<typename native_type<scalar_t>::T> backward(
            size,
            params,
            at::cuda::getCurrentCUDAStream());

        backward.Run(
            ptr<scalar_t>(x),
            ptr<scalar_t>(grad_spike),
            ptr<scalar_t>(grad_x));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return grad_x;
}

// =============================================================================
// Hard voltage transform
// =============================================================================

Tensor hard_voltage_transform_forward(
    const Tensor& v_in,
    const Tensor& spike_in,
    double v_reset) {

    Tensor v = v_in.contiguous();
    Tensor spike = spike_in.contiguous();
    CHECK_INPUT(v);
    CHECK_INPUT(spike);
    CHECK_SAME_SIZE(v, spike);

    const auto options = v.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor v_next = torch::empty_like(v);
    const int size = checked_size(v);

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(v.scalar_type(), "hard_voltage_transform_forward", ([&] {
        using namespace kernels;
        HardVoltageTransformForward<typename native_type<scalar_t>::T> forward(
            size,
            v_reset,
            at::cuda::getCurrentCUDAStream());

        forward.Run(
            ptr<scalar_t>(v),
            ptr<scalar_t>(spike),
            ptr<scalar_t>(v_next));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return v_next;
}

std::vector<Tensor> hard_voltage_transform_backward(
    const Tensor& v_in,
    const Tensor& spike_in,
    const Tensor& grad_in,
    double v_reset) {

    Tensor v = v_in.contiguous();
    Tensor spike = spike_in.contiguous();
    Tensor grad_v_next = grad_in.contiguous();
    CHECK_INPUT(v);
    CHECK_INPUT(spike);
    CHECK_INPUT(grad_v_next);
    CHECK_SAME_SIZE(v, spike);
    CHECK_SAME_SIZE(v, grad_v_next);

    const auto options = v.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor grad_v = torch::empty_like(v);
    Tensor grad_spike = torch::empty_like(v);
    const int size = checked_size(v);

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(v.scalar_type(), "hard_voltage_transform_backward", ([&] {
        using namespace kernels;
        HardVoltageTransformBackward<typename native_type<scalar_t>::T> backward(
            size,
            v_reset,
            at::cuda::getCurrentCUDAStream());

        backward.Run(
            ptr<scalar_t>(v),
            ptr<scalar_t>(spike),
            ptr<scalar_t>(grad_v_next),
            ptr<scalar_t>(grad_v),
            ptr<scalar_t>(grad_spike));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return {grad_v, grad_spike};
}

// =============================================================================
// Soft voltage transform
// =============================================================================

Tensor soft_voltage_transform_forward(
    const Tensor& v_in,
    const Tensor& spike_in,
    double v_threshold) {

    Tensor v = v_in.contiguous();
    Tensor spike = spike_in.contiguous();
    CHECK_INPUT(v);
    CHECK_INPUT(spike);
    CHECK_SAME_SIZE(v, spike);

    const auto options = v.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor v_next = torch::empty_like(v);
    const int size = checked_size(v);

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(v.scalar_type(), "soft_voltage_transform_forward", ([&] {
        using namespace kernels;
        SoftVoltageTransformForward<typename native_type<scalar_t>::T> forward(
            size,
            v_threshold,
            at::cuda::getCurrentCUDAStream());

        forward.Run(
            ptr<scalar_t>(v),
            ptr<scalar_t>(spike),
            ptr<scalar_t>(v_next));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return v_next;
}

Tensor soft_voltage_transform_backward(
    const Tensor& grad_in,
    double v_threshold) {

    Tensor grad_v_next = grad_in.contiguous();
    CHECK_INPUT(grad_v_next);

    const auto options = grad_v_next.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor grad_spike = torch::empty_like(grad_v_next);
    const int size = checked_size(grad_v_next);

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(grad_v_next.scalar_type(), "soft_voltage_transform_backward", ([&] {
        using namespace kernels;
        SoftVoltageTransformBackward<typename native_type<scalar_t>::T> backward(
            size,
            v_threshold,
            at::cuda::getCurrentCUDAStream());

        backward.Run(
            ptr<scalar_t>(grad_v_next),
            ptr<scalar_t>(grad_spike));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return grad_spike;
}

// =============================================================================
// Spike multiply
// =============================================================================

Tensor spike_mul_forward(
    const Tensor& x_in,
    const Tensor& spike_in,
    bool spike_mul_spike) {

    Tensor x = x_in.contiguous();
    Tensor spike = spike_in.contiguous();
    CHECK_INPUT(x);
    CHECK_INPUT(spike);
    CHECK_SAME_SIZE(x, spike);

    const auto options = x.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor out = torch::empty_like(x);
    const int size = checked_size(x);

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(x.scalar_type(), "spike_mul_forward", ([&] {
        using namespace kernels;
        SpikeMulForward<typename native_type<scalar_t>::T> forward(
            size,
            spike_mul_spike,
            at::cuda::getCurrentCUDAStream());

        forward.Run(
            ptr<scalar_t>(x),
            ptr<scalar_t>(spike),
            ptr<scalar_t>(out));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return out;
}

std::vector<Tensor> spike_mul_backward(
    const Tensor& x_in,
    const Tensor& spike_in,
    const Tensor& grad_in) {

    Tensor x = x_in.contiguous();
    Tensor spike = spike_in.contiguous();
    Tensor grad_out = grad_in.contiguous();
    CHECK_INPUT(x);
    CHECK_INPUT(spike);
    CHECK_INPUT(grad_out);
    CHECK_SAME_SIZE(x, spike);
    CHECK_SAME_SIZE(x, grad_out);

    const auto options = x.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor grad_x = torch::empty_like(x);
    Tensor grad_spike = torch::empty_like(x);
    const int size = checked_size(x);

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(x.scalar_type(), "spike_mul_backward", ([&] {
        using namespace kernels;
        SpikeMulBackward<typename native_type<scalar_t>::T> backward(
            size,
            at::cuda::getCurrentCUDAStream());

        backward.Run(
            ptr<scalar_t>(x),
            ptr<scalar_t>(spike),
            ptr<scalar_t>(grad_out),
            ptr<scalar_t>(grad_x),
            ptr<scalar_t>(grad_spike));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return {grad_x, grad_spike};
}

// =============================================================================
// Spiking LSTM inference
// =============================================================================

std::vector<Tensor> spiking_lstm_inference(
    const Tensor& x_in,
    const Tensor& h0_in,
    const Tensor& c0_in,
    const Tensor& w_ih_in,
    const Tensor& w_hh_in,
    const Tensor& b_ih_in,
    const Tensor& b_hh_in,
    double v_threshold) {

    TORCH_CHECK(x_in.dim() == 3, "x must be [T, B, input_size], got ", x_in.sizes());

    const auto time_steps = x_in.size(0);
    const auto batch_size = x_in.size(1);
    const auto input_size = x_in.size(2);
    const auto hidden_size = w_hh_in.size(1);

    Tensor x = x_in.contiguous();
    Tensor h0 = h0_in.contiguous();
    Tensor c0 = c0_in.contiguous();
    Tensor w_ih = w_ih_in.contiguous();
    Tensor w_hh = w_hh_in.contiguous();
    Tensor b_ih = b_ih_in.defined() ? b_ih_in.contiguous() : b_ih_in;
    Tensor b_hh = b_hh_in.defined() ? b_hh_in.contiguous() : b_hh_in;

    CHECK_INPUT(x);
    CHECK_INPUT(h0);
    CHECK_INPUT(c0);
    CHECK_INPUT(w_ih);
    CHECK_INPUT(w_hh);
    TORCH_CHECK(w_ih.size(0) == 4 * hidden_size && w_ih.size(1) == input_size,
                "w_ih must be [4*hidden_size, input_size], got ", w_ih.sizes());
    TORCH_CHECK(h0.sizes() == torch::IntArrayRef({batch_size, hidden_size}),
                "h0 must be [batch_size, hidden_size], got ", h0.sizes());
    CHECK_SAME_SIZE(h0, c0);

    const auto options = x.options();
    const at::cuda::CUDAGuard guard(options.device_index());

    Tensor h = torch::empty({time_steps + 1, batch_size, hidden_size}, options);
    Tensor c = torch::empty({time_steps + 1, batch_size, hidden_size}, options);
    Tensor workspace = torch::empty({(time_steps + 1) * batch_size * 4 * hidden_size}, options);

    h[0] = h0;
    c[0] = c0;

    AT_DISPATCH_FLOATING_TYPES_AND_HALF(x.scalar_type(), "spiking_lstm_inference", ([&] {
        using namespace kernels;
        SpikingLSTMInference<typename native_type<scalar_t>::T> inference(
            batch_size, input_size, hidden_size,
            v_threshold,
            at::cuda::getCurrentCUDABlasHandle(),
            at::cuda::getCurrentCUDAStream());

        inference.Run(
            time_steps,
            ptr<scalar_t>(w_ih),
            ptr<scalar_t>(w_hh),
            ptr_or_null<scalar_t>(b_ih),
            ptr_or_null<scalar_t>(b_hh),
            ptr<scalar_t>(x),
            ptr<scalar_t>(h),
            ptr<scalar_t>(c),
            ptr<scalar_t>(workspace));
    }));
    C10_CUDA_KERNEL_LAUNCH_CHECK();

    return {h, c};
}

}  // namespace cuda
}  // namespace spikegrad
