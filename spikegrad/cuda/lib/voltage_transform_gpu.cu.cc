// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Voltage Transform and Spike Multiply CUDA Kernels
//
// These replace the general element-wise arithmetic after a spike step when
// the spike tensor is known to be exactly 0/1:
//
// Hard reset:  v' = s ? v_reset : v
// Soft reset:  v' = s ? v - v_th : v
// Spike mul:   out = s ? x : 0            (or x && s when both are spikes)
//
// Backward passes keep the formulas of the general arithmetic so gradients
// are identical to the unfused path.

#include <cuda.h>
#include <cuda_runtime.h>
#include <cuda_fp16.h>
#include <cstdio>

#include "spikegrad/spike_kernels.h"
#include "inline_ops.h"

namespace {

// =============================================================================
// Hard reset
// =============================================================================

template<typename T>
__global__ void HardVoltageForwardKernel(
    const int size,
    const double v_reset,
    const T* __restrict__ v,
    const T* __restrict__ spike,
    T* __restrict__ v_next) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        const A s = static_cast<A>(spike[idx]);
        v_next[idx] = s != static_cast<A>(0) ? static_cast<T>(static_cast<A>(v_reset)) : v[idx];
    }
}

// grad_v = grad * (1 - s)
// grad_s = grad * (v_reset - v)
template<typename T>
__global__ void HardVoltageBackwardKernel(
    const int size,
    const double v_reset,
    const T* __restrict__ v,
    const T* __restrict__ spike,
    const T* __restrict__ grad_v_next,
    T* __restrict__ grad_v,
    T* __restrict__ grad_spike) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        const A g = static_cast<A>(grad_v_next[idx]);
        const A s = static_cast<A>(spike[idx]);
        const A v_val = static_cast<A>(v[idx]);
        if (grad_v) grad_v[idx] = static_cast<T>(g * (static_cast<A>(1) - s));
        if (grad_spike) grad_spike[idx] = static_cast<T>(g * (static_cast<A>(v_reset) - v_val));
    }
}

// =============================================================================
// Soft reset
// =============================================================================

template<typename T>
__global__ void SoftVoltageForwardKernel(
    const int size,
    const double v_threshold,
    const T* __restrict__ v,
    const T* __restrict__ spike,
    T* __restrict__ v_next) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        const A s = static_cast<A>(spike[idx]);
        const A v_val = static_cast<A>(v[idx]);
        v_next[idx] = s != static_cast<A>(0)
            ? static_cast<T>(v_val - static_cast<A>(v_threshold))
            : v[idx];
    }
}

template<typename T>
__global__ void SoftVoltageBackwardKernel(
    const int size,
    const double v_threshold,
    const T* __restrict__ grad_v_next,
    T* __restrict__ grad_spike) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        grad_spike[idx] = static_cast<T>(-static_cast<A>(v_threshold) * static_cast<A>(grad_v_next[idx]));
    }
}

// =============================================================================
// Spike multiply
// =============================================================================

template<typename T>
__global__ void SpikeMulForwardKernel(
    const int size,
    const bool spike_mul_spike,
    const T* __restrict__ x,
    const T* __restrict__ spike,
    T* __restrict__ out) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        const A zero = static_cast<A>(0);
        const bool fired = static_cast<A>(spike[idx]) != zero;
        if (spike_mul_spike) {
            const bool x_fired = static_cast<A>(x[idx]) != zero;
            out[idx] = static_cast<T>((fired && x_fired) ? static_cast<A>(1) : zero);
        } else {
            out[idx] = fired ? x[idx] : static_cast<T>(zero);
        }
    }
}

// grad_x = grad * s
// grad_s = grad * x
template<typename T>
__global__ void SpikeMulBackwardKernel(
    const int size,
    const T* __restrict__ x,
    const T* __restrict__ spike,
    const T* __restrict__ grad_out,
    T* __restrict__ grad_x,
    T* __restrict__ grad_spike) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        const A g = static_cast<A>(grad_out[idx]);
        if (grad_x) {
            const bool fired = static_cast<A>(spike[idx]) != static_cast<A>(0);
            grad_x[idx] = fired ? grad_out[idx] : static_cast<T>(static_cast<A>(0));
        }
        if (grad_spike) grad_spike[idx] = static_cast<T>(g * static_cast<A>(x[idx]));
    }
}

inline int num_blocks_for(int size, int block_size) {
    return (size + block_size - 1) / block_size;
}

}  // anonymous namespace


namespace spikegrad {
namespace v0 {
namespace spike_kernels {

// =============================================================================
// Hard reset
// =============================================================================

template<typename T>
HardVoltageTransformForward<T>::HardVoltageTransformForward(
    int size,
    double v_reset,
    const cudaStream_t& stream)
    : size_(size),
      v_reset_(v_reset),
      stream_(stream) {}

template<typename T>
void HardVoltageTransformForward<T>::Run(
    const T* v,
    const T* spike,
    T* v_next) {

    if (size_ == 0) {
        return;
    }
    const int block_size = 256;
    HardVoltageForwardKernel<T><<<num_blocks_for(size_, block_size), block_size, 0, stream_>>>(
        size_, v_reset_, v, spike, v_next);
}

template<typename T>
HardVoltageTransformBackward<T>::HardVoltageTransformBackward(
    int size,
    double v_reset,
    const cudaStream_t& stream)
    : size_(size),
      v_reset_(v_reset),
      stream_(stream) {}

template<typename T>
void HardVoltageTransformBackward<T>::Run(
    const T* v,
    const T* spike,
    const T* grad_v_next,
    T* grad_v,
    T* grad_spike) {

    if (size_ == 0 || (!grad_v && !grad_spike)) {
        return;
    }
    const int block_size = 256;
    HardVoltageBackwardKernel<T><<<num_blocks_for(size_, block_size), block_size, 0, stream_>>>(
        size_, v_reset_, v, spike, grad_v_next, grad_v, grad_spike);
}

// =============================================================================
// Soft reset
// =============================================================================

template<typename T>
SoftVoltageTransformForward<T>::SoftVoltageTransformForward(
    int size,
    double v_threshold,
    const cudaStream_t& stream)
    : size_(size),
      v_threshold_(v_threshold),
      stream_(stream) {}

template<typename T>
void SoftVoltageTransformForward<T>::Run(
    const T* v,
    const T* spike,
    T* v_next) {

    if (size_ == 0) {
        return;
    }
    const int block_size = 256;
    SoftVoltageForwardKernel<T><<<num_blocks_for(size_, block_size), block_size, 0, stream_>>>(
        size_, v_threshold_, v, spike, v_next);
}

template<typename T>
SoftVoltageTransformBackward<T>::SoftVoltageTransformBackward(
    int size,
    double v_threshold,
    const cudaStream_t& stream)
    : size_(size),
      v_threshold_(v_threshold),
      stream_(stream) {}

template<typename T>
void SoftVoltageTransformBackward<T>::Run(
    const T* grad_v_next,
    T* grad_spike) {

    if (size_ == 0) {
        return;
    }
    const int block_size = 256;
    SoftVoltageBackwardKernel<T><<<num_blocks_for(size_, block_size), block_size, 0, stream_>>>(
        size_, v_threshold_, grad_v_next, grad_spike);
}

// =============================================================================
// Spike multiply
// =============================================================================

template<typename T>
SpikeMulForward<T>::SpikeMulForward(
    int size,
    bool spike_mul_spike,
    const cudaStream_t& stream)
    : size_(size),
      spike_mul_spike_(spike_mul_spike),
      stream_(stream) {}

template<typename T>
void SpikeMulForward<T>::Run(
    const T* x,
    const T* spike,
    T* out) {

    if (size_ == 0) {
        return;
    }
    const int block_size = 256;
    SpikeMulForwardKernel<T><<<num_blocks_for(size_, block_size), block_size, 0, stream_>>>(
        size_, spike_mul_spike_, x, spike, out);
}

template<typename T>
SpikeMulBackward<T>::SpikeMulBackward(
    int size,
    const cudaStream_t& stream)
    : size_(size),
      stream_(stream) {}

template<typename T>
void SpikeMulBackward<T>::Run(
    const T* x,
    const T* spike,
    const T* grad_out,
    T* grad_x,
    T* grad_spike) {

    if (size_ == 0 || (!grad_x && !grad_spike)) {
        return;
    }
    const int block_size = 256;
    SpikeMulBackwardKernel<T><<<num_blocks_for(size_, block_size), block_size, 0, stream_>>>(
        size_, x, spike, grad_out, grad_x, grad_spike);
}

// Explicit template instantiations
template struct HardVoltageTransformForward<__half>;
template struct HardVoltageTransformForward<float>;
template struct HardVoltageTransformForward<double>;

template struct HardVoltageTransformBackward<__half>;
template struct HardVoltageTransformBackward<float>;
template struct HardVoltageTransformBackward<double>;

template struct SoftVoltageTransformForward<__half>;
template struct SoftVoltageTransformForward<float>;
template struct SoftVoltageTransformForward<double>;

template struct SoftVoltageTransformBackward<__half>;
template struct SoftVoltageTransformBackward<float>;
template struct SoftVoltageTransformBackward<double>;

template struct SpikeMulForward<__half>;
template struct SpikeMulForward<float>;
template struct SpikeMulForward<double>;

template struct SpikeMulBackward<__half>;
template struct SpikeMulBackward<float>;
template struct SpikeMulBackward<double>;

}  // namespace spike_kernels
}  // namespace v0
}  // namespace spikegrad
