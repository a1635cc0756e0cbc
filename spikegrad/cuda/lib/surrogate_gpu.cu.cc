// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Surrogate Spike CUDA Kernels
//
// Forward:  spike = H(x), with H(0) = 1
// Backward: grad_x = grad_spike * g'(x)
//
// The forward is the exact Heaviside step for every surrogate kind; only the
// backward depends on the kind, so the kind is a runtime argument rather than
// a template parameter.

#include <cuda.h>
#include <cuda_runtime.h>
#include <cuda_fp16.h>
#include <cstdio>

#include "spikegrad/spike_kernels.h"
#include "inline_ops.h"

namespace {

using spikegrad::v0::spike_kernels::SurrogateParams;

template<typename T>
__global__ void HeavisideKernel(
    const int size,
    const T* __restrict__ x,
    T* __restrict__ spike) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        spike[idx] = static_cast<T>(heaviside(static_cast<A>(x[idx])));
    }
}

template<typename T>
__global__ void SurrogateGradKernel(
    const int size,
    const SurrogateParams params,
    const T* __restrict__ x,
    const T* __restrict__ grad_spike,
    T* __restrict__ grad_x) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    if (idx < size) {
        using A = typename acc_type<T>::type;
        const A g = static_cast<A>(grad_spike[idx]);
        grad_x[idx] = static_cast<T>(g * surrogate_grad(params, static_cast<A>(x[idx])));
    }
}

}  // anonymous namespace


namespace spikegrad {
namespace v0 {
namespace spike_kernels {

template<typename T>
SurrogateSpikeForward<T>::SurrogateSpikeForward(
    int size,
    const cudaStream_t& stream)
    : size_(size),
      stream_(stream) {}

template<typename T>
void SurrogateSpikeForward<T>::Run(
    const T* x,
    T* spike) {

    if (size_ == 0) {
        return;
    }
    const int block_size = 256;
    const int num_blocks = (size_ + block_size - 1) / block_size;

    HeavisideKernel<T><<<num_blocks, block_size, 0, stream_>>>(size_, x, spike);
}

template<typename T>
SurrogateSpikeBackward<T>::SurrogateSpikeBackward(
    int size,
    const SurrogateParams& params,
    const cudaStream_t& stream)
    : size_(size),
      params_(params),
      stream_(stream) {}

template<typename T>
void SurrogateSpikeBackward<T>::Run(
    const T* x,
    const T* grad_spike,
    T* grad_x) {

    if (size_ == 0) {
        return;
    }
    if (params_.kind < kSigmoid || params_.kind > kATan) {
        fprintf(stderr, "SurrogateSpikeBackward: unsupported surrogate kind=%d\n", params_.kind);
        return;
    }
    const int block_size = 256;
    const int num_blocks = (size_ + block_size - 1) / block_size;

    SurrogateGradKernel<T><<<num_blocks, block_size, 0, stream_>>>(
        size_, params_, x, grad_spike, grad_x);
}

template struct SurrogateSpikeForward<__half>;
template struct SurrogateSpikeForward<float>;
template struct SurrogateSpikeForward<double>;

template struct SurrogateSpikeBackward<__half>;
template struct SurrogateSpikeBackward<float>;
template struct SurrogateSpikeBackward<double>;

}  // namespace spike_kernels
}  // namespace v0
}  // namespace spikegrad
