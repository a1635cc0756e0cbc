// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Spiking LSTM CUDA Kernel - inference over a full sequence
//
// Spiking LSTM Equations:
// [i; f; g; o] = H(W_ih @ x_t + b_ih + W_hh @ h_{t-1} + b_hh - v_th)
// c_t = f * c_{t-1} + i * g
// h_t = o * c_t
//
// H is the Heaviside step, so every gate is 0 or 1 and the cell update is a
// masked accumulation rather than a product.
//
// Optimization strategy:
// 1. Pre-compute W_ih @ x for all timesteps in one big GEMM (batch over time)
// 2. Per-timestep: W_hh @ h GEMM + fused gate/state kernel

#include <cuda.h>
#include <cuda_runtime.h>
#include <cuda_fp16.h>
#include <cublas_v2.h>

#include "spikegrad/spike_kernels.h"
#include "blas.h"
#include "inline_ops.h"

namespace {

// Inputs:
//   Wx: [B, 4*H] - pre-computed W_ih @ x for this timestep
//   Wh: [B, 4*H] - W_hh @ h_prev
//   b_ih, b_hh: [4*H] or nullptr
//   c_prev: [B, H]
template<typename T>
__global__ void SpikingLSTMGatesFused(
    const int batch_size,
    const int hidden_size,
    const double v_threshold,
    const T* __restrict__ Wx,
    const T* __restrict__ Wh,
    const T* __restrict__ b_ih,
    const T* __restrict__ b_hh,
    const T* __restrict__ c_prev,
    T* __restrict__ c_out,
    T* __restrict__ h_out) {

    const int idx = blockIdx.x * blockDim.x + threadIdx.x;
    const int total = batch_size * hidden_size;

    if (idx < total) {
        using A = typename acc_type<T>::type;
        const int b = idx / hidden_size;
        const int d = idx % hidden_size;
        const int H = hidden_size;
        const int row = b * 4 * H;

        A gate[4];
        #pragma unroll
        for (int k = 0; k < 4; ++k) {
            const int col = k * H + d;
            A pre = static_cast<A>(Wx[row + col]) + static_cast<A>(Wh[row + col]);
            if (b_ih) pre += static_cast<A>(b_ih[col]);
            if (b_hh) pre += static_cast<A>(b_hh[col]);
            gate[k] = heaviside(pre - static_cast<A>(v_threshold));
        }
        const A i_val = gate[0];
        const A f_val = gate[1];
        const A g_val = gate[2];
        const A o_val = gate[3];

        const A zero = static_cast<A>(0);
        const A c_p = static_cast<A>(c_prev[idx]);
        const A c_new = (f_val != zero ? c_p : zero) + ((i_val != zero && g_val != zero) ? static_cast<A>(1) : zero);
        const A h_new = o_val != zero ? c_new : zero;

        c_out[idx] = static_cast<T>(c_new);
        h_out[idx] = static_cast<T>(h_new);
    }
}

}  // anonymous namespace


namespace spikegrad {
namespace v0 {
namespace spike_kernels {

template<typename T>
SpikingLSTMInference<T>::SpikingLSTMInference(
    int batch_size,
    int input_size,
    int hidden_size,
    double v_threshold,
    const cublasHandle_t& blas_handle,
    const cudaStream_t& stream)
    : batch_size_(batch_size),
      input_size_(input_size),
      hidden_size_(hidden_size),
      v_threshold_(v_threshold),
      blas_handle_(blas_handle),
      stream_(stream) {}

template<typename T>
void SpikingLSTMInference<T>::Run(
    int steps,
    const T* W_ih,
    const T* W_hh,
    const T* b_ih,
    const T* b_hh,
    const T* x,
    T* h,
    T* c,
    T* workspace) {

    if (steps == 0 || batch_size_ == 0) {
        return;
    }

    // Set cuBLAS stream to match our kernel stream for proper synchronization
    cublasSetStream(blas_handle_, stream_);
    typename blas<T>::set_pointer_mode policy(blas_handle_);

    static const T alpha = static_cast<T>(1.0f);
    static const T beta_zero = static_cast<T>(0.0f);

    const int H4 = 4 * hidden_size_;
    const int BH = batch_size_ * hidden_size_;
    const int BH4 = batch_size_ * H4;
    const int block_size = 256;
    const int num_blocks = (BH + block_size - 1) / block_size;

    // Workspace layout:
    // Wx_all: [T, B, 4*H] - pre-computed W_ih @ x for all timesteps
    // Wh: [B, 4*H] - per-step W_hh @ h
    T* Wx_all = workspace;
    T* Wh = workspace + steps * BH4;

    // W_ih is [4*H, I], x is [T*B, I], result is [T*B, 4*H]
    blas<T>::gemm(
        blas_handle_,
        CUBLAS_OP_T, CUBLAS_OP_N,
        H4, steps * batch_size_, input_size_,
        &alpha,
        W_ih, input_size_,
        x, input_size_,
        &beta_zero,
        Wx_all, H4);

    for (int t = 0; t < steps; ++t) {
        const T* Wx_t = Wx_all + t * BH4;
        const T* h_prev = h + t * BH;
        const T* c_prev = c + t * BH;
        T* h_t = h + (t + 1) * BH;
        T* c_t = c + (t + 1) * BH;

        blas<T>::gemm(
            blas_handle_,
            CUBLAS_OP_T, CUBLAS_OP_N,
            H4, batch_size_, hidden_size_,
            &alpha,
            W_hh, hidden_size_,
            h_prev, hidden_size_,
            &beta_zero,
            Wh, H4);

        SpikingLSTMGatesFused<T><<<num_blocks, block_size, 0, stream_>>>(
            batch_size_, hidden_size_, v_threshold_,
            Wx_t, Wh, b_ih, b_hh, c_prev,
            c_t, h_t);
    }
}

// Explicit template instantiations
template struct SpikingLSTMInference<__half>;
template struct SpikingLSTMInference<float>;
template struct SpikingLSTMInference<double>;

}  // namespace spike_kernels
}  // namespace v0
}  // namespace spikegrad
