// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Spike kernels for clock-driven spiking neurons.
//
// This header declares the CUDA paths behind the spike-aware autograd
// functions:
//
//   Surrogate spike     - Heaviside forward, analytic surrogate backward
//   Voltage transforms  - hard (snap to v_reset) and soft (subtract v_th) reset
//   Spike multiply      - x * spike where spike is exactly 0/1
//   Spiking LSTM        - inference over a whole sequence with binary gates
//
// All element-wise structs expect contiguous buffers of identical size.

#ifndef SPIKEGRAD_SPIKE_KERNELS_H
#define SPIKEGRAD_SPIKE_KERNELS_H

#include <cuda.h>
#include <cuda_runtime.h>
#include <cublas_v2.h>

namespace spikegrad {
namespace v0 {
namespace spike_kernels {

// Tag values mirror spikegrad::surrogate::Kind.
enum SurrogateKind : int {
    kSigmoid = 0,
    kBilinearLeakyReLU = 1,
    kSignSwish = 2,
    kErf = 3,
    kATan = 4,
};

// p0..p2 meaning per kind:
//   Sigmoid / Erf / ATan: p0 = alpha
//   SignSwish:            p0 = beta
//   BilinearLeakyReLU:    p0 = a, p1 = b, p2 = c
struct SurrogateParams {
    int kind;
    double p0;
    double p1;
    double p2;
};

// =============================================================================
// Surrogate spike
// spike = x >= 0
// grad_x = grad_spike * g'(x)
// =============================================================================

template<typename T>
struct SurrogateSpikeForward {
    SurrogateSpikeForward(
        int size,
        const cudaStream_t& stream);

    void Run(
        const T* x,
        T* spike);

private:
    int size_;
    cudaStream_t stream_;
};

template<typename T>
struct SurrogateSpikeBackward {
    SurrogateSpikeBackward(
        int size,
        const SurrogateParams& params,
        const cudaStream_t& stream);

    void Run(
        const T* x,
        const T* grad_spike,
        T* grad_x);

private:
    int size_;
    SurrogateParams params_;
    cudaStream_t stream_;
};

// =============================================================================
// Hard voltage transform
// v' = v * (1 - s) + v_reset * s
// =============================================================================

template<typename T>
struct HardVoltageTransformForward {
    HardVoltageTransformForward(
        int size,
        double v_reset,
        const cudaStream_t& stream);

    void Run(
        const T* v,
        const T* spike,
        T* v_next);

private:
    int size_;
    double v_reset_;
    cudaStream_t stream_;
};

template<typename T>
struct HardVoltageTransformBackward {
    HardVoltageTransformBackward(
        int size,
        double v_reset,
        const cudaStream_t& stream);

    void Run(
        const T* v,
        const T* spike,
        const T* grad_v_next,
        T* grad_v,          // grad_v_next * (1 - s)
        T* grad_spike);     // grad_v_next * (v_reset - v)

private:
    int size_;
    double v_reset_;
    cudaStream_t stream_;
};

// =============================================================================
// Soft voltage transform
// v' = v - s * v_threshold
// =============================================================================

template<typename T>
struct SoftVoltageTransformForward {
    SoftVoltageTransformForward(
        int size,
        double v_threshold,
        const cudaStream_t& stream);

    void Run(
        const T* v,
        const T* spike,
        T* v_next);

private:
    int size_;
    double v_threshold_;
    cudaStream_t stream_;
};

// grad_v is grad_v_next unchanged, so only grad_spike is produced here.
template<typename T>
struct SoftVoltageTransformBackward {
    SoftVoltageTransformBackward(
        int size,
        double v_threshold,
        const cudaStream_t& stream);

    void Run(
        const T* grad_v_next,
        T* grad_spike);

private:
    int size_;
    double v_threshold_;
    cudaStream_t stream_;
};

// =============================================================================
// Spike multiply
// out = x * s, s in {0, 1}
// =============================================================================

template<typename T>
struct SpikeMulForward {
    SpikeMulForward(
        int size,
        bool spike_mul_spike,
        const cudaStream_t& stream);

    void Run(
        const T* x,
        const T* spike,
        T* out);

private:
    int size_;
    bool spike_mul_spike_;
    cudaStream_t stream_;
};

template<typename T>
struct SpikeMulBackward {
    SpikeMulBackward(
        int size,
        const cudaStream_t& stream);

    void Run(
        const T* x,
        const T* spike,
        const T* grad_out,
        T* grad_x,          // may be nullptr
        T* grad_spike);     // may be nullptr

private:
    int size_;
    cudaStream_t stream_;
};

// =============================================================================
// Spiking LSTM inference
// [i; f; g; o] = H(W_ih @ x_t + b_ih + W_hh @ h_{t-1} + b_hh - v_threshold)
// c_t = f * c_{t-1} + i * g
// h_t = o * c_t
// =============================================================================

template<typename T>
struct SpikingLSTMInference {
    SpikingLSTMInference(
        int batch_size,
        int input_size,
        int hidden_size,
        double v_threshold,
        const cublasHandle_t& blas_handle,
        const cudaStream_t& stream);

    void Run(
        int steps,
        const T* W_ih,      // [4*H, I]
        const T* W_hh,      // [4*H, H]
        const T* b_ih,      // [4*H]
        const T* b_hh,      // [4*H]
        const T* x,         // [T, B, I]
        T* h,               // [T+1, B, H], h[0] is h_init
        T* c,               // [T+1, B, H], c[0] is c_init
        T* workspace);      // [T*B*4H + B*4H]

private:
    int batch_size_;
    int input_size_;
    int hidden_size_;
    double v_threshold_;
    cublasHandle_t blas_handle_;
    cudaStream_t stream_;
};

}  // namespace spike_kernels
}  // namespace v0
}  // namespace spikegrad

#endif  // SPIKEGRAD_SPIKE_KERNELS_H
