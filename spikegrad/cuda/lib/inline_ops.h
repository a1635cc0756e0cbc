// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Device-side helpers shared by the spike kernels.

#pragma once

#include <cuda_fp16.h>

#include "spikegrad/spike_kernels.h"

// Arithmetic type used inside kernels. Half precision is widened to float.
template<typename T>
struct acc_type {
    using type = T;
};

template<>
struct acc_type<__half> {
    using type = float;
};

template<typename A>
__device__ __forceinline__ A heaviside(const A x) {
    return x >= static_cast<A>(0) ? static_cast<A>(1) : static_cast<A>(0);
}

template<typename A>
__device__ __forceinline__ A sigmoid(const A x) {
    return static_cast<A>(1) / (static_cast<A>(1) + exp(-x));
}

// Surrogate derivative g'(x) for each SurrogateKind.
template<typename A>
__device__ __forceinline__ A surrogate_grad(
    const spikegrad::v0::spike_kernels::SurrogateParams& p,
    const A x) {
    using namespace spikegrad::v0::spike_kernels;
    const A one = static_cast<A>(1);
    const A pi = static_cast<A>(3.14159265358979323846);

    switch (p.kind) {
    case kSigmoid: {
        const A alpha = static_cast<A>(p.p0);
        const A s = sigmoid(alpha * x);
        return alpha * s * (one - s);
    }
    case kBilinearLeakyReLU: {
        const A c = static_cast<A>(p.p2);
        return (x < -c || x > c) ? static_cast<A>(p.p1) : static_cast<A>(p.p0);
    }
    case kSignSwish: {
        const A beta = static_cast<A>(p.p0);
        const A bx = beta * x;
        return beta * (static_cast<A>(2) - bx * tanh(bx / static_cast<A>(2))) / (one + cosh(bx));
    }
    case kErf: {
        const A alpha = static_cast<A>(p.p0);
        return alpha / sqrt(pi) * exp(-(alpha * x) * (alpha * x));
    }
    case kATan: {
        const A alpha = static_cast<A>(p.p0);
        const A z = pi / static_cast<A>(2) * alpha * x;
        return alpha / static_cast<A>(2) / (one + z * z);
    }
    default:
        return static_cast<A>(0);
    }
}
