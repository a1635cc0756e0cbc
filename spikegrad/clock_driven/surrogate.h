// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Surrogate spike functions.
//
// Every surrogate fires with the Heaviside step in the forward pass,
//
//     spike = H(x) = 1[x >= 0],
//
// and replaces the (almost everywhere zero) derivative of H with the
// derivative g'(x) of a smooth primitive g during the backward pass. The
// forward value never depends on the chosen surrogate.
//
// A surrogate can be switched out of spiking mode, in which case it returns
// g(x) itself and autograd differentiates it directly.

#ifndef SPIKEGRAD_CLOCK_DRIVEN_SURROGATE_H
#define SPIKEGRAD_CLOCK_DRIVEN_SURROGATE_H

#include <torch/torch.h>

#include <array>
#include <ostream>
#include <string>

namespace spikegrad {
namespace surrogate {

// Values mirror spikegrad::v0::spike_kernels::SurrogateKind.
enum class Kind : int64_t {
    kSigmoid = 0,
    kBilinearLeakyReLU = 1,
    kSignSwish = 2,
    kErf = 3,
    kATan = 4,
};

class SurrogateFunction {
public:
    using Params = std::array<double, 3>;

    SurrogateFunction(Kind kind, Params params, bool spiking = true);

    // Spike in spiking mode, g(x) otherwise. Differentiable either way.
    torch::Tensor operator()(const torch::Tensor& x) const;

    // Hard step, no graph.
    torch::Tensor heaviside(const torch::Tensor& x) const;

    // grad_out * g'(x). This is the backward of operator() in spiking mode.
    torch::Tensor backward(const torch::Tensor& x, const torch::Tensor& grad_out) const;

    // g(x), built from differentiable ATen ops.
    torch::Tensor primitive(const torch::Tensor& x) const;

    // g'(x).
    torch::Tensor grad(const torch::Tensor& x) const;

    bool spiking() const { return spiking_; }
    void set_spiking_mode(bool spiking) { spiking_ = spiking; }

    Kind kind() const { return kind_; }
    const Params& params() const { return params_; }
    std::string name() const;

private:
    Kind kind_;
    Params params_;
    bool spiking_;
};

std::ostream& operator<<(std::ostream& stream, const SurrogateFunction& function);

// g'(x) = a for -c <= x <= c, b otherwise.
//
//        { bx + bc - ac,  x < -c
// g(x) = { ax,            -c <= x <= c
//        { bx - bc + ac,  x > c
struct BilinearLeakyReLU : SurrogateFunction {
    explicit BilinearLeakyReLU(double a = 1.0, double b = 0.01, double c = 0.5, bool spiking = true);
};

// g(x) = sigmoid(alpha * x)
// g'(x) = alpha * sigmoid(alpha * x) * (1 - sigmoid(alpha * x))
struct Sigmoid : SurrogateFunction {
    explicit Sigmoid(double alpha = 1.0, bool spiking = true);
};

// Darabi et al., "BNN+: Improved binary network training", 2018.
//
// g(x) = 2 * sigmoid(beta * x) * (1 + beta * x * (1 - sigmoid(beta * x))) - 1
// g'(x) = beta * (2 - beta * x * tanh(beta * x / 2)) / (1 + cosh(beta * x))
struct SignSwish : SurrogateFunction {
    explicit SignSwish(double beta = 5.0, bool spiking = true);
};

// g(x) = erfc(-alpha * x) / 2
// g'(x) = alpha / sqrt(pi) * exp(-alpha^2 * x^2)
struct Erf : SurrogateFunction {
    explicit Erf(double alpha = 2.0, bool spiking = true);
};

// g(x) = atan(pi / 2 * alpha * x) / pi + 1 / 2
// g'(x) = alpha / 2 / (1 + (pi / 2 * alpha * x)^2)
struct ATan : SurrogateFunction {
    explicit ATan(double alpha = 2.0, bool spiking = true);
};

}  // namespace surrogate
}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_SURROGATE_H
