// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include "spikegrad/clock_driven/surrogate.h"

#include <cmath>

#include "spikegrad/cuda/pytorch/spike_kernels.h"

namespace spikegrad {
namespace surrogate {

namespace {

using torch::Tensor;
using torch::autograd::AutogradContext;
using torch::autograd::tensor_list;

constexpr double kPi = 3.14159265358979323846;

Tensor heaviside_impl(const Tensor& x) {
    if (cuda::can_fuse({x})) {
        return cuda::surrogate_spike_forward(x);
    }
    return (x >= 0).to(x.scalar_type());
}

Tensor grad_impl(Kind kind, const SurrogateFunction::Params& p, const Tensor& x) {
    switch (kind) {
    case Kind::kSigmoid: {
        const double alpha = p[0];
        Tensor s = torch::sigmoid(alpha * x);
        return alpha * s * (1 - s);
    }
    case Kind::kBilinearLeakyReLU: {
        const double a = p[0];
        const double b = p[1];
        const double c = p[2];
        return torch::where(x.abs() > c, torch::full_like(x, b), torch::full_like(x, a));
    }
    case Kind::kSignSwish: {
        const double beta = p[0];
        Tensor beta_x = beta * x;
        return beta * (2 - beta_x * torch::tanh(beta_x / 2)) / (1 + torch::cosh(beta_x));
    }
    case Kind::kErf: {
        const double alpha = p[0];
        return alpha / std::sqrt(kPi) * torch::exp(-(alpha * x).pow(2));
    }
    case Kind::kATan: {
        const double alpha = p[0];
        return alpha / 2 / (1 + (kPi / 2 * alpha * x).pow(2));
    }
    }
    TORCH_CHECK(false, "unknown surrogate kind ", static_cast<int64_t>(kind));
}

Tensor backward_impl(Kind kind, const SurrogateFunction::Params& p, const Tensor& x, const Tensor& grad_out) {
    if (cuda::can_fuse({x, grad_out})) {
        return cuda::surrogate_spike_backward(
            x, grad_out, static_cast<int64_t>(kind), p[0], p[1], p[2]);
    }
    return grad_out * grad_impl(kind, p, x);
}

// Heaviside forward, surrogate backward. x is only kept alive for the
// backward pass when it requires grad.
class SpikeFunction : public torch::autograd::Function<SpikeFunction> {
public:
    static Tensor forward(
        AutogradContext* ctx,
        const Tensor& x,
        int64_t kind,
        double p0,
        double p1,
        double p2) {

        if (x.requires_grad()) {
            ctx->save_for_backward({x});
            ctx->saved_data["kind"] = kind;
            ctx->saved_data["p0"] = p0;
            ctx->saved_data["p1"] = p1;
            ctx->saved_data["p2"] = p2;
        }
        return heaviside_impl(x);
    }

    static tensor_list backward(AutogradContext* ctx, tensor_list grad_outputs) {
        auto saved = ctx->get_saved_variables();
        Tensor grad_x;
        if (!saved.empty()) {
            const auto kind = static_cast<Kind>(ctx->saved_data["kind"].toInt());
            const SurrogateFunction::Params params{
                ctx->saved_data["p0"].toDouble(),
                ctx->saved_data["p1"].toDouble(),
                ctx->saved_data["p2"].toDouble()};
            grad_x = backward_impl(kind, params, saved[0], grad_outputs[0]);
        }
        return {grad_x, Tensor(), Tensor(), Tensor(), Tensor()};
    }
};

}  // anonymous namespace

SurrogateFunction::SurrogateFunction(Kind kind, Params params, bool spiking)
    : kind_(kind),
      params_(params),
      spiking_(spiking) {}

Tensor SurrogateFunction::operator()(const Tensor& x) const {
    if (spiking_) {
        return SpikeFunction::apply(x, static_cast<int64_t>(kind_), params_[0], params_[1], params_[2]);
    }
    return primitive(x);
}

Tensor SurrogateFunction::heaviside(const Tensor& x) const {
    torch::NoGradGuard no_grad;
    return heaviside_impl(x);
}

Tensor SurrogateFunction::backward(const Tensor& x, const Tensor& grad_out) const {
    return backward_impl(kind_, params_, x, grad_out);
}

Tensor SurrogateFunction::grad(const Tensor& x) const {
    return grad_impl(kind_, params_, x);
}

Tensor SurrogateFunction::primitive(const Tensor& x) const {
    switch (kind_) {
    case Kind::kSigmoid:
        return torch::sigmoid(params_[0] * x);
    case Kind::kBilinearLeakyReLU: {
        const double a = params_[0];
        const double b = params_[1];
        const double c = params_[2];
        return torch::where(
            x < -c,
            b * x + (b * c - a * c),
            torch::where(x > c, b * x - (b * c - a * c), a * x));
    }
    case Kind::kSignSwish: {
        const double beta = params_[0];
        Tensor beta_x = beta * x;
        Tensor s = torch::sigmoid(beta_x);
        return 2 * s * (1 + beta_x * (1 - s)) - 1;
    }
    case Kind::kErf:
        return torch::erfc(-params_[0] * x) / 2;
    case Kind::kATan:
        return torch::atan(kPi / 2 * params_[0] * x) / kPi + 0.5;
    }
    TORCH_CHECK(false, "unknown surrogate kind ", static_cast<int64_t>(kind_));
}

std::string SurrogateFunction::name() const {
    switch (kind_) {
    case Kind::kSigmoid: return "Sigmoid";
    case Kind::kBilinearLeakyReLU: return "BilinearLeakyReLU";
    case Kind::kSignSwish: return "SignSwish";
    case Kind::kErf: return "Erf";
    case Kind::kATan: return "ATan";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& stream, const SurrogateFunction& function) {
    const auto& p = function.params();
    stream << function.name() << "(";
    switch (function.kind()) {
    case Kind::kBilinearLeakyReLU:
        stream << "a=" << p[0] << ", b=" << p[1] << ", c=" << p[2];
        break;
    case Kind::kSignSwish:
        stream << "beta=" << p[0];
        break;
    default:
        stream << "alpha=" << p[0];
        break;
    }
    stream << ", spiking=" << std::boolalpha << function.spiking() << ")";
    return stream;
}

BilinearLeakyReLU::BilinearLeakyReLU(double a, double b, double c, bool spiking)
    : SurrogateFunction(Kind::kBilinearLeakyReLU, {a, b, c}, spiking) {}

Sigmoid::Sigmoid(double alpha, bool spiking)
    : SurrogateFunction(Kind::kSigmoid, {alpha, 0.0, 0.0}, spiking) {}

SignSwish::SignSwish(double beta, bool spiking)
    : SurrogateFunction(Kind::kSignSwish, {beta, 0.0, 0.0}, spiking) {}

Erf::Erf(double alpha, bool spiking)
    : SurrogateFunction(Kind::kErf, {alpha, 0.0, 0.0}, spiking) {}

ATan::ATan(double alpha, bool spiking)
    : SurrogateFunction(Kind::kATan, {alpha, 0.0, 0.0}, spiking) {}

}  // namespace surrogate
}  // namespace spikegrad
