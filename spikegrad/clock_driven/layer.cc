// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include "spikegrad/clock_driven/layer.h"

#include <c10/util/Logging.h>

#include <cmath>
#include <vector>

namespace spikegrad {
namespace layer {

using torch::Tensor;

namespace F = torch::nn::functional;

// =============================================================================
// Dropout
// =============================================================================

DropoutImpl::DropoutImpl(const DropoutOptions& options_) : options(options_) {
    C10_LOG_API_USAGE_ONCE("spikegrad.layer.Dropout");
    TORCH_CHECK_VALUE(
        options.p() > 0 && options.p() < 1,
        "dropout probability must lie in (0, 1), got ", options.p());
}

Tensor DropoutImpl::forward(const Tensor& x) {
    if (!is_training()) {
        return x;
    }
    if (mask_.defined() && mask_.sizes() != x.sizes()) {
        TORCH_WARN_ONCE(
            layer_name(), ": input shape changed from ", mask_.sizes(), " to ", x.sizes(),
            " without reset(); drawing a new mask");
        mask_ = Tensor();
    }
    if (!mask_.defined()) {
        mask_ = draw_mask(x);
    }
    return mask_ * x;
}

Tensor DropoutImpl::draw_mask(const Tensor& x) const {
    torch::NoGradGuard no_grad;
    return torch::dropout(torch::ones_like(x), options.p(), true);
}

void DropoutImpl::reset() {
    mask_ = Tensor();
}

void DropoutImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::layer::" << layer_name() << "(p=" << options.p() << ")";
}

Dropout2dImpl::Dropout2dImpl(const DropoutOptions& options_) : DropoutImpl(options_) {
    C10_LOG_API_USAGE_ONCE("spikegrad.layer.Dropout2d");
}

Tensor Dropout2dImpl::draw_mask(const Tensor& x) const {
    torch::NoGradGuard no_grad;
    return F::dropout2d(torch::ones_like(x), F::Dropout2dFuncOptions().p(options.p()).training(true));
}

// =============================================================================
// LowPassSynapse
// =============================================================================

LowPassSynapseImpl::LowPassSynapseImpl(const LowPassSynapseOptions& options_) : options(options_) {
    C10_LOG_API_USAGE_ONCE("spikegrad.layer.LowPassSynapse");
    TORCH_CHECK(options.tau() > 0, "LowPassSynapse: tau must be positive, got ", options.tau());
    Tensor reciprocal = torch::full({1}, 1 / options.tau());
    if (options.learnable()) {
        reciprocal_tau_ = register_parameter("reciprocal_tau", reciprocal);
    } else {
        reciprocal_tau_ = register_buffer("reciprocal_tau", reciprocal);
    }
}

Tensor LowPassSynapseImpl::forward(const Tensor& spike) {
    if (!out_.defined()) {
        out_ = torch::zeros_like(spike);
    }
    out_ = out_ - (1 - spike) * out_ * reciprocal_tau_ + spike;
    return out_;
}

void LowPassSynapseImpl::reset() {
    out_ = Tensor();
}

double LowPassSynapseImpl::tau() const {
    torch::NoGradGuard no_grad;
    return 1 / reciprocal_tau_.item<double>();
}

void LowPassSynapseImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::layer::LowPassSynapse(tau=" << tau()
           << ", learnable=" << std::boolalpha << options.learnable() << ")";
}

// =============================================================================
// NeuNorm
// =============================================================================

NeuNormImpl::NeuNormImpl(const NeuNormOptions& options_) : options(options_) {
    C10_LOG_API_USAGE_ONCE("spikegrad.layer.NeuNorm");
    const int64_t channels = options.in_channels();
    TORCH_CHECK(channels > 0, "NeuNorm: in_channels must be positive, got ", channels);
    k0_ = options.k();
    k1_ = (1 - k0_) / static_cast<double>(channels * channels);
    w = register_parameter("w", torch::empty({channels, 1, 1}));
    torch::nn::init::kaiming_uniform_(w, std::sqrt(5.0));
}

Tensor NeuNormImpl::forward(const Tensor& spike) {
    TORCH_CHECK(spike.dim() == 4 && spike.size(1) == options.in_channels(),
                "NeuNorm: input must be [N, ", options.in_channels(), ", H, W], got ", spike.sizes());
    Tensor drive = k1_ * spike.sum(1, /*keepdim=*/true);
    x_ = x_.defined() ? k0_ * x_ + drive : drive;
    return spike - w * x_;
}

void NeuNormImpl::reset() {
    x_ = Tensor();
}

void NeuNormImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::layer::NeuNorm(in_channels=" << options.in_channels()
           << ", k=" << options.k() << ")";
}

// =============================================================================
// ChannelsMaxPool
// =============================================================================

ChannelsMaxPoolImpl::ChannelsMaxPoolImpl(const ChannelsMaxPoolOptions& options_) : options(options_) {
    TORCH_CHECK(options.kernel_size() > 0, "ChannelsMaxPool: kernel_size must be positive");
}

Tensor ChannelsMaxPoolImpl::forward(const Tensor& x) {
    TORCH_CHECK(x.dim() >= 3, "ChannelsMaxPool: input must be [N, C, *], got ", x.sizes());
    const int64_t kernel_size = options.kernel_size();
    const int64_t stride = options.stride().value_or(kernel_size);

    // [N, C, S] -> [N, S, C], pool over C, back to [N, C', S].
    Tensor pooled = torch::max_pool1d(x.flatten(2).permute({0, 2, 1}), {kernel_size}, {stride})
                        .permute({0, 2, 1});

    std::vector<int64_t> shape = x.sizes().vec();
    shape[1] = pooled.size(1);
    return pooled.reshape(shape);
}

void ChannelsMaxPoolImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::layer::ChannelsMaxPool(kernel_size=" << options.kernel_size()
           << ", stride=" << options.stride().value_or(options.kernel_size()) << ")";
}

// =============================================================================
// BatchNorm2d
// =============================================================================

BatchNorm2dImpl::BatchNorm2dImpl(const BatchNorm2dOptions& options_) : options(options_) {
    bn = register_module(
        "bn",
        torch::nn::BatchNorm2d(torch::nn::BatchNorm2dOptions(options.num_features())
                                   .eps(options.eps())
                                   .momentum(options.momentum())
                                   .affine(false)
                                   .track_running_stats(options.track_running_stats())));
    if (options.scaling()) {
        weight = register_parameter("weight", torch::ones({options.num_features(), 1, 1}));
    }
}

Tensor BatchNorm2dImpl::forward(const Tensor& x) {
    Tensor y = bn(x);
    return weight.defined() ? y * weight : y;
}

void BatchNorm2dImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::layer::BatchNorm2d(" << options.num_features()
           << ", eps=" << options.eps()
           << ", momentum=" << options.momentum()
           << ", scaling=" << std::boolalpha << options.scaling()
           << ", track_running_stats=" << options.track_running_stats() << ")";
}

// =============================================================================
// AXAT
// =============================================================================

AXATImpl::AXATImpl(const AXATOptions& options_) : options(options_) {
    A = register_parameter("A", torch::empty({options.out_features(), options.in_features()}));
    torch::nn::init::kaiming_uniform_(A, std::sqrt(5.0));
}

Tensor AXATImpl::forward(const Tensor& x) {
    const int64_t n = options.in_features();
    TORCH_CHECK(x.dim() >= 2 && x.size(-2) == n && x.size(-1) == n,
                "AXAT: input must be [*, ", n, ", ", n, "], got ", x.sizes());
    Tensor y = A.matmul(x.reshape({-1, n, n})).matmul(A.t());

    std::vector<int64_t> shape = x.sizes().vec();
    shape[shape.size() - 2] = options.out_features();
    shape[shape.size() - 1] = options.out_features();
    return y.reshape(shape);
}

void AXATImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::layer::AXAT(in_features=" << options.in_features()
           << ", out_features=" << options.out_features() << ")";
}

// =============================================================================
// DCT
// =============================================================================

DCTImpl::DCTImpl(const DCTOptions& options_) : options(options_) {
    const int64_t n = options.kernel_size();
    TORCH_CHECK(n > 0, "DCT: kernel_size must be positive, got ", n);

    Tensor matrix = torch::empty({n, n});
    auto a = matrix.accessor<float, 2>();
    const double pi = std::acos(-1.0);
    for (int64_t i = 0; i < n; ++i) {
        const double scale = std::sqrt((i == 0 ? 1.0 : 2.0) / n);
        for (int64_t j = 0; j < n; ++j) {
            a[i][j] = static_cast<float>(scale * std::cos((j + 0.5) * pi * i / n));
        }
    }
    kernel = register_buffer("kernel", matrix);
}

Tensor DCTImpl::forward(const Tensor& x) {
    const int64_t n = options.kernel_size();
    TORCH_CHECK(x.dim() >= 2, "DCT: input needs at least two dims, got ", x.sizes());
    const int64_t height = x.size(-2);
    const int64_t width = x.size(-1);
    TORCH_CHECK(height % n == 0 && width % n == 0,
                "DCT: last two dims ", x.sizes(), " must be multiples of kernel_size=", n);

    // [*, H, W] -> [B, H/n, W/n, n, n]
    Tensor blocks = x.reshape({-1, height / n, n, width / n, n}).permute({0, 1, 3, 2, 4});
    Tensor k = kernel.to(x.options());
    Tensor y = k.matmul(blocks).matmul(k.t());
    return y.permute({0, 1, 3, 2, 4}).reshape(x.sizes());
}

void DCTImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::layer::DCT(kernel_size=" << options.kernel_size() << ")";
}

}  // namespace layer
}  // namespace spikegrad
