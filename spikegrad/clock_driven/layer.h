// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Layers for clock-driven SNNs.
//
// Dropout, Dropout2d, LowPassSynapse and NeuNorm keep state between time
// steps and follow the neuron lifecycle: call reset() between independent
// runs. The remaining layers are stateless.

#ifndef SPIKEGRAD_CLOCK_DRIVEN_LAYER_H
#define SPIKEGRAD_CLOCK_DRIVEN_LAYER_H

#include <torch/torch.h>

#include <optional>
#include <ostream>

#include "spikegrad/clock_driven/stateful.h"

namespace spikegrad {
namespace layer {

// =============================================================================
// Dropout
// =============================================================================

struct DropoutOptions {
    /* implicit */ DropoutOptions(double p = 0.5) : p_(p) {}

    // Must lie in (0, 1).
    TORCH_ARG(double, p);
};

// Dropout whose mask is drawn on the first training call and reused until
// reset(), so a dropped connection stays dropped for the whole simulated
// time window. Kept elements are scaled by 1 / (1 - p). Identity in eval
// mode.
class DropoutImpl : public torch::nn::Module, public StatefulModule {
public:
    explicit DropoutImpl(const DropoutOptions& options_ = {});

    torch::Tensor forward(const torch::Tensor& x);

    void reset() override;

    // Undefined until the first training call after reset().
    const torch::Tensor& mask() const { return mask_; }

    void pretty_print(std::ostream& stream) const override;

    DropoutOptions options;

protected:
    virtual torch::Tensor draw_mask(const torch::Tensor& x) const;
    virtual const char* layer_name() const { return "Dropout"; }

    torch::Tensor mask_;
};

TORCH_MODULE(Dropout);

// Whole channels of [N, C, H, W] are dropped together. The default p is 0.2.
class Dropout2dImpl : public DropoutImpl {
public:
    explicit Dropout2dImpl(const DropoutOptions& options_ = DropoutOptions(0.2));

protected:
    torch::Tensor draw_mask(const torch::Tensor& x) const override;
    const char* layer_name() const override { return "Dropout2d"; }
};

TORCH_MODULE(Dropout2d);

// =============================================================================
// LowPassSynapse
// =============================================================================

struct LowPassSynapseOptions {
    /* implicit */ LowPassSynapseOptions(double tau = 100.0) : tau_(tau) {}

    TORCH_ARG(double, tau);

    // Learn 1/tau as a parameter.
    TORCH_ARG(bool, learnable) = false;
};

// Leaky accumulator of binary spikes:
//
//   I = I - (1 - spike) * I / tau + spike
//
// I decays towards 0 without input and jumps by one on every spike. Usually
// placed after the output layer to accumulate an analog readout.
class LowPassSynapseImpl : public torch::nn::Module, public StatefulModule {
public:
    explicit LowPassSynapseImpl(const LowPassSynapseOptions& options_ = {});

    torch::Tensor forward(const torch::Tensor& spike);

    void reset() override;

    // Effective tau.
    double tau() const;

    const torch::Tensor& reciprocal_tau() const { return reciprocal_tau_; }
    const torch::Tensor& out() const { return out_; }

    void pretty_print(std::ostream& stream) const override;

    LowPassSynapseOptions options;

private:
    torch::Tensor reciprocal_tau_;
    torch::Tensor out_;
};

TORCH_MODULE(LowPassSynapse);

// =============================================================================
// NeuNorm
// =============================================================================

struct NeuNormOptions {
    /* implicit */ NeuNormOptions(int64_t in_channels) : in_channels_(in_channels) {}

    TORCH_ARG(int64_t, in_channels);
    TORCH_ARG(double, k) = 0.9;
};

// Wu et al., "Direct Training for Spiking Neural Networks: Faster, Larger,
// Better", 2018.
//
//   x = k0 * x + k1 * sum_c(in)      k0 = k, k1 = (1 - k) / C^2
//   out = in - w * x                 w: [C, 1, 1]
//
// Input is [N, C, H, W]. This reading of the paper may be wrong and has been
// seen to slow convergence.
class NeuNormImpl : public torch::nn::Module, public StatefulModule {
public:
    explicit NeuNormImpl(const NeuNormOptions& options_);

    torch::Tensor forward(const torch::Tensor& spike);

    void reset() override;

    double k0() const { return k0_; }
    double k1() const { return k1_; }
    const torch::Tensor& x() const { return x_; }

    void pretty_print(std::ostream& stream) const override;

    NeuNormOptions options;

    torch::Tensor w;

private:
    double k0_;
    double k1_;
    torch::Tensor x_;
};

TORCH_MODULE(NeuNorm);

// =============================================================================
// Stateless layers
// =============================================================================

struct ChannelsMaxPoolOptions {
    /* implicit */ ChannelsMaxPoolOptions(int64_t kernel_size) : kernel_size_(kernel_size) {}

    TORCH_ARG(int64_t, kernel_size);

    // Defaults to kernel_size.
    TORCH_ARG(std::optional<int64_t>, stride) = std::nullopt;
};

// Max pooling along the channel dimension of [N, C, *].
class ChannelsMaxPoolImpl : public torch::nn::Module {
public:
    explicit ChannelsMaxPoolImpl(const ChannelsMaxPoolOptions& options_);

    torch::Tensor forward(const torch::Tensor& x);

    void pretty_print(std::ostream& stream) const override;

    ChannelsMaxPoolOptions options;
};

TORCH_MODULE(ChannelsMaxPool);

struct BatchNorm2dOptions {
    /* implicit */ BatchNorm2dOptions(int64_t num_features) : num_features_(num_features) {}

    TORCH_ARG(int64_t, num_features);
    TORCH_ARG(double, eps) = 1e-5;
    TORCH_ARG(double, momentum) = 0.1;

    // Multiply by a learnable per-channel scale, initialised to one.
    TORCH_ARG(bool, scaling) = true;

    TORCH_ARG(bool, track_running_stats) = true;
};

// Batch norm without shift. A bias would shift every membrane potential of
// a channel, which acts as a second threshold.
class BatchNorm2dImpl : public torch::nn::Module {
public:
    explicit BatchNorm2dImpl(const BatchNorm2dOptions& options_);

    torch::Tensor forward(const torch::Tensor& x);

    void pretty_print(std::ostream& stream) const override;

    BatchNorm2dOptions options;

    torch::nn::BatchNorm2d bn{nullptr};

    // [C, 1, 1]; undefined without scaling.
    torch::Tensor weight;
};

TORCH_MODULE(BatchNorm2d);

struct AXATOptions {
    AXATOptions(int64_t in_features, int64_t out_features)
        : in_features_(in_features), out_features_(out_features) {}

    TORCH_ARG(int64_t, in_features);
    TORCH_ARG(int64_t, out_features);
};

// A X A^T over the last two dims, [*, in, in] -> [*, out, out].
class AXATImpl : public torch::nn::Module {
public:
    AXATImpl(int64_t in_features, int64_t out_features)
        : AXATImpl(AXATOptions(in_features, out_features)) {}
    explicit AXATImpl(const AXATOptions& options_);

    torch::Tensor forward(const torch::Tensor& x);

    void pretty_print(std::ostream& stream) const override;

    AXATOptions options;

    torch::Tensor A;
};

TORCH_MODULE(AXAT);

struct DCTOptions {
    /* implicit */ DCTOptions(int64_t kernel_size) : kernel_size_(kernel_size) {}

    TORCH_ARG(int64_t, kernel_size);
};

// Blockwise orthonormal DCT-II over the last two dims. Both dims must be
// multiples of kernel_size.
class DCTImpl : public torch::nn::Module {
public:
    explicit DCTImpl(const DCTOptions& options_);

    torch::Tensor forward(const torch::Tensor& x);

    void pretty_print(std::ostream& stream) const override;

    DCTOptions options;

    // [kernel_size, kernel_size] DCT matrix.
    torch::Tensor kernel;
};

TORCH_MODULE(DCT);

}  // namespace layer
}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_LAYER_H
