// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Clock-driven spiking neurons.
//
// Each call to forward() advances the neuron by one time step:
//
//   1. integrate: v = f(v, dv)              (model specific, see Integrator)
//   2. fire:      spike = H(v - v_threshold) (surrogate gradient backward)
//   3. reset:     hard  v = v * (1 - spike) + v_reset * spike
//                 soft  v = v - spike * v_threshold
//
// The membrane potential lives in the module between calls. Call reset()
// between independent runs (e.g. between mini-batches); a forgotten reset()
// carries the potential of the previous sample into the next one.

#ifndef SPIKEGRAD_CLOCK_DRIVEN_NEURON_H
#define SPIKEGRAD_CLOCK_DRIVEN_NEURON_H

#include <torch/torch.h>

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "spikegrad/clock_driven/monitor.h"
#include "spikegrad/clock_driven/stateful.h"
#include "spikegrad/clock_driven/surrogate.h"

namespace spikegrad {
namespace neuron {

enum class ResetMode {
    kHard,  // snap to v_reset after a spike
    kSoft,  // subtract v_threshold after a spike
};

struct BaseNodeOptions {
    TORCH_ARG(double, v_threshold) = 1.0;

    // std::nullopt selects soft reset.
    TORCH_ARG(std::optional<double>, v_reset) = 0.0;

    TORCH_ARG(surrogate::SurrogateFunction, surrogate_function) = surrogate::Sigmoid();

    TORCH_ARG(bool, monitor_state) = false;
};

ResetMode reset_mode(const BaseNodeOptions& options);

// Potential before any input: v_reset, or 0 with soft reset.
double rest_potential(const BaseNodeOptions& options);

// =============================================================================
// Subthreshold integration
// =============================================================================

enum class NodeKind {
    kIF,
    kLIF,
    kPLIF,
    kRIF,
};

// Parameters of one subthreshold rule. `weight` is recomputed from the
// module's raw parameter on every step so it stays on the autograd graph.
//
//   kIF:   v + dv
//   kLIF:  v + (dv - (v - v_rest)) / tau
//   kPLIF: v + (dv - (v - v_rest)) * weight       weight = 1 / tau
//   kRIF:  v + weight * (v - v_rest) + dv
struct Integrator {
    NodeKind kind = NodeKind::kIF;
    double tau = 1.0;
    torch::Tensor weight;
};

torch::Tensor integrate(
    const Integrator& integrator,
    const torch::Tensor& v,
    const torch::Tensor& dv,
    double v_rest);

struct FireResult {
    torch::Tensor spike;
    torch::Tensor v_next;
};

// Threshold and reset; no integration.
FireResult fire(const BaseNodeOptions& options, const torch::Tensor& v);

struct StepResult {
    torch::Tensor spike;
    torch::Tensor v_integrated;  // potential compared against the threshold
    torch::Tensor v_next;
};

// One full neuron update as a pure function of (v, dv).
StepResult step(
    const BaseNodeOptions& options,
    const Integrator& integrator,
    const torch::Tensor& v,
    const torch::Tensor& dv);

// =============================================================================
// BaseNode
// =============================================================================

class BaseNodeImpl : public torch::nn::Module, public StatefulModule, public MonitoredModule {
public:
    explicit BaseNodeImpl(BaseNodeOptions options_ = {});

    // Integrates dv with integrator() and calls spiking(). BaseNode has no
    // integration rule, so calling this on a bare BaseNode throws.
    virtual torch::Tensor forward(const torch::Tensor& dv);

    // Fires from the current potential and applies the reset rule.
    torch::Tensor spiking();

    void reset() override;

    void set_monitor(bool enabled) override;

    // The installed Monitor, or nullptr when monitoring is off.
    const monitor::Monitor* monitor() const;

    // Replaces the observer (including a Monitor). nullptr disables it.
    void set_observer(std::shared_ptr<monitor::NodeObserver> observer);

    const torch::Tensor& v() const { return v_; }
    void set_v(torch::Tensor v) { v_ = std::move(v); }

    double v_threshold() const { return options.v_threshold(); }
    const std::optional<double>& v_reset() const { return options.v_reset(); }
    ResetMode reset_mode() const { return neuron::reset_mode(options); }
    double rest_potential() const { return neuron::rest_potential(options); }

    void pretty_print(std::ostream& stream) const override;

    BaseNodeOptions options;

protected:
    virtual Integrator integrator() const;
    virtual std::string node_name() const { return "BaseNode"; }
    virtual void pretty_print_params(std::ostream& stream) const {}

    torch::Tensor v_;

private:
    std::shared_ptr<monitor::NodeObserver> observer_;
};

TORCH_MODULE(BaseNode);

// =============================================================================
// IF: perfect integrator
// =============================================================================

class IFNodeImpl : public BaseNodeImpl {
public:
    explicit IFNodeImpl(BaseNodeOptions options_ = {});

protected:
    Integrator integrator() const override;
    std::string node_name() const override { return "IFNode"; }
};

TORCH_MODULE(IFNode);

// =============================================================================
// LIF: leaky integrator with a fixed time constant
// =============================================================================

struct LIFNodeOptions {
    TORCH_ARG(double, tau) = 100.0;
    TORCH_ARG(BaseNodeOptions, node) = {};
};

class LIFNodeImpl : public BaseNodeImpl {
public:
    explicit LIFNodeImpl(const LIFNodeOptions& options_ = {});

    double tau() const { return tau_; }

protected:
    Integrator integrator() const override;
    std::string node_name() const override { return "LIFNode"; }
    void pretty_print_params(std::ostream& stream) const override;

private:
    double tau_;
};

TORCH_MODULE(LIFNode);

// =============================================================================
// PLIF: LIF with a learnable 1/tau
// =============================================================================

// Maps the raw parameter w to 1/tau and back. inverse(bound(w)) must be
// the identity at the initial tau.
struct DecayBound {
    std::string name;
    std::function<torch::Tensor(const torch::Tensor&)> bound;  // w -> 1/tau
    std::function<double(double)> inverse;                     // tau -> w

    // 1 - exp(-w) / 2 for w >= 0, exp(w) / 2 otherwise. 1/tau in (0, 1).
    static DecayBound piecewise_exp();

    // sigmoid(w). 1/tau in (0, 1).
    static DecayBound sigmoid();

    // 1 / (1 + |w|). 1/tau in (0, 1].
    static DecayBound reciprocal_abs_plus_1();
};

struct PLIFNodeOptions {
    TORCH_ARG(double, init_tau) = 2.0;

    // Without a bound, w is 1/tau itself.
    TORCH_ARG(std::optional<DecayBound>, clamp) = std::nullopt;

    TORCH_ARG(BaseNodeOptions, node) = {};
};

// Fang et al., "Incorporating Learnable Membrane Time Constant to Enhance
// Learning of Spiking Neural Networks", 2020.
//
// One w is shared by every neuron of the layer.
class PLIFNodeImpl : public BaseNodeImpl {
public:
    explicit PLIFNodeImpl(const PLIFNodeOptions& options_ = {});

    // Effective 1/tau, on the autograd graph.
    torch::Tensor reciprocal_tau() const;

    // Effective tau.
    double tau() const;

    const torch::Tensor& w() const { return w_; }

protected:
    Integrator integrator() const override;
    std::string node_name() const override { return "PLIFNode"; }
    void pretty_print_params(std::ostream& stream) const override;

private:
    std::optional<DecayBound> clamp_;
    torch::Tensor w_;
};

TORCH_MODULE(PLIFNode);

// =============================================================================
// RIF: IF with learnable self feedback
// =============================================================================

// (lo, hi) range of the effective feedback weight.
using Amplitude = std::optional<std::pair<double, double>>;

struct RIFNodeOptions {
    TORCH_ARG(double, init_w) = -1e-3;

    // Without an amplitude, the raw parameter is the weight. With (lo, hi)
    // the weight is sigmoid(g) * (hi - lo) + lo.
    TORCH_ARG(Amplitude, amplitude) = std::nullopt;

    TORCH_ARG(BaseNodeOptions, node) = {};

    // Symmetric range (-a, a).
    static Amplitude symmetric(double a) { return std::make_pair(-a, a); }
};

// The weight scales only the feedback term (v - v_rest), never dv.
class RIFNodeImpl : public BaseNodeImpl {
public:
    explicit RIFNodeImpl(const RIFNodeOptions& options_ = {});

    // Effective feedback weight, on the autograd graph.
    torch::Tensor weight() const;

    // Effective feedback weight.
    double w() const;

    const torch::Tensor& g() const { return g_; }

protected:
    Integrator integrator() const override;
    std::string node_name() const override { return "RIFNode"; }
    void pretty_print_params(std::ostream& stream) const override;

private:
    Amplitude amplitude_;
    torch::Tensor g_;
};

TORCH_MODULE(RIFNode);

}  // namespace neuron
}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_NEURON_H
