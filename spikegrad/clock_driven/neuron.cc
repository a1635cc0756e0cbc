// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include "spikegrad/clock_driven/neuron.h"

#include <c10/util/Logging.h>

#include <cmath>

#include "spikegrad/clock_driven/accelerating.h"

namespace spikegrad {
namespace neuron {

using torch::Tensor;

namespace {

constexpr double kRoundTripTolerance = 1e-4;

Tensor apply_reset(const BaseNodeOptions& options, const Tensor& v, const Tensor& spike) {
    // The fused transforms assume a binary spike.
    const bool binary = options.surrogate_function().spiking();
    const double v_threshold = options.v_threshold();

    if (options.v_reset().has_value()) {
        const double v_reset = *options.v_reset();
        if (binary) {
            return accelerating::hard_voltage_transform(v, spike, v_reset);
        }
        return v * (1 - spike) + v_reset * spike;
    }
    if (binary) {
        return accelerating::soft_voltage_transform(v, spike, v_threshold);
    }
    return v - spike * v_threshold;
}

Tensor rest_tensor(const BaseNodeOptions& options) {
    return torch::scalar_tensor(rest_potential(options));
}

}  // anonymous namespace

ResetMode reset_mode(const BaseNodeOptions& options) {
    return options.v_reset().has_value() ? ResetMode::kHard : ResetMode::kSoft;
}

double rest_potential(const BaseNodeOptions& options) {
    return options.v_reset().value_or(0.0);
}

Tensor integrate(const Integrator& integrator, const Tensor& v, const Tensor& dv, double v_rest) {
    switch (integrator.kind) {
    case NodeKind::kIF:
        return v + dv;
    case NodeKind::kLIF:
        return v + (dv - (v - v_rest)) / integrator.tau;
    case NodeKind::kPLIF:
        return v + (dv - (v - v_rest)) * integrator.weight;
    case NodeKind::kRIF:
        return v + integrator.weight * (v - v_rest) + dv;
    }
    TORCH_CHECK(false, "unknown node kind ", static_cast<int>(integrator.kind));
}

FireResult fire(const BaseNodeOptions& options, const Tensor& v) {
    Tensor spike = options.surrogate_function()(v - options.v_threshold());
    return {spike, apply_reset(options, v, spike)};
}

StepResult step(
    const BaseNodeOptions& options,
    const Integrator& integrator,
    const Tensor& v,
    const Tensor& dv) {

    Tensor v_integrated = integrate(integrator, v, dv, rest_potential(options));
    FireResult fired = fire(options, v_integrated);
    return {fired.spike, v_integrated, fired.v_next};
}

// =============================================================================
// BaseNode
// =============================================================================

BaseNodeImpl::BaseNodeImpl(BaseNodeOptions options_)
    : options(std::move(options_)), v_(rest_tensor(options)) {
    set_monitor(options.monitor_state());
}

Tensor BaseNodeImpl::forward(const Tensor& dv) {
    v_ = integrate(integrator(), v_, dv, rest_potential());
    return spiking();
}

Tensor BaseNodeImpl::spiking() {
    FireResult fired = fire(options, v_);
    if (observer_) {
        observer_->on_spiking(v_, fired.spike, rest_potential());
    }
    v_ = fired.v_next;
    return fired.spike;
}

void BaseNodeImpl::reset() {
    v_ = rest_tensor(options);
    if (observer_) {
        observer_->on_reset();
    }
}

void BaseNodeImpl::set_monitor(bool enabled) {
    options.monitor_state(enabled);
    if (enabled) {
        observer_ = std::make_shared<monitor::Monitor>();
    } else {
        observer_.reset();
    }
}

const monitor::Monitor* BaseNodeImpl::monitor() const {
    return dynamic_cast<const monitor::Monitor*>(observer_.get());
}

void BaseNodeImpl::set_observer(std::shared_ptr<monitor::NodeObserver> observer) {
    observer_ = std::move(observer);
    options.monitor_state(monitor() != nullptr);
}

Integrator BaseNodeImpl::integrator() const {
    TORCH_CHECK_NOT_IMPLEMENTED(
        false, node_name(), " has no integration rule; use IFNode, LIFNode, PLIFNode or RIFNode");
}

void BaseNodeImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::neuron::" << node_name() << "(v_threshold=" << options.v_threshold()
           << ", v_reset=";
    if (options.v_reset().has_value()) {
        stream << *options.v_reset();
    } else {
        stream << "None";
    }
    pretty_print_params(stream);
    stream << ", surrogate_function=" << options.surrogate_function() << ")";
}

// =============================================================================
// IF
// =============================================================================

IFNodeImpl::IFNodeImpl(BaseNodeOptions options_) : BaseNodeImpl(std::move(options_)) {
    C10_LOG_API_USAGE_ONCE("spikegrad.neuron.IFNode");
}

Integrator IFNodeImpl::integrator() const {
    return {NodeKind::kIF, 1.0, Tensor()};
}

// =============================================================================
// LIF
// =============================================================================

LIFNodeImpl::LIFNodeImpl(const LIFNodeOptions& options_)
    : BaseNodeImpl(options_.node()), tau_(options_.tau()) {
    C10_LOG_API_USAGE_ONCE("spikegrad.neuron.LIFNode");
    TORCH_CHECK(tau_ > 0, "LIFNode: tau must be positive, got ", tau_);
}

Integrator LIFNodeImpl::integrator() const {
    return {NodeKind::kLIF, tau_, Tensor()};
}

void LIFNodeImpl::pretty_print_params(std::ostream& stream) const {
    stream << ", tau=" << tau_;
}

// =============================================================================
// PLIF
// =============================================================================

DecayBound DecayBound::piecewise_exp() {
    return {
        "piecewise_exp",
        [](const Tensor& w) {
            return torch::where(w >= 0, 1 - torch::exp(-w) / 2, torch::exp(w) / 2);
        },
        [](double tau) {
            if (tau >= 2) {
                return std::log(2 / tau);
            }
            return -std::log(2 - 2 / tau);
        }};
}

DecayBound DecayBound::sigmoid() {
    return {
        "sigmoid",
        [](const Tensor& w) { return torch::sigmoid(w); },
        [](double tau) { return -std::log(tau - 1); }};
}

DecayBound DecayBound::reciprocal_abs_plus_1() {
    return {
        "reciprocal_abs_plus_1",
        [](const Tensor& w) { return 1 / (1 + w.abs()); },
        [](double tau) { return tau - 1; }};
}

PLIFNodeImpl::PLIFNodeImpl(const PLIFNodeOptions& options_)
    : BaseNodeImpl(options_.node()), clamp_(options_.clamp()) {
    C10_LOG_API_USAGE_ONCE("spikegrad.neuron.PLIFNode");
    const double init_tau = options_.init_tau();
    TORCH_CHECK(init_tau > 0, "PLIFNode: init_tau must be positive, got ", init_tau);

    const double init_w = clamp_ ? clamp_->inverse(init_tau) : 1 / init_tau;
    w_ = register_parameter("w", torch::full({1}, init_w));

    if (clamp_) {
        const double tau = this->tau();
        TORCH_CHECK(
            std::abs(tau - init_tau) < kRoundTripTolerance,
            "PLIFNode: bound '", clamp_->name, "' does not invert its inverse at init_tau=",
            init_tau, " (got tau=", tau, ")");
    }
}

Tensor PLIFNodeImpl::reciprocal_tau() const {
    return clamp_ ? clamp_->bound(w_) : w_;
}

double PLIFNodeImpl::tau() const {
    torch::NoGradGuard no_grad;
    return 1 / reciprocal_tau().item<double>();
}

Integrator PLIFNodeImpl::integrator() const {
    return {NodeKind::kPLIF, 1.0, reciprocal_tau()};
}

void PLIFNodeImpl::pretty_print_params(std::ostream& stream) const {
    stream << ", tau=" << tau();
    if (clamp_) {
        stream << ", clamp=" << clamp_->name;
    }
}

// =============================================================================
// RIF
// =============================================================================

RIFNodeImpl::RIFNodeImpl(const RIFNodeOptions& options_)
    : BaseNodeImpl(options_.node()), amplitude_(options_.amplitude()) {
    C10_LOG_API_USAGE_ONCE("spikegrad.neuron.RIFNode");
    const double init_w = options_.init_w();

    double init_g = init_w;
    if (amplitude_) {
        const double lo = amplitude_->first;
        const double hi = amplitude_->second;
        TORCH_CHECK(lo < hi, "RIFNode: amplitude must satisfy lo < hi, got (", lo, ", ", hi, ")");
        TORCH_CHECK(
            lo < init_w && init_w < hi,
            "RIFNode: init_w=", init_w, " must lie strictly inside (", lo, ", ", hi, ")");
        const double p = (init_w - lo) / (hi - lo);
        init_g = std::log(p / (1 - p));
    }
    g_ = register_parameter("g", torch::full({1}, init_g));
}

Tensor RIFNodeImpl::weight() const {
    if (!amplitude_) {
        return g_;
    }
    const double lo = amplitude_->first;
    const double hi = amplitude_->second;
    return torch::sigmoid(g_) * (hi - lo) + lo;
}

double RIFNodeImpl::w() const {
    torch::NoGradGuard no_grad;
    return weight().item<double>();
}

Integrator RIFNodeImpl::integrator() const {
    return {NodeKind::kRIF, 1.0, weight()};
}

void RIFNodeImpl::pretty_print_params(std::ostream& stream) const {
    stream << ", w=" << w();
    if (amplitude_) {
        stream << ", amplitude=(" << amplitude_->first << ", " << amplitude_->second << ")";
    }
}

}  // namespace neuron
}  // namespace spikegrad
