// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Spiking LSTM.
//
// Rao et al., "Long Short-Term Memory Spiking Networks and Their
// Applications", 2020. The sigmoid and tanh gate nonlinearities of the LSTM
// are replaced by Heaviside spikes with surrogate gradients:
//
//   i = H(W_ii x + b_ii + W_hi h + b_hi - v_threshold)
//   f = H(W_if x + b_if + W_hf h + b_hf - v_threshold)
//   g = H(W_ig x + b_ig + W_hg h + b_hg - v_threshold)
//   o = H(W_io x + b_io + W_ho h + b_ho - v_threshold)
//   c' = f * c + i * g
//   h' = o * c'

#ifndef SPIKEGRAD_CLOCK_DRIVEN_RNN_H
#define SPIKEGRAD_CLOCK_DRIVEN_RNN_H

#include <torch/torch.h>

#include <memory>
#include <optional>
#include <ostream>
#include <tuple>
#include <vector>

#include "spikegrad/clock_driven/monitor.h"
#include "spikegrad/clock_driven/stateful.h"
#include "spikegrad/clock_driven/surrogate.h"

namespace spikegrad {
namespace rnn {

// (h, c)
using HiddenState = std::tuple<torch::Tensor, torch::Tensor>;

struct SpikingLSTMCellOptions {
    SpikingLSTMCellOptions(int64_t input_size, int64_t hidden_size)
        : input_size_(input_size), hidden_size_(hidden_size) {}

    TORCH_ARG(int64_t, input_size);
    TORCH_ARG(int64_t, hidden_size);
    TORCH_ARG(bool, bias) = true;
    TORCH_ARG(double, v_threshold) = 1.0;

    // Generates i, f, o, and g unless surrogate_function2 is set.
    TORCH_ARG(surrogate::SurrogateFunction, surrogate_function1) = surrogate::Erf();

    // Generates g. Must agree with surrogate_function1 on spiking().
    TORCH_ARG(std::optional<surrogate::SurrogateFunction>, surrogate_function2) = std::nullopt;

    // Start with the gate recorder switched on.
    TORCH_ARG(bool, monitor_state) = false;
};

// One time step of the spiking LSTM.
//
// The cell keeps the (h, c) it produced last, so forward(x) can be called
// once per step like a neuron. forward(x, hc) starts from an explicit state
// instead and stores the result the same way. Weights and biases are drawn
// from U(-1/sqrt(hidden_size), 1/sqrt(hidden_size)).
class SpikingLSTMCellImpl : public torch::nn::Module, public StatefulModule, public MonitoredModule {
public:
    SpikingLSTMCellImpl(int64_t input_size, int64_t hidden_size)
        : SpikingLSTMCellImpl(SpikingLSTMCellOptions(input_size, hidden_size)) {}
    explicit SpikingLSTMCellImpl(const SpikingLSTMCellOptions& options_);

    void reset_parameters();

    // x: [B, input_size]. Returns (h', c'), each [B, hidden_size].
    HiddenState forward(const torch::Tensor& x);
    HiddenState forward(const torch::Tensor& x, const HiddenState& hc);

    // The stored state, zero-initialised for x's batch when unset or when
    // the batch size changed.
    HiddenState prepare_state(const torch::Tensor& x);
    void set_state(torch::Tensor h, torch::Tensor c);

    void reset() override;
    void set_monitor(bool enabled) override;

    // Records of i, f, g, o, c and h per step, or nullptr when off.
    const monitor::Recorder* monitor() const { return recorder_.get(); }

    // True when every gate is a binary spike in the forward pass.
    bool gates_spiking() const;

    const torch::Tensor& weight_ih() const { return linear_ih->weight; }
    const torch::Tensor& weight_hh() const { return linear_hh->weight; }
    // Undefined without bias.
    const torch::Tensor& bias_ih() const { return linear_ih->bias; }
    const torch::Tensor& bias_hh() const { return linear_hh->bias; }

    const torch::Tensor& h() const { return h_; }
    const torch::Tensor& c() const { return c_; }

    void pretty_print(std::ostream& stream) const override;

    SpikingLSTMCellOptions options;

    torch::nn::Linear linear_ih{nullptr};
    torch::nn::Linear linear_hh{nullptr};

private:
    void check_spiking_modes() const;

    torch::Tensor h_;
    torch::Tensor c_;
    std::unique_ptr<monitor::Recorder> recorder_;
};

TORCH_MODULE(SpikingLSTMCell);

struct SpikingLSTMOptions {
    SpikingLSTMOptions(int64_t input_size, int64_t hidden_size)
        : input_size_(input_size), hidden_size_(hidden_size) {}

    TORCH_ARG(int64_t, input_size);
    TORCH_ARG(int64_t, hidden_size);
    TORCH_ARG(int64_t, num_layers) = 1;
    TORCH_ARG(bool, bias) = true;

    // Dropout on the input of every layer but the first, training only.
    TORCH_ARG(double, dropout_p) = 0.0;

    // Draw one [B, hidden_size] mask per forward() and use it at every step
    // and layer, instead of a fresh mask per step.
    TORCH_ARG(bool, invariant_dropout_mask) = false;

    // Not supported.
    TORCH_ARG(bool, bidirectional) = false;

    TORCH_ARG(double, v_threshold) = 1.0;
    TORCH_ARG(surrogate::SurrogateFunction, surrogate_function1) = surrogate::Erf();
    TORCH_ARG(std::optional<surrogate::SurrogateFunction>, surrogate_function2) = std::nullopt;

    // Passed on to every cell.
    TORCH_ARG(bool, monitor_state) = false;
};

// A stack of SpikingLSTMCell layers run over a whole sequence.
//
// The final (h, c) of every layer is kept, so consecutive forward() calls
// continue one run. reset() starts a new one.
//
// With autograd disabled, CUDA input, spiking gates, no active dropout and
// no monitor, each layer runs as one fused CUDA sequence instead of the
// per-step loop.
class SpikingLSTMImpl : public torch::nn::Module, public StatefulModule, public MonitoredModule {
public:
    SpikingLSTMImpl(int64_t input_size, int64_t hidden_size)
        : SpikingLSTMImpl(SpikingLSTMOptions(input_size, hidden_size)) {}
    explicit SpikingLSTMImpl(const SpikingLSTMOptions& options_);

    // x: [T, B, input_size]. Returns (output [T, B, hidden_size],
    // (h_n, c_n) each [num_layers, B, hidden_size]).
    std::tuple<torch::Tensor, HiddenState> forward(const torch::Tensor& x);
    std::tuple<torch::Tensor, HiddenState> forward(const torch::Tensor& x, const HiddenState& hc);

    void reset() override;
    void set_monitor(bool enabled) override;

    // Mask drawn by the last training forward() with invariant_dropout_mask,
    // undefined otherwise.
    const torch::Tensor& dropout_mask() const { return dropout_mask_; }

    void pretty_print(std::ostream& stream) const override;

    SpikingLSTMOptions options;

    std::vector<SpikingLSTMCell> cells;

private:
    std::tuple<torch::Tensor, HiddenState> run(const torch::Tensor& x, const std::optional<HiddenState>& hc);
    std::tuple<torch::Tensor, HiddenState> run_fused(const torch::Tensor& x, const std::optional<HiddenState>& hc);
    bool can_run_fused(const torch::Tensor& x) const;
    bool dropout_active() const;
    HiddenState final_state() const;

    torch::Tensor dropout_mask_;
};

TORCH_MODULE(SpikingLSTM);

}  // namespace rnn
}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_RNN_H
