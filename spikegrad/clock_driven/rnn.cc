// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include "spikegrad/clock_driven/rnn.h"

#include <c10/util/Logging.h>

#include <cmath>
#include <string>
#include <vector>

#include "spikegrad/clock_driven/accelerating.h"
#include "spikegrad/cuda/pytorch/spike_kernels.h"

namespace spikegrad {
namespace rnn {

using torch::Tensor;

// =============================================================================
// SpikingLSTMCell
// =============================================================================

SpikingLSTMCellImpl::SpikingLSTMCellImpl(const SpikingLSTMCellOptions& options_)
    : options(options_) {
    C10_LOG_API_USAGE_ONCE("spikegrad.rnn.SpikingLSTMCell");
    TORCH_CHECK(options.input_size() > 0, "input_size must be positive, got ", options.input_size());
    TORCH_CHECK(options.hidden_size() > 0, "hidden_size must be positive, got ", options.hidden_size());
    check_spiking_modes();

    const int64_t gate_size = 4 * options.hidden_size();
    linear_ih = register_module(
        "linear_ih",
        torch::nn::Linear(torch::nn::LinearOptions(options.input_size(), gate_size).bias(options.bias())));
    linear_hh = register_module(
        "linear_hh",
        torch::nn::Linear(torch::nn::LinearOptions(options.hidden_size(), gate_size).bias(options.bias())));
    reset_parameters();
    set_monitor(options.monitor_state());
}

void SpikingLSTMCellImpl::reset_parameters() {
    torch::NoGradGuard no_grad;
    const double bound = std::sqrt(1.0 / options.hidden_size());
    linear_ih->weight.uniform_(-bound, bound);
    linear_hh->weight.uniform_(-bound, bound);
    if (options.bias()) {
        linear_ih->bias.uniform_(-bound, bound);
        linear_hh->bias.uniform_(-bound, bound);
    }
}

void SpikingLSTMCellImpl::check_spiking_modes() const {
    const auto& second = options.surrogate_function2();
    if (second.has_value()) {
        TORCH_CHECK(
            options.surrogate_function1().spiking() == second->spiking(),
            "SpikingLSTMCell: surrogate_function1 (spiking=", options.surrogate_function1().spiking(),
            ") and surrogate_function2 (spiking=", second->spiking(), ") must share one spiking mode");
    }
}

bool SpikingLSTMCellImpl::gates_spiking() const {
    const auto& second = options.surrogate_function2();
    return options.surrogate_function1().spiking() && (!second.has_value() || second->spiking());
}

HiddenState SpikingLSTMCellImpl::prepare_state(const Tensor& x) {
    TORCH_CHECK(x.dim() == 2, "SpikingLSTMCell: x must be [batch, input_size], got ", x.sizes());
    const int64_t batch_size = x.size(0);
    if (h_.defined() && h_.size(0) != batch_size) {
        TORCH_WARN_ONCE(
            "SpikingLSTMCell: batch size changed from ", h_.size(0), " to ", batch_size,
            " without reset(); the stored state is discarded");
        h_ = Tensor();
        c_ = Tensor();
    }
    if (!h_.defined()) {
        h_ = torch::zeros({batch_size, options.hidden_size()}, x.options());
        c_ = torch::zeros_like(h_);
    }
    return {h_, c_};
}

void SpikingLSTMCellImpl::set_state(Tensor h, Tensor c) {
    h_ = std::move(h);
    c_ = std::move(c);
}

HiddenState SpikingLSTMCellImpl::forward(const Tensor& x) {
    return forward(x, prepare_state(x));
}

HiddenState SpikingLSTMCellImpl::forward(const Tensor& x, const HiddenState& hc) {
    const Tensor& h = std::get<0>(hc);
    const Tensor& c = std::get<1>(hc);
    TORCH_CHECK(x.dim() == 2 && x.size(1) == options.input_size(),
                "SpikingLSTMCell: x must be [batch, ", options.input_size(), "], got ", x.sizes());
    TORCH_CHECK(h.sizes() == c.sizes(), "SpikingLSTMCell: h and c differ in shape, ", h.sizes(), " vs ", c.sizes());
    TORCH_CHECK(h.dim() == 2 && h.size(0) == x.size(0) && h.size(1) == options.hidden_size(),
                "SpikingLSTMCell: h must be [", x.size(0), ", ", options.hidden_size(), "], got ", h.sizes());
    check_spiking_modes();

    Tensor pre = linear_ih(x) + linear_hh(h) - options.v_threshold();

    Tensor i, f, g, o;
    const auto& second = options.surrogate_function2();
    if (!second.has_value()) {
        auto gates = options.surrogate_function1()(pre).chunk(4, 1);
        i = gates[0];
        f = gates[1];
        g = gates[2];
        o = gates[3];
    } else {
        const auto& first = options.surrogate_function1();
        auto chunks = pre.chunk(4, 1);
        i = first(chunks[0]);
        f = first(chunks[1]);
        g = (*second)(chunks[2]);
        o = first(chunks[3]);
    }

    Tensor c_next;
    Tensor h_next;
    if (gates_spiking()) {
        c_next = accelerating::mul(c, f) + accelerating::mul(i, g, true);
        h_next = accelerating::mul(c_next, o);
    } else {
        c_next = c * f + i * g;
        h_next = c_next * o;
    }

    if (recorder_) {
        recorder_->record("i", i);
        recorder_->record("f", f);
        recorder_->record("g", g);
        recorder_->record("o", o);
        recorder_->record("c", c_next);
        recorder_->record("h", h_next);
    }

    h_ = h_next;
    c_ = c_next;
    return {h_next, c_next};
}

void SpikingLSTMCellImpl::reset() {
    h_ = Tensor();
    c_ = Tensor();
    if (recorder_) {
        recorder_->clear();
    }
}

void SpikingLSTMCellImpl::set_monitor(bool enabled) {
    options.monitor_state(enabled);
    if (enabled) {
        recorder_ = std::make_unique<monitor::Recorder>(
            std::vector<std::string>{"i", "f", "g", "o", "c", "h"});
    } else {
        recorder_.reset();
    }
}

void SpikingLSTMCellImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::rnn::SpikingLSTMCell(input_size=" << options.input_size()
           << ", hidden_size=" << options.hidden_size()
           << ", bias=" << std::boolalpha << options.bias()
           << ", v_threshold=" << options.v_threshold()
           << ", surrogate_function1=" << options.surrogate_function1();
    if (options.surrogate_function2().has_value()) {
        stream << ", surrogate_function2=" << *options.surrogate_function2();
    }
    stream << ")";
}

// =============================================================================
// SpikingLSTM
// =============================================================================

SpikingLSTMImpl::SpikingLSTMImpl(const SpikingLSTMOptions& options_)
    : options(options_) {
    C10_LOG_API_USAGE_ONCE("spikegrad.rnn.SpikingLSTM");
    TORCH_CHECK_NOT_IMPLEMENTED(!options.bidirectional(), "SpikingLSTM: bidirectional is not supported");
    TORCH_CHECK(options.num_layers() >= 1, "SpikingLSTM: num_layers must be at least 1, got ", options.num_layers());
    TORCH_CHECK_VALUE(
        options.dropout_p() >= 0 && options.dropout_p() < 1,
        "SpikingLSTM: dropout_p must lie in [0, 1), got ", options.dropout_p());

    for (int64_t layer = 0; layer < options.num_layers(); ++layer) {
        const int64_t input_size = layer == 0 ? options.input_size() : options.hidden_size();
        auto cell_options = SpikingLSTMCellOptions(input_size, options.hidden_size())
                                .bias(options.bias())
                                .v_threshold(options.v_threshold())
                                .surrogate_function1(options.surrogate_function1())
                                .surrogate_function2(options.surrogate_function2())
                                .monitor_state(options.monitor_state());
        cells.push_back(register_module("cell_" + std::to_string(layer), SpikingLSTMCell(cell_options)));
    }
}

std::tuple<Tensor, HiddenState> SpikingLSTMImpl::forward(const Tensor& x) {
    return can_run_fused(x) ? run_fused(x, std::nullopt) : run(x, std::nullopt);
}

std::tuple<Tensor, HiddenState> SpikingLSTMImpl::forward(const Tensor& x, const HiddenState& hc) {
    TORCH_CHECK(x.dim() == 3, "SpikingLSTM: x must be [T, batch, input_size], got ", x.sizes());
    const std::vector<int64_t> shape = {options.num_layers(), x.size(1), options.hidden_size()};
    const torch::IntArrayRef expected(shape);
    TORCH_CHECK(std::get<0>(hc).sizes() == expected && std::get<1>(hc).sizes() == expected,
                "SpikingLSTM: h and c must be ", expected, ", got ",
                std::get<0>(hc).sizes(), " and ", std::get<1>(hc).sizes());
    return can_run_fused(x) ? run_fused(x, hc) : run(x, hc);
}

bool SpikingLSTMImpl::dropout_active() const {
    return is_training() && options.dropout_p() > 0 && options.num_layers() > 1;
}

bool SpikingLSTMImpl::can_run_fused(const Tensor& x) const {
    if (torch::GradMode::is_enabled() || !x.is_cuda()) {
        return false;
    }
    bool fused = !dropout_active() && cuda::can_fuse({x});
    for (const auto& cell : cells) {
        fused = fused && cell->gates_spiking() && cell->monitor() == nullptr &&
                cell->weight_ih().scalar_type() == x.scalar_type();
    }
    if (!fused) {
        TORCH_WARN_ONCE("SpikingLSTM: CUDA inference falls back to the per-step loop");
    }
    return fused;
}

std::tuple<Tensor, HiddenState> SpikingLSTMImpl::run(const Tensor& x, const std::optional<HiddenState>& hc) {
    TORCH_CHECK(x.dim() == 3 && x.size(0) > 0 && x.size(2) == options.input_size(),
                "SpikingLSTM: x must be [T, batch, ", options.input_size(), "] with T > 0, got ", x.sizes());
    const int64_t time_steps = x.size(0);
    const int64_t batch_size = x.size(1);
    const double p = options.dropout_p();
    const bool dropout = dropout_active();

    if (hc.has_value()) {
        for (size_t layer = 0; layer < cells.size(); ++layer) {
            cells[layer]->set_state(std::get<0>(*hc)[layer], std::get<1>(*hc)[layer]);
        }
    }

    dropout_mask_ = Tensor();
    if (dropout && options.invariant_dropout_mask()) {
        torch::NoGradGuard no_grad;
        dropout_mask_ = torch::dropout(torch::ones({batch_size, options.hidden_size()}, x.options()), p, true);
    }

    std::vector<Tensor> output;
    output.reserve(time_steps);
    for (int64_t t = 0; t < time_steps; ++t) {
        Tensor input = x[t];
        for (size_t layer = 0; layer < cells.size(); ++layer) {
            if (layer > 0 && dropout) {
                input = dropout_mask_.defined() ? input * dropout_mask_ : torch::dropout(input, p, true);
            }
            input = std::get<0>(cells[layer]->forward(input));
        }
        output.push_back(input);
    }
    return {torch::stack(output), final_state()};
}

std::tuple<Tensor, HiddenState> SpikingLSTMImpl::run_fused(const Tensor& x, const std::optional<HiddenState>& hc) {
    TORCH_CHECK(x.dim() == 3 && x.size(0) > 0 && x.size(2) == options.input_size(),
                "SpikingLSTM: x must be [T, batch, ", options.input_size(), "] with T > 0, got ", x.sizes());
    const int64_t time_steps = x.size(0);
    dropout_mask_ = Tensor();

    Tensor input = x;
    for (size_t layer = 0; layer < cells.size(); ++layer) {
        auto& cell = cells[layer];
        HiddenState state = hc.has_value()
            ? HiddenState(std::get<0>(*hc)[layer], std::get<1>(*hc)[layer])
            : cell->prepare_state(x[0]);

        auto hc_seq = cuda::spiking_lstm_inference(
            input, std::get<0>(state), std::get<1>(state),
            cell->weight_ih(), cell->weight_hh(), cell->bias_ih(), cell->bias_hh(),
            options.v_threshold());

        cell->set_state(hc_seq[0][time_steps], hc_seq[1][time_steps]);
        input = hc_seq[0].slice(0, 1);
    }
    return {input, final_state()};
}

HiddenState SpikingLSTMImpl::final_state() const {
    std::vector<Tensor> h;
    std::vector<Tensor> c;
    for (const auto& cell : cells) {
        h.push_back(cell->h());
        c.push_back(cell->c());
    }
    return {torch::stack(h), torch::stack(c)};
}

void SpikingLSTMImpl::reset() {
    for (auto& cell : cells) {
        cell->reset();
    }
    dropout_mask_ = Tensor();
}

void SpikingLSTMImpl::set_monitor(bool enabled) {
    options.monitor_state(enabled);
    for (auto& cell : cells) {
        cell->set_monitor(enabled);
    }
}

void SpikingLSTMImpl::pretty_print(std::ostream& stream) const {
    stream << "spikegrad::rnn::SpikingLSTM(input_size=" << options.input_size()
           << ", hidden_size=" << options.hidden_size()
           << ", num_layers=" << options.num_layers()
           << ", dropout_p=" << options.dropout_p()
           << ", invariant_dropout_mask=" << std::boolalpha << options.invariant_dropout_mask() << ")";
}

}  // namespace rnn
}  // namespace spikegrad
