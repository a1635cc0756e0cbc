// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Observers of neuron state.
//
// A neuron notifies its observer once per spike step with the membrane
// potential it is about to threshold and the resulting spike. With no
// observer installed nothing is recorded and nothing is copied.

#ifndef SPIKEGRAD_CLOCK_DRIVEN_MONITOR_H
#define SPIKEGRAD_CLOCK_DRIVEN_MONITOR_H

#include <torch/torch.h>

#include <map>
#include <string>
#include <vector>

namespace spikegrad {
namespace monitor {

class NodeObserver {
public:
    virtual ~NodeObserver() = default;

    // v is the pre-spike potential, v_rest the potential before any input.
    virtual void on_spiking(const torch::Tensor& v, const torch::Tensor& spike, double v_rest) = 0;

    virtual void on_reset() = 0;
};

// Records detached CPU copies of v and spike.
//
// v() holds one more entry than s(): the first entry is the potential at the
// step before any input (filled with v_rest), followed by the pre-spike
// potential of every step.
class Monitor : public NodeObserver {
public:
    void on_spiking(const torch::Tensor& v, const torch::Tensor& spike, double v_rest) override;
    void on_reset() override;

    const std::vector<torch::Tensor>& v() const { return v_; }
    const std::vector<torch::Tensor>& s() const { return s_; }

private:
    std::vector<torch::Tensor> v_;
    std::vector<torch::Tensor> s_;
};

// Named recorder for multi-tensor state such as LSTM gates.
class Recorder {
public:
    explicit Recorder(std::vector<std::string> keys);

    void record(const std::string& key, const torch::Tensor& value);
    void clear();

    const std::vector<torch::Tensor>& operator[](const std::string& key) const;

private:
    std::map<std::string, std::vector<torch::Tensor>> records_;
};

// Detached CPU copy.
torch::Tensor snapshot(const torch::Tensor& t);

}  // namespace monitor
}  // namespace spikegrad

#endif  // SPIKEGRAD_CLOCK_DRIVEN_MONITOR_H
