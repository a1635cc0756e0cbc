// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include "spikegrad/clock_driven/monitor.h"

#include <utility>

namespace spikegrad {
namespace monitor {

torch::Tensor snapshot(const torch::Tensor& t) {
    return t.detach().to(torch::kCPU).clone();
}

void Monitor::on_spiking(const torch::Tensor& v, const torch::Tensor& spike, double v_rest) {
    if (v_.empty()) {
        v_.push_back(torch::full_like(snapshot(v), v_rest));
    }
    v_.push_back(snapshot(v));
    s_.push_back(snapshot(spike));
}

void Monitor::on_reset() {
    v_.clear();
    s_.clear();
}

Recorder::Recorder(std::vector<std::string> keys) {
    for (auto& key : keys) {
        records_.emplace(std::move(key), std::vector<torch::Tensor>());
    }
}

void Recorder::record(const std::string& key, const torch::Tensor& value) {
    auto it = records_.find(key);
    TORCH_CHECK(it != records_.end(), "Recorder has no key '", key, "'");
    it->second.push_back(snapshot(value));
}

void Recorder::clear() {
    for (auto& entry : records_) {
        entry.second.clear();
    }
}

const std::vector<torch::Tensor>& Recorder::operator[](const std::string& key) const {
    auto it = records_.find(key);
    TORCH_CHECK(it != records_.end(), "Recorder has no key '", key, "'");
    return it->second;
}

}  // namespace monitor
}  // namespace spikegrad
