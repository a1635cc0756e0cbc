// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "spikegrad/clock_driven/functional.h"
#include "spikegrad/clock_driven/layer.h"
#include "spikegrad/clock_driven/neuron.h"
#include "spikegrad/clock_driven/rnn.h"

namespace spikegrad {
namespace functional {
namespace {

torch::nn::Sequential make_net() {
    return torch::nn::Sequential(
        torch::nn::Linear(4, 8),
        neuron::IFNode(),
        layer::Dropout(0.5),
        layer::LowPassSynapse(10.0));
}

TEST(ResetNetTest, ResetsEveryStatefulModule) {
    auto net = make_net();
    auto node = net[1]->as<neuron::IFNodeImpl>();
    auto dropout = net[2]->as<layer::DropoutImpl>();
    auto synapse = net[3]->as<layer::LowPassSynapseImpl>();
    ASSERT_NE(node, nullptr);
    ASSERT_NE(dropout, nullptr);
    ASSERT_NE(synapse, nullptr);

    for (int t = 0; t < 3; ++t) {
        net->forward(torch::randn({2, 4}) * 4);
    }
    EXPECT_EQ(node->v().dim(), 2);
    EXPECT_TRUE(dropout->mask().defined());
    EXPECT_TRUE(synapse->out().defined());

    EXPECT_EQ(reset_net(*net), 3);
    EXPECT_EQ(node->v().dim(), 0);
    EXPECT_EQ(node->v().item<double>(), 0.0);
    EXPECT_FALSE(dropout->mask().defined());
    EXPECT_FALSE(synapse->out().defined());
}

TEST(ResetNetTest, CountsTheRootModule) {
    neuron::LIFNode node;
    node->forward(torch::ones({3}));
    EXPECT_EQ(reset_net(*node), 1);
    EXPECT_EQ(node->v().dim(), 0);
}

TEST(ResetNetTest, StatelessNetworkResetsNothing) {
    torch::nn::Sequential net(torch::nn::Linear(2, 2), torch::nn::ReLU());
    EXPECT_EQ(reset_net(*net), 0);
}

TEST(ResetNetTest, ResetsLstmAndItsCells) {
    rnn::SpikingLSTM lstm(rnn::SpikingLSTMOptions(3, 5).num_layers(2));
    lstm->forward(torch::randn({4, 2, 3}));
    ASSERT_TRUE(lstm->cells[0]->h().defined());

    // The LSTM and both cells.
    EXPECT_EQ(reset_net(*lstm), 3);
    EXPECT_FALSE(lstm->cells[0]->h().defined());
    EXPECT_FALSE(lstm->cells[1]->c().defined());
}

TEST(SetMonitorTest, TogglesNeuronsAndCells) {
    torch::nn::Sequential net(
        torch::nn::Linear(4, 4),
        neuron::IFNode(),
        neuron::PLIFNode(),
        layer::LowPassSynapse());
    auto first = net[1]->as<neuron::IFNodeImpl>();
    auto second = net[2]->as<neuron::PLIFNodeImpl>();

    EXPECT_EQ(set_monitor(*net, true), 2);
    ASSERT_NE(first->monitor(), nullptr);
    ASSERT_NE(second->monitor(), nullptr);

    net->forward(torch::randn({1, 4}));
    EXPECT_EQ(first->monitor()->s().size(), 1u);
    EXPECT_EQ(second->monitor()->v().size(), 2u);

    EXPECT_EQ(set_monitor(*net, false), 2);
    EXPECT_EQ(first->monitor(), nullptr);
    EXPECT_EQ(second->monitor(), nullptr);
}

TEST(SetMonitorTest, ReachesLstmCells) {
    rnn::SpikingLSTM lstm(rnn::SpikingLSTMOptions(3, 5).num_layers(2));
    EXPECT_EQ(set_monitor(*lstm, true), 3);
    for (const auto& cell : lstm->cells) {
        EXPECT_NE(cell->monitor(), nullptr);
    }
    set_monitor(*lstm, false);
    for (const auto& cell : lstm->cells) {
        EXPECT_EQ(cell->monitor(), nullptr);
    }
}

}  // namespace
}  // namespace functional
}  // namespace spikegrad
