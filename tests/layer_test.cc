// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <cmath>
#include <vector>

#include "spikegrad/clock_driven/layer.h"

namespace spikegrad {
namespace layer {
namespace {

// =============================================================================
// Dropout
// =============================================================================

TEST(DropoutTest, MaskIsReusedUntilReset) {
    Dropout dropout(0.5);
    dropout->train();
    auto x = torch::ones({64, 64});

    auto first = dropout->forward(x);
    auto second = dropout->forward(x);
    EXPECT_TRUE(torch::equal(first, second));
    EXPECT_TRUE(torch::logical_or(first == 0, first == 2).all().item<bool>());

    dropout->reset();
    EXPECT_FALSE(dropout->mask().defined());
    auto third = dropout->forward(x);
    // 4096 independent draws; a repeat of the same mask is practically impossible.
    EXPECT_FALSE(torch::equal(first, third));
}

TEST(DropoutTest, EvalIsIdentity) {
    Dropout dropout;
    dropout->eval();
    auto x = torch::randn({8, 8});
    EXPECT_TRUE(torch::equal(dropout->forward(x), x));
    EXPECT_FALSE(dropout->mask().defined());
}

TEST(DropoutTest, MaskScalesInputElementwise) {
    Dropout dropout(0.2);
    auto x = torch::randn({10, 10});
    auto y = dropout->forward(x);
    EXPECT_TRUE(torch::allclose(y, x * dropout->mask()));
}

TEST(DropoutTest, RejectsProbabilityOutsideOpenInterval) {
    EXPECT_THROW(Dropout(0.0), c10::ValueError);
    EXPECT_THROW(Dropout(1.0), c10::ValueError);
    EXPECT_THROW(Dropout(-0.5), c10::ValueError);
    EXPECT_THROW(Dropout2d(1.5), c10::ValueError);
}

TEST(DropoutTest, DefaultProbabilities) {
    EXPECT_EQ(Dropout()->options.p(), 0.5);
    EXPECT_EQ(Dropout2d()->options.p(), 0.2);
}

TEST(Dropout2dTest, DropsWholeChannels) {
    Dropout2d dropout(0.5);
    auto x = torch::ones({4, 16, 5, 5});
    auto y = dropout->forward(x);

    // Every channel map is either all zero or all 2.
    auto per_channel_min = std::get<0>(y.flatten(2).min(2));
    auto per_channel_max = std::get<0>(y.flatten(2).max(2));
    EXPECT_TRUE(torch::equal(per_channel_min, per_channel_max));
    EXPECT_TRUE(torch::equal(dropout->forward(x), y));
}

// =============================================================================
// LowPassSynapse
// =============================================================================

TEST(LowPassSynapseTest, DecaysBetweenSpikes) {
    LowPassSynapse synapse(10.0);
    std::vector<double> out;
    for (double s : {1.0, 0.0, 0.0}) {
        out.push_back(synapse->forward(torch::full({1}, s)).item<double>());
    }
    EXPECT_NEAR(out[0], 1.0, 1e-6);
    EXPECT_NEAR(out[1], 0.9, 1e-6);
    EXPECT_NEAR(out[2], 0.81, 1e-6);
}

TEST(LowPassSynapseTest, SpikeAddsOne) {
    LowPassSynapse synapse(4.0);
    synapse->forward(torch::ones({2}));
    auto out = synapse->forward(torch::ones({2}));
    EXPECT_TRUE(torch::allclose(out, torch::full({2}, 2.0)));
}

TEST(LowPassSynapseTest, ResetClearsCurrent) {
    LowPassSynapse synapse(10.0);
    synapse->forward(torch::ones({3}));
    synapse->reset();
    EXPECT_FALSE(synapse->out().defined());
    auto out = synapse->forward(torch::zeros({3}));
    EXPECT_TRUE(torch::equal(out, torch::zeros({3})));
}

TEST(LowPassSynapseTest, LearnableTau) {
    LowPassSynapse fixed(LowPassSynapseOptions(5.0));
    EXPECT_TRUE(fixed->parameters().empty());
    EXPECT_NEAR(fixed->tau(), 5.0, 1e-5);

    LowPassSynapse learnable(LowPassSynapseOptions(5.0).learnable(true));
    ASSERT_EQ(learnable->parameters().size(), 1u);
    EXPECT_NEAR(learnable->reciprocal_tau().item<double>(), 0.2, 1e-7);
    EXPECT_NEAR(learnable->tau(), 5.0, 1e-5);

    learnable->forward(torch::ones({4}));
    auto out = learnable->forward(torch::zeros({4}));
    out.sum().backward();
    ASSERT_TRUE(learnable->reciprocal_tau().grad().defined());
    EXPECT_NEAR(learnable->reciprocal_tau().grad().item<double>(), -4.0, 1e-5);
}

// =============================================================================
// NeuNorm
// =============================================================================

TEST(NeuNormTest, FollowsRecurrence) {
    const int64_t channels = 3;
    const double k = 0.8;
    NeuNorm norm(NeuNormOptions(channels).k(k));
    EXPECT_DOUBLE_EQ(norm->k0(), k);
    EXPECT_DOUBLE_EQ(norm->k1(), (1 - k) / 9);

    auto s0 = (torch::rand({2, channels, 4, 4}) > 0.5).to(torch::kFloat);
    auto s1 = (torch::rand({2, channels, 4, 4}) > 0.5).to(torch::kFloat);

    auto x0 = norm->k1() * s0.sum(1, true);
    auto x1 = k * x0 + norm->k1() * s1.sum(1, true);

    auto out0 = norm->forward(s0);
    auto out1 = norm->forward(s1);
    EXPECT_TRUE(torch::allclose(out0, s0 - norm->w * x0));
    EXPECT_TRUE(torch::allclose(out1, s1 - norm->w * x1));
    EXPECT_EQ(norm->w.sizes(), torch::IntArrayRef({channels, 1, 1}));
}

TEST(NeuNormTest, ResetForgetsHistory) {
    NeuNorm norm(2);
    auto s = torch::ones({1, 2, 3, 3});
    auto first = norm->forward(s);
    norm->forward(s);
    norm->reset();
    EXPECT_FALSE(norm->x().defined());
    EXPECT_TRUE(torch::allclose(norm->forward(s), first));
}

// =============================================================================
// Stateless layers
// =============================================================================

TEST(ChannelsMaxPoolTest, PoolsAlongChannels) {
    ChannelsMaxPool pool(2);
    auto x = torch::arange(2 * 4 * 3 * 3, torch::kFloat).reshape({2, 4, 3, 3});
    auto y = pool->forward(x);
    EXPECT_EQ(y.sizes(), torch::IntArrayRef({2, 2, 3, 3}));
    auto expected = torch::stack(
        {torch::max(x.select(1, 0), x.select(1, 1)), torch::max(x.select(1, 2), x.select(1, 3))}, 1);
    EXPECT_TRUE(torch::equal(y, expected));
}

TEST(BatchNorm2dTest, ScalesNormalisedInput) {
    BatchNorm2d bn(BatchNorm2dOptions(3));
    ASSERT_TRUE(bn->weight.defined());
    {
        torch::NoGradGuard no_grad;
        bn->weight.copy_(torch::tensor({1.0f, 2.0f, 3.0f}).view({3, 1, 1}));
    }
    auto x = torch::randn({8, 3, 4, 4});
    auto y = bn->forward(x);
    auto reference = torch::batch_norm(x, {}, {}, {}, {}, true, 0.1, 1e-5, false);
    EXPECT_TRUE(torch::allclose(y, reference * bn->weight, 1e-4, 1e-5));
}

TEST(BatchNorm2dTest, WithoutScalingHasNoParameters) {
    BatchNorm2d bn(BatchNorm2dOptions(3).scaling(false));
    EXPECT_FALSE(bn->weight.defined());
    EXPECT_TRUE(bn->parameters().empty());
}

TEST(AXATTest, AppliesBothSides) {
    AXAT axat(4, 2);
    auto x = torch::randn({5, 3, 4, 4});
    auto y = axat->forward(x);
    EXPECT_EQ(y.sizes(), torch::IntArrayRef({5, 3, 2, 2}));
    auto expected = axat->A.matmul(x[1][2]).matmul(axat->A.t());
    EXPECT_TRUE(torch::allclose(y[1][2], expected, 1e-5, 1e-6));
}

TEST(DCTTest, KernelIsOrthonormal) {
    DCT dct(8);
    auto k = dct->kernel;
    EXPECT_TRUE(torch::allclose(k.matmul(k.t()), torch::eye(8), 1e-5, 1e-6));
}

TEST(DCTTest, ConstantBlockHasOnlyDcCoefficient) {
    DCT dct(4);
    auto x = torch::ones({2, 8, 8});
    auto y = dct->forward(x);
    EXPECT_EQ(y.sizes(), x.sizes());
    // Each 4x4 block of ones: DC = (4 / sqrt(4))^2 = 4, every other coefficient 0.
    for (int64_t i = 0; i < 8; ++i) {
        for (int64_t j = 0; j < 8; ++j) {
            const double expected = (i % 4 == 0 && j % 4 == 0) ? 4.0 : 0.0;
            EXPECT_NEAR(y[1][i][j].item<double>(), expected, 1e-5);
        }
    }
}

TEST(DCTTest, RejectsIndivisibleInput) {
    DCT dct(3);
    EXPECT_THROW(dct->forward(torch::ones({4, 4})), c10::Error);
}

}  // namespace
}  // namespace layer
}  // namespace spikegrad
