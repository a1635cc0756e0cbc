// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "spikegrad/clock_driven/accelerating.h"

namespace spikegrad {
namespace accelerating {
namespace {

torch::Tensor random_spike(torch::IntArrayRef shape) {
    return (torch::rand(shape) > 0.5).to(torch::kFloat);
}

TEST(AcceleratingTest, MulMatchesElementwiseProduct) {
    auto x = torch::randn({4, 5}, torch::requires_grad());
    auto spike = random_spike({4, 5}).requires_grad_();
    auto grad_out = torch::randn({4, 5});

    auto y = mul(x, spike);
    EXPECT_TRUE(torch::allclose(y, x * spike));

    y.backward(grad_out);
    EXPECT_TRUE(torch::allclose(x.grad(), grad_out * spike));
    EXPECT_TRUE(torch::allclose(spike.grad(), grad_out * x));
}

TEST(AcceleratingTest, SpikeMulSpikeIsLogicalAnd) {
    auto a = torch::tensor({0.0f, 0.0f, 1.0f, 1.0f});
    auto b = torch::tensor({0.0f, 1.0f, 0.0f, 1.0f});
    EXPECT_TRUE(torch::equal(mul(a, b, true), torch::tensor({0.0f, 0.0f, 0.0f, 1.0f})));
}

TEST(AcceleratingTest, MulReducesBroadcastGradient) {
    auto x = torch::randn({3, 1}, torch::requires_grad());
    auto spike = random_spike({3, 4});
    mul(x, spike).sum().backward();
    EXPECT_EQ(x.grad().sizes(), x.sizes());
    EXPECT_TRUE(torch::allclose(x.grad(), spike.sum(1, true)));
}

TEST(AcceleratingTest, HardVoltageTransformMatchesFormula) {
    const double v_reset = -0.2;
    auto v = torch::randn({6}, torch::requires_grad());
    auto spike = torch::tensor({1.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f}).requires_grad_();
    auto grad_out = torch::randn({6});

    auto v_next = hard_voltage_transform(v, spike, v_reset);
    EXPECT_TRUE(torch::allclose(v_next, v * (1 - spike) + v_reset * spike));

    v_next.backward(grad_out);
    EXPECT_TRUE(torch::allclose(v.grad(), grad_out * (1 - spike)));
    EXPECT_TRUE(torch::allclose(spike.grad(), grad_out * (v_reset - v)));
}

TEST(AcceleratingTest, SoftVoltageTransformMatchesFormula) {
    const double v_threshold = 1.5;
    auto v = torch::randn({6}, torch::requires_grad());
    auto spike = torch::tensor({1.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f}).requires_grad_();
    auto grad_out = torch::randn({6});

    auto v_next = soft_voltage_transform(v, spike, v_threshold);
    EXPECT_TRUE(torch::allclose(v_next, v - spike * v_threshold));

    v_next.backward(grad_out);
    EXPECT_TRUE(torch::allclose(v.grad(), grad_out));
    EXPECT_TRUE(torch::allclose(spike.grad(), -v_threshold * grad_out));
}

TEST(AcceleratingTest, IsSpike) {
    EXPECT_TRUE(is_spike(torch::tensor({0.0f, 1.0f, 1.0f})));
    EXPECT_FALSE(is_spike(torch::tensor({0.0f, 0.5f, 1.0f})));
    EXPECT_FALSE(is_spike(torch::tensor({-1.0f})));
}

TEST(AcceleratingTest, CudaMatchesCpu) {
    if (!torch::cuda::is_available()) {
        GTEST_SKIP() << "CUDA not available";
    }
    auto v_cpu = torch::randn({1000});
    auto s_cpu = random_spike({1000});
    auto g_cpu = torch::randn({1000});

    auto v = v_cpu.to(torch::kCUDA).requires_grad_();
    auto s = s_cpu.to(torch::kCUDA).requires_grad_();
    auto g = g_cpu.to(torch::kCUDA);

    auto hard = hard_voltage_transform(v, s, 0.0);
    EXPECT_TRUE(torch::allclose(hard.cpu(), v_cpu * (1 - s_cpu)));
    hard.backward(g);
    EXPECT_TRUE(torch::allclose(v.grad().cpu(), g_cpu * (1 - s_cpu)));
    EXPECT_TRUE(torch::allclose(s.grad().cpu(), -g_cpu * v_cpu));

    v.mutable_grad() = torch::Tensor();
    s.mutable_grad() = torch::Tensor();
    auto soft = soft_voltage_transform(v, s, 1.0);
    EXPECT_TRUE(torch::allclose(soft.cpu(), v_cpu - s_cpu));
    soft.backward(g);
    EXPECT_TRUE(torch::allclose(v.grad().cpu(), g_cpu));
    EXPECT_TRUE(torch::allclose(s.grad().cpu(), -g_cpu));

    v.mutable_grad() = torch::Tensor();
    s.mutable_grad() = torch::Tensor();
    auto product = mul(v, s);
    EXPECT_TRUE(torch::allclose(product.cpu(), v_cpu * s_cpu));
    product.backward(g);
    EXPECT_TRUE(torch::allclose(v.grad().cpu(), g_cpu * s_cpu));
    EXPECT_TRUE(torch::allclose(s.grad().cpu(), g_cpu * v_cpu));
}

TEST(AcceleratingTest, CudaDoubleResetIsExact) {
    if (!torch::cuda::is_available()) {
        GTEST_SKIP() << "CUDA not available";
    }
    auto v_cpu = torch::randn({1000}, torch::kDouble);
    auto s_cpu = random_spike({1000}).to(torch::kDouble);
    auto v = v_cpu.to(torch::kCUDA);
    auto s = s_cpu.to(torch::kCUDA);

    auto hard = hard_voltage_transform(v, s, -0.1).cpu();
    EXPECT_TRUE(torch::equal(hard, hard_voltage_transform(v_cpu, s_cpu, -0.1)));
    auto fired = s_cpu != 0;
    EXPECT_TRUE((hard.masked_select(fired) == -0.1).all().item<bool>());

    auto soft = soft_voltage_transform(v, s, 0.3).cpu();
    EXPECT_TRUE(torch::equal(soft, soft_voltage_transform(v_cpu, s_cpu, 0.3)));
}

}  // namespace
}  // namespace accelerating
}  // namespace spikegrad
