// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <sstream>
#include <vector>

#include "spikegrad/clock_driven/surrogate.h"

namespace spikegrad {
namespace surrogate {
namespace {

std::vector<SurrogateFunction> all_surrogates() {
    return {Sigmoid(4.0), BilinearLeakyReLU(), SignSwish(), Erf(), ATan()};
}

torch::Tensor probe_points() {
    return torch::tensor({-2.0, -0.3, -0.01, 0.0, 0.01, 0.3, 2.0}, torch::kDouble);
}

TEST(SurrogateTest, ForwardIsHeavisideStep) {
    const auto expected = torch::tensor({0.0, 0.0, 0.0, 1.0, 1.0, 1.0, 1.0}, torch::kDouble);
    for (const auto& sg : all_surrogates()) {
        SCOPED_TRACE(sg.name());
        auto spike = sg(probe_points());
        EXPECT_EQ(spike.scalar_type(), torch::kDouble);
        EXPECT_TRUE(torch::equal(spike, expected));
        EXPECT_TRUE(torch::equal(sg.heaviside(probe_points()), expected));
    }
}

TEST(SurrogateTest, ZeroInputFires) {
    for (const auto& sg : all_surrogates()) {
        SCOPED_TRACE(sg.name());
        EXPECT_EQ(sg(torch::zeros({3})).sum().item<float>(), 3.0f);
    }
}

TEST(SurrogateTest, SigmoidBackwardMatchesAnalyticGradient) {
    const double alpha = 4.0;
    Sigmoid sg(alpha);
    auto x = probe_points().requires_grad_();
    sg(x).sum().backward();

    auto s = torch::sigmoid(alpha * probe_points());
    auto expected = alpha * s * (1 - s);
    EXPECT_TRUE(torch::allclose(x.grad(), expected));
}

TEST(SurrogateTest, BilinearLeakyReLUGradientIsPiecewiseConstant) {
    BilinearLeakyReLU sg(1.0, 0.01, 0.5);
    auto x = torch::tensor({-1.0, -0.5, 0.0, 0.5, 1.0}, torch::kDouble).requires_grad_();
    sg(x).sum().backward();
    auto expected = torch::tensor({0.01, 1.0, 1.0, 1.0, 0.01}, torch::kDouble);
    EXPECT_TRUE(torch::allclose(x.grad(), expected));
}

TEST(SurrogateTest, BackwardScalesIncomingGradient) {
    for (const auto& sg : all_surrogates()) {
        SCOPED_TRACE(sg.name());
        auto x = probe_points().requires_grad_();
        auto grad_out = torch::linspace(0.5, 2.0, x.numel(), torch::kDouble);
        sg(x).backward(grad_out);
        EXPECT_TRUE(torch::allclose(x.grad(), grad_out * sg.grad(probe_points())));
        EXPECT_TRUE(torch::allclose(sg.backward(probe_points(), grad_out), x.grad()));
    }
}

TEST(SurrogateTest, GradIsDerivativeOfPrimitive) {
    // Away from the BilinearLeakyReLU corners at +-c.
    auto points = torch::tensor({-1.7, -0.2, 0.05, 0.4, 1.3}, torch::kDouble);
    for (const auto& sg : all_surrogates()) {
        SCOPED_TRACE(sg.name());
        auto x = points.clone().requires_grad_();
        sg.primitive(x).sum().backward();
        EXPECT_TRUE(torch::allclose(x.grad(), sg.grad(points), 1e-6, 1e-8));
    }
}

TEST(SurrogateTest, PrimitiveIsMonotoneAndCentred) {
    auto x = torch::linspace(-3.0, 3.0, 61, torch::kDouble);
    for (const auto& sg : all_surrogates()) {
        if (sg.kind() == Kind::kBilinearLeakyReLU || sg.kind() == Kind::kSignSwish) {
            continue;
        }
        SCOPED_TRACE(sg.name());
        auto g = sg.primitive(x);
        EXPECT_TRUE((g.slice(0, 1) >= g.slice(0, 0, -1)).all().item<bool>());
        EXPECT_NEAR(sg.primitive(torch::zeros({1}, torch::kDouble)).item<double>(), 0.5, 1e-12);
    }
}

TEST(SurrogateTest, NonSpikingModeReturnsPrimitive) {
    for (auto sg : all_surrogates()) {
        SCOPED_TRACE(sg.name());
        sg.set_spiking_mode(false);
        EXPECT_FALSE(sg.spiking());

        auto x = probe_points().requires_grad_();
        auto y = sg(x);
        EXPECT_TRUE(torch::allclose(y, sg.primitive(probe_points())));

        y.sum().backward();
        EXPECT_TRUE(torch::allclose(x.grad(), sg.grad(probe_points()), 1e-6, 1e-8));
    }
}

TEST(SurrogateTest, NoGraphWithoutRequiresGrad) {
    Erf sg;
    auto spike = sg(probe_points());
    EXPECT_FALSE(spike.requires_grad());
}

TEST(SurrogateTest, DefaultParameters) {
    EXPECT_DOUBLE_EQ(Sigmoid().params()[0], 1.0);
    EXPECT_DOUBLE_EQ(SignSwish().params()[0], 5.0);
    EXPECT_DOUBLE_EQ(Erf().params()[0], 2.0);
    EXPECT_DOUBLE_EQ(ATan().params()[0], 2.0);

    const auto p = BilinearLeakyReLU().params();
    EXPECT_DOUBLE_EQ(p[0], 1.0);
    EXPECT_DOUBLE_EQ(p[1], 0.01);
    EXPECT_DOUBLE_EQ(p[2], 0.5);
}

TEST(SurrogateTest, PrintsKindAndParameters) {
    std::ostringstream out;
    out << Sigmoid(4.0);
    EXPECT_EQ(out.str(), "Sigmoid(alpha=4, spiking=true)");

    std::ostringstream out2;
    out2 << SignSwish(5.0, false);
    EXPECT_EQ(out2.str(), "SignSwish(beta=5, spiking=false)");
}

TEST(SurrogateTest, CudaMatchesCpu) {
    if (!torch::cuda::is_available()) {
        GTEST_SKIP() << "CUDA not available";
    }
    auto x_cpu = torch::randn({257}, torch::kFloat);
    auto grad_out = torch::rand({257}, torch::kFloat);
    for (const auto& sg : all_surrogates()) {
        SCOPED_TRACE(sg.name());
        auto x_cuda = x_cpu.to(torch::kCUDA).requires_grad_();
        auto spike = sg(x_cuda);
        spike.backward(grad_out.to(torch::kCUDA));

        EXPECT_TRUE(torch::equal(spike.cpu(), sg.heaviside(x_cpu)));
        EXPECT_TRUE(torch::allclose(x_cuda.grad().cpu(), grad_out * sg.grad(x_cpu), 1e-4, 1e-5));
    }
}

}  // namespace
}  // namespace surrogate
}  // namespace spikegrad
