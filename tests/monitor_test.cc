// Copyright 2025 Erik Garrison. Apache 2.0 License.

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "spikegrad/clock_driven/monitor.h"

namespace spikegrad {
namespace monitor {
namespace {

TEST(MonitorTest, FirstStepAddsRestEntry) {
    Monitor m;
    m.on_spiking(torch::tensor({0.5f, 1.2f}), torch::tensor({0.0f, 1.0f}), -0.1);

    ASSERT_EQ(m.v().size(), 2u);
    ASSERT_EQ(m.s().size(), 1u);
    EXPECT_TRUE(torch::allclose(m.v()[0], torch::tensor({-0.1f, -0.1f})));
    EXPECT_TRUE(torch::allclose(m.v()[1], torch::tensor({0.5f, 1.2f})));

    m.on_spiking(torch::tensor({0.1f, 0.1f}), torch::tensor({0.0f, 0.0f}), -0.1);
    EXPECT_EQ(m.v().size(), 3u);
    EXPECT_EQ(m.s().size(), 2u);
}

TEST(MonitorTest, RecordsAreDetachedCopies) {
    Monitor m;
    auto v = torch::ones({2}, torch::requires_grad());
    auto spike = torch::ones({2});
    m.on_spiking(v * 2, spike, 0.0);
    EXPECT_FALSE(m.v()[1].requires_grad());

    spike.zero_();
    EXPECT_TRUE(torch::equal(m.s()[0], torch::ones({2})));
}

TEST(MonitorTest, ResetClearsRecords) {
    Monitor m;
    m.on_spiking(torch::zeros({1}), torch::zeros({1}), 0.0);
    m.on_reset();
    EXPECT_TRUE(m.v().empty());
    EXPECT_TRUE(m.s().empty());
}

TEST(RecorderTest, RecordsByKey) {
    Recorder r({"a", "b"});
    r.record("a", torch::ones({1}));
    r.record("a", torch::zeros({1}));
    EXPECT_EQ(r["a"].size(), 2u);
    EXPECT_TRUE(r["b"].empty());

    r.clear();
    EXPECT_TRUE(r["a"].empty());
}

TEST(RecorderTest, UnknownKeyThrows) {
    Recorder r({"a"});
    EXPECT_THROW(r.record("z", torch::ones({1})), c10::Error);
    EXPECT_THROW(r["z"], c10::Error);
}

}  // namespace
}  // namespace monitor
}  // namespace spikegrad
