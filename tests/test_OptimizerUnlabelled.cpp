/*
Test the optimizer of the unlabelled example weights
*/

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "OptimizerUnlabelled.hpp"

namespace {

auto top = at::TensorOptions().dtype(torch::kFloat64);

} // anonymous namespace

TEST(OptimizerUnlabelledTest, StepAgainstGradientAndClamp) {
    at::Tensor weights = at::full({4}, 0.5, top).requires_grad_(true);
    OptimizerUnlabelled optimizer(weights, 1.0, 0.1);
    at::Tensor loss = (weights * at::tensor({100.0, -100.0, 1.0, -1.0}, top)).sum();
    loss.backward();
    optimizer.step();
    // Moving averages: 0.1 x |gradient| in the column of its sign
    EXPECT_TRUE(at::allclose(optimizer.grad_hist,
        at::tensor({10.0, 0.0, 0.0, 10.0, 0.1, 0.0, 0.0, 0.1}, top).view({4, 2})));
    // 0.5 - 10, 0.5 + 10, 0.5 - 0.1, 0.5 + 0.1 has mean 0.5, then clamp
    EXPECT_TRUE(at::allclose(optimizer.weights.detach(), at::tensor({0.01, 0.99, 0.4, 0.6}, top)));
    // The optimizer updates the caller's tensor in place
    EXPECT_TRUE(at::equal(weights.detach(), optimizer.weights.detach()));
}

TEST(OptimizerUnlabelledTest, WeightsStayInRange) {
    at::Tensor weights = at::full({6}, 0.5, top).requires_grad_(true);
    OptimizerUnlabelled optimizer(weights, 10.0, 0.1, true);
    at::Tensor direction = at::tensor({3.0, -2.0, 0.5, -0.1, 7.0, -4.0}, top);
    for (size_t i = 0; i < 20; i++) {
        optimizer.zero_grad();
        at::Tensor loss = (weights * direction * (i % 2 == 0 ? 1.0 : -0.5)).sum();
        loss.backward();
        optimizer.step();
        EXPECT_GE(weights.min().item<double>(), 0.01);
        EXPECT_LE(weights.max().item<double>(), 0.99);
    }
}

TEST(OptimizerUnlabelledTest, RejectsBadWeights) {
    EXPECT_THROW(OptimizerUnlabelled(at::full({3}, 0.5, top)), std::invalid_argument);
    EXPECT_THROW(OptimizerUnlabelled(at::full({3, 2}, 0.5, top).requires_grad_(true)), std::invalid_argument);
    at::Tensor weights = at::full({3}, 0.5, top).requires_grad_(true);
    OptimizerUnlabelled optimizer(weights);
    EXPECT_THROW(optimizer.step(), std::invalid_argument);
}
