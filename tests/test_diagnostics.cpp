/*
Test the diagnostics
*/

#include <cmath>
#include <gtest/gtest.h>
#include <torch/torch.h>
#include <ATen/CPUGeneratorImpl.h>

#include "RevNet.hpp"
#include "GMM.hpp"
#include "diagnostics.hpp"

namespace {

auto top = at::TensorOptions().dtype(torch::kFloat64);

} // anonymous namespace

TEST(DiagnosticsTest, QuantileDerivativeAtMedian) {
    // d/dp of the standard normal quantile at p = 0.5 is sqrt(2 pi)
    at::Tensor grad = diagnostics::icdf_grad(at::tensor({0.5}, top), at::tensor({1.0}, top));
    EXPECT_NEAR(grad[0].item<double>(), std::sqrt(2.0 * M_PI), 1e-12);
    EXPECT_NEAR(diagnostics::erfinv_grad(at::tensor({0.0}, top))[0].item<double>(), 0.5 * std::sqrt(M_PI), 1e-12);
}

TEST(DiagnosticsTest, AccuracyOfOwnCluster) {
    at::Tensor means = at::tensor({-5.0, 0.0, 5.0, 0.0}, top).view({2, 2});
    at::Tensor stds = at::ones({2, 2}, top);
    at::Tensor outs = at::tensor({-5.2, 0.1, -4.7, -0.3, 4.9, -0.3, 5.4, 0.2}, top).view({4, 2});
    at::Tensor targets = at::tensor({0, 0, 1, 1}, at::kLong);
    at::Tensor distances = diagnostics::compute_icdf_grads_to_mean(outs, means, stds);
    ASSERT_EQ(distances.sizes().vec(), std::vector<int64_t>({4, 2}));
    EXPECT_DOUBLE_EQ(diagnostics::compute_icdf_grad_accuracy(outs, targets, means, stds), 1.0);
    EXPECT_DOUBLE_EQ(diagnostics::compute_icdf_grad_accuracy(outs, 1 - targets, means, stds), 0.0);
    EXPECT_LT(diagnostics::compute_icdf_grad_loss(outs, targets, means, stds).item<double>(),
              diagnostics::compute_icdf_grad_loss(outs, 1 - targets, means, stds).item<double>());
    EXPECT_THROW(diagnostics::compute_icdf_grad_accuracy(outs, targets.slice(0, 0, 3), means, stds),
                 std::invalid_argument);
}

TEST(DiagnosticsTest, ExampleOnClusterMean) {
    at::Tensor means = at::tensor({-5.0, 0.0, 5.0, 0.0}, top).view({2, 2});
    at::Tensor stds = at::ones({2, 2}, top);
    at::Tensor outs = at::tensor({-5.0, 0.0, 5.0, 0.0, 4.0, 1.0}, top).view({3, 2}).requires_grad_(true);
    at::Tensor targets = at::tensor({0, 1, 1}, at::kLong);
    at::Tensor distances = diagnostics::compute_icdf_grads_to_mean(outs, means, stds);
    EXPECT_TRUE(at::isfinite(distances).all().item<bool>());
    EXPECT_LT(distances[0][0].item<double>(), distances[0][1].item<double>());
    EXPECT_DOUBLE_EQ(diagnostics::compute_icdf_grad_accuracy(outs, targets, means, stds), 1.0);
    diagnostics::compute_icdf_grad_loss(outs, targets, means, stds).backward();
    EXPECT_TRUE(at::isfinite(outs.grad()).all().item<bool>());
}

TEST(DiagnosticsTest, ReconstructionsInvertToSamples) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(40);
    torch::manual_seed(40);
    auto pipeline = std::make_shared<RevNet::Pipeline>();
    pipeline->append(std::make_shared<RevNet::SubsampleSplitter>(2, 2, true));
    pipeline->append(std::make_shared<RevNet::ReversibleBlock>(
        RevNet::coupling_subnet(2, 8), RevNet::coupling_subnet(2, 8)));
    pipeline->to(torch::kFloat64);
    auto mixture = std::make_shared<GMM::Mixture>(2, 4, 1.0, generator);
    at::Tensor rec_examples, gauss_samples;
    std::tie(rec_examples, gauss_samples) = diagnostics::get_inputs_from_reverted_samples(
        7, mixture, pipeline, generator);
    ASSERT_EQ(rec_examples.sizes().vec(), std::vector<int64_t>({7, 1, 2, 2}));
    ASSERT_EQ(gauss_samples.sizes().vec(), std::vector<int64_t>({7, 4}));
    EXPECT_TRUE(at::allclose(pipeline->latent(rec_examples), gauss_samples, 1e-10, 1e-10));
}
