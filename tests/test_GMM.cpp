/*
Test the Gaussian mixture: partition of a sample size, projection, densities
*/

#include <cmath>
#include <numeric>
#include <gtest/gtest.h>
#include <torch/torch.h>
#include <ATen/CPUGeneratorImpl.h>

#include "GMM.hpp"

namespace {

auto top = at::TensorOptions().dtype(torch::kFloat64);

int64_t sum(const std::vector<int64_t> & sizes) {
    int64_t total = 0;
    for (const int64_t & s : sizes) total += s;
    return total;
}

} // anonymous namespace

TEST(GMMTest, SizesFromEqualWeights) {
    EXPECT_EQ(GMM::sizes_from_weights(10, std::vector<double>({1.0, 1.0, 1.0})),
              std::vector<int64_t>({4, 3, 3}));
    // 3.5 + 3.5 rounds to 8, the lowest index gives 1 back
    EXPECT_EQ(GMM::sizes_from_weights(7, std::vector<double>({0.5, 0.5})),
              std::vector<int64_t>({3, 4}));
}

TEST(GMMTest, SizesFromWeightsSumExactly) {
    std::vector<std::vector<double>> all_weights = {
        {0.1, 0.2, 0.7}, {1.0, 2.0, 3.0, 4.0}, {0.3333, 0.3333, 0.3334}, {0.05, 0.95}, {1.0}};
    for (const auto & weights : all_weights)
    for (int64_t size : {0, 1, 2, 3, 7, 10, 64, 101}) {
        std::vector<int64_t> sizes = GMM::sizes_from_weights(size, weights);
        EXPECT_EQ(sum(sizes), size);
        for (size_t i = 0; i < weights.size(); i++) {
            EXPECT_GE(sizes[i], 0);
            EXPECT_LE(std::abs((double)sizes[i] - weights[i] / std::accumulate(weights.begin(), weights.end(), 0.0) * size), 1.0);
        }
    }
}

TEST(GMMTest, ZeroWeightGetsNoSample) {
    std::vector<int64_t> sizes = GMM::sizes_from_weights(5, std::vector<double>({0.0, 1.0, 1.0}));
    EXPECT_EQ(sizes[0], 0);
    EXPECT_EQ(sum(sizes), 5);
    at::Tensor weights = at::tensor({0.0, 0.5, 0.5}, top);
    EXPECT_EQ(GMM::sizes_from_weights(5, weights), sizes);
}

TEST(GMMTest, SizesFromWeightsRejectsBadInput) {
    EXPECT_THROW(GMM::sizes_from_weights(-1, std::vector<double>({1.0})), std::invalid_argument);
    EXPECT_THROW(GMM::sizes_from_weights(3, std::vector<double>({-0.5, 1.5})), std::invalid_argument);
    EXPECT_THROW(GMM::sizes_from_weights(3, std::vector<double>({0.0, 0.0})), std::invalid_argument);
}

TEST(GMMTest, ProjectOntoSimplex) {
    GMM::Mixture mixture(at::zeros({3, 2}, top), at::tensor({1.0, -1.0, 0.5, 2.0, 0.0, 1.0}, top).view({3, 2}),
                         at::tensor({-0.2, 0.6, 0.6}, top));
    mixture.project(1e-4);
    EXPECT_TRUE(at::allclose(mixture.weights, at::tensor({0.0, 0.5, 0.5}, top)));
    EXPECT_GE(mixture.stds.min().item<double>(), 1e-4);
    EXPECT_DOUBLE_EQ(mixture.stds[0][0].item<double>(), 1.0);
    // Every weight clamped to 0 restarts from uniform
    {
        torch::NoGradGuard no_grad;
        mixture.weights.fill_(-1.0);
    }
    mixture.project();
    EXPECT_TRUE(at::allclose(mixture.weights, at::full({3}, 1.0 / 3.0, top)));
}

TEST(GMMTest, RandomMixtureIsRegistered) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(1);
    GMM::Mixture mixture(4, 3, 2.0, generator);
    EXPECT_EQ(mixture.NClusters(), 4);
    EXPECT_EQ(mixture.NDims(), 3);
    EXPECT_EQ(mixture.parameters().size(), (size_t)3);
    EXPECT_NEAR(mixture.normed_weights().sum().item<double>(), 1.0, 1e-12);
}

TEST(GMMTest, SampleInClusterOrder) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(2);
    at::Tensor means = at::tensor({-3.0, 0.0, 0.0, 1.0, 5.0, 5.0}, top).view({3, 2});
    at::Tensor stds = at::full({3, 2}, 1e-9, top);
    at::Tensor samples = GMM::sample_mixture_gaussian({3, 0, 2}, means, stds, generator);
    ASSERT_EQ(samples.sizes().vec(), std::vector<int64_t>({5, 2}));
    EXPECT_TRUE(at::allclose(samples.slice(0, 0, 3), means[0].unsqueeze(0).expand({3, 2}), 0.0, 1e-6));
    EXPECT_TRUE(at::allclose(samples.slice(0, 3, 5), means[2].unsqueeze(0).expand({2, 2}), 0.0, 1e-6));
    // The draws join the parameters without cutting their gradient
    at::Tensor leaf_means = means.clone().requires_grad_(true);
    GMM::sample_mixture_gaussian({3, 0, 2}, leaf_means, stds, generator).sum().backward();
    EXPECT_TRUE(at::allclose(leaf_means.grad(), at::tensor({3.0, 3.0, 0.0, 0.0, 2.0, 2.0}, top).view({3, 2})));
}

TEST(GMMTest, LogDensityOfStandardNormal) {
    at::Tensor X = at::zeros({1, 2}, top);
    at::Tensor means = at::zeros({1, 2}, top);
    at::Tensor stds = at::ones({1, 2}, top);
    double expected = -std::log(2.0 * M_PI) - 2.0 * std::log(1.0 + 1e-6);
    EXPECT_NEAR(GMM::log_gaussian_pdf_per_cluster(X, means, stds)[0][0].item<double>(), expected, 1e-12);
    at::Tensor weights = at::ones({1}, top);
    EXPECT_NEAR(GMM::log_densities(X, means, stds, weights)[0][0].item<double>(), expected, 1e-12);
}

TEST(GMMTest, MeanDistances) {
    at::Tensor X = at::tensor({1.0, 1.0}, top).view({1, 2});
    at::Tensor means = at::tensor({0.0, 0.0, 1.0, 1.0}, top).view({2, 2});
    at::Tensor stds = at::ones({2, 2}, top);
    at::Tensor distances = GMM::mean_distances(X, means, stds);
    EXPECT_NEAR(distances[0][0].item<double>(), -1.0, 1e-12);
    EXPECT_NEAR(distances[0][1].item<double>(), 0.0, 1e-12);
}

TEST(GMMTest, SampleDistances) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(14);
    at::Tensor X = at::tensor({1.0, 1.0, 0.0, 2.0, -1.0, 0.0}, top).view({3, 2});
    at::Tensor means = at::tensor({0.0, 0.0, 1.0, 1.0}, top).view({2, 2});
    // Degenerate clusters sample their means exactly
    at::Tensor distances = GMM::sample_distances(X, means, at::zeros({2, 2}, top), generator);
    ASSERT_EQ(distances.sizes().vec(), std::vector<int64_t>({3, 2}));
    EXPECT_TRUE(at::allclose(distances, GMM::mean_distances(X, means, at::ones({2, 2}, top))));
    EXPECT_NEAR(distances[1][1].item<double>(), -1.0, 1e-12);
}

TEST(GMMTest, TransformByDirections) {
    at::Tensor means = at::tensor({1.0, 2.0}, top).view({1, 2});
    at::Tensor stds = at::tensor({3.0, 4.0}, top).view({1, 2});
    at::Tensor directions = at::tensor({1.0, 0.0, 0.6, 0.8}, top).view({2, 2});
    at::Tensor transformed_means, transformed_stds;
    std::tie(transformed_means, transformed_stds) = GMM::transform_by_dirs(means, stds, directions);
    EXPECT_NEAR(transformed_means[0][0].item<double>(), 1.0, 1e-12);
    EXPECT_NEAR(transformed_means[1][0].item<double>(), 0.6 + 1.6, 1e-12);
    EXPECT_NEAR(transformed_stds[0][0].item<double>(), 3.0, 1e-12);
    EXPECT_NEAR(transformed_stds[1][0].item<double>(), std::sqrt(0.36 * 9.0 + 0.64 * 16.0), 1e-12);
}

TEST(GMMTest, MixtureCDFIsMonotone) {
    at::Tensor x = at::linspace(-6.0, 6.0, 101, top).view({1, 101});
    at::Tensor means = at::tensor({0.0, 1.0}, top).view({1, 2});
    at::Tensor stds = at::tensor({1.0, 0.5}, top).view({1, 2});
    at::Tensor weights = at::tensor({0.3, 0.7}, top);
    at::Tensor cdfs = GMM::multi_directions_gaussian_cdfs(x, means, stds, weights);
    ASSERT_EQ(cdfs.sizes().vec(), std::vector<int64_t>({1, 101}));
    at::Tensor increments = cdfs.slice(1, 1, 101) - cdfs.slice(1, 0, 100);
    EXPECT_GE(increments.min().item<double>(), 0.0);
    EXPECT_GE(cdfs.min().item<double>(), 0.0);
    EXPECT_LE(cdfs.max().item<double>(), 1.0);
    EXPECT_LT(cdfs[0][0].item<double>(), 1e-6);
    EXPECT_GT(cdfs[0][100].item<double>(), 1.0 - 1e-6);
}
