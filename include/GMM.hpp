/*
A mixture of axis-aligned Gaussians in latent space

Nomenclature:
    means, stds: clusters x dims
    weights: clusters, non-negative and summing to 1 after every projection
    directions: directions x dims, unit norm
Diagonal covariance: the dimensions within a cluster are independent
*/

#ifndef GMM_hpp
#define GMM_hpp

#include <torch/torch.h>

namespace GMM {

// The learnable mixture
struct Mixture : torch::nn::Module {
    at::Tensor means, stds, weights;

    Mixture(const at::Tensor & means_, const at::Tensor & stds_, const at::Tensor & weights_);
    // n_clusters clusters in n_dims dimensions: means ~ N(0, mean_scale^2), unit stds, uniform weights
    Mixture(const int64_t & n_clusters, const int64_t & n_dims, const double & mean_scale, at::Generator & generator);
    ~Mixture();

    int64_t NClusters() const;
    int64_t NDims() const;

    // weights / sum(weights), differentiable
    at::Tensor normed_weights() const;

    // Outside autograd, after an optimizer step:
    //     clamp weights at 0 and renormalize to sum 1
    //     clamp stds at std_floor
    void project(const double & std_floor = 1e-4);
};

// Integer per-cluster sizes summing exactly to `size`,
// as close as possible to the fractions given by `weights`
std::vector<int64_t> sizes_from_weights(const int64_t & size, const std::vector<double> & weights);
std::vector<int64_t> sizes_from_weights(const int64_t & size, const at::Tensor & weights);

// sizes[i] samples from the i-th cluster, concatenated in cluster order
// Clusters with 0 samples are skipped
at::Tensor sample_mixture_gaussian(const std::vector<int64_t> & sizes,
const at::Tensor & means, const at::Tensor & stds, at::Generator & generator);

// examples x clusters
at::Tensor log_gaussian_pdf_per_cluster(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, const double & eps = 1e-6);

// Log density per cluster including the log weight, examples x clusters
at::Tensor log_densities(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights);

// Negative mean squared distance of each example to 2 x examples samples of each cluster,
// examples x clusters
at::Tensor sample_distances(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, at::Generator & generator);

// Negative mean squared distance of each example to each cluster mean, examples x clusters
at::Tensor mean_distances(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, const bool & normalize_by_std = false);

// Project each cluster onto each direction
// Return 1-dimensional means and stds, both directions x clusters
std::tuple<at::Tensor, at::Tensor> transform_by_dirs(
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & directions);

// Mixture cumulative distribution function along each direction
// x: directions x points, means and stds: directions x clusters, weights: clusters
// Return directions x points
at::Tensor multi_directions_gaussian_cdfs(const at::Tensor & x,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights);

} // namespace GMM

#endif
