/*
Sliced transport losses between a latent batch and a Gaussian mixture

Every loss projects the batch and the mixture onto a set of directions,
compares the 1-dimensional distributions along each direction,
then averages over directions

The loss families:
    1. order statistics matching against a sorted virtual sample of the mixture
    2. L2 distance between the analytical mixture CDF and the empirical CDF
    3. energy distance between halves of the batch and 2 virtual samples
    4. per class quantile matching, optionally with softly assigned unlabelled examples
    5. pairwise separation losses along mean-difference arrows

Nomenclature:
    samples: examples x dims
    means, stds: clusters x dims
    weights: clusters
    directions: directions x dims
    projected or sorted samples: examples x directions
*/

#ifndef OT_hpp
#define OT_hpp

#include <torch/torch.h>

namespace OT {

struct TransportOptions {
    // "abs" for mean absolute difference, "square" for per-direction root mean square
    std::string abs_or_square = "square";
    // Size of the virtual mixture sample, <= 0 means 2 x number of examples
    int64_t n_interpolation_samples = -1;
    // Weight the differences by the per-sample cluster weights,
    // so the loss reaches the mixture weights
    bool backprop_to_cluster_weights = true;
    // Divide the differences by the interpolated std of the virtual sample
    bool normalize_by_stds = true;
    // Energy distance instead of single matching
    bool energy_based = false;
    // E[a,ya] + E[b,yb] - E[a,b] - E[ya,yb] instead of 2 E[a,ya] - E[a,b] - E[ya,yb]
    bool symmetric_energy = false;
};

// Per-sample weights of a virtual sample drawn with `sizes`
// Each value is 1 (0 for a zero weight) but carries the relative gradient of its cluster weight
at::Tensor get_weights_per_sample(const at::Tensor & normed_weights, const std::vector<int64_t> & sizes);

// Draw n_interpolation_samples projected mixture samples, sort them along each direction,
// then interpolate linearly onto the ranks of n_samples order statistics
// Return the interpolated values, per-sample cluster weights (undefined unless backprop_to_cluster_weights)
// and per-sample projected stds (undefined unless compute_stds_per_sample), all n_samples x directions
std::tuple<at::Tensor, at::Tensor, at::Tensor> projected_samples_mixture_sorted(
const at::Tensor & weights, const at::Tensor & means, const at::Tensor & stds,
const at::Tensor & directions, const int64_t & n_samples, const int64_t & n_interpolation_samples,
const bool & backprop_to_cluster_weights, const bool & compute_stds_per_sample,
at::Generator & generator);

// Difference between the sorted batch and the sorted virtual sample
at::Tensor sampled_transport_diffs_interpolate_sorted_part(
const at::Tensor & sorted_samples, const at::Tensor & directions,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const int64_t & n_interpolation_samples, const std::string & abs_or_square,
const bool & backprop_to_cluster_weights, const bool & normalize_by_stds,
at::Generator & generator);

// The number of examples must be even
at::Tensor sampled_energy_transport_loss(
const at::Tensor & projected_samples, const at::Tensor & directions,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const std::string & abs_or_square,
const bool & backprop_to_cluster_weights, const bool & normalize_by_stds,
const bool & symmetric_energy, at::Generator & generator);

// Undefined directions means a fresh set of orthogonal random directions
at::Tensor sample_transport_loss(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const at::Tensor & directions, const TransportOptions & options, at::Generator & generator);

// Analytical CDF matching, see OT_analytical.cpp
at::Tensor analytical_l2_cdf_loss_given_sorted_samples(
const at::Tensor & sorted_samples, const at::Tensor & directions,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights);

at::Tensor analytical_l2_cdf_loss(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const at::Tensor & directions, at::Generator & generator);

// Return the analytical and the sample based loss along the same directions
std::tuple<at::Tensor, at::Tensor> analytical_l2_cdf_and_sample_transport_loss(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const at::Tensor & directions, const TransportOptions & options, at::Generator & generator);

// Match the projected examples of each class against the quantiles of their own cluster
// Unlabelled examples are assigned to 1 of 2 clusters by Bernoulli draws from unlabelled_weights,
// whose relative gradient flows back into them
// normalization: "none", "std" (divide by the projected cluster std) or "both" (sum of the 2)
at::Tensor transport_loss_per_class(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds,
const at::Tensor & targets, const at::Tensor & directions, at::Generator & generator,
const at::Tensor & unlabelled_samples = at::Tensor(), const at::Tensor & unlabelled_weights = at::Tensor(),
const std::string & normalization = "none");

// Sum of transport_loss_per_class over 2 random and the adversarial direction sets,
// each extended by the mean-difference direction if add_mean_diff_directions
at::Tensor compute_class_trans_loss(const at::Tensor & batch_outs,
const at::Tensor & means, const at::Tensor & stds,
const at::Tensor & directions_adv, const at::Tensor & batch_y, at::Generator & generator,
const bool & add_mean_diff_directions = true,
const at::Tensor & unlabelled_outs = at::Tensor(), const at::Tensor & unlabelled_weights = at::Tensor(),
const std::string & normalization = "none");

// W2 against each cluster weighted by soft targets (examples x clusters),
// the sum of a model part (mixture detached) and a distribution part (samples detached)
at::Tensor w2_for_dist_w2_normalized_for_model(const at::Tensor & outs,
const at::Tensor & directions, const at::Tensor & soft_targets,
const at::Tensor & means, const at::Tensor & stds);

// Pairwise separation, see OT_pairwise.cpp
// Both require exactly 2 clusters
at::Tensor dist_transport_loss(const at::Tensor & means, const at::Tensor & stds);
at::Tensor dist_transport_loss_relative(const at::Tensor & means, const at::Tensor & stds,
const double & std_offset = 1.0);

// Return:
//     projections of the examples onto the arrow from cluster a to cluster b,
//     relative to the projection of mean a, examples x clusters x clusters
//     the projected midpoints between the means on the same scale, clusters x clusters
//     the sum of the 2 projected stds along the normalized arrow, clusters x clusters
std::tuple<at::Tensor, at::Tensor, at::Tensor> pairwise_projections(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds);

// Penalty per example for reaching past the wanted region towards any other cluster
at::Tensor pairwise_projection_loss(const at::Tensor & X, const at::Tensor & targets,
const at::Tensor & means, const at::Tensor & stds,
const bool & scaled = true, const bool & add_stds = false);

// examples x clusters, larger is closer
at::Tensor pairwise_projection_score(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds);

} // namespace OT

#endif
