/*
A mixture of axis-aligned Gaussians in latent space

Nomenclature:
    means, stds: clusters x dims
    weights: clusters, non-negative and summing to 1 after every projection
    directions: directions x dims, unit norm
Diagonal covariance: the dimensions within a cluster are independent
*/

#include <torch/torch.h>

#include "utility.hpp"
#include "GMM.hpp"

namespace GMM {

Mixture::Mixture(const at::Tensor & means_, const at::Tensor & stds_, const at::Tensor & weights_) {
    if (means_.dim() != 2 || stds_.sizes() != means_.sizes()) throw std::invalid_argument(
        "Mixture error: means and stds must both be clusters x dims");
    if (weights_.dim() != 1 || weights_.size(0) != means_.size(0)) throw std::invalid_argument(
        "Mixture error: there must be 1 weight per cluster");
    means   = register_parameter("means",   means_  .detach().clone());
    stds    = register_parameter("stds",    stds_   .detach().clone());
    weights = register_parameter("weights", weights_.detach().clone());
}
// n_clusters clusters in n_dims dimensions: means ~ N(0, mean_scale^2), unit stds, uniform weights
Mixture::Mixture(const int64_t & n_clusters, const int64_t & n_dims, const double & mean_scale, at::Generator & generator) {
    auto top = at::TensorOptions().dtype(torch::kFloat64);
    means   = register_parameter("means",   mean_scale * at::randn({n_clusters, n_dims}, generator, top));
    stds    = register_parameter("stds",    at::ones({n_clusters, n_dims}, top));
    weights = register_parameter("weights", at::ones(n_clusters, top) / (double)n_clusters);
}
Mixture::~Mixture() {}

int64_t Mixture::NClusters() const {return means.size(0);}
int64_t Mixture::NDims() const {return means.size(1);}

at::Tensor Mixture::normed_weights() const {return weights / weights.sum();}

void Mixture::project(const double & std_floor) {
    torch::NoGradGuard no_grad;
    weights.clamp_min_(0.0);
    double total = weights.sum().item<double>();
    // Every weight was clamped to 0, restart from uniform
    if (total > 0.0) weights.div_(total);
    else weights.fill_(1.0 / (double)weights.size(0));
    stds.clamp_min_(std_floor);
}

// Integer per-cluster sizes summing exactly to `size`,
// as close as possible to the fractions given by `weights`
std::vector<int64_t> sizes_from_weights(const int64_t & size, const std::vector<double> & weights) {
    if (size < 0) throw std::invalid_argument("sizes_from_weights error: negative size " + std::to_string(size));
    if (weights.empty()) throw std::invalid_argument("sizes_from_weights error: no weights");
    double weight_sum = 0.0;
    for (const double & w : weights) {
        if (! (w >= 0.0) || std::isinf(w)) throw std::invalid_argument(
            "sizes_from_weights error: weights must be finite and non-negative");
        weight_sum += w;
    }
    if (weight_sum <= 0.0) throw std::invalid_argument("sizes_from_weights error: weights sum to 0");
    size_t n = weights.size();
    std::vector<int64_t> rounded(n);
    std::vector<double> diff_with_half(n);
    int64_t n_total = 0;
    for (size_t i = 0; i < n; i++) {
        double fractional = weights[i] / weight_sum * (double)size;
        // Round half to even
        rounded[i] = (int64_t)std::nearbyint(fractional);
        diff_with_half[i] = fractional - std::floor(fractional) - 0.5;
        n_total += rounded[i];
    }
    // Those closest to 0.5 take the next smaller or next bigger number
    // until the wanted overall size is matched
    while (n_total > size) {
        std::vector<size_t> candidates;
        for (size_t i = 0; i < n; i++) if (diff_with_half[i] > 0.0 && rounded[i] > 0) candidates.push_back(i);
        if (candidates.empty())
        for (size_t i = 0; i < n; i++) if (rounded[i] > 0) candidates.push_back(i);
        size_t i_min = candidates[0];
        for (const size_t & i : candidates) if (diff_with_half[i] < diff_with_half[i_min]) i_min = i;
        diff_with_half[i_min] += 0.5;
        rounded[i_min]--;
        n_total--;
    }
    while (n_total < size) {
        std::vector<size_t> candidates;
        for (size_t i = 0; i < n; i++) if (diff_with_half[i] < 0.0 && weights[i] > 0.0) candidates.push_back(i);
        if (candidates.empty())
        for (size_t i = 0; i < n; i++) if (weights[i] > 0.0) candidates.push_back(i);
        size_t i_max = candidates[0];
        for (const size_t & i : candidates) if (diff_with_half[i] > diff_with_half[i_max]) i_max = i;
        diff_with_half[i_max] -= 0.5;
        rounded[i_max]++;
        n_total++;
    }
    int64_t check = 0;
    for (const int64_t & r : rounded) check += r;
    if (check != size) throw std::logic_error("sizes_from_weights error: sizes sum to "
        + std::to_string(check) + " instead of " + std::to_string(size));
    return rounded;
}
std::vector<int64_t> sizes_from_weights(const int64_t & size, const at::Tensor & weights) {
    at::Tensor w = weights.detach().to(at::kCPU, torch::kFloat64).contiguous();
    std::vector<double> weights_vector(w.data_ptr<double>(), w.data_ptr<double>() + w.numel());
    return sizes_from_weights(size, weights_vector);
}

// sizes[i] samples from the i-th cluster, concatenated in cluster order
// Clusters with 0 samples are skipped
at::Tensor sample_mixture_gaussian(const std::vector<int64_t> & sizes,
const at::Tensor & means, const at::Tensor & stds, at::Generator & generator) {
    if ((int64_t)sizes.size() != means.size(0)) throw std::invalid_argument(
        "sample_mixture_gaussian error: there must be 1 size per cluster");
    int64_t n_dims = means.size(1);
    std::vector<at::Tensor> parts;
    for (size_t i = 0; i < sizes.size(); i++) {
        if (sizes[i] == 0) continue;
        if (sizes[i] < 0) throw std::invalid_argument("sample_mixture_gaussian error: negative size");
        // Draw with the CPU generator, then join the parameters on their device
        std::vector<at::Tensor> joint = to_common_device({
            at::randn({sizes[i], n_dims}, generator, at::TensorOptions().dtype(means.scalar_type())),
            means[i], stds[i]});
        at::Tensor samples = joint[0] * joint[2].unsqueeze(0) + joint[1].unsqueeze(0);
        parts.push_back(samples);
    }
    if (parts.empty()) throw std::invalid_argument("sample_mixture_gaussian error: no sample is requested");
    return at::cat(parts, 0);
}

// examples x clusters
at::Tensor log_gaussian_pdf_per_cluster(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, const double & eps) {
    // log(sqrt(2 pi)) per dimension + log(std) per dimension
    at::Tensor subtractors = std::log(2.0 * M_PI) / 2.0 * (double)stds.size(1)
                           + at::sum(at::log(stds + eps), 1);
    // examples x dims x clusters
    at::Tensor demeaned_X = X.unsqueeze(2) - means.t().unsqueeze(0);
    at::Tensor squared_std = stds * stds;
    at::Tensor log_pdf_per_dim_per_cluster = -(demeaned_X * demeaned_X) / (2.0 * squared_std.t().unsqueeze(0));
    at::Tensor log_pdf_per_cluster = at::sum(log_pdf_per_dim_per_cluster, 1);
    return log_pdf_per_cluster - subtractors.unsqueeze(0);
}

// Log density per cluster including the log weight, examples x clusters
at::Tensor log_densities(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights) {
    return log_gaussian_pdf_per_cluster(X, means, stds) + at::log(weights.unsqueeze(0));
}

// Negative mean squared distance of each example to 2 x examples samples of each cluster,
// examples x clusters
at::Tensor sample_distances(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, at::Generator & generator) {
    int64_t n_clusters = means.size(0);
    std::vector<at::Tensor> samples_per_cluster;
    for (int64_t i = 0; i < n_clusters; i++) {
        std::vector<int64_t> sizes(n_clusters, 0);
        sizes[i] = X.size(0) * 2;
        samples_per_cluster.push_back(sample_mixture_gaussian(sizes, means, stds, generator));
    }
    // clusters x samples x dims x examples
    at::Tensor diffs = at::stack(samples_per_cluster).unsqueeze(3) - X.t().unsqueeze(0).unsqueeze(1);
    at::Tensor avg_diff = at::mean(at::mean(diffs * diffs, 2), 1).t();
    return -avg_diff;
}

// Negative mean squared distance of each example to each cluster mean, examples x clusters
at::Tensor mean_distances(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds, const bool & normalize_by_std) {
    // examples x dims x clusters
    at::Tensor diffs_to_mean = X.unsqueeze(2) - means.t().unsqueeze(0);
    if (normalize_by_std) diffs_to_mean = diffs_to_mean / (stds.t().unsqueeze(0) + 1e-6);
    return -at::mean(diffs_to_mean * diffs_to_mean, 1);
}

// Project each cluster onto each direction
// Return 1-dimensional means and stds, both directions x clusters
std::tuple<at::Tensor, at::Tensor> transform_by_dirs(
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & directions) {
    at::Tensor transformed_means = directions.mm(means.t());
    // Diagonal covariance: the projected variance is sum_d direction_d^2 * std_d^2
    at::Tensor transformed_stds = at::sqrt((directions * directions).mm((stds * stds).t()));
    return std::make_tuple(transformed_means, transformed_stds);
}

// Mixture cumulative distribution function along each direction
// x: directions x points, means and stds: directions x clusters, weights: clusters
// Return directions x points
at::Tensor multi_directions_gaussian_cdfs(const at::Tensor & x,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights) {
    at::Tensor safe_stds = at::clamp_min(stds, 1e-6);
    at::Tensor normed_weights = weights / weights.sum();
    // directions x points x clusters
    at::Tensor cdfs = 0.5 * (1.0 + at::erf((x.unsqueeze(2) - means.unsqueeze(1))
                                          / (safe_stds.unsqueeze(1) * std::sqrt(2.0))));
    return at::sum(cdfs * normed_weights.unsqueeze(0).unsqueeze(1), 2);
}

} // namespace GMM
