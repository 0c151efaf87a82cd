/*
Sliced transport losses against the closed form mixture

The empirical CDF of n order statistics is evenly spaced in [1/n, 1 - 1/n]
The quantile function of a Gaussian is mean + std * sqrt(2) * erfinv(2p - 1)
*/

#include <torch/torch.h>

#include "utility.hpp"
#include "GMM.hpp"
#include "directions.hpp"
#include "OT.hpp"

namespace OT {

at::Tensor analytical_l2_cdf_loss_given_sorted_samples(
const at::Tensor & sorted_samples, const at::Tensor & directions,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights) {
    int64_t n_samples = sorted_samples.size(0);
    at::Tensor mean_dirs, std_dirs;
    std::tie(mean_dirs, std_dirs) = GMM::transform_by_dirs(means, stds, directions);
    if (weights.sum().item<double>() <= 0.0) throw std::invalid_argument(
        "analytical_l2_cdf_loss error: cluster weights must sum to a positive number");
    at::Tensor normed_weights = weights / weights.sum();
    // directions x examples
    at::Tensor analytical_cdf = GMM::multi_directions_gaussian_cdfs(
        sorted_samples.t(), mean_dirs, std_dirs, normed_weights);
    at::Tensor diffs = analytical_cdf - empirical_cdf(n_samples, sorted_samples.options()).unsqueeze(0);
    return at::sqrt(at::sum(diffs * diffs, 1)).mean();
}

at::Tensor analytical_l2_cdf_loss(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const at::Tensor & directions, at::Generator & generator) {
    at::Tensor dirs = directions.defined() ? directions::norm_directions(directions)
                    : directions::sample_directions(samples.size(1), true, generator, samples.options());
    at::Tensor sorted_samples = std::get<0>(samples.mm(dirs.t()).sort(0));
    return analytical_l2_cdf_loss_given_sorted_samples(sorted_samples, dirs, means, stds, weights);
}

std::tuple<at::Tensor, at::Tensor> analytical_l2_cdf_and_sample_transport_loss(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const at::Tensor & directions, const TransportOptions & options, at::Generator & generator) {
    at::Tensor dirs = directions.defined() ? directions::norm_directions(directions)
                    : directions::sample_directions(samples.size(1), true, generator, samples.options());
    at::Tensor projected_samples = samples.mm(dirs.t());
    at::Tensor sorted_samples = std::get<0>(projected_samples.sort(0));
    at::Tensor cdf_loss = analytical_l2_cdf_loss_given_sorted_samples(sorted_samples, dirs, means, stds, weights);
    at::Tensor sample_loss;
    if (options.energy_based) sample_loss = sampled_energy_transport_loss(
        projected_samples, dirs, means, stds, weights, options.abs_or_square,
        options.backprop_to_cluster_weights, options.normalize_by_stds,
        options.symmetric_energy, generator);
    else {
        int64_t n_interpolation_samples = options.n_interpolation_samples > 0
                                        ? options.n_interpolation_samples : 2 * samples.size(0);
        sample_loss = sampled_transport_diffs_interpolate_sorted_part(
            sorted_samples, dirs, means, stds, weights, n_interpolation_samples, options.abs_or_square,
            options.backprop_to_cluster_weights, options.normalize_by_stds, generator);
    }
    return std::make_tuple(cdf_loss, sample_loss);
}

at::Tensor transport_loss_per_class(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds,
const at::Tensor & targets, const at::Tensor & directions, at::Generator & generator,
const at::Tensor & unlabelled_samples, const at::Tensor & unlabelled_weights,
const std::string & normalization) {
    if (! targets.defined() || targets.size(0) != samples.size(0)) throw std::invalid_argument(
        "transport_loss_per_class error: there must be 1 target per example");
    if (normalization != "none" && normalization != "std" && normalization != "both") throw std::invalid_argument(
        "transport_loss_per_class error: normalization must be none, std or both, got " + normalization);
    int64_t n_clusters = means.size(0);
    bool has_unlabelled = unlabelled_samples.defined() && unlabelled_samples.size(0) > 0;
    if (has_unlabelled) {
        if (n_clusters != 2) throw std::invalid_argument(
            "transport_loss_per_class error: unlabelled examples are assigned to 1 of exactly 2 clusters");
        if (! unlabelled_weights.defined() || unlabelled_weights.size(0) != unlabelled_samples.size(0))
        throw std::invalid_argument("transport_loss_per_class error: there must be 1 weight per unlabelled example");
    }
    at::Tensor dirs = directions.defined() ? directions::norm_directions(directions)
                    : directions::sample_directions(samples.size(1), true, generator, samples.options());
    int64_t n_dirs = dirs.size(0);
    at::Tensor all_samples = has_unlabelled ? at::cat({samples, unlabelled_samples}, 0) : samples;
    at::Tensor projected_samples = all_samples.mm(dirs.t());
    // directions x clusters
    at::Tensor transformed_means, transformed_stds;
    std::tie(transformed_means, transformed_stds) = GMM::transform_by_dirs(means, stds, dirs);
    at::Tensor weights_per_sample = at::ones({samples.size(0)}, samples.options());
    at::Tensor all_targets = targets.to(samples.device(), at::kLong);
    if (has_unlabelled) {
        at::Tensor normed_unlabelled_weights = unlabelled_weights / (unlabelled_weights.mean() * 2.0);
        normed_unlabelled_weights = normed_unlabelled_weights.clamp(0.01, 0.99);
        // 1 for cluster 1, 0 for cluster 0
        at::Tensor targets_unlabelled = to_common_device({at::bernoulli(
            normed_unlabelled_weights.detach().to(at::kCPU), generator), samples})[0];
        at::Tensor weights_per_unlabelled_sample =
            targets_unlabelled * (normed_unlabelled_weights + 1e-6)
            + (1.0 - targets_unlabelled) * (1.0 - normed_unlabelled_weights + 1e-6);
        weights_per_unlabelled_sample = relative_grad(weights_per_unlabelled_sample);
        weights_per_sample = at::cat({weights_per_sample, weights_per_unlabelled_sample});
        all_targets = at::cat({all_targets, targets_unlabelled.to(at::kLong)});
    }
    at::Tensor loss = at::zeros({}, samples.options());
    for (int64_t i = 0; i < n_clusters; i++) {
        at::Tensor indices = (all_targets == i).nonzero().view(-1);
        int64_t n_samples = indices.size(0);
        // An empty cluster contributes nothing
        if (n_samples == 0) continue;
        at::Tensor this_samples = projected_samples.index_select(0, indices);
        at::Tensor this_diff_weights = weights_per_sample.index_select(0, indices);
        // examples x directions
        at::Tensor sorted_samples, i_sorted;
        std::tie(sorted_samples, i_sorted) = this_samples.sort(0);
        at::Tensor all_diff_weights = this_diff_weights.index_select(0, i_sorted.view(-1)).view(i_sorted.sizes());
        // 1 x directions
        at::Tensor this_transformed_means = transformed_means.slice(1, i, i + 1).t();
        at::Tensor this_transformed_stds  = transformed_stds .slice(1, i, i + 1).t();
        at::Tensor i_cdf = standard_normal_icdf(empirical_cdf(n_samples, samples.options()));
        at::Tensor all_i_cdfs = i_cdf.unsqueeze(1) * this_transformed_stds + this_transformed_means;
        at::Tensor diffs = all_i_cdfs - sorted_samples;
        if (normalization == "none") {
            loss = loss + at::sqrt((diffs * diffs * all_diff_weights).mean());
        }
        else if (normalization == "std") {
            diffs = diffs / this_transformed_stds.clamp_min(1e-6);
            loss = loss + at::sqrt((diffs * diffs * all_diff_weights).mean());
        }
        else {
            // First without normalization, then with normalization
            loss = loss + at::sqrt((diffs * diffs * all_diff_weights).mean());
            diffs = diffs / this_transformed_stds.clamp_min(1e-6);
            loss = loss + at::sqrt((diffs * diffs * all_diff_weights).mean());
        }
    }
    return loss / (double)n_clusters;
}

at::Tensor compute_class_trans_loss(const at::Tensor & batch_outs,
const at::Tensor & means, const at::Tensor & stds,
const at::Tensor & directions_adv, const at::Tensor & batch_y, at::Generator & generator,
const bool & add_mean_diff_directions,
const at::Tensor & unlabelled_outs, const at::Tensor & unlabelled_weights,
const std::string & normalization) {
    if (! batch_y.defined()) throw std::invalid_argument("compute_class_trans_loss error: targets are required");
    if (batch_y.size(0) != batch_outs.size(0)) throw std::invalid_argument(
        "compute_class_trans_loss error: there must be 1 target per example");
    at::Tensor mean_diff;
    if (add_mean_diff_directions) mean_diff = directions::mean_diff_direction(means);
    at::Tensor trans_loss = at::zeros({}, batch_outs.options());
    // 2 random direction sets then the adversarial one
    for (size_t i = 0; i < 3; i++) {
        at::Tensor dirs = i < 2 ? directions::sample_directions(means.size(1), true, generator, means.options())
                                : directions::norm_directions(directions_adv);
        if (add_mean_diff_directions) dirs = at::cat({dirs, mean_diff}, 0);
        trans_loss = trans_loss + transport_loss_per_class(batch_outs, means, stds, batch_y, dirs, generator,
            unlabelled_outs, unlabelled_weights, normalization);
    }
    return trans_loss;
}

at::Tensor w2_for_dist_w2_normalized_for_model(const at::Tensor & outs,
const at::Tensor & directions, const at::Tensor & soft_targets,
const at::Tensor & means, const at::Tensor & stds) {
    if (soft_targets.dim() != 2 || soft_targets.size(0) != outs.size(0) || soft_targets.size(1) != means.size(0))
    throw std::invalid_argument("w2_for_dist_w2_normalized_for_model error: soft targets must be examples x clusters");
    at::Tensor projected_samples = outs.mm(directions.t());
    at::Tensor sorted_samples, i_sorted;
    std::tie(sorted_samples, i_sorted) = projected_samples.sort(0);
    at::Tensor loss = at::zeros({}, outs.options());
    for (int64_t i = 0; i < means.size(0); i++) {
        at::Tensor transformed_means, transformed_stds;
        std::tie(transformed_means, transformed_stds) = GMM::transform_by_dirs(
            means.slice(0, i, i + 1), at::abs(stds.slice(0, i, i + 1)), directions);
        // examples x directions, the soft targets in the order of each direction
        at::Tensor sorted_weights = soft_targets.select(1, i)
            .index_select(0, i_sorted.view(-1)).view(i_sorted.sizes());
        // The soft targets make a virtual sample of n_virtual_samples examples
        at::Tensor n_virtual_samples = sorted_weights.sum(0, true);
        at::Tensor start = 1.0 / n_virtual_samples;
        at::Tensor wanted_sum = 1.0 - 2.0 / n_virtual_samples;
        at::Tensor probs = sorted_weights * wanted_sum / n_virtual_samples;
        at::Tensor cdf = start + at::cumsum(probs, 0);
        at::Tensor all_i_cdfs = standard_normal_icdf(cdf) * transformed_stds.t() + transformed_means.t();
        // Model part: the mixture is a fixed target
        at::Tensor diffs = all_i_cdfs.detach() - sorted_samples;
        diffs = diffs / transformed_stds.detach().t().clamp_min(1e-8);
        at::Tensor loss_model = at::sqrt((diffs * diffs * sorted_weights).mean(1).mean(0));
        // Distribution part: the samples are a fixed target
        diffs = all_i_cdfs - sorted_samples.detach();
        at::Tensor loss_distribution = at::sqrt((diffs * diffs * sorted_weights).mean(1).mean(0));
        loss = loss + loss_model + loss_distribution;
    }
    return loss;
}

} // namespace OT
