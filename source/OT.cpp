/*
Sample based sliced transport losses

The mixture side is a virtual sample: n_interpolation_samples projected mixture samples,
split among the clusters by sizes_from_weights, sorted along each direction,
then linearly interpolated onto the ranks of the batch order statistics
*/

#include <torch/torch.h>

#include "utility.hpp"
#include "GMM.hpp"
#include "directions.hpp"
#include "OT.hpp"

namespace OT {

namespace {
    void check_abs_or_square(const std::string & abs_or_square) {
        if (abs_or_square != "abs" && abs_or_square != "square") throw std::invalid_argument(
            "OT error: abs_or_square must be abs or square, got " + abs_or_square);
    }

    // Mean absolute or mean squared deviation, weighted elementwise if weights is defined
    at::Tensor mean_deviation(const at::Tensor & diffs, const at::Tensor & weights, const std::string & abs_or_square) {
        at::Tensor deviation = abs_or_square == "abs" ? at::abs(diffs) : diffs * diffs;
        if (weights.defined()) deviation = deviation * weights;
        return deviation.mean();
    }
}

at::Tensor get_weights_per_sample(const at::Tensor & normed_weights, const std::vector<int64_t> & sizes) {
    std::vector<at::Tensor> all_weights;
    for (size_t i = 0; i < sizes.size(); i++) {
        if (sizes[i] == 0) continue;
        if (sizes[i] < 0) throw std::invalid_argument("get_weights_per_sample error: negative size");
        at::Tensor weight = normed_weights[i];
        if (weight.item<double>() < 0.0) throw std::invalid_argument(
            "get_weights_per_sample error: negative weight of cluster " + std::to_string(i));
        // relative_grad keeps a zero weight zero
        all_weights.push_back(relative_grad(weight).expand({sizes[i]}));
    }
    if (all_weights.empty()) throw std::invalid_argument("get_weights_per_sample error: no sample");
    return at::cat(all_weights);
}

std::tuple<at::Tensor, at::Tensor, at::Tensor> projected_samples_mixture_sorted(
const at::Tensor & weights, const at::Tensor & means, const at::Tensor & stds,
const at::Tensor & directions, const int64_t & n_samples, const int64_t & n_interpolation_samples,
const bool & backprop_to_cluster_weights, const bool & compute_stds_per_sample,
at::Generator & generator) {
    if (n_samples < 1 || n_interpolation_samples < 1) throw std::invalid_argument(
        "projected_samples_mixture_sorted error: sample sizes must be positive");
    std::vector<int64_t> sizes = GMM::sizes_from_weights(n_interpolation_samples, weights);
    at::Tensor dir_means, dir_stds;
    std::tie(dir_means, dir_stds) = GMM::transform_by_dirs(means, stds, directions);
    // samples x directions
    at::Tensor cluster_samples = GMM::sample_mixture_gaussian(sizes, dir_means.t(), dir_stds.t(), generator);
    at::Tensor sorted_cluster_samples, sort_inds;
    std::tie(sorted_cluster_samples, sort_inds) = cluster_samples.sort(0);
    at::Tensor weights_per_sample, std_per_sample;
    if (backprop_to_cluster_weights) {
        weights_per_sample = get_weights_per_sample(weights / weights.sum(), sizes);
        // Follow the order of each direction
        weights_per_sample = weights_per_sample.index_select(0, sort_inds.view(-1)).view(sort_inds.sizes());
    }
    if (compute_stds_per_sample) {
        std::vector<at::Tensor> std_factors;
        for (size_t i = 0; i < sizes.size(); i++)
        if (sizes[i] > 0) std_factors.push_back(dir_stds.slice(1, i, i + 1).repeat({1, sizes[i]}));
        // unsorted samples x directions, then sorted
        std_per_sample = at::cat(std_factors, 1).t().gather(0, sort_inds);
    }
    // Rank i of n_samples sits at i * n_interp / n_samples + offset in the virtual sample
    int64_t n_interp = sorted_cluster_samples.size(0);
    double offset_x_in_input = -0.5 + 0.5 * (double)n_interp / (double)n_samples;
    at::Tensor x_grid = at::linspace(offset_x_in_input, (double)(n_interp - 1) - offset_x_in_input,
        n_samples, sorted_cluster_samples.options());
    at::Tensor i_low  = at::floor(x_grid);
    at::Tensor i_high = at::ceil(x_grid);
    at::Tensor weights_high = (x_grid - i_low).unsqueeze(1);
    i_low  = i_low .clamp(0, n_interp - 1).to(at::kLong);
    i_high = i_high.clamp(0, n_interp - 1).to(at::kLong);
    at::Tensor vals_interpolated = sorted_cluster_samples.index_select(0, i_low) * (1.0 - weights_high)
                                 + sorted_cluster_samples.index_select(0, i_high) * weights_high;
    if (backprop_to_cluster_weights)
    weights_per_sample = weights_per_sample.index_select(0, i_low) * (1.0 - weights_high)
                       + weights_per_sample.index_select(0, i_high) * weights_high;
    if (compute_stds_per_sample)
    std_per_sample = std_per_sample.index_select(0, i_low) * (1.0 - weights_high)
                   + std_per_sample.index_select(0, i_high) * weights_high;
    return std::make_tuple(vals_interpolated, weights_per_sample, std_per_sample);
}

at::Tensor sampled_transport_diffs_interpolate_sorted_part(
const at::Tensor & sorted_samples, const at::Tensor & directions,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const int64_t & n_interpolation_samples, const std::string & abs_or_square,
const bool & backprop_to_cluster_weights, const bool & normalize_by_stds,
at::Generator & generator) {
    check_abs_or_square(abs_or_square);
    at::Tensor sorted_samples_cluster, diff_weights, stds_per_sample;
    std::tie(sorted_samples_cluster, diff_weights, stds_per_sample) = projected_samples_mixture_sorted(
        weights, means, stds, directions, sorted_samples.size(0), n_interpolation_samples,
        backprop_to_cluster_weights, normalize_by_stds, generator);
    // examples x directions
    at::Tensor diffs = sorted_samples_cluster - sorted_samples;
    if (normalize_by_stds) diffs = diffs / stds_per_sample.clamp_min(1e-6);
    if (abs_or_square == "abs") return mean_deviation(diffs, diff_weights, "abs");
    // Root mean square per direction, then mean over directions
    at::Tensor squared = diffs * diffs;
    if (backprop_to_cluster_weights) squared = squared * diff_weights;
    return at::sqrt(squared.mean(0)).mean();
}

at::Tensor sampled_energy_transport_loss(
const at::Tensor & projected_samples, const at::Tensor & directions,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const std::string & abs_or_square,
const bool & backprop_to_cluster_weights, const bool & normalize_by_stds,
const bool & symmetric_energy, at::Generator & generator) {
    check_abs_or_square(abs_or_square);
    int64_t n_examples = projected_samples.size(0);
    if (n_examples < 2 || n_examples % 2 != 0) throw std::invalid_argument(
        "sampled_energy_transport_loss error: the batch must split into 2 equal halves, got "
        + std::to_string(n_examples) + " examples");
    at::Tensor permutation = to_common_device({at::randperm(n_examples, generator,
        at::TensorOptions().dtype(at::kLong)), projected_samples})[0];
    std::vector<at::Tensor> halves = projected_samples.index_select(0, permutation).chunk(2, 0);
    at::Tensor sorted_samples_a = std::get<0>(halves[0].sort(0));
    at::Tensor sorted_samples_b = std::get<0>(halves[1].sort(0));
    int64_t n_half = sorted_samples_a.size(0);
    at::Tensor sorted_samples_cluster_a, diff_weights_a, stds_per_sample_a;
    std::tie(sorted_samples_cluster_a, diff_weights_a, stds_per_sample_a) = projected_samples_mixture_sorted(
        weights, means, stds, directions, n_half, n_half,
        backprop_to_cluster_weights, normalize_by_stds, generator);
    at::Tensor sorted_samples_cluster_b, diff_weights_b, stds_per_sample_b;
    std::tie(sorted_samples_cluster_b, diff_weights_b, stds_per_sample_b) = projected_samples_mixture_sorted(
        weights, means, stds, directions, n_half, n_half,
        backprop_to_cluster_weights, normalize_by_stds, generator);
    at::Tensor diffs_x_y_a = sorted_samples_a - sorted_samples_cluster_a;
    at::Tensor diffs_x_y_b = sorted_samples_b - sorted_samples_cluster_b;
    at::Tensor diffs_x_x = sorted_samples_a - sorted_samples_b;
    at::Tensor diffs_y_y = sorted_samples_cluster_a - sorted_samples_cluster_b;
    if (normalize_by_stds) {
        stds_per_sample_a = stds_per_sample_a.clamp_min(1e-6);
        stds_per_sample_b = stds_per_sample_b.clamp_min(1e-6);
        diffs_x_y_a = diffs_x_y_a / stds_per_sample_a;
        diffs_x_y_b = diffs_x_y_b / stds_per_sample_b;
        diffs_y_y = diffs_y_y / ((stds_per_sample_a + stds_per_sample_b) / 2.0);
    }
    at::Tensor weights_y_y;
    if (backprop_to_cluster_weights) weights_y_y = (diff_weights_a + diff_weights_b) / 2.0;
    at::Tensor e_x_x = mean_deviation(diffs_x_x, at::Tensor(), abs_or_square);
    at::Tensor e_y_y = mean_deviation(diffs_y_y, weights_y_y, abs_or_square);
    at::Tensor e_x_y_a = mean_deviation(diffs_x_y_a, diff_weights_a, abs_or_square);
    if (symmetric_energy) {
        at::Tensor e_x_y_b = mean_deviation(diffs_x_y_b, diff_weights_b, abs_or_square);
        return e_x_y_a + e_x_y_b - e_x_x - e_y_y;
    }
    return 2.0 * e_x_y_a - e_x_x - e_y_y;
}

at::Tensor sample_transport_loss(const at::Tensor & samples,
const at::Tensor & means, const at::Tensor & stds, const at::Tensor & weights,
const at::Tensor & directions, const TransportOptions & options, at::Generator & generator) {
    at::Tensor dirs = directions.defined() ? directions::norm_directions(directions)
                    : directions::sample_directions(samples.size(1), true, generator, samples.options());
    at::Tensor projected_samples = samples.mm(dirs.t());
    if (options.energy_based) return sampled_energy_transport_loss(
        projected_samples, dirs, means, stds, weights, options.abs_or_square,
        options.backprop_to_cluster_weights, options.normalize_by_stds,
        options.symmetric_energy, generator);
    at::Tensor sorted_samples = std::get<0>(projected_samples.sort(0));
    int64_t n_interpolation_samples = options.n_interpolation_samples > 0
                                    ? options.n_interpolation_samples : 2 * samples.size(0);
    return sampled_transport_diffs_interpolate_sorted_part(
        sorted_samples, dirs, means, stds, weights, n_interpolation_samples, options.abs_or_square,
        options.backprop_to_cluster_weights, options.normalize_by_stds, generator);
}

} // namespace OT
