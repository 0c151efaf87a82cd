/*
Separation of clusters along the arrows between their means

For clusters a and b the arrow is means[b] - means[a]
Projections are measured relative to the projection of means[a],
so negative means already behind the wanted mean
*/

#include <torch/torch.h>

#include "GMM.hpp"
#include "OT.hpp"

namespace OT {

at::Tensor dist_transport_loss(const at::Tensor & means, const at::Tensor & stds) {
    if (means.size(0) != 2) throw std::invalid_argument(
        "dist_transport_loss error: exactly 2 clusters are required, got " + std::to_string(means.size(0)));
    at::Tensor mean_diff = means[1] - means[0];
    at::Tensor normed_diff = mean_diff / at::norm(mean_diff, 2);
    at::Tensor transformed_stds = std::get<1>(GMM::transform_by_dirs(means, stds, normed_diff.unsqueeze(0))).view(-1);
    return -at::sqrt(at::sum(mean_diff * mean_diff)) + at::sqrt(at::sum(transformed_stds * transformed_stds));
}

at::Tensor dist_transport_loss_relative(const at::Tensor & means, const at::Tensor & stds,
const double & std_offset) {
    if (means.size(0) != 2) throw std::invalid_argument(
        "dist_transport_loss_relative error: exactly 2 clusters are required, got " + std::to_string(means.size(0)));
    at::Tensor mean_diff = means[1] - means[0];
    at::Tensor normed_diff = mean_diff / at::norm(mean_diff, 2);
    at::Tensor transformed_stds = std::get<1>(GMM::transform_by_dirs(means, stds, normed_diff.unsqueeze(0))).view(-1);
    return (at::sum(transformed_stds) + std_offset) / at::sqrt(at::sum(mean_diff * mean_diff));
}

std::tuple<at::Tensor, at::Tensor, at::Tensor> pairwise_projections(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds) {
    int64_t n_clusters = means.size(0);
    // clusters x clusters x dims
    at::Tensor diff_between_clusters = means.unsqueeze(0) - means.unsqueeze(1);
    // examples x clusters x clusters
    at::Tensor outs_per_class_pair = at::sum(X.unsqueeze(1).unsqueeze(2) * diff_between_clusters.unsqueeze(0), 3);
    at::Tensor mean_between_clusters = (means.unsqueeze(0) + means.unsqueeze(1)) / 2.0;
    // clusters x clusters
    at::Tensor midpoints = at::sum(mean_between_clusters * diff_between_clusters, 2);
    at::Tensor first_mean_projected = at::sum(means.unsqueeze(1) * diff_between_clusters, 2);
    outs_per_class_pair = outs_per_class_pair - first_mean_projected.unsqueeze(0);
    midpoints = midpoints - first_mean_projected;
    std::vector<at::Tensor> rows;
    for (int64_t a = 0; a < n_clusters; a++) {
        std::vector<at::Tensor> row;
        for (int64_t b = 0; b < n_clusters; b++) {
            // The arrow from a cluster to itself has no direction
            if (a == b) {
                row.push_back(at::zeros({}, means.options()));
                continue;
            }
            at::Tensor diff_vector = diff_between_clusters[a][b];
            at::Tensor normed_diff_vector = diff_vector / at::norm(diff_vector, 2);
            at::Tensor relevant_means = at::stack({means[a], means[b]}, 0);
            at::Tensor relevant_stds  = at::stack({stds [a], stds [b]}, 0);
            at::Tensor pair_std = std::get<1>(GMM::transform_by_dirs(
                relevant_means, relevant_stds, normed_diff_vector.unsqueeze(0)));
            row.push_back(at::sum(pair_std));
        }
        rows.push_back(at::stack(row));
    }
    at::Tensor stds_per_pair = at::stack(rows);
    return std::make_tuple(outs_per_class_pair, midpoints, stds_per_pair);
}

at::Tensor pairwise_projection_loss(const at::Tensor & X, const at::Tensor & targets,
const at::Tensor & means, const at::Tensor & stds,
const bool & scaled, const bool & add_stds) {
    if (targets.size(0) != X.size(0)) throw std::invalid_argument(
        "pairwise_projection_loss error: there must be 1 target per example");
    int64_t n_clusters = means.size(0);
    at::Tensor outs_per_class_pair, midpoints, stds_per_pair;
    std::tie(outs_per_class_pair, midpoints, stds_per_pair) = pairwise_projections(X, means, stds);
    at::Tensor labels = targets.to(X.device(), at::kLong);
    at::Tensor losses = at::zeros({X.size(0)}, X.options());
    // With a single cluster there is nothing to be separated from
    if (n_clusters < 2) return losses;
    for (int64_t i = 0; i < n_clusters; i++) {
        at::Tensor indices = (labels == i).nonzero().view(-1);
        if (indices.size(0) == 0) continue;
        // examples x clusters, the projections towards every other cluster
        at::Tensor relevant_outs = outs_per_class_pair.select(1, i).index_select(0, indices);
        if (add_stds) relevant_outs = relevant_outs + stds_per_pair[i].unsqueeze(0);
        at::Tensor scaled_outs = scaled ? relevant_outs / (midpoints[i].unsqueeze(0) + 1e-6) : relevant_outs;
        // Drop the column of the own cluster
        std::vector<at::Tensor> parts;
        if (i > 0) parts.push_back(scaled_outs.slice(1, 0, i));
        if (i < n_clusters - 1) parts.push_back(scaled_outs.slice(1, i + 1, n_clusters));
        scaled_outs = at::cat(parts, 1);
        // Only punish examples further than 5% of the way to the midpoint
        double threshold = scaled ? 0.05 : 0.0;
        at::Tensor outs_to_be_penalized = (scaled_outs > threshold).to(scaled_outs.scalar_type());
        at::Tensor this_losses = at::sum(outs_to_be_penalized * scaled_outs * scaled_outs, 1);
        losses = losses.index_copy(0, indices, this_losses);
    }
    return losses;
}

at::Tensor pairwise_projection_score(const at::Tensor & X,
const at::Tensor & means, const at::Tensor & stds) {
    at::Tensor outs_per_class_pair, midpoints, stds_per_pair;
    std::tie(outs_per_class_pair, midpoints, stds_per_pair) = pairwise_projections(X, means, stds);
    at::Tensor with_stds = outs_per_class_pair + stds_per_pair.unsqueeze(0);
    at::Tensor scaled_outs = with_stds / (midpoints.unsqueeze(0) + 1e-6);
    return -at::sqrt(at::sum(scaled_outs * scaled_outs, 2));
}

} // namespace OT
