/*
Projection directions for the sliced transport losses

A direction set is directions x dims, every row of unit norm when consumed
*/

#include <torch/torch.h>

#include "directions.hpp"

namespace directions {

at::Tensor sample_directions(const int64_t & n_dims, const bool & orthogonalize,
at::Generator & generator, const at::TensorOptions & options) {
    if (n_dims < 1) throw std::invalid_argument("sample_directions error: at least 1 dimension is required");
    at::Tensor dirs = at::randn({n_dims, n_dims}, generator,
        at::TensorOptions().dtype(options.dtype()));
    if (orthogonalize) dirs = std::get<0>(at::linalg_qr(dirs));
    dirs = dirs.to(options.device());
    at::Tensor norm_factors = at::norm(dirs, 2, {1}, true);
    return dirs / norm_factors;
}

at::Tensor norm_directions(const at::Tensor & directions) {
    if (directions.dim() != 2) throw std::invalid_argument("norm_directions error: directions must be directions x dims");
    at::Tensor norm_factors = at::norm(directions, 2, {1}, true);
    return directions / norm_factors;
}

at::Tensor mean_diff_direction(const at::Tensor & means) {
    if (means.size(0) != 2) throw std::invalid_argument(
        "mean_diff_direction error: exactly 2 clusters are required, got " + std::to_string(means.size(0)));
    at::Tensor mean_diff = means[1] - means[0];
    return (mean_diff / at::norm(mean_diff, 2)).unsqueeze(0);
}

} // namespace directions
