/*
Diagnostics of a trained pipeline and mixture
*/

#include <torch/torch.h>

#include "GMM.hpp"
#include "diagnostics.hpp"

namespace diagnostics {

at::Tensor icdf_grad(const at::Tensor & p, const at::Tensor & sigma) {
    return sigma * std::sqrt(2.0) * 2.0 * erfinv_grad(2.0 * p - 1.0);
}

at::Tensor erfinv_grad(const at::Tensor & p) {
    at::Tensor erfinved_p = at::erfinv(p);
    return 0.5 * std::sqrt(M_PI) * at::exp(erfinved_p * erfinved_p);
}

at::Tensor compute_icdf_grads_to_mean(const at::Tensor & outs, const at::Tensor & means, const at::Tensor & stds) {
    // examples x clusters x dims
    at::Tensor diffs_to_means = outs.unsqueeze(1) - means.unsqueeze(0);
    // examples x clusters
    at::Tensor squared_diffs = at::sum(diffs_to_means * diffs_to_means, 2);
    // An example on a mean has no arrow, any arrow gives it cdf = 0.5
    at::Tensor arrows = at::where((squared_diffs == 0.0).unsqueeze(2),
        at::ones_like(diffs_to_means), diffs_to_means);
    // Std of each cluster along the (unnormalized) arrow to each example
    std::vector<at::Tensor> cluster_stds(means.size(0));
    for (int64_t i = 0; i < means.size(0); i++)
    cluster_stds[i] = std::get<1>(GMM::transform_by_dirs(
        means.slice(0, i, i + 1), stds.slice(0, i, i + 1), arrows.select(1, i)));
    // examples x clusters
    at::Tensor stds_per_example = at::cat(cluster_stds, 1);
    at::Tensor x_euclid_diff = at::sqrt(squared_diffs + 1e-12);
    at::Tensor cdfs = 0.5 * (1.0 + at::erf(x_euclid_diff / (stds_per_example * std::sqrt(2.0))));
    // Keep away from p = 1
    return icdf_grad(cdfs - 1e-7, stds_per_example);
}

double compute_icdf_grad_accuracy(const at::Tensor & outs, const at::Tensor & targets,
const at::Tensor & means, const at::Tensor & stds) {
    if (outs.size(0) != targets.size(0)) throw std::invalid_argument(
        "compute_icdf_grad_accuracy error: should have same number of outputs as targets");
    torch::NoGradGuard no_grad;
    at::Tensor distances = compute_icdf_grads_to_mean(outs, means, stds);
    at::Tensor predictions = distances.argmin(1);
    return (predictions == targets.to(predictions.device(), at::kLong)).to(torch::kFloat64).mean().item<double>();
}

at::Tensor compute_icdf_grad_loss(const at::Tensor & outs, const at::Tensor & targets,
const at::Tensor & means, const at::Tensor & stds) {
    if (outs.size(0) != targets.size(0)) throw std::invalid_argument(
        "compute_icdf_grad_loss error: should have same number of outputs as targets");
    at::Tensor distances = compute_icdf_grads_to_mean(outs, means, stds);
    distances = distances / distances.mean(1, true);
    at::Tensor labels = targets.to(outs.device(), at::kLong);
    at::Tensor loss = at::zeros({}, outs.options());
    for (int64_t i = 0; i < means.size(0); i++) {
        at::Tensor indices = (labels == i).nonzero().view(-1);
        if (indices.size(0) == 0) continue;
        loss = loss + distances.select(1, i).index_select(0, indices).mean();
    }
    return loss;
}

std::tuple<at::Tensor, at::Tensor> get_inputs_from_reverted_samples(const int64_t & n_inputs,
const std::shared_ptr<GMM::Mixture> & mixture, const std::shared_ptr<RevNet::Pipeline> & pipeline,
at::Generator & generator) {
    pipeline->eval();
    torch::NoGradGuard no_grad;
    std::vector<int64_t> sizes = GMM::sizes_from_weights(n_inputs, mixture->weights);
    at::Tensor gauss_samples = GMM::sample_mixture_gaussian(sizes, mixture->means, mixture->stds, generator);
    at::Tensor rec_examples = pipeline->invert(gauss_samples.view({n_inputs, mixture->NDims(), 1, 1}));
    return std::make_tuple(rec_examples, gauss_samples);
}

} // namespace diagnostics
