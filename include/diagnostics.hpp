/*
Diagnostics of a trained pipeline and mixture

The inverse-CDF-gradient distance of an example to a cluster is the derivative
of the quantile function of the cluster, projected onto the arrow from its mean to the example,
evaluated at the CDF of the example along that arrow
It grows quickly once an example leaves the bulk of a cluster
*/

#ifndef diagnostics_hpp
#define diagnostics_hpp

#include <torch/torch.h>

#include "RevNet.hpp"
#include "GMM.hpp"

namespace diagnostics {

// d/dp of the quantile function of N(0, sigma^2)
at::Tensor icdf_grad(const at::Tensor & p, const at::Tensor & sigma);

// d/dp erfinv(p)
at::Tensor erfinv_grad(const at::Tensor & p);

// examples x clusters
at::Tensor compute_icdf_grads_to_mean(const at::Tensor & outs, const at::Tensor & means, const at::Tensor & stds);

// Fraction of examples whose smallest distance is to their own cluster
double compute_icdf_grad_accuracy(const at::Tensor & outs, const at::Tensor & targets,
const at::Tensor & means, const at::Tensor & stds);

// Sum over clusters of the mean distance of its examples,
// distances relative to the mean distance of each example
at::Tensor compute_icdf_grad_loss(const at::Tensor & outs, const at::Tensor & targets,
const at::Tensor & means, const at::Tensor & stds);

// Sample n_inputs latent vectors from the mixture and invert the pipeline on them
// Return the reconstructed inputs and the Gaussian samples
std::tuple<at::Tensor, at::Tensor> get_inputs_from_reverted_samples(const int64_t & n_inputs,
const std::shared_ptr<GMM::Mixture> & mixture, const std::shared_ptr<RevNet::Pipeline> & pipeline,
at::Generator & generator);

} // namespace diagnostics

#endif
