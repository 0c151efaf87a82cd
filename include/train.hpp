/*
Training steps and epochs

A step:
    1. zero the gradients of every optimizer
    2. forward the batch (and the unlabelled examples) through the pipeline
    3. transport loss summed over 2 random and the adversarial direction sets,
       plus L1 penalty on the mixture, plus the optional supervised loss
    4. backward once
    5. step the feature optimizer (network, mixture, classifier)
    6. step the unlabelled-weight optimizer if present
    7. negate the gradient of the adversarial directions then step their optimizer,
       so the directions maximize the loss that everything else minimizes
    8. project the mixture weights onto the simplex and floor the mixture stds
*/

#ifndef train_hpp
#define train_hpp

#include <torch/torch.h>

#include "RevNet.hpp"
#include "GMM.hpp"
#include "OptimizerUnlabelled.hpp"

namespace train {

struct TrainOptions {
    // L1 penalty factors on the mixture parameters
    double std_l1 = 0.5, mean_l1 = 0.01, weight_l1 = 0.0;
    // Weight the sample transport loss by the per-sample cluster weights
    bool backprop_to_cluster_weights = false;
    // Divide the sample transport loss by the interpolated stds
    bool normalize_by_std = false;
    // Per class normalization: "none", "std" or "both"
    std::string normalization = "none";
    // Energy distance instead of single matching
    bool energy_based = false;
    bool symmetric_energy = false;
    // Append the mean-difference direction to every per class direction set
    bool add_mean_diff_directions = true;
    // Floor of the mixture stds after every step
    double std_floor = 1e-4;
};

struct BatchLoss {
    double transport, l1, target, total;
};

// (predictions, targets) -> scalar loss
typedef std::function<at::Tensor(const at::Tensor &, const at::Tensor &)> LossFunction;

// The energy distance splits every batch into 2 equal halves
void check_batch_size(const int64_t & batch_size, const bool & energy_based);

// mean|stds| * std_l1 + mean|weights| * weight_l1 + mean|means| * mean_l1
at::Tensor l1_penalty(const std::shared_ptr<GMM::Mixture> & mixture, const TrainOptions & options);

// Unsupervised, or supervised if batch_y is defined
// The classifier is optional, without it the latent features are the predictions
BatchLoss train_on_batch(const at::Tensor & batch_X,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator,
const torch::nn::Sequential & clf = torch::nn::Sequential(nullptr),
const at::Tensor & batch_y = at::Tensor(), const LossFunction & loss_function = nullptr);

// Exact size batches over inputs, with targets if defined
std::vector<BatchLoss> train_epoch(const at::Tensor & inputs, const int64_t & batch_size,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator,
const torch::nn::Sequential & clf = torch::nn::Sequential(nullptr),
const at::Tensor & targets = at::Tensor(), const LossFunction & loss_function = nullptr);

// Per class transport loss, the supervised loss is required
// All unlabelled inputs join every batch, softly assigned by optim_unlabelled->weights
BatchLoss train_on_batch_per_class(const at::Tensor & batch_X, const at::Tensor & batch_y,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator, const LossFunction & loss_function,
const torch::nn::Sequential & clf = torch::nn::Sequential(nullptr),
const at::Tensor & unlabelled_inputs = at::Tensor(), OptimizerUnlabelled * optim_unlabelled = nullptr);

// Class balanced batches, 1 class per mixture cluster
std::vector<BatchLoss> train_epoch_per_class(const at::Tensor & inputs, const at::Tensor & targets,
const int64_t & batch_size,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator, const LossFunction & loss_function,
const torch::nn::Sequential & clf = torch::nn::Sequential(nullptr),
const at::Tensor & unlabelled_inputs = at::Tensor(), OptimizerUnlabelled * optim_unlabelled = nullptr);

// Transport losses of a batch under 2 random and the adversarial direction sets, nothing is updated
std::vector<double> eval_inputs(const at::Tensor & batch_X,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, at::Generator & generator, const bool & energy_based = false);

// Mean of each loss over the batches of an epoch
BatchLoss mean_loss(const std::vector<BatchLoss> & losses);

} // namespace train

#endif
