/*
Training steps and epochs

The feature optimizer holds the network, the mixture and the classifier parameters,
the adversarial optimizer holds only the adversarial directions
*/

#include <torch/torch.h>

#include "utility.hpp"
#include "GMM.hpp"
#include "OT.hpp"
#include "batching.hpp"
#include "train.hpp"

namespace train {

void check_batch_size(const int64_t & batch_size, const bool & energy_based) {
    if (batch_size < 1) throw std::invalid_argument(
        "check_batch_size error: batch size must be positive, got " + std::to_string(batch_size));
    if (energy_based && (batch_size < 2 || batch_size % 2 != 0)) throw std::invalid_argument(
        "check_batch_size error: energy distance needs an even batch size, got " + std::to_string(batch_size));
}

at::Tensor l1_penalty(const std::shared_ptr<GMM::Mixture> & mixture, const TrainOptions & options) {
    return at::abs(mixture->stds   ).mean() * options.std_l1
         + at::abs(mixture->weights).mean() * options.weight_l1
         + at::abs(mixture->means  ).mean() * options.mean_l1;
}

BatchLoss train_on_batch(const at::Tensor & batch_X,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator,
const torch::nn::Sequential & clf, const at::Tensor & batch_y, const LossFunction & loss_function) {
    if (batch_y.defined()) {
        if (batch_y.size(0) != batch_X.size(0)) throw std::invalid_argument(
            "train_on_batch error: there must be 1 target per example");
        if (! loss_function) throw std::invalid_argument("train_on_batch error: targets come without a loss function");
    }
    optimizer.zero_grad();
    optimizer_adv.zero_grad();
    at::Tensor batch_outs = pipeline->latent(to_common_device({batch_X, mixture->means})[0]);
    OT::TransportOptions trans_options;
    trans_options.abs_or_square = "square";
    trans_options.n_interpolation_samples = batch_outs.size(0) * 2;
    trans_options.backprop_to_cluster_weights = options.backprop_to_cluster_weights;
    trans_options.normalize_by_stds = options.normalize_by_std;
    trans_options.energy_based = options.energy_based;
    trans_options.symmetric_energy = options.symmetric_energy;
    at::Tensor normed_weights = mixture->normed_weights();
    at::Tensor trans_loss = at::zeros({}, batch_outs.options());
    // 2 random direction sets then the adversarial one
    for (size_t i = 0; i < 3; i++) trans_loss = trans_loss + OT::sample_transport_loss(
        batch_outs, mixture->means, mixture->stds, normed_weights,
        i < 2 ? at::Tensor() : directions_adv, trans_options, generator);
    at::Tensor threshold_l1_penalty = l1_penalty(mixture, options);
    at::Tensor target_loss = at::zeros({}, batch_outs.options());
    if (batch_y.defined()) {
        torch::nn::Sequential classifier = clf;
        at::Tensor preds = classifier.is_empty() ? batch_outs : classifier->forward(batch_outs);
        target_loss = loss_function(preds, batch_y.to(preds.device()));
    }
    at::Tensor total_loss = trans_loss + threshold_l1_penalty + target_loss;
    total_loss.backward();
    optimizer.step();
    // Directions should try to increase loss
    if (directions_adv.grad().defined()) directions_adv.grad().neg_();
    optimizer_adv.step();
    mixture->project(options.std_floor);
    return BatchLoss{trans_loss.item<double>(), threshold_l1_penalty.item<double>(),
                     target_loss.item<double>(), total_loss.item<double>()};
}

std::vector<BatchLoss> train_epoch(const at::Tensor & inputs, const int64_t & batch_size,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator,
const torch::nn::Sequential & clf, const at::Tensor & targets, const LossFunction & loss_function) {
    check_batch_size(batch_size, options.energy_based);
    pipeline->train();
    std::vector<BatchLoss> losses;
    for (const at::Tensor & i_examples : batching::get_exact_size_batches(inputs.size(0), batch_size, generator)) {
        at::Tensor batch_X = inputs.index_select(0, i_examples.to(inputs.device()));
        at::Tensor batch_y;
        if (targets.defined()) batch_y = targets.index_select(0, i_examples.to(targets.device()));
        losses.push_back(train_on_batch(batch_X, pipeline, mixture, directions_adv,
            optimizer, optimizer_adv, options, generator, clf, batch_y, loss_function));
    }
    return losses;
}

BatchLoss train_on_batch_per_class(const at::Tensor & batch_X, const at::Tensor & batch_y,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator, const LossFunction & loss_function,
const torch::nn::Sequential & clf,
const at::Tensor & unlabelled_inputs, OptimizerUnlabelled * optim_unlabelled) {
    if (! batch_y.defined() || batch_y.size(0) != batch_X.size(0)) throw std::invalid_argument(
        "train_on_batch_per_class error: there must be 1 target per example");
    if (! loss_function) throw std::invalid_argument("train_on_batch_per_class error: a loss function is required");
    bool has_unlabelled = unlabelled_inputs.defined() && unlabelled_inputs.size(0) > 0;
    if (has_unlabelled && optim_unlabelled == nullptr) throw std::invalid_argument(
        "train_on_batch_per_class error: unlabelled inputs come without their weight optimizer");
    if (optim_unlabelled != nullptr) optim_unlabelled->zero_grad();
    optimizer.zero_grad();
    optimizer_adv.zero_grad();
    std::vector<at::Tensor> migrated = to_common_device({batch_X, batch_y, unlabelled_inputs, mixture->means});
    at::Tensor batch_outs = pipeline->latent(migrated[0]);
    at::Tensor unlabelled_outs, unlabelled_weights;
    if (has_unlabelled) {
        unlabelled_outs = pipeline->latent(migrated[2]);
        unlabelled_weights = optim_unlabelled->weights;
    }
    at::Tensor labels = migrated[1];
    at::Tensor trans_loss = OT::compute_class_trans_loss(batch_outs, mixture->means, mixture->stds,
        directions_adv, labels, generator, options.add_mean_diff_directions,
        unlabelled_outs, unlabelled_weights, options.normalization);
    at::Tensor threshold_l1_penalty = l1_penalty(mixture, options);
    torch::nn::Sequential classifier = clf;
    at::Tensor preds = classifier.is_empty() ? batch_outs : classifier->forward(batch_outs);
    at::Tensor target_loss = loss_function(preds, labels);
    at::Tensor total_loss = trans_loss + threshold_l1_penalty + target_loss;
    total_loss.backward();
    optimizer.step();
    if (has_unlabelled) optim_unlabelled->step();
    // Directions should try to increase loss
    if (directions_adv.grad().defined()) directions_adv.grad().neg_();
    optimizer_adv.step();
    mixture->project(options.std_floor);
    return BatchLoss{trans_loss.item<double>(), threshold_l1_penalty.item<double>(),
                     target_loss.item<double>(), total_loss.item<double>()};
}

std::vector<BatchLoss> train_epoch_per_class(const at::Tensor & inputs, const at::Tensor & targets,
const int64_t & batch_size,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv,
const TrainOptions & options, at::Generator & generator, const LossFunction & loss_function,
const torch::nn::Sequential & clf,
const at::Tensor & unlabelled_inputs, OptimizerUnlabelled * optim_unlabelled) {
    pipeline->train();
    std::vector<BatchLoss> losses;
    for (const at::Tensor & i_examples : batching::get_batches_equal_classes(
    targets, mixture->NClusters(), batch_size, generator)) {
        at::Tensor batch_X = inputs.index_select(0, i_examples.to(inputs.device()));
        at::Tensor batch_y = targets.index_select(0, i_examples.to(targets.device()));
        losses.push_back(train_on_batch_per_class(batch_X, batch_y, pipeline, mixture, directions_adv,
            optimizer, optimizer_adv, options, generator, loss_function,
            clf, unlabelled_inputs, optim_unlabelled));
    }
    return losses;
}

std::vector<double> eval_inputs(const at::Tensor & batch_X,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, at::Generator & generator, const bool & energy_based) {
    check_batch_size(batch_X.size(0), energy_based);
    torch::NoGradGuard no_grad;
    at::Tensor all_outs = pipeline->latent(to_common_device({batch_X, mixture->means})[0]);
    OT::TransportOptions trans_options;
    trans_options.abs_or_square = "square";
    trans_options.n_interpolation_samples = all_outs.size(0) * 2;
    trans_options.backprop_to_cluster_weights = false;
    trans_options.normalize_by_stds = false;
    trans_options.energy_based = energy_based;
    at::Tensor normed_weights = mixture->normed_weights();
    std::vector<double> trans_losses(3);
    for (size_t i = 0; i < 3; i++) trans_losses[i] = OT::sample_transport_loss(
        all_outs, mixture->means, mixture->stds, normed_weights,
        i < 2 ? at::Tensor() : directions_adv, trans_options, generator).item<double>();
    return trans_losses;
}

BatchLoss mean_loss(const std::vector<BatchLoss> & losses) {
    BatchLoss mean{0.0, 0.0, 0.0, 0.0};
    if (losses.empty()) return mean;
    for (const BatchLoss & loss : losses) {
        mean.transport += loss.transport;
        mean.l1        += loss.l1;
        mean.target    += loss.target;
        mean.total     += loss.total;
    }
    double n = (double)losses.size();
    mean.transport /= n;
    mean.l1        /= n;
    mean.target    /= n;
    mean.total     /= n;
    return mean;
}

} // namespace train
