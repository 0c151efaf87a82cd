/*
Test the training steps on a tiny pipeline:
1 channel 2 x 2 input, 1 subsample and 1 coupling stage, 4 latent features
*/

#include <cmath>
#include <gtest/gtest.h>
#include <torch/torch.h>
#include <ATen/CPUGeneratorImpl.h>

#include "RevNet.hpp"
#include "GMM.hpp"
#include "directions.hpp"
#include "OT.hpp"
#include "OptimizerUnlabelled.hpp"
#include "train.hpp"

namespace {

auto top = at::TensorOptions().dtype(torch::kFloat64);

std::shared_ptr<RevNet::Pipeline> tiny_pipeline() {
    auto pipeline = std::make_shared<RevNet::Pipeline>();
    pipeline->append(std::make_shared<RevNet::SubsampleSplitter>(2, 2, true));
    pipeline->append(std::make_shared<RevNet::ReversibleBlock>(
        RevNet::coupling_subnet(2, 8), RevNet::coupling_subnet(2, 8)));
    pipeline->input_shape = {1, 2, 2};
    pipeline->latent_dim = 4;
    RevNet::init_params(* pipeline);
    pipeline->to(torch::kFloat64);
    return pipeline;
}

std::vector<at::Tensor> feature_parameters(const std::shared_ptr<RevNet::Pipeline> & pipeline,
const std::shared_ptr<GMM::Mixture> & mixture) {
    std::vector<at::Tensor> parameters = pipeline->parameters();
    for (const at::Tensor & p : mixture->parameters()) parameters.push_back(p);
    return parameters;
}

void expect_on_simplex(const std::shared_ptr<GMM::Mixture> & mixture, const double & std_floor) {
    EXPECT_GE(mixture->weights.min().item<double>(), 0.0);
    EXPECT_NEAR(mixture->weights.sum().item<double>(), 1.0, 1e-12);
    EXPECT_GE(mixture->stds.min().item<double>(), std_floor);
}

} // anonymous namespace

TEST(TrainTest, L1Penalty) {
    auto mixture = std::make_shared<GMM::Mixture>(at::full({2, 2}, -2.0, top), at::full({2, 2}, 3.0, top),
                                                  at::tensor({0.25, 0.75}, top));
    train::TrainOptions options;
    options.std_l1 = 1.0;
    options.mean_l1 = 0.5;
    options.weight_l1 = 2.0;
    EXPECT_NEAR(train::l1_penalty(mixture, options).item<double>(), 3.0 + 1.0 + 1.0, 1e-12);
}

TEST(TrainTest, StepKeepsMixtureOnSimplex) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(30);
    torch::manual_seed(30);
    auto pipeline = tiny_pipeline();
    auto mixture = std::make_shared<GMM::Mixture>(2, 4, 1.0, generator);
    at::Tensor directions_adv = directions::sample_directions(4, true, generator, top).requires_grad_(true);
    // A large L1 factor drives the weights below 0 before the projection
    torch::optim::SGD optimizer(feature_parameters(pipeline, mixture), torch::optim::SGDOptions(0.1));
    torch::optim::Adam optimizer_adv(std::vector<at::Tensor>{directions_adv}, 0.01);
    train::TrainOptions options;
    options.backprop_to_cluster_weights = true;
    options.weight_l1 = 100.0;
    at::Tensor inputs = at::randn({16, 1, 2, 2}, generator, top);
    std::vector<train::BatchLoss> losses = train::train_epoch(inputs, 8, pipeline, mixture, directions_adv,
        optimizer, optimizer_adv, options, generator);
    ASSERT_EQ(losses.size(), (size_t)2);
    for (const train::BatchLoss & loss : losses) {
        EXPECT_TRUE(std::isfinite(loss.total));
        EXPECT_NEAR(loss.total, loss.transport + loss.l1 + loss.target, 1e-9);
        EXPECT_EQ(loss.target, 0.0);
    }
    expect_on_simplex(mixture, options.std_floor);
    train::BatchLoss mean = train::mean_loss(losses);
    EXPECT_NEAR(mean.total, (losses[0].total + losses[1].total) / 2.0, 1e-12);
}

TEST(TrainTest, AdversarialDirectionsAscend) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(31);
    torch::manual_seed(31);
    auto pipeline = tiny_pipeline();
    auto mixture = std::make_shared<GMM::Mixture>(2, 4, 1.0, generator);
    at::Tensor directions_adv = directions::sample_directions(4, true, generator, top).requires_grad_(true);
    // Nothing moves, so the stored gradient can be compared against a replay of the same loss
    torch::optim::SGD optimizer(feature_parameters(pipeline, mixture), torch::optim::SGDOptions(0.0));
    torch::optim::SGD optimizer_adv(std::vector<at::Tensor>{directions_adv}, torch::optim::SGDOptions(0.0));
    train::TrainOptions options;
    at::Tensor batch_X = at::randn({8, 1, 2, 2}, generator, top);
    at::Generator replay = generator.clone();
    train::train_on_batch(batch_X, pipeline, mixture, directions_adv, optimizer, optimizer_adv, options, generator);
    ASSERT_TRUE(directions_adv.grad().defined());

    at::Tensor dirs = directions_adv.detach().clone().requires_grad_(true);
    at::Tensor outs = pipeline->latent(batch_X);
    OT::TransportOptions trans_options;
    trans_options.n_interpolation_samples = 16;
    trans_options.backprop_to_cluster_weights = false;
    trans_options.normalize_by_stds = false;
    at::Tensor normed_weights = mixture->normed_weights();
    at::Tensor loss = at::zeros({}, top);
    for (size_t i = 0; i < 3; i++) loss = loss + OT::sample_transport_loss(outs, mixture->means, mixture->stds,
        normed_weights, i < 2 ? at::Tensor() : dirs, trans_options, replay);
    loss.backward();
    EXPECT_TRUE(at::allclose(directions_adv.grad(), -dirs.grad(), 1e-8, 1e-10));
    EXPECT_GT(dirs.grad().abs().sum().item<double>(), 0.0);
}

TEST(TrainTest, SupervisedStepWithClassifier) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(32);
    torch::manual_seed(32);
    auto pipeline = tiny_pipeline();
    auto mixture = std::make_shared<GMM::Mixture>(2, 4, 1.0, generator);
    at::Tensor directions_adv = directions::sample_directions(4, true, generator, top).requires_grad_(true);
    torch::nn::Sequential clf(torch::nn::Linear(4, 2));
    clf->to(torch::kFloat64);
    std::vector<at::Tensor> parameters = feature_parameters(pipeline, mixture);
    for (const at::Tensor & p : clf->parameters()) parameters.push_back(p);
    torch::optim::Adam optimizer(parameters, 0.001);
    torch::optim::Adam optimizer_adv(std::vector<at::Tensor>{directions_adv}, 0.001);
    at::Tensor inputs = at::randn({12, 1, 2, 2}, generator, top);
    at::Tensor targets = at::tensor({0, 1, 0, 1, 0, 1, 0, 1, 0, 1, 0, 1}, at::kLong);
    train::LossFunction loss_function = [](const at::Tensor & preds, const at::Tensor & targets) {
        return torch::nn::functional::cross_entropy(preds, targets);
    };
    at::Tensor weight_before = clf->parameters()[0].detach().clone();
    std::vector<train::BatchLoss> losses = train::train_epoch(inputs, 6, pipeline, mixture, directions_adv,
        optimizer, optimizer_adv, train::TrainOptions(), generator, clf, targets, loss_function);
    ASSERT_EQ(losses.size(), (size_t)2);
    EXPECT_GT(losses[0].target, 0.0);
    EXPECT_FALSE(at::equal(weight_before, clf->parameters()[0].detach()));
    // Targets need a loss function
    EXPECT_THROW(train::train_on_batch(inputs, pipeline, mixture, directions_adv, optimizer, optimizer_adv,
        train::TrainOptions(), generator, clf, targets), std::invalid_argument);
}

TEST(TrainTest, PerClassEpochWithUnlabelledExamples) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(33);
    torch::manual_seed(33);
    auto pipeline = tiny_pipeline();
    auto mixture = std::make_shared<GMM::Mixture>(2, 4, 1.0, generator);
    at::Tensor directions_adv = directions::sample_directions(4, true, generator, top).requires_grad_(true);
    torch::optim::Adam optimizer(feature_parameters(pipeline, mixture), 0.001);
    torch::optim::Adam optimizer_adv(std::vector<at::Tensor>{directions_adv}, 0.001);
    at::Tensor inputs = at::randn({12, 1, 2, 2}, generator, top);
    at::Tensor targets = at::tensor({0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1}, at::kLong);
    at::Tensor unlabelled_inputs = at::randn({6, 1, 2, 2}, generator, top);
    at::Tensor unlabelled_weights = at::full({6}, 0.5, top).requires_grad_(true);
    OptimizerUnlabelled optim_unlabelled(unlabelled_weights);
    std::shared_ptr<GMM::Mixture> model = mixture;
    train::LossFunction loss_function = [model](const at::Tensor & preds, const at::Tensor & targets) {
        return torch::nn::functional::cross_entropy(
            GMM::log_gaussian_pdf_per_cluster(preds, model->means, model->stds), targets);
    };
    train::TrainOptions options;
    options.normalization = "both";
    std::vector<train::BatchLoss> losses = train::train_epoch_per_class(inputs, targets, 4,
        pipeline, mixture, directions_adv, optimizer, optimizer_adv, options, generator, loss_function,
        torch::nn::Sequential(nullptr), unlabelled_inputs, & optim_unlabelled);
    // Class 0 needs 4 batches of 2
    ASSERT_EQ(losses.size(), (size_t)4);
    for (const train::BatchLoss & loss : losses) EXPECT_TRUE(std::isfinite(loss.total));
    EXPECT_GE(unlabelled_weights.min().item<double>(), 0.01);
    EXPECT_LE(unlabelled_weights.max().item<double>(), 0.99);
    expect_on_simplex(mixture, options.std_floor);
    // Unlabelled inputs need their weight optimizer
    EXPECT_THROW(train::train_on_batch_per_class(inputs, targets, pipeline, mixture, directions_adv,
        optimizer, optimizer_adv, options, generator, loss_function,
        torch::nn::Sequential(nullptr), unlabelled_inputs), std::invalid_argument);
}

TEST(TrainTest, EvaluationChangesNothing) {
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(34);
    torch::manual_seed(34);
    auto pipeline = tiny_pipeline();
    auto mixture = std::make_shared<GMM::Mixture>(2, 4, 1.0, generator);
    at::Tensor directions_adv = directions::sample_directions(4, true, generator, top).requires_grad_(true);
    at::Tensor means_before = mixture->means.detach().clone();
    std::vector<double> losses = train::eval_inputs(at::randn({10, 1, 2, 2}, generator, top),
        pipeline, mixture, directions_adv, generator);
    ASSERT_EQ(losses.size(), (size_t)3);
    for (const double & loss : losses) EXPECT_TRUE(std::isfinite(loss));
    EXPECT_TRUE(at::equal(means_before, mixture->means.detach()));
    EXPECT_FALSE(directions_adv.grad().defined());
    std::vector<double> energy_losses = train::eval_inputs(at::randn({10, 1, 2, 2}, generator, top),
        pipeline, mixture, directions_adv, generator, true);
    for (const double & loss : energy_losses) EXPECT_TRUE(std::isfinite(loss));
}

TEST(TrainTest, EnergyNeedsEvenBatch) {
    EXPECT_NO_THROW(train::check_batch_size(7, false));
    EXPECT_NO_THROW(train::check_batch_size(8, true));
    EXPECT_THROW(train::check_batch_size(7, true), std::invalid_argument);
    EXPECT_THROW(train::check_batch_size(0, false), std::invalid_argument);
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(35);
    torch::manual_seed(35);
    auto pipeline = tiny_pipeline();
    auto mixture = std::make_shared<GMM::Mixture>(2, 4, 1.0, generator);
    at::Tensor directions_adv = directions::sample_directions(4, true, generator, top).requires_grad_(true);
    torch::optim::SGD optimizer(feature_parameters(pipeline, mixture), torch::optim::SGDOptions(0.1));
    torch::optim::SGD optimizer_adv(std::vector<at::Tensor>{directions_adv}, torch::optim::SGDOptions(0.1));
    train::TrainOptions options;
    options.energy_based = true;
    at::Tensor means_before = mixture->means.detach().clone();
    // Rejected before the first step
    EXPECT_THROW(train::train_epoch(at::randn({10, 1, 2, 2}, generator, top), 5, pipeline, mixture,
        directions_adv, optimizer, optimizer_adv, options, generator), std::invalid_argument);
    EXPECT_TRUE(at::equal(means_before, mixture->means.detach()));
    EXPECT_THROW(train::eval_inputs(at::randn({9, 1, 2, 2}, generator, top), pipeline, mixture,
        directions_adv, generator, true), std::invalid_argument);
}
