/*
The jobs of the command line driver

Training jobs print a progress line and save checkpoints every epoch / 10 epochs:
    RevNet_<epoch>.net, GMM_<epoch>.net, directions_<epoch>.pt, [clf_<epoch>.net],
    RevNet_<epoch>.opt, directions_<epoch>.opt
*/

#include <torch/torch.h>

#include <CppLibrary/TorchSupport.hpp>

#include "RevNet.hpp"
#include "GMM.hpp"
#include "OptimizerUnlabelled.hpp"
#include "train.hpp"
#include "diagnostics.hpp"
#include "data.hpp"

namespace jobs {

std::shared_ptr<torch::optim::Optimizer> make_optimizer(const std::string & opt,
const std::vector<at::Tensor> & parameters, const double & learning_rate) {
    if (opt == "Adam") return std::make_shared<torch::optim::Adam>(parameters, learning_rate);
    if (opt == "SGD") return std::make_shared<torch::optim::SGD>(parameters,
        torch::optim::SGDOptions(learning_rate).momentum(0.9).nesterov(true));
    throw std::invalid_argument("make_optimizer error: unsupported optimizer " + opt);
}

// The network, the mixture and the classifier are trained together
std::vector<at::Tensor> feature_parameters(const std::shared_ptr<RevNet::Pipeline> & pipeline,
const std::shared_ptr<GMM::Mixture> & mixture, const torch::nn::Sequential & clf) {
    std::vector<at::Tensor> parameters = pipeline->parameters();
    for (const at::Tensor & p : mixture->parameters()) parameters.push_back(p);
    if (! clf.is_empty()) for (const at::Tensor & p : clf->parameters()) parameters.push_back(p);
    return parameters;
}

void follow(const size_t & iepoch, const std::vector<train::BatchLoss> & losses,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, const torch::nn::Sequential & clf,
torch::optim::Optimizer & optimizer, torch::optim::Optimizer & optimizer_adv) {
    train::BatchLoss mean = train::mean_loss(losses);
    std::cout << "epoch = " << iepoch
              << ", transport = " << mean.transport << ", L1 = " << mean.l1
              << ", target = " << mean.target << ", total = " << mean.total << '\n'
              << "    network gradient 1-norm = " << CL::TS::NetGradNorm(pipeline->parameters())
              << ", cluster weights =";
    at::Tensor weights = mixture->weights.detach().to(at::kCPU);
    for (int64_t i = 0; i < weights.size(0); i++) std::cout << ' ' << weights[i].item<double>();
    std::cout << std::endl;
    std::string tag = std::to_string(iepoch);
    torch::save(pipeline, "RevNet_" + tag + ".net");
    torch::save(mixture, "GMM_" + tag + ".net");
    torch::save(directions_adv, "directions_" + tag + ".pt");
    if (! clf.is_empty()) torch::save(clf, "clf_" + tag + ".net");
    torch::save(optimizer, "RevNet_" + tag + ".opt");
    torch::save(optimizer_adv, "directions_" + tag + ".opt");
}

void unsupervised(const data::DataSet & data_set,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, const torch::nn::Sequential & clf,
const train::TrainOptions & options, const std::string & checkpoint,
const std::string & opt, const size_t & epoch, const int64_t & batch_size,
const double & learning_rate, const double & adv_learning_rate, at::Generator & generator) {
    std::cout << "Start unsupervised training\n";
    // A classifier turns on the supervised loss on the labelled examples
    data::DataSet training_set = data_set;
    train::LossFunction loss_function = nullptr;
    if (! clf.is_empty()) {
        training_set = data_set.labelled();
        if (training_set.size() == 0) throw std::invalid_argument("unsupervised error: the classifier needs labelled examples");
        loss_function = [](const at::Tensor & preds, const at::Tensor & targets) {
            return torch::nn::functional::cross_entropy(preds, targets);
        };
        std::cout << "The classifier is trained on " << training_set.size() << " labelled examples\n";
    }
    at::Tensor targets = clf.is_empty() ? at::Tensor() : training_set.targets;
    auto optimizer = make_optimizer(opt, feature_parameters(pipeline, mixture, clf), learning_rate);
    auto optimizer_adv = make_optimizer(opt, {directions_adv}, adv_learning_rate);
    if (! checkpoint.empty()) {
        torch::load(* optimizer, "RevNet_" + checkpoint + ".opt");
        torch::load(* optimizer_adv, "directions_" + checkpoint + ".opt");
    }
    std::cout << "batch size = " << batch_size << '\n';
    size_t follow_every = epoch / 10 > 0 ? epoch / 10 : 1;
    for (size_t iepoch = 1; iepoch <= epoch; iepoch++) {
        std::vector<train::BatchLoss> losses = train::train_epoch(training_set.inputs, batch_size,
            pipeline, mixture, directions_adv, * optimizer, * optimizer_adv, options, generator,
            clf, targets, loss_function);
        if (iepoch % follow_every == 0) follow(iepoch, losses, pipeline, mixture, directions_adv, clf,
            * optimizer, * optimizer_adv);
    }
}

void per_class(const data::DataSet & data_set,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, const torch::nn::Sequential & clf,
const train::TrainOptions & options, const std::string & checkpoint,
const std::string & opt, const size_t & epoch, const int64_t & batch_size,
const double & learning_rate, const double & adv_learning_rate, const double & unlabelled_lr,
at::Generator & generator) {
    std::cout << "Start per class training\n";
    data::DataSet labelled_set = data_set.labelled();
    at::Tensor unlabelled_inputs = data_set.unlabelled_inputs();
    std::cout << "Number of labelled examples = " << labelled_set.size()
              << ", number of unlabelled examples = " << unlabelled_inputs.size(0) << '\n';
    if (labelled_set.size() == 0) throw std::invalid_argument("per_class error: no labelled example");
    if (labelled_set.targets.max().item<int64_t>() >= mixture->NClusters()) throw std::invalid_argument(
        "per_class error: more classes than mixture clusters");
    // Without a classifier the class logits are the per-cluster log densities
    train::LossFunction loss_function;
    if (clf.is_empty()) {
        std::shared_ptr<GMM::Mixture> model = mixture;
        loss_function = [model](const at::Tensor & preds, const at::Tensor & targets) {
            return torch::nn::functional::cross_entropy(
                GMM::log_gaussian_pdf_per_cluster(preds, model->means, model->stds), targets);
        };
    }
    else loss_function = [](const at::Tensor & preds, const at::Tensor & targets) {
        return torch::nn::functional::cross_entropy(preds, targets);
    };
    auto optimizer = make_optimizer(opt, feature_parameters(pipeline, mixture, clf), learning_rate);
    auto optimizer_adv = make_optimizer(opt, {directions_adv}, adv_learning_rate);
    if (! checkpoint.empty()) {
        torch::load(* optimizer, "RevNet_" + checkpoint + ".opt");
        torch::load(* optimizer_adv, "directions_" + checkpoint + ".opt");
    }
    // Every unlabelled example starts undecided between the 2 clusters
    std::shared_ptr<OptimizerUnlabelled> optim_unlabelled;
    if (unlabelled_inputs.size(0) > 0) {
        at::Tensor unlabelled_weights = at::full({unlabelled_inputs.size(0)}, 0.5,
            mixture->means.options()).requires_grad_(true);
        optim_unlabelled = std::make_shared<OptimizerUnlabelled>(unlabelled_weights, unlabelled_lr);
    }
    else unlabelled_inputs = at::Tensor();
    std::cout << "batch size = " << batch_size << '\n';
    size_t follow_every = epoch / 10 > 0 ? epoch / 10 : 1;
    for (size_t iepoch = 1; iepoch <= epoch; iepoch++) {
        std::vector<train::BatchLoss> losses = train::train_epoch_per_class(
            labelled_set.inputs, labelled_set.targets, batch_size,
            pipeline, mixture, directions_adv, * optimizer, * optimizer_adv, options, generator,
            loss_function, clf, unlabelled_inputs, optim_unlabelled.get());
        if (iepoch % follow_every == 0) follow(iepoch, losses, pipeline, mixture, directions_adv, clf,
            * optimizer, * optimizer_adv);
    }
    if (optim_unlabelled) {
        torch::save(optim_unlabelled->weights.detach(), "unlabelled_weights.pt");
        std::cout << "Unlabelled examples assigned to cluster 1: "
                  << (optim_unlabelled->weights > 0.5).sum().item<int64_t>()
                  << " of " << optim_unlabelled->weights.size(0) << '\n';
    }
}

void evaluate(const data::DataSet & data_set,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, const bool & energy_based, at::Generator & generator) {
    pipeline->eval();
    std::vector<double> trans_losses = train::eval_inputs(data_set.inputs, pipeline, mixture,
        directions_adv, generator, energy_based);
    std::cout << "Transport loss along random directions = " << trans_losses[0] << ", " << trans_losses[1] << '\n'
              << "Transport loss along adversarial directions = " << trans_losses[2] << '\n';
    data::DataSet labelled_set = data_set.labelled();
    if (labelled_set.size() > 0) {
        torch::NoGradGuard no_grad;
        at::Tensor outs = pipeline->latent(labelled_set.inputs.to(mixture->means.device()));
        at::Tensor targets = labelled_set.targets.to(outs.device());
        std::cout << "Inverse CDF gradient accuracy = "
                  << diagnostics::compute_icdf_grad_accuracy(outs, targets, mixture->means, mixture->stds) << '\n'
                  << "Inverse CDF gradient loss = "
                  << diagnostics::compute_icdf_grad_loss(outs, targets, mixture->means, mixture->stds).item<double>() << '\n';
        at::Tensor log_densities = GMM::log_densities(outs, mixture->means, mixture->stds, mixture->weights);
        std::cout << "Mean log density of the labelled examples = "
                  << at::logsumexp(log_densities, 1).mean().item<double>() << '\n';
    }
}

void invert(const int64_t & n_reconstructions,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
at::Generator & generator) {
    at::Tensor rec_examples, gauss_samples;
    std::tie(rec_examples, gauss_samples) = diagnostics::get_inputs_from_reverted_samples(
        n_reconstructions, mixture, pipeline, generator);
    data::write_examples("reconstructions.txt", rec_examples);
    data::write_examples("gaussian_samples.txt", gauss_samples);
    std::cout << n_reconstructions << " reconstructions are written to reconstructions.txt\n";
}

} // namespace jobs
