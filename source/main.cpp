/*
RevOT: reversible networks trained by sliced optimal transport based on libtorch
*/

#include <iostream>
#include <torch/torch.h>
#include <ATen/CPUGeneratorImpl.h>

#include <CppLibrary/argparse.hpp>
#include <CppLibrary/utility.hpp>
#include <CppLibrary/TorchSupport.hpp>

#include "utility.hpp"
#include "RevNet.hpp"
#include "GMM.hpp"
#include "directions.hpp"
#include "train.hpp"
#include "data.hpp"

argparse::ArgumentParser parse_args(const int & argc, const char ** & argv) {
    CL::utility::EchoCommand(argc, argv); std::cout << '\n';
    argparse::ArgumentParser parser("Reversible networks trained by sliced optimal transport based on libtorch");

    // Required arguments
    parser.add_argument("--job", 1, false, "unsupervised, per_class, evaluate, invert");
    parser.add_argument("--RevNet_in", 1, false, "an input file to define the reversible network");

    // Optional arguments for data and model
    parser.add_argument("--data_set", '+', true, "data file or data set list file, required except for invert");
    parser.add_argument("--n_clusters", 1, true, "number of mixture clusters, default = 2");
    parser.add_argument("-c","--checkpoint", 1, true, "the epoch of the checkpoint to continue from");
    parser.add_argument("--classifier", 0, true, "train a linear classifier on the latent features");
    parser.add_argument("--seed", 1, true, "random seed, default = 0");
    parser.add_argument("--cuda", 0, true, "run on GPU if available");
    // for optimization
    parser.add_argument("-o","--optimizer", 1, true, "Adam, SGD (default = Adam)");
    parser.add_argument("-e","--epoch", 1, true, "default = 100");
    parser.add_argument("-b","--batch_size", 1, true, "default = 64");
    parser.add_argument("-l","--learning_rate", 1, true, "default = 0.001");
    parser.add_argument("--adv_learning_rate", 1, true, "learning rate of the adversarial directions, default = learning_rate");
    parser.add_argument("--std_l1", 1, true, "L1 penalty factor on mixture stds, default = 0.5");
    parser.add_argument("--mean_l1", 1, true, "L1 penalty factor on mixture means, default = 0.01");
    parser.add_argument("--weight_l1", 1, true, "L1 penalty factor on mixture weights, default = 0");
    parser.add_argument("--normalize_by_std", 0, true, "normalize the transport losses by the mixture stds");
    parser.add_argument("--energy", 0, true, "energy distance instead of single matching");
    parser.add_argument("--backprop_weights", 0, true, "backpropagate the transport loss to the cluster weights");
    parser.add_argument("--unlabelled_lr", 1, true, "learning rate of the unlabelled example weights, default = 10");

    // for inverting the network
    parser.add_argument("--n_reconstructions", 1, true, "number of reconstructed examples, default = 100");

    parser.parse_args(argc, argv);
    return parser;
}

namespace jobs {
void unsupervised(const data::DataSet & data_set,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, const torch::nn::Sequential & clf,
const train::TrainOptions & options, const std::string & checkpoint,
const std::string & opt, const size_t & epoch, const int64_t & batch_size,
const double & learning_rate, const double & adv_learning_rate, at::Generator & generator);

void per_class(const data::DataSet & data_set,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, const torch::nn::Sequential & clf,
const train::TrainOptions & options, const std::string & checkpoint,
const std::string & opt, const size_t & epoch, const int64_t & batch_size,
const double & learning_rate, const double & adv_learning_rate, const double & unlabelled_lr,
at::Generator & generator);

void evaluate(const data::DataSet & data_set,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
const at::Tensor & directions_adv, const bool & energy_based, at::Generator & generator);

void invert(const int64_t & n_reconstructions,
const std::shared_ptr<RevNet::Pipeline> & pipeline, const std::shared_ptr<GMM::Mixture> & mixture,
at::Generator & generator);
} // namespace jobs

int main(int argc, const char** argv) {
    // Welcome
    std::cout << "RevOT: reversible networks trained by sliced optimal transport based on libtorch\n\n";
    argparse::ArgumentParser args = parse_args(argc, argv);
    CL::utility::ShowTime();
    std::cout << '\n';
    // Retrieve required command line arguments
    std::string job = args.retrieve<std::string>("job");
    std::cout << "Job type: " + job << '\n';
    if (job != "unsupervised" && job != "per_class" && job != "evaluate" && job != "invert")
    throw std::invalid_argument("Unsupported job type " + job);
    std::string RevNet_in = args.retrieve<std::string>("RevNet_in");
    // Retrieve optional command line arguments
    int64_t n_clusters = 2;
    if (args.gotArgument("n_clusters")) n_clusters = args.retrieve<int64_t>("n_clusters");
    std::string checkpoint;
    if (args.gotArgument("checkpoint")) checkpoint = args.retrieve<std::string>("checkpoint");
    bool use_classifier = args.gotArgument("classifier");
    size_t seed = 0;
    if (args.gotArgument("seed")) seed = args.retrieve<size_t>("seed");
    bool cuda = args.gotArgument("cuda") && torch::cuda::is_available();
    // for optimization
    std::string optimizer = "Adam";
    if (args.gotArgument("optimizer")) optimizer = args.retrieve<std::string>("optimizer");
    size_t epoch = 100;
    if (args.gotArgument("epoch")) epoch = args.retrieve<size_t>("epoch");
    int64_t batch_size = 64;
    if (args.gotArgument("batch_size")) batch_size = args.retrieve<int64_t>("batch_size");
    double learning_rate = 0.001;
    if (args.gotArgument("learning_rate")) learning_rate = args.retrieve<double>("learning_rate");
    double adv_learning_rate = learning_rate;
    if (args.gotArgument("adv_learning_rate")) adv_learning_rate = args.retrieve<double>("adv_learning_rate");
    train::TrainOptions options;
    if (args.gotArgument("std_l1")) options.std_l1 = args.retrieve<double>("std_l1");
    if (args.gotArgument("mean_l1")) options.mean_l1 = args.retrieve<double>("mean_l1");
    if (args.gotArgument("weight_l1")) options.weight_l1 = args.retrieve<double>("weight_l1");
    if (args.gotArgument("normalize_by_std")) {
        options.normalize_by_std = true;
        options.normalization = "std";
    }
    options.energy_based = args.gotArgument("energy");
    if (job == "unsupervised") train::check_batch_size(batch_size, options.energy_based);
    options.backprop_to_cluster_weights = args.gotArgument("backprop_weights");
    double unlabelled_lr = 10.0;
    if (args.gotArgument("unlabelled_lr")) unlabelled_lr = args.retrieve<double>("unlabelled_lr");
    int64_t n_reconstructions = 100;
    if (args.gotArgument("n_reconstructions")) n_reconstructions = args.retrieve<int64_t>("n_reconstructions");

    // Initialize
    torch::manual_seed(seed);
    at::Generator generator = at::make_generator<at::CPUGeneratorImpl>(seed);
    std::shared_ptr<RevNet::Pipeline> pipeline = RevNet::define_pipeline(RevNet_in);
    RevNet::init_params(* pipeline);
    auto mixture = std::make_shared<GMM::Mixture>(n_clusters, pipeline->latent_dim, 1.0, generator);
    at::Tensor directions_adv = directions::sample_directions(pipeline->latent_dim, true, generator,
        at::TensorOptions().dtype(torch::kFloat64));
    torch::nn::Sequential clf(nullptr);
    if (use_classifier) {
        clf = torch::nn::Sequential(torch::nn::Linear(pipeline->latent_dim, n_clusters));
        RevNet::init_params(* clf);
        clf->to(torch::kFloat64);
    }
    if (! checkpoint.empty()) {
        torch::load(pipeline, "RevNet_" + checkpoint + ".net");
        torch::load(mixture, "GMM_" + checkpoint + ".net");
        torch::load(directions_adv, "directions_" + checkpoint + ".pt");
        if (use_classifier) torch::load(clf, "clf_" + checkpoint + ".net");
        std::cout << "Continue from checkpoint " << checkpoint << '\n';
    }
    if (cuda) {
        std::cout << "Running on GPU\n";
        pipeline->to(torch::kCUDA);
        mixture->to(torch::kCUDA);
        if (use_classifier) clf->to(torch::kCUDA);
        directions_adv = directions_adv.to(torch::kCUDA);
    }
    directions_adv.requires_grad_(true);
    std::cout << "Number of mixture clusters = " << n_clusters << '\n'
              << "Number of trainable parameters = " << CL::TS::NParameters(pipeline->parameters())
                                                      + CL::TS::NParameters(mixture->parameters())
                                                      + (use_classifier ? CL::TS::NParameters(clf->parameters()) : 0)
              << '\n';

    std::cout << '\n';
    if (job == "invert") {
        jobs::invert(n_reconstructions, pipeline, mixture, generator);
    }
    else {
        if (! args.gotArgument("data_set")) throw std::invalid_argument(job + " requires --data_set");
        std::vector<std::string> data_files = verify_data_set(args.retrieve<std::vector<std::string>>("data_set"));
        data::DataSet data_set = data::read_DataSet(data_files, pipeline->input_shape);
        // evaluate takes the whole data set as 1 batch
        if (job == "evaluate") train::check_batch_size(data_set.size(), options.energy_based);
        if (cuda) {
            data_set.inputs = data_set.inputs.to(torch::kCUDA);
            data_set.targets = data_set.targets.to(torch::kCUDA);
        }
        if (job == "unsupervised") {
            jobs::unsupervised(data_set, pipeline, mixture, directions_adv, clf, options, checkpoint,
                optimizer, epoch, batch_size, learning_rate, adv_learning_rate, generator);
        }
        else if (job == "per_class") {
            jobs::per_class(data_set, pipeline, mixture, directions_adv, clf, options, checkpoint,
                optimizer, epoch, batch_size, learning_rate, adv_learning_rate, unlabelled_lr, generator);
        }
        else {
            jobs::evaluate(data_set, pipeline, mixture, directions_adv, options.energy_based, generator);
        }
    }

    std::cout << '\n';
    CL::utility::ShowTime();
    std::cout << "Mission success\n";
    return 0;
}
