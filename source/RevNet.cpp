/*
A reversible feature network

The network is a pipeline of exactly invertible stages:
    1. ReversibleBlock splits the channels into 2 halves and updates each half additively
       with a function of the other half, so the update can be subtracted again
    2. SubsampleSplitter moves strided spatial sub-grids into channels,
       so every output stream sees a subsampled view of the entire input field
Running the pipeline forward then invert (or vice versa) is the identity up to rounding
*/

#include <fstream>
#include <torch/torch.h>

#include <CppLibrary/utility.hpp>
#include <CppLibrary/TorchSupport.hpp>

#include "RevNet.hpp"

namespace RevNet {

Stage::~Stage() {}

ReversibleBlock::ReversibleBlock(const torch::nn::Sequential & F_, const torch::nn::Sequential & G_) {
    F = register_module("F", F_);
    G = register_module("G", G_);
}
ReversibleBlock::~ReversibleBlock() {}
StageKind ReversibleBlock::kind() const {return StageKind::coupling;}
at::Tensor ReversibleBlock::forward(const at::Tensor & x) {
    int64_t n_chans = x.size(1);
    if (n_chans % 2 != 0) throw std::invalid_argument(
        "ReversibleBlock::forward error: odd number of channels " + std::to_string(n_chans));
    at::Tensor x1 = x.slice(1, 0, n_chans / 2);
    at::Tensor x2 = x.slice(1, n_chans / 2, n_chans);
    at::Tensor y1 = F->forward(x1) + x2;
    at::Tensor y2 = G->forward(y1) + x1;
    return at::cat({y1, y2}, 1);
}
at::Tensor ReversibleBlock::invert(const at::Tensor & y) {
    int64_t n_chans = y.size(1);
    if (n_chans % 2 != 0) throw std::invalid_argument(
        "ReversibleBlock::invert error: odd number of channels " + std::to_string(n_chans));
    at::Tensor y1 = y.slice(1, 0, n_chans / 2);
    at::Tensor y2 = y.slice(1, n_chans / 2, n_chans);
    at::Tensor x1 = y2 - G->forward(y1);
    at::Tensor x2 = y1 - F->forward(x1);
    return at::cat({x1, x2}, 1);
}

SubsampleSplitter::SubsampleSplitter(const int64_t & sh_, const int64_t & sw_, const bool & chunk_chans_first_)
: sh(sh_), sw(sw_), chunk_chans_first(chunk_chans_first_) {
    if (sh < 1 || sw < 1) throw std::invalid_argument("SubsampleSplitter error: stride must be positive");
}
SubsampleSplitter::~SubsampleSplitter() {}
StageKind SubsampleSplitter::kind() const {return StageKind::subsample;}
at::Tensor SubsampleSplitter::forward(const at::Tensor & x) {
    if (x.dim() != 4) throw std::invalid_argument(
        "SubsampleSplitter::forward error: input must be batch x channels x height x width");
    int64_t n_chans = x.size(1), height = x.size(2), width = x.size(3);
    if (height % sh != 0 || width % sw != 0) throw std::invalid_argument(
        "SubsampleSplitter::forward error: spatial size " + std::to_string(height) + " x " + std::to_string(width)
        + " is not divisible by stride " + std::to_string(sh) + " x " + std::to_string(sw));
    // Chunk chans first to ensure that each of the two streams in the
    // following coupling blocks sees a subsampled version of the whole input
    std::vector<at::Tensor> xs;
    if (chunk_chans_first && n_chans > 1) {
        if (n_chans % 2 != 0) throw std::invalid_argument(
            "SubsampleSplitter::forward error: cannot chunk odd number of channels " + std::to_string(n_chans));
        xs = x.chunk(2, 1);
    }
    else xs = {x};
    std::vector<at::Tensor> new_x;
    for (const at::Tensor & one_x : xs)
    for (int64_t i = 0; i < sh; i++)
    for (int64_t j = 0; j < sw; j++)
    new_x.push_back(one_x.slice(2, i, height, sh).slice(3, j, width, sw));
    return at::cat(new_x, 1);
}
at::Tensor SubsampleSplitter::invert(const at::Tensor & y) {
    if (y.dim() != 4) throw std::invalid_argument(
        "SubsampleSplitter::invert error: input must be batch x channels x height x width");
    int64_t n_chans = y.size(1);
    if (n_chans % (sh * sw) != 0) throw std::invalid_argument(
        "SubsampleSplitter::invert error: " + std::to_string(n_chans)
        + " channels cannot come from stride " + std::to_string(sh) + " x " + std::to_string(sw));
    int64_t n_all_chans_before = n_chans / (sh * sw);
    // If there was only 1 channel before, forward did not chunk
    std::vector<at::Tensor> chan_features;
    if (chunk_chans_first && n_all_chans_before > 1) chan_features = y.chunk(2, 1);
    else chan_features = {y};
    std::vector<at::Tensor> all_previous_features;
    for (const at::Tensor & one_chan_features : chan_features) {
        int64_t n_chans_before = one_chan_features.size(1) / (sh * sw);
        int64_t height = one_chan_features.size(2) * sh,
                width  = one_chan_features.size(3) * sw;
        at::Tensor previous_features = at::zeros(
            {one_chan_features.size(0), n_chans_before, height, width},
            one_chan_features.options());
        int64_t cur_chan = 0;
        for (int64_t i = 0; i < sh; i++)
        for (int64_t j = 0; j < sw; j++) {
            previous_features.slice(2, i, height, sh).slice(3, j, width, sw).copy_(
                one_chan_features.slice(1, cur_chan * n_chans_before, (cur_chan + 1) * n_chans_before));
            cur_chan++;
        }
        all_previous_features.push_back(previous_features);
    }
    return at::cat(all_previous_features, 1);
}

Pipeline::Pipeline() {}
Pipeline::~Pipeline() {}
void Pipeline::append(const std::shared_ptr<Stage> & stage) {
    std::string name = stage->kind() == StageKind::coupling ? "coupling-" : "subsample-";
    stages.push_back(register_module(name + std::to_string(stages.size()), stage));
}
size_t Pipeline::NStages(const StageKind & kind) const {
    size_t count = 0;
    for (const auto & stage : stages) if (stage->kind() == kind) count++;
    return count;
}
at::Tensor Pipeline::forward(const at::Tensor & x) {
    at::Tensor y = x;
    for (auto & stage : stages) y = stage->forward(y);
    return y;
}
at::Tensor Pipeline::invert(const at::Tensor & features) {
    at::Tensor x = features;
    for (auto stage = stages.rbegin(); stage != stages.rend(); ++stage) x = (*stage)->invert(x);
    return x;
}
at::Tensor Pipeline::latent(const at::Tensor & x) {
    at::Tensor y = this->forward(x);
    return y.view({y.size(0), -1});
}

at::Tensor invert(const std::shared_ptr<Pipeline> & pipeline, const at::Tensor & features) {
    return pipeline->invert(features);
}
at::Tensor invert(const std::shared_ptr<Stage> & stage, const at::Tensor & features) {
    return stage->invert(features);
}

// F or G of a coupling block: Conv2d 3x3 -> ELU -> Conv2d 3x3, preserving shape
torch::nn::Sequential coupling_subnet(const int64_t & chans, const int64_t & hidden) {
    return torch::nn::Sequential(
        torch::nn::Conv2d(torch::nn::Conv2dOptions(chans, hidden, 3).padding(1)),
        torch::nn::ELU(),
        torch::nn::Conv2d(torch::nn::Conv2dOptions(hidden, chans, 3).padding(1)));
}

// Define the pipeline from an input file, see RevNet.in for the format
std::shared_ptr<Pipeline> define_pipeline(const std::string & RevNet_in) {
    auto pipeline = std::make_shared<Pipeline>();
    std::ifstream ifs; ifs.open(RevNet_in);
        if (! ifs.good()) throw std::invalid_argument("define_pipeline error: cannot open " + RevNet_in);
        std::string line;
        std::vector<std::string> strs;
        // Input shape
        std::getline(ifs, line);
        std::getline(ifs, line); CL::utility::split(line, strs);
        if (strs.size() != 3) throw std::invalid_argument(
            "define_pipeline error: input shape must be channels height width");
        int64_t chans  = std::stoll(strs[0]),
                height = std::stoll(strs[1]),
                width  = std::stoll(strs[2]);
        pipeline->input_shape = {chans, height, width};
        // Stages
        std::getline(ifs, line);
        while (std::getline(ifs, line)) {
            CL::utility::trim(line);
            if (line.empty()) continue;
            CL::utility::split(line, strs);
            if (strs[0] == "subsample") {
                if (strs.size() != 4) throw std::invalid_argument(
                    "define_pipeline error: expect `subsample sh sw chunk|nochunk`, got `" + line + "`");
                int64_t sh = std::stoll(strs[1]), sw = std::stoll(strs[2]);
                bool chunk = strs[3] == "chunk";
                if (height % sh != 0 || width % sw != 0) throw std::invalid_argument(
                    "define_pipeline error: spatial size " + std::to_string(height) + " x " + std::to_string(width)
                    + " is not divisible by stride " + std::to_string(sh) + " x " + std::to_string(sw));
                if (chunk && chans > 1 && chans % 2 != 0) throw std::invalid_argument(
                    "define_pipeline error: cannot chunk odd number of channels " + std::to_string(chans));
                pipeline->append(std::make_shared<SubsampleSplitter>(sh, sw, chunk));
                chans *= sh * sw;
                height /= sh;
                width  /= sw;
            }
            else if (strs[0] == "coupling") {
                if (strs.size() != 2) throw std::invalid_argument(
                    "define_pipeline error: expect `coupling hidden_channels`, got `" + line + "`");
                if (chans % 2 != 0) throw std::invalid_argument(
                    "define_pipeline error: coupling block on odd number of channels " + std::to_string(chans));
                int64_t hidden = std::stoll(strs[1]);
                pipeline->append(std::make_shared<ReversibleBlock>(
                    coupling_subnet(chans / 2, hidden), coupling_subnet(chans / 2, hidden)));
            }
            else throw std::invalid_argument("define_pipeline error: unknown stage " + strs[0]);
        }
    ifs.close();
    if (height != 1 || width != 1) throw std::invalid_argument(
        "define_pipeline error: the last stage must reach spatial size 1 x 1, got "
        + std::to_string(height) + " x " + std::to_string(width));
    pipeline->latent_dim = chans;
    pipeline->to(torch::kFloat64);
    std::cout << "Number of invertible stages = " << pipeline->stages.size() << " ("
              << pipeline->NStages(StageKind::subsample) << " subsample, "
              << pipeline->NStages(StageKind::coupling) << " coupling)\n"
              << "Latent dimension = " << pipeline->latent_dim << '\n'
              << "Number of trainable network parameters = "
              << CL::TS::NParameters(pipeline->parameters()) << '\n';
    return pipeline;
}

// Xavier uniform for convolution and linear weights with zero bias,
// unit weight and zero bias for batch normalization
void init_params(torch::nn::Module & module, const double & gain) {
    torch::NoGradGuard no_grad;
    for (auto & m : module.modules(false)) {
        if (auto * conv = m->as<torch::nn::Conv2d>()) {
            torch::nn::init::xavier_uniform_(conv->weight, gain);
            if (conv->bias.defined()) torch::nn::init::constant_(conv->bias, 0.0);
        }
        else if (auto * linear = m->as<torch::nn::Linear>()) {
            torch::nn::init::xavier_uniform_(linear->weight, gain);
            if (linear->bias.defined()) torch::nn::init::constant_(linear->bias, 0.0);
        }
        else if (auto * norm = m->as<torch::nn::BatchNorm2d>()) {
            if (norm->weight.defined()) torch::nn::init::constant_(norm->weight, 1.0);
            if (norm->bias.defined())   torch::nn::init::constant_(norm->bias, 0.0);
        }
    }
}

} // namespace RevNet
