/*
A reversible feature network

The network is a pipeline of exactly invertible stages:
    1. ReversibleBlock splits the channels into 2 halves and updates each half additively
       with a function of the other half, so the update can be subtracted again
    2. SubsampleSplitter moves strided spatial sub-grids into channels,
       so every output stream sees a subsampled view of the entire input field
Running the pipeline forward then invert (or vice versa) is the identity up to rounding
*/

#ifndef RevNet_hpp
#define RevNet_hpp

#include <torch/torch.h>

namespace RevNet {

// The closed set of invertible stages
enum class StageKind {coupling, subsample};

// An invertible stage owns a paired forward and invert
struct Stage : torch::nn::Module {
    virtual ~Stage();

    virtual StageKind kind() const = 0;
    virtual at::Tensor forward(const at::Tensor & x) = 0;
    virtual at::Tensor invert(const at::Tensor & y) = 0;
};

// y1 = F(x1) + x2
// y2 = G(y1) + x1
struct ReversibleBlock : Stage {
    torch::nn::Sequential F{nullptr}, G{nullptr};

    // F and G map a half of the channels to the same shape
    ReversibleBlock(const torch::nn::Sequential & F_, const torch::nn::Sequential & G_);
    ~ReversibleBlock();

    StageKind kind() const override;
    // x.size(1) must be even
    at::Tensor forward(const at::Tensor & x) override;
    // x1 = y2 - G(y1)
    // x2 = y1 - F(x1)
    at::Tensor invert(const at::Tensor & y) override;
};

// Input and output are batch x channels x height x width
struct SubsampleSplitter : Stage {
    // Stride along height and width
    int64_t sh, sw;
    // Chunk the channels into 2 halves before subsampling,
    // skipped when there is only 1 channel
    bool chunk_chans_first;

    SubsampleSplitter(const int64_t & sh_, const int64_t & sw_, const bool & chunk_chans_first_ = true);
    ~SubsampleSplitter();

    StageKind kind() const override;
    at::Tensor forward(const at::Tensor & x) override;
    at::Tensor invert(const at::Tensor & y) override;
};

struct Pipeline : torch::nn::Module {
    std::vector<std::shared_ptr<Stage>> stages;
    // Shape of a single input example (channels, height, width), empty if unknown
    std::vector<int64_t> input_shape;
    // Number of latent features per example, -1 if unknown
    int64_t latent_dim = -1;

    Pipeline();
    ~Pipeline();

    // The stage is registered as <kind>-<position>, e.g. coupling-1
    void append(const std::shared_ptr<Stage> & stage);
    size_t NStages(const StageKind & kind) const;

    at::Tensor forward(const at::Tensor & x);
    // Apply the inverse of each stage in reverse order
    at::Tensor invert(const at::Tensor & features);
    // Forward then flatten to examples x latent features
    at::Tensor latent(const at::Tensor & x);
};

at::Tensor invert(const std::shared_ptr<Pipeline> & pipeline, const at::Tensor & features);
at::Tensor invert(const std::shared_ptr<Stage> & stage, const at::Tensor & features);

// F or G of a coupling block: Conv2d 3x3 -> ELU -> Conv2d 3x3, preserving shape
torch::nn::Sequential coupling_subnet(const int64_t & chans, const int64_t & hidden);

// Define the pipeline from an input file, see RevNet.in for the format
std::shared_ptr<Pipeline> define_pipeline(const std::string & RevNet_in);

// Xavier uniform for convolution and linear weights with zero bias,
// unit weight and zero bias for batch normalization
void init_params(torch::nn::Module & module, const double & gain = 1.0);

} // namespace RevNet

#endif
