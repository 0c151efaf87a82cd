/*
Optimizer for the soft cluster assignment of unlabelled examples

Instead of the raw gradient, each weight moves by the difference between
exponential moving averages of the magnitudes of its positive and negative gradients,
then the weights are re-centred around 0.5 and clamped to [0.01, 0.99]
*/

#ifndef OptimizerUnlabelled_hpp
#define OptimizerUnlabelled_hpp

#include <torch/torch.h>

class OptimizerUnlabelled { public:
    // Leaf tensor of per-example weights, updated in place
    at::Tensor weights;
    // examples x 2, moving averages of positive (column 0) and negative (column 1) gradient magnitudes
    at::Tensor grad_hist;
    double lr, alpha;
    // Step by the current gradient magnitude minus the moving average of the opposite sign
    bool always_accumulate;

    OptimizerUnlabelled(const at::Tensor & weights_, const double & lr_ = 10.0, const double & alpha_ = 0.1,
        const bool & always_accumulate_ = false);
    ~OptimizerUnlabelled();

    void zero_grad();
    void step();
};

#endif
