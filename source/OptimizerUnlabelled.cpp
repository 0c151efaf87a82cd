#include <torch/torch.h>

#include "OptimizerUnlabelled.hpp"

OptimizerUnlabelled::OptimizerUnlabelled(const at::Tensor & weights_, const double & lr_, const double & alpha_,
const bool & always_accumulate_)
: weights(weights_), lr(lr_), alpha(alpha_), always_accumulate(always_accumulate_) {
    if (weights.dim() != 1) throw std::invalid_argument("OptimizerUnlabelled error: weights must be 1-dimensional");
    if (! weights.requires_grad()) throw std::invalid_argument("OptimizerUnlabelled error: weights must require gradient");
    grad_hist = at::zeros({weights.size(0), 2}, weights.options());
}
OptimizerUnlabelled::~OptimizerUnlabelled() {}

void OptimizerUnlabelled::zero_grad() {
    if (weights.grad().defined()) weights.grad().zero_();
}

void OptimizerUnlabelled::step() {
    if (! weights.grad().defined()) throw std::invalid_argument("OptimizerUnlabelled::step error: no gradient");
    torch::NoGradGuard no_grad;
    at::Tensor grad = weights.grad();
    at::Tensor abs_grad = grad.abs();
    // Views into grad_hist
    at::Tensor pos_hist = grad_hist.select(1, 0),
               neg_hist = grad_hist.select(1, 1);
    at::Tensor gradient = at::zeros_like(grad);
    at::Tensor mask = grad > 0;
    pos_hist.copy_(at::where(mask, (1.0 - alpha) * pos_hist + alpha * abs_grad, pos_hist));
    if (always_accumulate) gradient = at::where(mask, abs_grad - neg_hist, gradient);
    mask = grad < 0;
    neg_hist.copy_(at::where(mask, (1.0 - alpha) * neg_hist + alpha * abs_grad, neg_hist));
    if (always_accumulate) gradient = at::where(mask, pos_hist - abs_grad, gradient);
    else gradient = pos_hist - neg_hist;
    weights.sub_(lr * gradient);
    // Re-centre so the mean is 0.5
    double mean = weights.mean().item<double>();
    weights.div_(2.0 * mean);
    weights.clamp_(0.01, 0.99);
}
