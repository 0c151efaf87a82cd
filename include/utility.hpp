#ifndef utility_hpp
#define utility_hpp

#include <torch/torch.h>

// If any of `tensors` lives on an accelerator, move all of them there
std::vector<at::Tensor> to_common_device(const std::vector<at::Tensor> & tensors);

// x / stop_gradient(x)
// Forward value is 1 (0 where x == 0), backward sees d/dx = 1 / x,
// so only the relative change of x reaches its parameters
at::Tensor relative_grad(const at::Tensor & x);

// Empirical cumulative probabilities of n order statistics:
// evenly spaced in [1/n, 1 - 1/n], never exactly 0 or 1
at::Tensor empirical_cdf(const int64_t & n, const at::TensorOptions & options);

// Quantile function of the standard normal distribution: sqrt(2) * erfinv(2p - 1)
at::Tensor standard_normal_icdf(const at::Tensor & p);

// Check if user inputs are data files (end with .txt)
// otherwise consider as lists, then read the lists for data files
std::vector<std::string> verify_data_set(const std::vector<std::string> & original_data_set);

#endif
