/*
Batch construction for an epoch

Every batch holds exactly batch_size example indices (int64)
The final partial chunk is padded from the start of the shuffled order
*/

#ifndef batching_hpp
#define batching_hpp

#include <torch/torch.h>

namespace batching {

// Shuffle 0, 1, ..., n_examples - 1 then cut into chunks of batch_size
// The last chunk is padded by cycling from the start of the permutation,
// which also covers n_examples < batch_size
std::vector<at::Tensor> get_exact_size_batches(const int64_t & n_examples, const int64_t & batch_size,
at::Generator & generator);

// Every batch holds batch_size / n_classes examples of each class 0, 1, ..., n_classes - 1
// batch_size must be divisible by n_classes and every class must be present
// The most populated class sets the number of batches, the other classes wrap around
// into a fresh permutation of their examples, so every example appears once or twice per epoch
// A class too small for 1 extra pass is rejected
std::vector<at::Tensor> get_batches_equal_classes(const at::Tensor & targets, const int64_t & n_classes,
const int64_t & batch_size, at::Generator & generator);

} // namespace batching

#endif
