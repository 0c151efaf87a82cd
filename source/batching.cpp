/*
Batch construction for an epoch

Every batch holds exactly batch_size example indices (int64)
The final partial chunk is padded from the start of the shuffled order
*/

#include <torch/torch.h>

#include "batching.hpp"

namespace batching {

std::vector<at::Tensor> get_exact_size_batches(const int64_t & n_examples, const int64_t & batch_size,
at::Generator & generator) {
    if (n_examples < 1) throw std::invalid_argument("get_exact_size_batches error: no example");
    if (batch_size < 1) throw std::invalid_argument("get_exact_size_batches error: batch size must be positive");
    auto top = at::TensorOptions().dtype(at::kLong);
    at::Tensor permutation = at::randperm(n_examples, generator, top);
    int64_t n_batches = (n_examples + batch_size - 1) / batch_size;
    std::vector<at::Tensor> batches(n_batches);
    for (int64_t i = 0; i < n_batches; i++) {
        // Positions past the end wrap around to the start of the permutation
        at::Tensor positions = at::arange(i * batch_size, (i + 1) * batch_size, top).remainder(n_examples);
        batches[i] = permutation.index_select(0, positions);
    }
    return batches;
}

std::vector<at::Tensor> get_batches_equal_classes(const at::Tensor & targets, const int64_t & n_classes,
const int64_t & batch_size, at::Generator & generator) {
    if (n_classes < 1) throw std::invalid_argument("get_batches_equal_classes error: at least 1 class is required");
    if (batch_size < n_classes || batch_size % n_classes != 0) throw std::invalid_argument(
        "get_batches_equal_classes error: batch size " + std::to_string(batch_size)
        + " is not divisible by the number of classes " + std::to_string(n_classes));
    int64_t examples_per_class = batch_size / n_classes;
    at::Tensor labels = targets.to(at::kCPU, at::kLong);
    std::vector<at::Tensor> class_indices(n_classes);
    int64_t n_batches = 0;
    for (int64_t i = 0; i < n_classes; i++) {
        class_indices[i] = (labels == i).nonzero().view(-1);
        int64_t n_examples = class_indices[i].size(0);
        if (n_examples == 0) throw std::invalid_argument(
            "get_batches_equal_classes error: no example of class " + std::to_string(i));
        int64_t this_n_batches = (n_examples + examples_per_class - 1) / examples_per_class;
        n_batches = this_n_batches > n_batches ? this_n_batches : n_batches;
    }
    auto top = at::TensorOptions().dtype(at::kLong);
    std::vector<at::Tensor> columns(n_classes);
    int64_t n_positions = n_batches * examples_per_class;
    for (int64_t i = 0; i < n_classes; i++) {
        int64_t n_examples = class_indices[i].size(0);
        // Every index at most twice per epoch
        if (n_positions > 2 * n_examples) throw std::invalid_argument(
            "get_batches_equal_classes error: class " + std::to_string(i) + " has only "
            + std::to_string(n_examples) + " examples to fill " + std::to_string(n_positions)
            + " positions in more than 1 extra pass");
        at::Tensor order = at::randperm(n_examples, generator, top);
        // The wrapped positions come from a fresh permutation
        if (n_positions > n_examples) order = at::cat({order,
            at::randperm(n_examples, generator, top).slice(0, 0, n_positions - n_examples)});
        else order = order.slice(0, 0, n_positions);
        // Revert back to actual indices
        columns[i] = class_indices[i].index_select(0, order).view({n_batches, examples_per_class});
    }
    at::Tensor all_batches = at::cat(columns, 1);
    std::vector<at::Tensor> batches(n_batches);
    for (int64_t j = 0; j < n_batches; j++) batches[j] = all_batches[j].clone();
    return batches;
}

} // namespace batching
