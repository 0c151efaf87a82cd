/*
Projection directions for the sliced transport losses

A direction set is directions x dims, every row of unit norm when consumed
*/

#ifndef directions_hpp
#define directions_hpp

#include <torch/torch.h>

namespace directions {

// n_dims random unit directions in n_dims dimensions,
// mutually orthogonal if orthogonalize
// Drawn on CPU with generator then moved to the device of options
at::Tensor sample_directions(const int64_t & n_dims, const bool & orthogonalize,
at::Generator & generator, const at::TensorOptions & options);

// Divide each row by its 2-norm, out of place,
// so the gradient still reaches the unnormalized directions
at::Tensor norm_directions(const at::Tensor & directions);

// (means[1] - means[0]) / ||means[1] - means[0]||, 1 x dims
at::Tensor mean_diff_direction(const at::Tensor & means);

} // namespace directions

#endif
