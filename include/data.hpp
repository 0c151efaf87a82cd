/*
To load the data set

A data file holds 1 example per line:
    the integer class label (-1 for unlabelled) followed by channels x height x width values
*/

#ifndef data_hpp
#define data_hpp

#include <torch/torch.h>

namespace data {

struct DataSet {
    // examples x channels x height x width
    at::Tensor inputs;
    // examples, int64, -1 for unlabelled
    at::Tensor targets;

    int64_t size() const;
    // The examples with a label
    DataSet labelled() const;
    // The inputs without a label
    at::Tensor unlabelled_inputs() const;
};

// input_shape = (channels, height, width)
DataSet read_DataSet(const std::vector<std::string> & data_set, const std::vector<int64_t> & input_shape);

// 1 flattened example per line
void write_examples(const std::string & file, const at::Tensor & examples);

} // namespace data

#endif
