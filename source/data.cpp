/*
To load the data set

A data file holds 1 example per line:
    the integer class label (-1 for unlabelled) followed by channels x height x width values
*/

#include <fstream>
#include <iomanip>
#include <torch/torch.h>

#include <CppLibrary/utility.hpp>

#include "data.hpp"

namespace data {

int64_t DataSet::size() const {return inputs.size(0);}

DataSet DataSet::labelled() const {
    at::Tensor indices = (targets >= 0).nonzero().view(-1);
    return DataSet{inputs.index_select(0, indices), targets.index_select(0, indices)};
}

at::Tensor DataSet::unlabelled_inputs() const {
    at::Tensor indices = (targets < 0).nonzero().view(-1);
    return inputs.index_select(0, indices);
}

DataSet read_DataSet(const std::vector<std::string> & data_set, const std::vector<int64_t> & input_shape) {
    if (input_shape.size() != 3) throw std::invalid_argument("read_DataSet error: input shape must be channels height width");
    size_t n_values = input_shape[0] * input_shape[1] * input_shape[2];
    std::vector<double> values;
    std::vector<int64_t> labels;
    for (const std::string & file : data_set) {
        std::ifstream ifs; ifs.open(file);
            if (! ifs.good()) throw std::invalid_argument("read_DataSet error: cannot open " + file);
            std::string line;
            std::vector<std::string> strs;
            while (std::getline(ifs, line)) {
                CL::utility::trim(line);
                if (line.empty()) continue;
                CL::utility::split(line, strs);
                if (strs.size() != n_values + 1) throw std::invalid_argument(
                    "read_DataSet error: " + file + " has an example of " + std::to_string(strs.size() - 1)
                    + " values, expect " + std::to_string(n_values));
                labels.push_back(std::stoll(strs[0]));
                for (size_t i = 1; i < strs.size(); i++) values.push_back(std::stod(strs[i]));
            }
        ifs.close();
    }
    if (labels.empty()) throw std::invalid_argument("read_DataSet error: no example");
    int64_t n_examples = labels.size();
    auto top = at::TensorOptions().dtype(torch::kFloat64);
    DataSet set;
    set.inputs = at::from_blob(values.data(), {n_examples, input_shape[0], input_shape[1], input_shape[2]}, top).clone();
    set.targets = at::from_blob(labels.data(), {n_examples}, at::TensorOptions().dtype(at::kLong)).clone();
    std::cout << "Number of examples = " << n_examples << ", of which "
              << (set.targets >= 0).sum().item<int64_t>() << " labelled\n";
    return set;
}

void write_examples(const std::string & file, const at::Tensor & examples) {
    at::Tensor flat = examples.detach().to(at::kCPU, torch::kFloat64).contiguous().view({examples.size(0), -1});
    std::ofstream ofs; ofs.open(file);
        if (! ofs.good()) throw std::invalid_argument("write_examples error: cannot open " + file);
        ofs << std::scientific << std::setprecision(15);
        const double * p = flat.data_ptr<double>();
        for (int64_t i = 0; i < flat.size(0); i++) {
            for (int64_t j = 0; j < flat.size(1); j++) ofs << std::setw(25) << p[i * flat.size(1) + j];
            ofs << '\n';
        }
    ofs.close();
}

} // namespace data
