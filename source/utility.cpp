#include <fstream>
#include <torch/torch.h>

#include <CppLibrary/utility.hpp>

#include "utility.hpp"

// If any of `tensors` lives on an accelerator, move all of them there
std::vector<at::Tensor> to_common_device(const std::vector<at::Tensor> & tensors) {
    std::vector<at::Tensor> migrated = tensors;
    for (const at::Tensor & t : tensors)
    if (t.defined() && ! t.device().is_cpu()) {
        for (at::Tensor & m : migrated)
        if (m.defined() && m.device() != t.device()) m = m.to(t.device());
        break;
    }
    return migrated;
}

// x / stop_gradient(x)
// Forward value is 1 (0 where x == 0), backward sees d/dx = 1 / x,
// so only the relative change of x reaches its parameters
at::Tensor relative_grad(const at::Tensor & x) {
    at::Tensor scale = x.detach().clone();
    scale.masked_fill_(scale == 0.0, 1.0);
    return x / scale;
}

// Empirical cumulative probabilities of n order statistics:
// evenly spaced in [1/n, 1 - 1/n], never exactly 0 or 1
at::Tensor empirical_cdf(const int64_t & n, const at::TensorOptions & options) {
    if (n < 1) throw std::invalid_argument("empirical_cdf error: at least 1 order statistic is required");
    // A single order statistic sits at the median
    if (n == 1) return at::full({1}, 0.5, options);
    return at::linspace(1.0 / (double)n, 1.0 - 1.0 / (double)n, n, options);
}

// Quantile function of the standard normal distribution: sqrt(2) * erfinv(2p - 1)
at::Tensor standard_normal_icdf(const at::Tensor & p) {
    return std::sqrt(2.0) * at::erfinv(2.0 * p - 1.0);
}

// Check if user inputs are data files (end with .txt)
// otherwise consider as lists, then read the lists for data files
std::vector<std::string> verify_data_set(const std::vector<std::string> & original_data_set) {
    std::vector<std::string> data_set;
    for (std::string item : original_data_set) {
        if (item.size() > 4 && item.substr(item.size() - 4) == ".txt") data_set.push_back(item);
        else {
            std::string prefix = CL::utility::GetPrefix(item);
            std::string file;
            std::ifstream ifs; ifs.open(item);
                if (! ifs.good()) throw std::invalid_argument("verify_data_set error: cannot open " + item);
                while (ifs >> file) data_set.push_back(prefix + file);
            ifs.close();
        }
    }
    if (data_set.empty()) throw std::invalid_argument("verify_data_set error: no data file is given");
    // output to job log
    std::cout << "The training set will be read from: \n    ";
    size_t line_length = 4;
    for (size_t i = 0; i < data_set.size()-1; i++) {
        line_length += data_set[i].size() + 2;
        if (line_length > 75) {
            std::cout << '\n' << "    ";
            line_length = 4;
        }
        std::cout << data_set[i] << ", ";
    }
    line_length += data_set[data_set.size()-1].size() + 2;
    if (line_length > 75) std::cout << '\n' << "    ";
    std::cout << data_set[data_set.size()-1] << '\n';
    return data_set;
}
