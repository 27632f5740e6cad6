#include "seawater/call_arguments.hpp"
#include <algorithm>

namespace seawater {

Array array_from_buffer(const double* data,
                        const std::vector<Eigen::Index>& shape,
                        const std::string& caller) {
    switch (shape.size()) {
        case 0:
            return Array::Constant(1, 1, data[0]);
        case 1: {
            Array out(1, shape[0]);
            for (Eigen::Index j = 0; j < shape[0]; j++)
                out(0, j) = data[j];
            return out;
        }
        case 2: {
            const Eigen::Index rows = shape[0], cols = shape[1];
            Array out(rows, cols);
            for (Eigen::Index i = 0; i < rows; i++)
                for (Eigen::Index j = 0; j < cols; j++)
                    out(i, j) = data[i * cols + j];
            return out;
        }
        default:
            throw DimensionMismatchError(
                caller + ": inputs with more than two dimensions are not supported");
    }
}

void check_keywords(const std::vector<std::string>& given,
                    const std::vector<std::string>& allowed,
                    const std::string& caller) {
    for (const auto& key : given) {
        if (std::find(allowed.begin(), allowed.end(), key) == allowed.end())
            throw UnknownKeywordError(
                caller + ": unexpected keyword argument '" + key + "'");
    }
}

const EquationOfState& select_equation_of_state(const EquationOfState* eos) {
    if (eos)
        return *eos;
    return default_equation_of_state();
}

}  // namespace seawater
