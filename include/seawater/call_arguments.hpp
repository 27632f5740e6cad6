#pragma once

#include "seawater/common.hpp"
#include "seawater/equation_of_state.hpp"

namespace seawater {

// Build a 2-D Array from a C-contiguous (row-major) buffer.
// A 0-D shape gives 1x1 and a 1-D shape gives a 1xN row, as in MATLAB.
// More than two dimensions raises DimensionMismatchError.
Array array_from_buffer(const double* data,
                        const std::vector<Eigen::Index>& shape,
                        const std::string& caller);

// Throws UnknownKeywordError naming the first keyword not in `allowed`.
void check_keywords(const std::vector<std::string>& given,
                    const std::vector<std::string>& allowed,
                    const std::string& caller);

// The caller's model when one is given, otherwise default_equation_of_state().
const EquationOfState& select_equation_of_state(const EquationOfState* eos);

}  // namespace seawater
