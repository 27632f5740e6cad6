#pragma once

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <cmath>
#include <stdexcept>

namespace seawater {

// Dynamic 2-D array with elementwise semantics (column-major)
using Array = Eigen::ArrayXXd;

// Constants
constexpr double CP0 = 3991.86795711963;     // Specific heat for CT (J/(kg K))
constexpr double P0 = 101325.0;              // Standard atmosphere (Pa)
constexpr double DB_TO_PA = 1.0e4;           // dbar -> Pa
constexpr double SSO = 35.16504;             // Standard Ocean Reference Salinity (g/kg)

// Raised when a call does not supply exactly SA, CT and p.
class ArgumentCountError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raised when input shapes cannot be reconciled.
class DimensionMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raised when a call passes a keyword argument it does not accept.
class UnknownKeywordError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace seawater
