#pragma once

#include "seawater/common.hpp"
#include <ostream>

namespace seawater {

struct Shape {
    Eigen::Index rows = 0;
    Eigen::Index cols = 0;

    Shape() = default;
    Shape(Eigen::Index rows, Eigen::Index cols) : rows(rows), cols(cols) {}

    static Shape of(const Array& a) { return Shape(a.rows(), a.cols()); }

    bool is_scalar() const { return rows == 1 && cols == 1; }
    bool is_empty() const { return rows == 0 || cols == 0; }
    Eigen::Index size() const { return rows * cols; }

    bool operator==(const Shape& other) const {
        return rows == other.rows && cols == other.cols;
    }
    bool operator!=(const Shape& other) const { return !(*this == other); }

    std::string str() const;
};

std::ostream& operator<<(std::ostream& os, const Shape& s);

// How a pressure array is reconciled with the [M,N] shape of SA.
// Rules are tried in declaration order; the first match wins.
enum class BroadcastRule {
    SCALAR,          // 1x1, fill [M,N]
    ROW,             // 1xN, copy down each column
    COLUMN,          // Mx1, copy across each row
    TRANSPOSED_ROW,  // Nx1, transpose to 1xN then copy down each column
    EXACT,           // already MxN
};

const char* to_string(BroadcastRule rule);

// Determine which rule reconciles p_shape with sa_shape.
// Throws DimensionMismatchError when none applies.
BroadcastRule classify_pressure(const Shape& sa_shape, const Shape& p_shape,
                                const std::string& caller = "broadcast_pressure");

// Expand p to sa_shape according to classify_pressure().
Array broadcast_pressure(const Array& p, const Shape& sa_shape,
                         const std::string& caller = "broadcast_pressure");

// Validated, same-shaped inputs ready for an equation of state.
// When SA is a single row the arrays are stored transposed to columns
// and `transposed` is set so the result can be restored afterwards.
struct NormalizedInputs {
    Array SA;
    Array CT;
    Array p;
    BroadcastRule rule = BroadcastRule::EXACT;
    bool transposed = false;

    Array restore(const Array& result) const;
};

// Check SA/CT agreement, broadcast p and orient row vectors as columns.
// `caller` prefixes error messages (e.g. "internal_energy_CT").
NormalizedInputs normalize_inputs(const Array& SA, const Array& CT,
                                  const Array& p,
                                  const std::string& caller);

}  // namespace seawater
