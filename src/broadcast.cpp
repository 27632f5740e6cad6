#include "seawater/broadcast.hpp"
#include <utility>

namespace seawater {

std::string Shape::str() const {
    return std::to_string(rows) + "x" + std::to_string(cols);
}

std::ostream& operator<<(std::ostream& os, const Shape& s) {
    return os << s.str();
}

const char* to_string(BroadcastRule rule) {
    switch (rule) {
        case BroadcastRule::SCALAR:         return "scalar";
        case BroadcastRule::ROW:            return "row";
        case BroadcastRule::COLUMN:         return "column";
        case BroadcastRule::TRANSPOSED_ROW: return "transposed_row";
        case BroadcastRule::EXACT:          return "exact";
    }
    return "unknown";
}

BroadcastRule classify_pressure(const Shape& sa_shape, const Shape& p_shape,
                                const std::string& caller) {
    const Eigen::Index ms = sa_shape.rows, ns = sa_shape.cols;
    const Eigen::Index mp = p_shape.rows, np = p_shape.cols;

    // Order matters when ms == ns: an Mx1 p is a column, not a transposed row.
    if (mp == 1 && np == 1)
        return BroadcastRule::SCALAR;
    if (np == ns && mp == 1)
        return BroadcastRule::ROW;
    if (mp == ms && np == 1)
        return BroadcastRule::COLUMN;
    if (mp == ns && np == 1)
        return BroadcastRule::TRANSPOSED_ROW;
    if (mp == ms && np == ns)
        return BroadcastRule::EXACT;

    throw DimensionMismatchError(
        caller + ": Inputs array dimensions arguments do not agree (SA is " +
        sa_shape.str() + ", p is " + p_shape.str() + ")");
}

namespace {

// Expand p to sa_shape for a rule already chosen by classify_pressure().
Array expand_pressure(const Array& p, const Shape& sa_shape, BroadcastRule rule) {
    const Eigen::Index ms = sa_shape.rows, ns = sa_shape.cols;

    switch (rule) {
        case BroadcastRule::SCALAR:
            return Array::Constant(ms, ns, p(0, 0));
        case BroadcastRule::ROW:
            return p.replicate(ms, 1);
        case BroadcastRule::COLUMN:
            return p.replicate(1, ns);
        case BroadcastRule::TRANSPOSED_ROW:
            return p.transpose().replicate(ms, 1);
        case BroadcastRule::EXACT:
            return p;
    }
    throw DimensionMismatchError("unhandled broadcast rule");
}

}  // namespace

Array broadcast_pressure(const Array& p, const Shape& sa_shape,
                         const std::string& caller) {
    return expand_pressure(p, sa_shape, classify_pressure(sa_shape, Shape::of(p), caller));
}

Array NormalizedInputs::restore(const Array& result) const {
    if (transposed)
        return result.transpose();
    return result;
}

NormalizedInputs normalize_inputs(const Array& SA, const Array& CT,
                                  const Array& p,
                                  const std::string& caller) {
    const Shape sa_shape = Shape::of(SA);

    if (Shape::of(CT) != sa_shape)
        throw DimensionMismatchError(
            caller + ": SA and CT must have same dimensions");
    if (sa_shape.is_empty())
        throw DimensionMismatchError(caller + ": inputs must not be empty");

    NormalizedInputs in;
    in.rule = classify_pressure(sa_shape, Shape::of(p), caller);
    Array p_full = expand_pressure(p, sa_shape, in.rule);

    // Row vectors are evaluated as columns and restored afterwards
    if (sa_shape.rows == 1) {
        in.SA = SA.transpose();
        in.CT = CT.transpose();
        in.p = p_full.transpose();
        in.transposed = true;
    } else {
        in.SA = SA;
        in.CT = CT;
        in.p = std::move(p_full);
        in.transposed = false;
    }
    return in;
}

}  // namespace seawater
