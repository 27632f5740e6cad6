#include "seawater/equation_of_state.hpp"
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>

namespace seawater {

namespace {

constexpr int MAX_RANGE_WARNINGS = LinearEquationOfState::MAX_RANGE_WARNINGS;

// Saturates at MAX_RANGE_WARNINGS
std::atomic<int> s_range_warnings{0};
std::mutex s_warning_mutex;

void warn_out_of_range(double SA, double p) {
    int n = s_range_warnings.load();
    while (n < MAX_RANGE_WARNINGS &&
           !s_range_warnings.compare_exchange_weak(n, n + 1)) {
    }
    if (n >= MAX_RANGE_WARNINGS)
        return;

    std::lock_guard<std::mutex> lock(s_warning_mutex);
    std::cerr << "[LinearEOS] Warning: evaluating outside calibration range"
              << " (SA=" << SA << " g/kg, p=" << p << " dbar)\n";
    if (n == MAX_RANGE_WARNINGS - 1)
        std::cerr << "[LinearEOS] (further warnings suppressed)\n";
}

}  // namespace

Array EquationOfState::internal_energy(const Array& SA, const Array& CT,
                                       const Array& p) const {
    if (SA.rows() != CT.rows() || SA.cols() != CT.cols() ||
        SA.rows() != p.rows() || SA.cols() != p.cols())
        throw DimensionMismatchError(
            name() + " equation of state: SA, CT and p must have same dimensions");

    const Eigen::Index rows = SA.rows();
    const Eigen::Index cols = SA.cols();
    Array u(rows, cols);

    const bool parallel = SA.size() >= eval_.parallel_threshold;

    // Exceptions cannot cross the parallel region; keep the first one and
    // rethrow it once all threads have joined.
    std::exception_ptr error;

    #pragma omp parallel for schedule(static) if (parallel)
    for (Eigen::Index j = 0; j < cols; j++) {
        try {
            for (Eigen::Index i = 0; i < rows; i++) {
                u(i, j) = internal_energy(SA(i, j), CT(i, j), p(i, j));
            }
        } catch (...) {
            #pragma omp critical(seawater_eos_error)
            {
                if (!error)
                    error = std::current_exception();
            }
        }
    }

    if (error)
        std::rethrow_exception(error);
    return u;
}

void LinearEosConfig::validate() const {
    if (!std::isfinite(rho0) || rho0 <= 0.0)
        throw std::invalid_argument("Reference density rho0 must be positive");
    if (!std::isfinite(cp0) || cp0 <= 0.0)
        throw std::invalid_argument("Heat capacity cp0 must be positive");
    if (!std::isfinite(kappa) || kappa < 0.0)
        throw std::invalid_argument("Compressibility kappa must be non-negative");
    if (!std::isfinite(alpha) || !std::isfinite(beta))
        throw std::invalid_argument("Expansion coefficients must be finite");
    if (!std::isfinite(SA_ref) || !std::isfinite(CT_ref))
        throw std::invalid_argument("Reference state must be finite");
}

LinearEquationOfState::LinearEquationOfState(const LinearEosConfig& config,
                                             const EosEvaluationConfig& eval)
    : EquationOfState(eval), config_(config) {
    config_.validate();
}

double LinearEquationOfState::specific_volume(double SA, double CT, double p) const {
    const double P = p * DB_TO_PA;
    const double v_lin = (1.0 / config_.rho0) *
        (1.0 + config_.alpha * (CT - config_.CT_ref)
             - config_.beta * (SA - config_.SA_ref));
    return v_lin * (1.0 - config_.kappa * P);
}

double LinearEquationOfState::enthalpy(double SA, double CT, double p) const {
    const double P = p * DB_TO_PA;
    const double v_lin = specific_volume(SA, CT, 0.0);
    // h = cp0*CT + integral_0^P v dP'
    return config_.cp0 * CT + v_lin * (P - 0.5 * config_.kappa * P * P);
}

double LinearEquationOfState::internal_energy(double SA, double CT, double p) const {
    if (SA < 0.0 || SA > 42.0 || p < 0.0 || p > 8000.0)
        warn_out_of_range(SA, p);

    const double P = p * DB_TO_PA;
    return enthalpy(SA, CT, p) - (P + P0) * specific_volume(SA, CT, p);
}

int LinearEquationOfState::range_warnings_issued() {
    return s_range_warnings.load();
}

const EquationOfState& default_equation_of_state() {
    static const LinearEquationOfState eos;
    return eos;
}

}  // namespace seawater
