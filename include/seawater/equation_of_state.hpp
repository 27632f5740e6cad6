#pragma once

#include "seawater/common.hpp"

namespace seawater {

struct EosEvaluationConfig {
    // Arrays with at least this many elements are evaluated with OpenMP
    // worksharing over columns. Smaller arrays run serially.
    Eigen::Index parallel_threshold = 4096;
};

// Equation of state providing specific internal energy (J/kg) from
// Absolute Salinity SA (g/kg), Conservative Temperature CT (deg C) and
// sea pressure p (dbar). The scalar kernel must be thread-safe because
// array evaluation can be split across threads. An exception thrown by
// the kernel aborts the evaluation and reaches the caller.
class EquationOfState {
public:
    explicit EquationOfState(const EosEvaluationConfig& eval = EosEvaluationConfig())
        : eval_(eval) {}
    virtual ~EquationOfState() = default;

    virtual double internal_energy(double SA, double CT, double p) const = 0;

    // Elementwise evaluation of same-shaped arrays.
    // Throws DimensionMismatchError if the shapes differ.
    virtual Array internal_energy(const Array& SA, const Array& CT,
                                  const Array& p) const;

    virtual std::string name() const = 0;

    const EosEvaluationConfig& evaluation_config() const { return eval_; }

protected:
    EosEvaluationConfig eval_;
};

struct LinearEosConfig {
    double rho0 = 1027.0;       // Reference density (kg/m^3)
    double alpha = 1.67e-4;     // Thermal expansion coefficient (1/K)
    double beta = 7.8e-4;       // Haline contraction coefficient (kg/g)
    double kappa = 4.5e-10;     // Isothermal compressibility (1/Pa)
    double SA_ref = SSO;        // Reference salinity (g/kg)
    double CT_ref = 10.0;       // Reference temperature (deg C)
    double cp0 = CP0;           // Heat capacity scaling CT to enthalpy (J/(kg K))

    void validate() const;
};

// Reference model: specific volume linear in SA and CT with constant
// compressibility,
//   v = v0 * (1 + alpha*(CT - CT_ref) - beta*(SA - SA_ref)) * (1 - kappa*P)
// where P is sea pressure in Pa. Enthalpy is cp0*CT plus the pressure
// integral of v, and u = h - (P + P0) * v.
class LinearEquationOfState : public EquationOfState {
public:
    explicit LinearEquationOfState(
        const LinearEosConfig& config = LinearEosConfig(),
        const EosEvaluationConfig& eval = EosEvaluationConfig());

    using EquationOfState::internal_energy;
    double internal_energy(double SA, double CT, double p) const override;

    double specific_volume(double SA, double CT, double p) const;
    double enthalpy(double SA, double CT, double p) const;

    std::string name() const override { return "linear"; }

    const LinearEosConfig& config() const { return config_; }

    // Out-of-range warnings printed so far in this process (capped).
    static constexpr int MAX_RANGE_WARNINGS = 5;
    static int range_warnings_issued();

private:
    LinearEosConfig config_;
};

// Shared immutable instance used by the entry points that take no model.
const EquationOfState& default_equation_of_state();

}  // namespace seawater
