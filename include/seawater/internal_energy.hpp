#pragma once

#include "seawater/common.hpp"
#include "seawater/broadcast.hpp"
#include "seawater/equation_of_state.hpp"

namespace seawater {

// Specific internal energy of seawater (J/kg).
//
//   SA  Absolute Salinity (g/kg)
//   CT  Conservative Temperature (deg C)
//   p   sea pressure (dbar), i.e. absolute pressure - 10.1325 dbar
//
// SA and CT must have the same dimensions. p may be 1x1, 1xN, Mx1, Nx1
// (a transposed row) or MxN when SA and CT are MxN; it is broadcast to
// MxN before evaluation. The result has the shape of SA.
Array internal_energy_CT(const Array& SA, const Array& CT, const Array& p,
                         const EquationOfState& eos);
Array internal_energy_CT(const Array& SA, const Array& CT, double p,
                         const EquationOfState& eos);
Array internal_energy_CT(const Array& SA, const Array& CT, const Array& p);
Array internal_energy_CT(const Array& SA, const Array& CT, double p);

// Argument-list form. Throws ArgumentCountError unless exactly
// {SA, CT, p} is supplied.
Array internal_energy_CT(const std::vector<Array>& args,
                         const EquationOfState& eos);
Array internal_energy_CT(const std::vector<Array>& args);

// Same as internal_energy_CT; the suffix only emphasises that the
// temperature input is Conservative Temperature.
Array internal_energy(const Array& SA, const Array& CT, const Array& p,
                      const EquationOfState& eos);
Array internal_energy(const Array& SA, const Array& CT, double p,
                      const EquationOfState& eos);
Array internal_energy(const Array& SA, const Array& CT, const Array& p);
Array internal_energy(const Array& SA, const Array& CT, double p);
Array internal_energy(const std::vector<Array>& args,
                      const EquationOfState& eos);
Array internal_energy(const std::vector<Array>& args);

}  // namespace seawater
