#include "seawater/internal_energy.hpp"

namespace seawater {

namespace {

const char* const CALLER = "internal_energy_CT";

}  // namespace

Array internal_energy_CT(const Array& SA, const Array& CT, const Array& p,
                         const EquationOfState& eos) {
    NormalizedInputs in = normalize_inputs(SA, CT, p, CALLER);
    Array u = eos.internal_energy(in.SA, in.CT, in.p);
    return in.restore(u);
}

Array internal_energy_CT(const Array& SA, const Array& CT, double p,
                         const EquationOfState& eos) {
    return internal_energy_CT(SA, CT, Array::Constant(1, 1, p), eos);
}

Array internal_energy_CT(const Array& SA, const Array& CT, const Array& p) {
    return internal_energy_CT(SA, CT, p, default_equation_of_state());
}

Array internal_energy_CT(const Array& SA, const Array& CT, double p) {
    return internal_energy_CT(SA, CT, p, default_equation_of_state());
}

Array internal_energy_CT(const std::vector<Array>& args,
                         const EquationOfState& eos) {
    if (args.size() != 3)
        throw ArgumentCountError(std::string(CALLER) + ": requires three inputs");
    return internal_energy_CT(args[0], args[1], args[2], eos);
}

Array internal_energy_CT(const std::vector<Array>& args) {
    return internal_energy_CT(args, default_equation_of_state());
}

Array internal_energy(const Array& SA, const Array& CT, const Array& p,
                      const EquationOfState& eos) {
    return internal_energy_CT(SA, CT, p, eos);
}

Array internal_energy(const Array& SA, const Array& CT, double p,
                      const EquationOfState& eos) {
    return internal_energy_CT(SA, CT, p, eos);
}

Array internal_energy(const Array& SA, const Array& CT, const Array& p) {
    return internal_energy_CT(SA, CT, p);
}

Array internal_energy(const Array& SA, const Array& CT, double p) {
    return internal_energy_CT(SA, CT, p);
}

Array internal_energy(const std::vector<Array>& args,
                      const EquationOfState& eos) {
    return internal_energy_CT(args, eos);
}

Array internal_energy(const std::vector<Array>& args) {
    return internal_energy_CT(args);
}

}  // namespace seawater
