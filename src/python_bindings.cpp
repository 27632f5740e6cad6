#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "seawater/common.hpp"
#include "seawater/broadcast.hpp"
#include "seawater/call_arguments.hpp"
#include "seawater/equation_of_state.hpp"
#include "seawater/internal_energy.hpp"

namespace py = pybind11;
using namespace seawater;

// Helper: convert a NumPy scalar/1-D/2-D input to a 2-D Array.
static Array to_array(const py::handle& obj, const std::string& caller) {
    auto a = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(obj);
    if (!a)
        throw std::invalid_argument(caller + ": inputs must be numeric arrays or scalars");

    std::vector<Eigen::Index> shape;
    for (py::ssize_t k = 0; k < a.ndim(); k++)
        shape.push_back(static_cast<Eigen::Index>(a.shape(k)));
    return array_from_buffer(a.data(), shape, caller);
}

static std::vector<Array> to_arrays(const py::args& args, const std::string& caller) {
    std::vector<Array> out;
    out.reserve(args.size());
    for (const auto& obj : args)
        out.push_back(to_array(obj, caller));
    return out;
}

// Only `eos` is accepted; it may be None.
static const EquationOfState* eos_keyword(const py::kwargs& kwargs, const std::string& caller) {
    std::vector<std::string> names;
    for (const auto& item : kwargs)
        names.push_back(py::str(item.first));
    check_keywords(names, {"eos"}, caller);

    if (kwargs.contains("eos") && !kwargs["eos"].is_none())
        return kwargs["eos"].cast<const EquationOfState*>();
    return nullptr;
}

PYBIND11_MODULE(_core, m) {
    m.doc() = "Specific internal energy of seawater from SA, CT and p";

    py::register_exception<ArgumentCountError>(m, "ArgumentCountError", PyExc_ValueError);
    py::register_exception<DimensionMismatchError>(m, "DimensionMismatchError", PyExc_ValueError);
    py::register_exception<UnknownKeywordError>(m, "UnknownKeywordError", PyExc_TypeError);

    // --- Broadcasting ---
    py::enum_<BroadcastRule>(m, "BroadcastRule")
        .value("SCALAR", BroadcastRule::SCALAR)
        .value("ROW", BroadcastRule::ROW)
        .value("COLUMN", BroadcastRule::COLUMN)
        .value("TRANSPOSED_ROW", BroadcastRule::TRANSPOSED_ROW)
        .value("EXACT", BroadcastRule::EXACT);

    m.def("classify_pressure",
          [](py::object SA, py::object p) {
              return classify_pressure(Shape::of(to_array(SA, "classify_pressure")),
                                       Shape::of(to_array(p, "classify_pressure")));
          },
          py::arg("SA"), py::arg("p"),
          "Return the rule used to broadcast p against the shape of SA");

    m.def("broadcast_pressure",
          [](py::object p, py::object SA) {
              return broadcast_pressure(to_array(p, "broadcast_pressure"),
                                        Shape::of(to_array(SA, "broadcast_pressure")));
          },
          py::arg("p"), py::arg("SA"),
          "Expand p to the shape of SA");

    // --- Equation of state ---
    py::class_<EosEvaluationConfig>(m, "EosEvaluationConfig")
        .def(py::init<>())
        .def_readwrite("parallel_threshold", &EosEvaluationConfig::parallel_threshold);

    py::class_<LinearEosConfig>(m, "LinearEosConfig")
        .def(py::init<>())
        .def_readwrite("rho0", &LinearEosConfig::rho0, "Reference density (kg/m^3)")
        .def_readwrite("alpha", &LinearEosConfig::alpha, "Thermal expansion (1/K)")
        .def_readwrite("beta", &LinearEosConfig::beta, "Haline contraction (kg/g)")
        .def_readwrite("kappa", &LinearEosConfig::kappa, "Compressibility (1/Pa)")
        .def_readwrite("SA_ref", &LinearEosConfig::SA_ref, "Reference salinity (g/kg)")
        .def_readwrite("CT_ref", &LinearEosConfig::CT_ref, "Reference temperature (deg C)")
        .def_readwrite("cp0", &LinearEosConfig::cp0, "Heat capacity (J/(kg K))")
        .def("validate", &LinearEosConfig::validate);

    py::class_<EquationOfState>(m, "EquationOfState")
        .def("name", &EquationOfState::name);

    py::class_<LinearEquationOfState, EquationOfState>(m, "LinearEquationOfState")
        .def(py::init<const LinearEosConfig&, const EosEvaluationConfig&>(),
             py::arg("config") = LinearEosConfig(),
             py::arg("evaluation") = EosEvaluationConfig())
        .def("internal_energy",
             py::overload_cast<double, double, double>(
                 &LinearEquationOfState::internal_energy, py::const_),
             py::arg("SA"), py::arg("CT"), py::arg("p"))
        .def("specific_volume", &LinearEquationOfState::specific_volume,
             py::arg("SA"), py::arg("CT"), py::arg("p"))
        .def("enthalpy", &LinearEquationOfState::enthalpy,
             py::arg("SA"), py::arg("CT"), py::arg("p"))
        .def_property_readonly("config", &LinearEquationOfState::config)
        .def("__repr__", [](const LinearEquationOfState& e) {
            return "<LinearEquationOfState rho0=" + std::to_string(e.config().rho0) +
                   " alpha=" + std::to_string(e.config().alpha) +
                   " beta=" + std::to_string(e.config().beta) + ">";
        });

    // --- Internal energy ---
    // Variadic so that a wrong argument count is reported as ArgumentCountError.
    m.def("internal_energy_CT",
          [](py::args args, py::kwargs kwargs) {
              const EquationOfState* eos = eos_keyword(kwargs, "internal_energy_CT");
              return internal_energy_CT(to_arrays(args, "internal_energy_CT"),
                                        select_equation_of_state(eos));
          },
          "internal_energy_CT(SA, CT, p, eos=None): specific internal energy (J/kg)");

    m.def("internal_energy",
          [](py::args args, py::kwargs kwargs) {
              const EquationOfState* eos = eos_keyword(kwargs, "internal_energy");
              return internal_energy(to_arrays(args, "internal_energy"),
                                     select_equation_of_state(eos));
          },
          "Same as internal_energy_CT");
}
