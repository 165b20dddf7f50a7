
/*
    bindings.cpp - Pybind11 bindings for the Gauss-Hermite quadrature library.

    This module exposes the Gauss-Hermite entry points and the integrators built on them to Python.

    Main Features:
    --------------
    - Rules:
        * gauss_hermite(n) and unweighted_gauss_hermite(n) return (nodes, weights) as NumPy arrays.
        * hermite_initial_guesses(n) returns the asymptotic starting points of the Newton solvers.
        * An optional HermiteSettings forces the algorithm and switches diagnostics on.

    - Integrator:
        * GaussHermiteQuadrature: fixed-order rule over (-inf, inf), plain and weighted.

    - Enumerations:
        * HermiteAlgorithm: Automatic, GolubWelsch, Recurrence, Asymptotic.

    - Errors:
        * polynomials::DomainError and its subclasses surface as fghq.DomainError (a ValueError).

    Usage:
    ------
        import fghq
        nodes, weights = fghq.gauss_hermite(100)
        settings = fghq.HermiteSettings()
        settings.algorithm = fghq.HermiteAlgorithm.GolubWelsch
        nodes, weights = fghq.unweighted_gauss_hermite(12, settings)
*/
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <utility>

#include "../include/quadrature/GaussHermite.hpp"
#include "../include/quadrature/HermiteInitialGuess.hpp"
#include "../include/quadrature/QuadratureRule.hpp"
#include "../include/polynomials/OrthogonalValidator.hpp"
#include "../include/traits/FGHQ_traits.hpp"

namespace py = pybind11;

using Real   = traits::DataType::PolynomialField;
using Vector = traits::DataType::StoringVector;

namespace {

std::pair<Vector, Vector> as_pair(quadrature::QuadratureRule<> rule)
{
    return {std::move(rule.nodes), std::move(rule.weights)};
}

} // namespace


PYBIND11_MODULE(fghq, m) {
    m.doc() = "Gauss-Hermite quadrature rules of arbitrary order (pybind11)";

    py::register_exception<polynomials::DomainError>(m, "DomainError", PyExc_ValueError);

    // ----- Enums -----
    /**
     * @brief Algorithms computing the nodes and weights.
     *
     * - `HermiteAlgorithm.Automatic` : Golub-Welsch for n <= 20, recurrence up to 200, asymptotic above.
     * - `HermiteAlgorithm.GolubWelsch`, `Recurrence`, `Asymptotic` : force one algorithm.
     */
    py::enum_<traits::HermiteAlgorithm>(m, "HermiteAlgorithm")
    .value("Automatic", traits::HermiteAlgorithm::Automatic)
    .value("GolubWelsch", traits::HermiteAlgorithm::GolubWelsch)
    .value("Recurrence", traits::HermiteAlgorithm::Recurrence)
    .value("Asymptotic", traits::HermiteAlgorithm::Asymptotic)
    .export_values();

    py::class_<traits::HermiteSettings>(m, "HermiteSettings")
    .def(py::init<>())
    .def_readwrite("algorithm", &traits::HermiteSettings::algorithm)
    .def_readwrite("verbose", &traits::HermiteSettings::verbose)
    .def_readwrite("max_iterations", &traits::HermiteSettings::max_iterations);

    // ----- Rules -----
    m.def("gauss_hermite",
          [](int n, const traits::HermiteSettings& settings) {
              return as_pair(quadrature::gauss_hermite(n, settings));
          },
          py::arg("n"), py::arg("settings") = traits::HermiteSettings{},
          "Nodes and weights for the weight function exp(-x^2).");

    m.def("unweighted_gauss_hermite",
          [](int n, const traits::HermiteSettings& settings) {
              return as_pair(quadrature::unweighted_gauss_hermite(n, settings));
          },
          py::arg("n"), py::arg("settings") = traits::HermiteSettings{},
          "Nodes and weights multiplied by exp(x^2).");

    m.def("hermite_initial_guesses", &quadrature::hermite_initial_guesses, py::arg("n"),
          "Asymptotic guesses for the non-negative nodes, n >= 20.");

    // ----- Integrator -----
    /**
     * @brief Fixed-order Gauss-Hermite integrator.
     *
     * ### Python Example
     * ```python
     * gh = GaussHermiteQuadrature(64)
     * gh.integrate(lambda x: math.exp(-x * x) * math.cos(x), -math.inf, math.inf)
     * gh.integrate_weighted(math.cos)
     * ```
     */
    py::class_<quadrature::GaussHermiteQuadrature<Real>>(m, "GaussHermiteQuadrature")
    .def(py::init<int, const traits::HermiteSettings&>(),
         py::arg("n"), py::arg("settings") = traits::HermiteSettings{})
    .def("integrate", &quadrature::GaussHermiteQuadrature<Real>::integrate,
         py::arg("integrand"), py::arg("lower_bound"), py::arg("upper_bound"))
    .def("integrate_weighted", &quadrature::GaussHermiteQuadrature<Real>::integrate_weighted,
         py::arg("integrand"))
    .def("order", &quadrature::GaussHermiteQuadrature<Real>::order);
}
