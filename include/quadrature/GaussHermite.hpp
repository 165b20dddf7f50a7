/**
 * @file GaussHermite.hpp
 * @brief Entry points computing Gauss-Hermite quadrature rules of arbitrary order.
 *
 * The rule of order n has nodes x_i and weights w_i such that
 *
 *     sum_i w_i f(x_i) ~ integral_{-inf}^{inf} f(x) e^{-x^2} dx
 *
 * is exact for polynomials of degree < 2n. The work is split by regime:
 *
 * | order        | algorithm                                      |
 * |--------------|------------------------------------------------|
 * | n <= 20      | Golub-Welsch (Jacobi matrix eigendecomposition) |
 * | 21 <= n <= 200 | Newton on the scaled three-term recurrence    |
 * | n > 200      | Newton in theta-space on the Airy expansion     |
 *
 * Every solver returns the non-negative half of the rule; it is mirrored across zero and the weights
 * are renormalised so that they sum to sqrt(pi).
 *
 * Two representations are offered:
 * - gauss_hermite: weights for the weight function e^{-x^2};
 * - unweighted_gauss_hermite: weights multiplied by e^{x_i^2}, so that sum_i w_i f(x_i) approximates
 *   the plain integral of f. These stay representable for orders where the weighted ones underflow.
 *
 * ## Usage Example
 * @code
 * auto rule = quadrature::gauss_hermite(100);
 * double integral = rule.weights.dot(rule.nodes.array().square().matrix()); // sqrt(pi) / 2
 *
 * traits::HermiteSettings settings;
 * settings.algorithm = traits::HermiteAlgorithm::GolubWelsch;
 * auto small = quadrature::unweighted_gauss_hermite(10, settings);
 * @endcode
 */
#ifndef GAUSS_HERMITE_HPP
#define GAUSS_HERMITE_HPP

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <boost/math/constants/constants.hpp>
#include "HermiteSolvers.hpp"
#include "../polynomials/OrthogonalValidator.hpp"
#include "../traits/FGHQ_traits.hpp"
#include "../utils/Utils.hpp"

namespace quadrature {

/**
 * @brief Nodes and weights of a Gauss-Hermite rule.
 *
 * nodes are ascending, nodes[i] == -nodes[n-1-i] and weights[i] == weights[n-1-i].
 */
template<typename R = traits::DataType::PolynomialField>
struct QuadratureRule {
    using StoringVector = Eigen::Matrix<R, Eigen::Dynamic, 1>;

    int n = 0;
    StoringVector nodes;
    StoringVector weights;

    /**
     * @brief Applies the rule to f: sum_i w_i f(x_i).
     */
    template<typename F>
    R apply(F&& f) const
    {
        R sum = 0;
        for (Eigen::Index i = 0; i < nodes.size(); ++i) {
            sum += weights[i] * f(nodes[i]);
        }
        return sum;
    }
};

using HermiteSolver = std::variant<GolubWelschSolver, RecurrenceSolver, AsymptoticSolver>;

inline std::string to_string(traits::HermiteAlgorithm algorithm)
{
    switch (algorithm) {
        case traits::HermiteAlgorithm::Automatic:   return "automatic";
        case traits::HermiteAlgorithm::GolubWelsch: return "Golub-Welsch";
        case traits::HermiteAlgorithm::Recurrence:  return "recurrence";
        case traits::HermiteAlgorithm::Asymptotic:  return "asymptotic";
    }
    throw std::invalid_argument("Unknown HermiteAlgorithm.");
}

/**
 * @brief Algorithm used for order n under the given choice; Automatic resolves by order.
 */
inline traits::HermiteAlgorithm resolve_algorithm(int n, traits::HermiteAlgorithm requested)
{
    using Constants = traits::HermiteConstants;
    if (requested != traits::HermiteAlgorithm::Automatic) {
        return requested;
    }
    if (n <= Constants::golub_welsch_max_order) {
        return traits::HermiteAlgorithm::GolubWelsch;
    }
    if (n <= Constants::recurrence_max_order) {
        return traits::HermiteAlgorithm::Recurrence;
    }
    return traits::HermiteAlgorithm::Asymptotic;
}

/**
 * @brief Solver for order n >= 2.
 *
 * @throws polynomials::ParameterDomainError if a Newton solver is forced for n < 20.
 */
inline HermiteSolver select_solver(int n, traits::HermiteAlgorithm requested)
{
    switch (resolve_algorithm(n, requested)) {
        case traits::HermiteAlgorithm::GolubWelsch:
            return GolubWelschSolver{};
        case traits::HermiteAlgorithm::Recurrence: {
            polynomials::PolynomialDomainValidator<double, polynomials::AsymptoticOrder> validator{
                polynomials::AsymptoticOrder(n)};
            return RecurrenceSolver{};
        }
        case traits::HermiteAlgorithm::Asymptotic: {
            polynomials::PolynomialDomainValidator<double, polynomials::AsymptoticOrder> validator{
                polynomials::AsymptoticOrder(n)};
            return AsymptoticSolver{};
        }
        default:
            throw std::invalid_argument("Unsupported HermiteAlgorithm specified.");
    }
}

/**
 * @brief Gauss-Hermite rule with weights multiplied by e^{x_i^2}.
 *
 * @param n Order, n >= 0.
 * @param settings Algorithm choice and diagnostics.
 * @throws polynomials::ParameterDomainError if n < 0, or a Newton solver is forced for n < 20.
 */
inline QuadratureRule<> unweighted_gauss_hermite(int n, const traits::HermiteSettings& settings = {})
{
    using StoringVector = traits::DataType::StoringVector;
    const double root_pi = boost::math::constants::root_pi<double>();

    polynomials::PolynomialDomainValidator<double, polynomials::HermiteOrder> validator{
        polynomials::HermiteOrder(n)};

    QuadratureRule<> rule;
    rule.n = n;
    if (n == 0) {
        return rule;
    }
    if (n == 1) {
        rule.nodes = StoringVector::Zero(1);
        rule.weights = StoringVector::Constant(1, root_pi);
        return rule;
    }

    const HermiteSolver solver = select_solver(n, settings.algorithm);
    if (settings.verbose) {
        std::cerr << "Gauss-Hermite: n = " << n << ", algorithm "
                  << to_string(resolve_algorithm(n, settings.algorithm)) << "\n";
    }

    HalfRule half = std::visit([n, &settings](const auto& s) { return s(n, settings); }, solver);

    const bool odd = (n % 2 == 1);
    if (odd) {
        half.nodes[0] = 0.0;
    }
    rule.nodes = Utils::mirror(half.nodes, odd, -1.0);
    rule.weights = Utils::mirror(half.weights, odd, 1.0);

    // Renormalise so that the weighted weights sum to sqrt(pi).
    const double mass = ((-rule.nodes.array().square()).exp() * rule.weights.array()).sum();
    rule.weights *= root_pi / mass;

    return rule;
}

/**
 * @brief Converts an unweighted rule to the representation for the weight function e^{-x^2}.
 *
 * The factor e^{-x^2} is evaluated on the non-negative half only and mirrored, so the weighted
 * weights keep the exact symmetry of the nodes.
 */
inline QuadratureRule<> weighted_rule(QuadratureRule<> rule)
{
    if (rule.n < 2) {
        return rule;
    }
    const Eigen::Index half_size = (rule.n + 1) / 2;
    const traits::DataType::StoringVector half =
        (rule.weights.tail(half_size).array() * (-rule.nodes.tail(half_size).array().square()).exp()).matrix();
    rule.weights = Utils::mirror(half, rule.n % 2 == 1, 1.0);
    return rule;
}

/**
 * @brief Gauss-Hermite rule for the weight function e^{-x^2}.
 *
 * Equal to unweighted_gauss_hermite with every weight multiplied by e^{-x_i^2}; for large n the
 * outermost weights underflow to zero.
 *
 * @param n Order, n >= 0.
 * @param settings Algorithm choice and diagnostics.
 * @throws polynomials::ParameterDomainError if n < 0, or a Newton solver is forced for n < 20.
 */
inline QuadratureRule<> gauss_hermite(int n, const traits::HermiteSettings& settings = {})
{
    return weighted_rule(unweighted_gauss_hermite(n, settings));
}

} // namespace quadrature

#endif // GAUSS_HERMITE_HPP
