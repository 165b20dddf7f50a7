/**
 * @file QuadratureRule.hpp
 * @brief Gauss-Hermite rule of fixed order used as an integrator over the real line.
 *
 * quadrature::GaussHermiteQuadrature keeps both representations of one rule: the unweighted one
 * approximates the plain integral of f, the weighted one the integral of f(x) e^{-x^2}.
 *
 * Usage Example:
 * @code
 * const double inf = std::numeric_limits<double>::infinity();
 * auto f = [](double x) { return std::exp(-x * x) * std::cos(x); };
 *
 * quadrature::GaussHermiteQuadrature<double> gauss(40);
 * double a = gauss.integrate(f, -inf, inf);
 * double b = gauss.integrate_weighted([](double x) { return std::cos(x); });
 * @endcode
 */
#ifndef QUADRATURE_RULE_HPP
#define QUADRATURE_RULE_HPP

#include <functional>
#include <stdexcept>
#include <boost/math/special_functions/fpclassify.hpp>
#include "GaussHermite.hpp"
#include "../traits/FGHQ_traits.hpp"

namespace quadrature {

/**
 * @brief Gauss-Hermite rule of fixed order used as an integrator on (-inf, inf).
 *
 * The rule is solved once, at construction; the weighted form is derived from the unweighted one.
 */
template<typename R = traits::DataType::PolynomialField>
class GaussHermiteQuadrature {
    QuadratureRule<> unweighted_;
    QuadratureRule<> weighted_;

public:
    /**
     * @param n Order of the rule.
     * @param settings Algorithm choice and diagnostics.
     * @throws polynomials::ParameterDomainError if n < 0.
     */
    explicit GaussHermiteQuadrature(int n, const traits::HermiteSettings& settings = {})
        : unweighted_(unweighted_gauss_hermite(n, settings))
        , weighted_(quadrature::weighted_rule(unweighted_))
    {}

    /**
     * @brief Approximates the integral of f over the real line.
     *
     * Uses the unweighted rule, so f must carry its own decay.
     * @throws std::invalid_argument unless the bounds are -inf and +inf.
     */
    R integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        if ((boost::math::isfinite)(lower_bound) || (boost::math::isfinite)(upper_bound)
            || lower_bound > 0 || upper_bound < 0) {
            throw std::invalid_argument("Gauss-Hermite quadrature integrates over (-inf, inf) only.");
        }
        return static_cast<R>(unweighted_.apply([&integrand](double x) { return static_cast<double>(integrand(static_cast<R>(x))); }));
    }

    /**
     * @brief Approximates the integral of f(x) e^{-x^2} over the real line.
     */
    R integrate_weighted(const std::function<R(R)>& integrand) const
    {
        return static_cast<R>(weighted_.apply([&integrand](double x) { return static_cast<double>(integrand(static_cast<R>(x))); }));
    }

    int order() const noexcept
    {
        return weighted_.n;
    }

    const QuadratureRule<>& weighted_rule() const noexcept
    {
        return weighted_;
    }

    const QuadratureRule<>& unweighted_rule() const noexcept
    {
        return unweighted_;
    }
};

} // namespace quadrature
#endif // QUADRATURE_RULE_HPP
