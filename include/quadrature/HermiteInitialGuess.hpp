/**
 * @file HermiteInitialGuess.hpp
 * @brief Asymptotic initial guesses for the non-negative zeros of the Hermite polynomial H_n.
 *
 * Two approximations are patched together:
 * - Gatteschi's formula in terms of the zeros of the Airy function, accurate near the largest
 *   zero sqrt(2n+1) (L. Gatteschi, J. Comput. Appl. Math. 144 (2002) 7-27);
 * - Tricomi's formula in terms of the solution of theta - sin(theta) = rhs, accurate near zero
 *   (F. G. Tricomi, Ann. Mat. Pura Appl. 26 (1947) 283-300).
 *
 * The guesses below index floor(0.4985 n) come from Tricomi's formula, the rest from Gatteschi's.
 * The result is ascending and has ceil(n/2) entries, the first being 0 for odd n.
 */
#ifndef HERMITE_INITIAL_GUESS_HPP
#define HERMITE_INITIAL_GUESS_HPP

#include <cmath>
#include <limits>
#include <boost/math/constants/constants.hpp>
#include "../polynomials/HermiteConstants.hpp"
#include "../polynomials/OrthogonalValidator.hpp"
#include "../polynomials/Polynomials.hpp"
#include "../traits/FGHQ_traits.hpp"

namespace quadrature {

namespace detail {

/**
 * @brief Asymptotic series for the magnitude of the k-th Airy zero, evaluated at t = 3/8 pi (4k - 1).
 *
 * T(t) = t^{2/3} (1 + 5/48 t^-2 - 5/36 t^-4 + 77125/82944 t^-6 - 108056875/6967296 t^-8
 *                 + 162375596875/334430208 t^-10)
 */
inline double airy_zero_series(double t)
{
    static const polynomials::Polynomial<5> series{
        1.0, 5.0 / 48, -5.0 / 36, 77125.0 / 82944, -108056875.0 / 6967296, 162375596875.0 / 334430208};
    return std::pow(t, 2.0 / 3) * series(1 / (t * t));
}

} // namespace detail

/**
 * @brief Initial guesses for the non-negative Gauss-Hermite nodes of order n.
 *
 * @param n Order, n >= 20.
 * @return ceil(n/2) ascending guesses in the physicists' variable.
 * @throws polynomials::ParameterDomainError if n < 20.
 */
inline traits::DataType::StoringVector hermite_initial_guesses(int n)
{
    using StoringVector = traits::DataType::StoringVector;
    using Constants = traits::HermiteConstants;
    const double pi = boost::math::constants::pi<double>();

    polynomials::PolynomialDomainValidator<double, polynomials::AsymptoticOrder> validator{
        polynomials::AsymptoticOrder(n)};

    const bool odd = (n % 2 == 1);
    const int m = odd ? (n - 1) / 2 : n / 2;
    const double a = odd ? 0.5 : -0.5;
    const double nu = 4.0 * m + 2.0 * a + 2.0;

    // Gatteschi: Airy zeros from the series, the first ten from the correctly rounded table.
    StoringVector airy_roots(m);
    for (int k = 1; k <= m; ++k) {
        airy_roots[k - 1] = -detail::airy_zero_series(3.0 / 8 * pi * (4.0 * k - 1));
    }
    constexpr int exact_roots = 10;
    for (int k = 0; k < exact_roots && k < m; ++k) {
        airy_roots[k] = polynomials::constants::airy_roots[k];
    }

    StoringVector x_airy(m);
    for (int k = 0; k < m; ++k) {
        const double r = airy_roots[k];
        const double value = nu
            + std::pow(2.0, 2.0 / 3) * r * std::pow(nu, 1.0 / 3)
            + (1.0 / 5 * std::pow(2.0, 4.0 / 3)) * r * r * std::pow(nu, -1.0 / 3)
            + (11.0 / 35 - a * a - 12.0 / 175) * r * r * r / nu
            + ((16.0 / 1575) * r + (92.0 / 7875) * std::pow(r, 4)) * std::pow(2.0, 2.0 / 3) * std::pow(nu, -5.0 / 3)
            - ((15152.0 / 3031875) * std::pow(r, 5) + (1088.0 / 121275) * r * r) * std::pow(2.0, 1.0 / 3) * std::pow(nu, -7.0 / 3);
        // Largest first; stored ascending.
        x_airy[m - 1 - k] = std::sqrt(std::abs(value));
    }

    // Tricomi: solve t - sin(t) = rhs with a fixed number of Newton steps from pi/2.
    StoringVector x_sine(m);
    for (int k = 1; k <= m; ++k) {
        const double rhs = ((4.0 * m + 3) - 4.0 * k) / nu * pi;
        double t = pi / 2;
        for (int it = 0; it < Constants::tricomi_newton_iterations; ++it) {
            t -= (t - std::sin(t) - rhs) / (1 - std::cos(t));
        }
        const double tn = std::pow(std::cos(t / 2), 2);
        x_sine[k - 1] = std::sqrt(nu * tn - (5 / (4 * std::pow(1 - tn, 2)) - 1 / (1 - tn) - 1 + 3 * a * a) / 3 / nu);
    }

    // Patch: Tricomi below floor(p n), Gatteschi from the 1-based index ceil(p n) on.
    const double p = Constants::patch_fraction + std::numeric_limits<double>::epsilon();
    const int sine_count = static_cast<int>(std::floor(p * n));
    const int airy_start = static_cast<int>(std::ceil(p * n)) - 1;
    const int airy_count = (airy_start < m) ? m - airy_start : 0;

    StoringVector patched(sine_count + airy_count);
    patched.head(sine_count) = x_sine.head(sine_count);
    if (airy_count > 0) {
        patched.tail(airy_count) = x_airy.segment(airy_start, airy_count);
    }

    if (odd) {
        StoringVector guesses(m + 1);
        guesses[0] = 0.0;
        guesses.tail(m) = patched.head(m);
        return guesses;
    }
    return patched.head(m);
}

} // namespace quadrature

#endif // HERMITE_INITIAL_GUESS_HPP
