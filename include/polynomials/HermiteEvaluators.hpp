/**
 * @file HermiteEvaluators.hpp
 * @brief Evaluation of scaled Hermite polynomials for the Newton solvers.
 *
 * Two evaluators return the pair (value, derivative-like term) driving a Newton step:
 *
 * - **hermite_recurrence**: three-term recurrence for the normalised probabilists' Hermite
 *   polynomial He_n(x)/sqrt(n!) times e^{-x^2/4}. Intermediate values are damped by
 *   w = e^{-x^2/(4n)} whenever they reach the rescale threshold; the damping factors not yet
 *   applied are multiplied in at the end, so the result does not depend on when rescaling happened.
 * - **hermite_asymptotic**: uniform Airy-type expansion of the Hermite polynomial of degree n in
 *   the variable theta, x = sqrt(2n+1) cos(theta), with four terms for the value and four for the
 *   derivative (DLMF 12.10.9, 12.10.10 and 12.10.43).
 *
 * hermite_recurrence_table returns the whole sequence of scaled values of degree 0..n at one point.
 *
 * Dependencies:
 * - Boost.Math for the Airy functions Ai and Ai'.
 * - Polynomials.hpp / Monomials.hpp for the closed-form expansion coefficients.
 */
#ifndef HH_HERMITE_EVALUATORS_HH
#define HH_HERMITE_EVALUATORS_HH

#include <algorithm>
#include <cmath>
#include <boost/math/special_functions/airy.hpp>
#include <boost/math/constants/constants.hpp>
#include "Monomials.hpp"
#include "OrthogonalValidator.hpp"
#include "Polynomials.hpp"
#include "../traits/FGHQ_traits.hpp"

namespace polynomials {

/**
 * @brief Value and derivative term of a scaled Hermite polynomial at one point.
 */
template<typename R = traits::DataType::PolynomialField>
struct PolyEvalPair {
    R value;
    R derivative;
};

/**
 * @brief Scaled Hermite value and Newton derivative term by forward recurrence.
 *
 * H_0 = 1, H_1 = x, H_{k+1} = x H_k / sqrt(k+1) - H_{k-1} / sqrt(1 + 1/k).
 * Every time |H_{k+1}| >= 100, and while fewer than n damping factors have been used, both H_{k+1}
 * and H_k are multiplied by w = e^{-x^2/(4n)}. The remaining factors are applied after the loop, so
 * the result carries exactly w^n = e^{-x^2/4}.
 *
 * @param n Degree, n >= 1.
 * @param x Evaluation point (probabilists' variable).
 * @return {H_n, -x H_n + sqrt(n) H_{n-1}}
 * @throws ParameterDomainError if n < 1.
 */
template<typename R = traits::DataType::PolynomialField>
PolyEvalPair<R> hermite_recurrence(int n, R x)
{
    PolynomialDomainValidator<R, EvaluationDegree> validator{EvaluationDegree(n)};

    const R w = std::exp(-x * x / (4 * n));
    int rescalings = 0;

    R H_old = 1;
    R H = x;
    for (int k = 1; k < n; ++k) {
        const R H_new = x * H / std::sqrt(R(k + 1)) - H_old / std::sqrt(1 + R(1) / k);
        H_old = H;
        H = H_new;
        while (std::abs(H) >= traits::HermiteConstants::rescale_threshold && rescalings < n) {
            H *= w;
            H_old *= w;
            ++rescalings;
        }
    }
    for (; rescalings < n; ++rescalings) {
        H *= w;
        H_old *= w;
    }

    return {H, -x * H + std::sqrt(R(n)) * H_old};
}

/**
 * @brief Scaled Hermite values of every degree 0..n at one point.
 *
 * Entry k holds He_k(x)/sqrt(k!) e^{-x^2/4}. The factor e^{-x^2/4} is split into
 * p = max(1, floor(x^2/100)) damping steps, applied to the whole table whenever the newest value
 * reaches the rescale threshold, and the unused steps are applied at the end.
 *
 * @param n Largest degree, n >= 0.
 * @param x Evaluation point (probabilists' variable).
 * @throws ParameterDomainError if n < 0.
 */
template<typename R = traits::DataType::PolynomialField>
Eigen::Array<R, Eigen::Dynamic, 1> hermite_recurrence_table(int n, R x)
{
    PolynomialDomainValidator<R, HermiteOrder> validator{HermiteOrder(n)};

    Eigen::Array<R, Eigen::Dynamic, 1> table(n + 1);
    if (n == 0) {
        table[0] = std::exp(-x * x / 4);
        return table;
    }

    const int p = std::max(1, static_cast<int>(std::floor(x * x / 100)));
    const R w = std::exp(-x * x / (4 * p));
    int rescalings = 0;

    R H_old = 1;
    R H = x;
    table[0] = H_old;
    table[1] = H;
    for (int k = 1; k < n; ++k) {
        const R H_new = x * H / std::sqrt(R(k + 1)) - H_old / std::sqrt(1 + R(1) / k);
        H_old = H;
        H = H_new;
        while (std::abs(H) >= traits::HermiteConstants::rescale_threshold && rescalings < p) {
            table.head(k + 1) *= w;
            H *= w;
            H_old *= w;
            ++rescalings;
        }
        table[k + 1] = H;
    }
    table *= std::pow(w, p - rescalings);

    return table;
}

namespace detail {

/**
 * @brief Polynomials in cos(theta) of the Hermite Airy expansion.
 *
 * u_k enter the value and v_k the derivative (DLMF 12.10.9 and 12.10.10).
 */
template<typename R>
struct AiryExpansionPolynomials {
    Polynomial<3, R> u1 = R(1) / 24 * Polynomial<3, R>{0, -6, 0, 1};
    Polynomial<4, R> u2 = R(1) / 1152 * Polynomial<4, R>{145, 0, 249, 0, -9};
    Polynomial<9, R> u3 = R(1) / 414720 * Polynomial<9, R>{0, -259290, 0, -151995, 0, -28287, 0, 18189, 0, -4042};

    Polynomial<3, R> v1 = R(1) / 24 * Polynomial<3, R>{0, 6, 0, 1};
    Polynomial<4, R> v2 = R(1) / 1152 * Polynomial<4, R>{-143, 0, -327, 0, 15};
    Polynomial<9, R> v3 = R(1) / 414720 * Polynomial<9, R>{0, 259290, 0, 238425, 0, -36387, 0, 18189, 0, -4042};
};

template<typename R>
const AiryExpansionPolynomials<R>& airy_expansion_polynomials()
{
    static const AiryExpansionPolynomials<R> polys;
    return polys;
}

} // namespace detail

/**
 * @brief Hermite value and derivative of degree n in theta-space from the Airy expansion.
 *
 * With mu^2 = 2n+1, eta = theta/2 - sin(2 theta)/4, chi = -(3 eta/2)^{2/3} and
 * phi = (-chi / sin^2 theta)^{1/4}, Ai and Ai' are evaluated at mu^{4/3} chi.
 *
 * @param n Degree, n >= 1.
 * @param theta Angle in (0, pi/2].
 * @return {value, derivative} as used by the asymptotic Newton solver.
 * @throws ParameterDomainError if n < 1.
 */
template<typename R = traits::DataType::PolynomialField>
PolyEvalPair<R> hermite_asymptotic(int n, R theta)
{
    PolynomialDomainValidator<R, EvaluationDegree> validator{EvaluationDegree(n)};
    const auto& poly = detail::airy_expansion_polynomials<R>();

    const R musq = 2 * R(n) + 1;
    const R cosT = std::cos(theta);
    const R sinT = std::sin(theta);
    const R sin2T = 2 * cosT * sinT;
    const R eta = theta / 2 - sin2T / 4;
    const R chi = -std::pow(3 * eta / 2, R(2) / 3);
    const R phi = std::pow(-chi / (sinT * sinT), R(1) / 4);

    const R z = std::pow(musq, R(2) / 3) * chi;
    const R airy0 = boost::math::airy_ai(z);
    const R airy1 = boost::math::airy_ai_prime(z);

    // Coefficients of (12.10.43)
    const R a0 = 1;
    const R b0 = 1;
    const R a1 = R(15) / 144;
    const R b1 = -R(7) / 5 * a1;
    const R a2 = R(5 * 7 * 9 * 11) / 2 / (144 * 144);
    const R b2 = -R(13) / 11 * a2;
    const R a3 = R(7 * 9 * 11 * 13 * 15 * 17) / 6 / (R(144) * 144 * 144);
    const R b3 = -R(19) / 17 * a3;

    const R phi6 = monomial<6>(phi);
    const R phi12 = monomial<12>(phi);
    const R phi18 = monomial<18>(phi);

    const R u0 = 1;
    const R u1 = poly.u1(cosT);
    const R u2 = poly.u2(cosT);
    const R u3 = poly.u3(cosT);

    const R A0 = 1;
    const R B0 = -(a0 * phi6 * u1 + a1 * u0) / (chi * chi);
    const R A1 = (b0 * phi12 * u2 + b1 * phi6 * u1 + b2 * u0) / monomial<3>(chi);
    const R B1 = -(phi18 * u3 + a1 * phi12 * u2 + a2 * phi6 * u1 + a3 * u0) / monomial<5>(chi);

    R value = A0 * airy0;
    value += B0 * airy1 / std::pow(musq, R(4) / 3);
    value += A1 * airy0 / (musq * musq);
    value += B1 * airy1 / std::pow(musq, R(4) / 3 + 2);
    value *= 2 * boost::math::constants::root_pi<R>() * std::pow(musq, R(1) / 6) * phi;

    const R v0 = 1;
    const R v1 = poly.v1(cosT);
    const R v2 = poly.v2(cosT);
    const R v3 = poly.v3(cosT);

    const R C0 = -(b0 * phi6 * v1 + b1 * v0) / chi;
    const R D0 = a0 * v0;
    const R C1 = -(phi18 * v3 + b1 * phi12 * v2 + b2 * phi6 * v1 + b3 * v0) / monomial<4>(chi);
    const R D1 = (a0 * phi12 * v2 + a1 * phi6 * v1 + a2 * v0) / monomial<3>(chi);

    R derivative = C0 * airy0 / std::pow(musq, R(2) / 3);
    derivative += D0 * airy1;
    derivative += C1 * airy0 / std::pow(musq, R(2) / 3 + 2);
    derivative += D1 * airy1 / (musq * musq);
    derivative *= std::sqrt(2 * boost::math::constants::pi<R>()) * std::pow(musq, R(1) / 3) / phi;

    return {value, derivative};
}

} // namespace polynomials

#endif // HH_HERMITE_EVALUATORS_HH
