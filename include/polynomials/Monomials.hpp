/**
 * @file Monomials.hpp
 * @brief Provides constexpr functions to compute monomials of a fixed degree.
 *
 * The powers phi^6, phi^12 and phi^18 of the Hermite asymptotic expansion are computed with
 * these helpers. The exponent is a template parameter and the product is unrolled by
 * repeated squaring at compile time.
 *
 * Example usage:
 * @code
 * constexpr auto result = polynomials::monomial<6>(2.0); // 64
 * @endcode
 */
#ifndef HH_MONOMIALS_HPP
#define HH_MONOMIALS_HPP
#include "../traits/FGHQ_traits.hpp"

namespace polynomials {

template <class R = traits::DataType::PolynomialField>
constexpr R
monomial(const R, traits::IntToType<0>)
{
  return 1;
}

template <class R = traits::DataType::PolynomialField>
constexpr R
monomial(const R x, traits::IntToType<1>)
{
  return x;
}

//! x^N as (x^{N/2})^2, times x when N is odd
template <unsigned int N, class R = traits::DataType::PolynomialField>
constexpr R
monomial(const R x, traits::IntToType<N>)
{
  const R half = monomial(x, traits::IntToType<N / 2>());
  if constexpr (N % 2 == 0)
    return half * half;
  else
    return half * half * x;
}

template <unsigned int N, class R = traits::DataType::PolynomialField>
constexpr R
monomial(const R x)
{
  return monomial(x, traits::IntToType<N>());
}

}
#endif // HH_MONOMIALS_HPP
