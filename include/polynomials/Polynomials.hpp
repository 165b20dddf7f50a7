/*!
 * @file Polynomials.hpp
 * @brief Defines the polynomials::Polynomial template class and related polynomial operations.
 *
 * This header provides a fixed-degree polynomial class template used for the closed-form
 * coefficients of the Hermite asymptotic expansion and of the Airy-zero series. Coefficients
 * are stored in an Eigen array, lowest degree first. Evaluation is by Horner's scheme or by
 * direct summation of powers.
 *
 * Dependencies:
 * - Eigen for array storage.
 * - C++20.
 *
 * Usage example:
 * @code
 * polynomials::Polynomial<3> u1{0.0, -6.0 / 24, 0.0, 1.0 / 24};
 * double val = u1(0.5);                  // (0.5^3 - 6 * 0.5) / 24
 * auto du1 = polynomials::der<1>(u1);    // (3 x^2 - 6) / 24
 * std::cout << u1 << std::endl;
 * @endcode
 */
#ifndef HH_POLYNOMIALS_HH
#define HH_POLYNOMIALS_HH

#include <cmath>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include "../traits/FGHQ_traits.hpp"

namespace polynomials {
/*!
* @class Polynomial
* @brief Template class for polynomials
* @tparam N Polynomial degree
* @tparam R Polynomial field
*/
template <unsigned int N, class R = traits::DataType::PolynomialField>
class Polynomial
{
public:
    using StoringArray = Eigen::Array<R, Eigen::Dynamic, 1>;

    Polynomial() : M_coeff(StoringArray::Zero(N + 1)) {}

    //! Constructor taking coefficients a_0..a_N
    explicit Polynomial(const StoringArray &c) : M_coeff{c}
    {
        if (M_coeff.size() != static_cast<Eigen::Index>(N + 1)) {
            throw std::invalid_argument("Polynomial of degree " + std::to_string(N) + " needs "
                                        + std::to_string(N + 1) + " coefficients.");
        }
    }

    //! Constructor from a list of coefficients a_0..a_N; missing trailing ones are zero
    Polynomial(std::initializer_list<R> c) : M_coeff(StoringArray::Zero(N + 1))
    {
        if (c.size() > N + 1) {
            throw std::invalid_argument("Too many coefficients for a polynomial of degree " + std::to_string(N));
        }
        Eigen::Index i = 0;
        for (const R &a : c) {
            M_coeff[i++] = a;
        }
    }

    //! Constructor with evaluation method
    Polynomial(const StoringArray &c, traits::EvalMethod method) : Polynomial(c)
    {
        eval_method = method;
    }

    //! I can initialize with another polynomial, but only if Degree<=
    template <unsigned int M>
    Polynomial(Polynomial<M, R> const &right) noexcept : M_coeff(StoringArray::Zero(N + 1))
    {
        static_assert(M <= N, "Cannot assign a polynomial of higher degree");
        M_coeff.head(M + 1) = right.get_coeff().head(M + 1);
    }

    Polynomial(Polynomial<N, R> const &) = default;
    Polynomial(Polynomial<N, R> &&) = default;
    Polynomial &operator=(Polynomial<N, R> const &) = default;
    Polynomial &operator=(Polynomial<N, R> &&) = default;

    //! Set coefficients
    void set_coeff(const StoringArray &c)
    {
        M_coeff = c;
    }

    //! Get coefficients
    const StoringArray &get_coeff() const noexcept
    {
        return M_coeff;
    }

    //! Get coefficient as reference (a nicer alternative to setter).
    StoringArray &get_coeff() noexcept
    {
        return M_coeff;
    }

    //! Select the evaluation method
    void set_eval_method(traits::EvalMethod method) noexcept
    {
        eval_method = method;
    }

    //! Evaluate polynomial with the selected method
    //! @param x The evaluation point
    R operator()(R const &x) const noexcept
    {
        return evaluate(x, eval_method);
    }

    /*!
     * @brief Returns a std::function evaluating a copy of this polynomial.
     */
    std::function<R(R)> as_function() const {
        return [poly_copy = *this](R x) -> R { return poly_copy(x); };
    }

    //! Unary minus (returns a new polynomial with inverted sign)
    Polynomial<N, R> operator-() const
    {
        Polynomial<N, R> result = *this;
        result.get_coeff() = -result.get_coeff();
        return result;
    }

    //! The polynomial degree
    static constexpr unsigned int degree()
    {
        return N;
    }

private:
    //! Coefficients a_0---a_n
    StoringArray M_coeff;

    //! Evaluation method
    traits::EvalMethod eval_method = traits::EvalMethod::Horner;

    R evaluate(R const &x, traits::EvalMethod method) const noexcept
    {
        if (method == traits::EvalMethod::Horner) {
            R result = M_coeff[N];
            for (int i = static_cast<int>(N) - 1; i >= 0; --i) {
                result = result * x + M_coeff[i];
            }
            return result;
        }

        // Direct evaluation
        R result = M_coeff[0];
        R x_power = R(1);
        for (unsigned int i = 1; i <= N; ++i) {
            x_power *= x;
            result += M_coeff[i] * x_power;
        }
        return result;
    }
};

/*!
 * Outputs the polynomial in a pretty-print way
 * @tparam N The degree
 * @tparam R The field
 * @param out The output stream
 * @param p The polynomial
 * @return The stream
 */
template <unsigned int N, typename R>
std::ostream &operator<<(std::ostream &out, Polynomial<N, R> const &p)
{
    const auto &coeffs = p.get_coeff();
    out << coeffs[0];

    for (unsigned int i = 1; i <= N; ++i)
    {
        if (coeffs[i] != 0)
        {
            out << (coeffs[i] > 0 ? " + " : " - ") << std::abs(coeffs[i]) << "x^" << i;
        }
    }

    return out;
}

/*!
 * Polynomial addition
 */
template <unsigned int LDegree, unsigned int RDegree, typename R>
auto operator+(Polynomial<LDegree, R> const &left, Polynomial<RDegree, R> const &right)
{
    constexpr unsigned int NMAX = (LDegree > RDegree) ? LDegree : RDegree;
    Polynomial<NMAX, R> res;
    res.get_coeff().head(LDegree + 1) += left.get_coeff();
    res.get_coeff().head(RDegree + 1) += right.get_coeff();
    return res;
}

/*!
 * Polynomial subtraction
 */
template <unsigned int LDegree, unsigned int RDegree, typename R>
auto operator-(Polynomial<LDegree, R> const &left, Polynomial<RDegree, R> const &right)
{
    return left + (-right);
}

/*!
* Multiplication of a polynomial with a scalar
*/
template <unsigned int RDegree, typename R>
auto operator*(R const &scalar, Polynomial<RDegree, R> const &right)
{
    Polynomial<RDegree, R> res;
    res.get_coeff() = scalar * right.get_coeff();
    return res;
}

template <unsigned int RDegree, typename R>
auto operator*(Polynomial<RDegree, R> const &left, R const &scalar)
{
    return scalar * left;
}

/*!
 * Derivative of a Polynomial
 * Usage: der<M>(p) (M>=0)
 *
 * @tparam M The derivative order
 * @tparam RDegree The degree of the polynomial
 * @tparam R The scalar field
 * @param p The polynomial
 * @return \f$\frac{d^{M}(p)}{dx^{M}}\f$
 */
template <unsigned M, unsigned RDegree, typename R>
auto
der(Polynomial<RDegree, R> const &p)
{
  if constexpr(M == 0u)
    return p;
  else if constexpr(RDegree < M)
    return Polynomial<0u, R>{R(0)};
  else
  {
    using StoringArray = typename Polynomial<RDegree, R>::StoringArray;
    // [1, 2, ..., RDegree] times a_1..a_RDegree
    StoringArray multipliers = StoringArray::LinSpaced(RDegree, 1, RDegree);
    StoringArray C = multipliers * p.get_coeff().segment(1, RDegree);

    return der<M - 1>(Polynomial<RDegree - 1, R>{C});
  }
}

} // namespace polynomials


#endif // HH_POLYNOMIALS_HH
