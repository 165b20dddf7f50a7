/**
 * @file OrthogonalPolynomials.hpp
 * @brief Defines a CRTP-based framework for orthogonal polynomials and the Hermite family.
 *
 * This header provides a base class template, `OrthogonalPolynomialBase`, describing a family of
 * orthogonal polynomials through its weight function and the coefficients of its three-term
 * recurrence, up to a runtime order n. From the recurrence it builds the Jacobi matrix
 *
 *     J = tridiag(sqrt(beta_k), alpha_k, sqrt(beta_k)),
 *
 * whose eigenvalues are the nodes of the Gauss rule of order n (Golub-Welsch), and it evaluates the
 * orthonormal polynomials by the same recurrence.
 *
 * ## Main Components
 *
 * - **OrthogonalPolynomialBase**: recurrence coefficients, weight function, evaluation domain,
 *   parameter validation, sparse Jacobi matrix and its diagonals.
 * - **HermitePolynomial**: Hermite polynomials orthogonal with respect to e^{-x^2} on the real line
 *   (alpha_k = 0, beta_k = k/2, beta_0 = sqrt(pi)).
 *
 * ## Usage Example
 * @code
 * polynomials::HermitePolynomial<> hermite(5);
 * auto J = hermite.getJacobiMatrix();        // 5x5, zero diagonal, sqrt(k/2) off the diagonal
 * double p3 = hermite.evaluate(0.5, 3);      // orthonormal p_3(0.5)
 * @endcode
 */
#ifndef HH_ORTHOGONAL_POLYNOMIALS_HH
#define HH_ORTHOGONAL_POLYNOMIALS_HH

#include <cmath>
#include <concepts>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/math/constants/constants.hpp>
#include "OrthogonalValidator.hpp"
#include "../traits/FGHQ_traits.hpp"


namespace polynomials {


/**
 * @brief Base class for orthogonal polynomials using CRTP.
 *
 * @tparam Derived Derived class (e.g., HermitePolynomial)
 * @tparam R Floating point type (e.g., float, double)
 * @tparam Params Variadic template for parameter validation
 */
template<typename Derived, typename R, typename... Params>
requires std::floating_point<R>
class OrthogonalPolynomialBase {
public:
    using ValidatorType = PolynomialDomainValidator<R, Params...>;
    using StoringArray = Eigen::Array<R, Eigen::Dynamic, 1>;
    using StoringVector = Eigen::Matrix<R, Eigen::Dynamic, 1>;
    using JacobiMatrixType = Eigen::SparseMatrix<R>;
    using Triplets = std::vector<Eigen::Triplet<R>>;


protected:
    int order;                                            // Size n of the Jacobi matrix
    Function<R> weight_function;                          // Weight function for the polynomial
    RecurrenceCoefficients<R> recurrence_coeffs;          // Recurrence coefficient system
    DomainInterval<R> evaluation_domain;                  // Valid domain for evaluation
    std::unique_ptr<ValidatorType> domain_validator;      // Parameter domain validator
    StoringArray alphas;                                  // alpha_0 .. alpha_{n-1}
    StoringArray betas;                                   // beta_0 .. beta_{n-1}
    JacobiMatrixType J;                                   // Jacobi matrix

public:
    /**
     * @brief Construct base class with order, weight function, recurrence coefficients, domain and validator.
     *
     * @param n Order (size of the Jacobi matrix)
     * @param weight Weight function
     * @param coeffs Recurrence coefficients
     * @param domain Evaluation domain
     * @param validator Parameter validator (validates on construction)
     */
    OrthogonalPolynomialBase(
        int n,
        const Function<R>& weight,
        const RecurrenceCoefficients<R>& coeffs,
        const DomainInterval<R>& domain,
        ValidatorType&& validator
    )
        : order(n)
        , weight_function(weight)
        , recurrence_coeffs(coeffs)
        , evaluation_domain(domain)
        , domain_validator(std::make_unique<ValidatorType>(std::move(validator)))
        , alphas(StoringArray::Zero(n))
        , betas(StoringArray::Zero(n))
        , J(n, n)
    {
        domain_validator->validateParameters();
        computeCoefficients();
        buildJacobiMatrix();
    }

    /**
     * @brief Evaluate the orthonormal polynomial of given degree at x.
     *
     * p_{-1} = 0, p_0 = 1/sqrt(beta_0),
     * sqrt(beta_{k+1}) p_{k+1} = (x - alpha_k) p_k - sqrt(beta_k) p_{k-1}.
     *
     * @param x Input point
     * @param degree Degree of polynomial, at most n - 1
     * @return Polynomial value at x
     * @throws EvaluationDomainError if x is outside domain.
     * @throws std::out_of_range if degree >= n
     */
    R evaluate(R x, int degree) const {
        if (!evaluation_domain.contains(x)) {
            throw EvaluationDomainError("Evaluation point outside valid domain.");
        }
        if (degree < 0 || degree >= order) {
            throw std::out_of_range("Requested degree " + std::to_string(degree) + " outside 0.."
                                    + std::to_string(order - 1) + ".");
        }

        R p_km1 = 0;
        R p_k = 1 / std::sqrt(betas[0]);
        for (int k = 0; k < degree; ++k) {
            const R sqrt_beta_k = (k == 0) ? R(0) : std::sqrt(betas[k]);
            const R p_kp1 = ((x - alphas[k]) * p_k - sqrt_beta_k * p_km1) / std::sqrt(betas[k + 1]);
            p_km1 = p_k;
            p_k = p_kp1;
        }
        return p_k;
    }

    /// @name Accessors for alpha and beta recurrence coefficients
    /// @{
    R getAlpha(int k) const noexcept {
        return alphas[k];
    }

    R getBeta(int k) const noexcept {
        return betas[k];
    }

    const StoringArray& getAlphas() const noexcept {
        return alphas;
    }

    const StoringArray& getBetas() const noexcept {
        return betas;
    }
    /// @}

    int getOrder() const noexcept {
        return order;
    }

    /**
     * @brief Evaluate the weight function at point x.
     * @throws EvaluationDomainError if x is outside valid domain
     */
    R getWeight(R x) const {
        if (!evaluation_domain.contains(x)) {
            throw EvaluationDomainError("Evaluation point outside valid domain");
        }
        return weight_function(x);
    }

    /**
     * @brief Total mass of the weight function (beta_0).
     */
    R getMass() const {
        return betas[0];
    }

    RecurrenceCoefficients<R> getRecurrenceCoefficients() const {
        return recurrence_coeffs;
    }

    /**
     * @brief Get the sparse Jacobi matrix.
     */
    const JacobiMatrixType& getJacobiMatrix() const noexcept {
        return J;
    }

    /**
     * @brief Diagonal of the Jacobi matrix (alpha_0 .. alpha_{n-1}).
     */
    StoringVector getJacobiDiagonal() const {
        return alphas.matrix();
    }

    /**
     * @brief Sub-diagonal of the Jacobi matrix (sqrt(beta_1) .. sqrt(beta_{n-1})).
     */
    StoringVector getJacobiSubDiagonal() const {
        if (order < 2) {
            return StoringVector(0);
        }
        return betas.tail(order - 1).sqrt().matrix();
    }

private:
    void computeCoefficients() {
        if (order == 0) {
            return;
        }
        betas[0] = recurrence_coeffs.beta_0(R(0));
        for (int k = 0; k < order; ++k) {
            alphas[k] = recurrence_coeffs.alpha_k(static_cast<R>(k));
            if (k > 0) {
                betas[k] = recurrence_coeffs.beta_k(static_cast<R>(k));
            }
        }
    }

    void buildJacobiMatrix() {
        Triplets triplets;
        triplets.reserve(3 * order);

        for (int i = 0; i < order; ++i) {
            triplets.emplace_back(i, i, alphas[i]);
            if (i > 0) {
                const R off = std::sqrt(betas[i]);
                triplets.emplace_back(i, i - 1, off);    // Lower
                triplets.emplace_back(i - 1, i, off);    // Upper
            }
        }

        J.resize(order, order);
        J.setFromTriplets(triplets.begin(), triplets.end());
        J.makeCompressed();
    }
};

/**
 * @brief Hermite polynomials orthogonal with respect to e^{-x^2} on the real line.
 *
 * Monic recurrence H_{k+1} = x H_k - (k/2) H_{k-1}; the weight has total mass sqrt(pi).
 */
template<class R = traits::DataType::PolynomialField>
class HermitePolynomial
    : public OrthogonalPolynomialBase<HermitePolynomial<R>, R, GolubWelschOrder> {

public:
    using Base = OrthogonalPolynomialBase<HermitePolynomial<R>, R, GolubWelschOrder>;

    explicit HermitePolynomial(int n)
        : Base(
            n,
            [](R x) { return std::exp(-x * x); }, // Weight function
            RecurrenceCoefficients<R>{
                [](R k) { (void)k; return R(0); },                                    // alpha_k
                [](R k) { return k / 2; },                                            // beta_k
                [](R k) { (void)k; return boost::math::constants::root_pi<R>(); }     // beta_0
            },
            DomainInterval<R>{std::numeric_limits<R>::lowest(),
                              std::numeric_limits<R>::max()},
            PolynomialDomainValidator<R, GolubWelschOrder>(GolubWelschOrder(n))
        )
    {
    }
};

} // namespace polynomials

#endif // HH_ORTHOGONAL_POLYNOMIALS_HH
