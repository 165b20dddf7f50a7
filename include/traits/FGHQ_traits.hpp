/*!
 * @file FGHQ_traits.hpp
 * @brief Defines core type traits, enumerations, constants and settings for the FGHQ library.
 *
 * This header provides the type definitions used throughout FGHQ (Eigen based storage for
 * nodes, weights and Jacobi matrices), the enumerations selecting algorithms and integrators,
 * and the numerical constants steering the Gauss-Hermite solvers.
 */

#ifndef FGHQ_TRAITS_HPP
#define FGHQ_TRAITS_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <cmath>
#include <limits>
#include <optional>
#include <type_traits>
#include <vector>

namespace traits
/*!
 * @namespace traits
 * @brief Contains all type traits, type aliases, enumerations and settings used across FGHQ.
 */
{

/*!
 * @struct DataType
 * @brief Central container of type aliases for the vector/matrix structures used in FGHQ.
 */
struct DataType
{
public:
    using PolynomialField = double;  ///< Scalar field used for all computations (default: double).

    using StoringMatrix = Eigen::Matrix<PolynomialField, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>; ///< Dynamic-size matrix type.

    using StoringVector = Eigen::Matrix<PolynomialField, Eigen::Dynamic, 1>; ///< Dynamic-size column vector type (nodes, weights).

    using StoringArray  = Eigen::Array<PolynomialField, Eigen::Dynamic, 1>; ///< Dynamic-size array for element-wise operations.

    using SparseStoringMatrix = Eigen::SparseMatrix<PolynomialField>; ///< Sparse matrix type (Jacobi matrix).

    using Triplet = Eigen::Triplet<PolynomialField>; ///< Triplet structure for building sparse matrices.

    using Triplets = std::vector<Triplet>; ///< Collection of triplets used for sparse matrix assembly.
};

/*!
 * @brief Converts an integer to a type at compile time.
 * @tparam N The unsigned integer to wrap in a type.
 */
template <unsigned int N>
using IntToType = std::integral_constant<unsigned int, N>;

/*!
 * @enum EvalMethod
 * @brief Enumeration of available methods for evaluating polynomials.
 */
enum class EvalMethod
{
    Horner, ///< Use Horner's method: efficient nested multiplication.
    Direct  ///< Use direct evaluation (less efficient, straightforward).
};

/*!
 * @enum HermiteAlgorithm
 * @brief Algorithms computing the Gauss-Hermite nodes and weights.
 */
enum class HermiteAlgorithm
{
    Automatic,   ///< Choose by order: Golub-Welsch, recurrence or asymptotic.
    GolubWelsch, ///< Eigendecomposition of the Jacobi matrix.
    Recurrence,  ///< Newton iteration on the three-term recurrence.
    Asymptotic   ///< Newton iteration in theta-space on the Airy expansion.
};

/*!
 * @struct HermiteConstants
 * @brief Numerical constants of the Gauss-Hermite solvers.
 *
 * The regime limits and iteration budgets are empirical and tuned together; the two Newton
 * tolerances differ by a factor of ten and are kept apart.
 */
struct HermiteConstants
{
    static constexpr int golub_welsch_max_order = 20;   ///< Largest order handled by Golub-Welsch.
    static constexpr int recurrence_max_order = 200;    ///< Largest order handled by the recurrence solver.
    static constexpr int min_asymptotic_order = 20;     ///< Smallest order for which initial guesses exist.

    static constexpr int recurrence_max_iterations = 10;
    static constexpr int asymptotic_max_iterations = 20;
    static constexpr int tricomi_newton_iterations = 7;

    static constexpr double rescale_threshold = 100.0;  ///< |H| at which recurrence values get damped.
    static constexpr double patch_fraction = 0.4985;    ///< Fraction of n where Tricomi guesses hand over to Gatteschi.

    static double recurrence_tolerance() noexcept
    {
        return std::sqrt(std::numeric_limits<double>::epsilon());
    }

    static double asymptotic_tolerance() noexcept
    {
        return std::sqrt(std::numeric_limits<double>::epsilon()) / 10;
    }
};

/*!
 * @struct HermiteSettings
 * @brief Per-call options of the Gauss-Hermite entry points.
 */
struct HermiteSettings
{
    HermiteAlgorithm algorithm = HermiteAlgorithm::Automatic; ///< Force an algorithm, or pick by order.
    bool verbose = false;                                     ///< Write diagnostics to std::cerr.
    std::optional<int> max_iterations;                        ///< Cap on Newton sweeps; unset keeps the solver's budget.
};

} // namespace traits

#endif // FGHQ_TRAITS_HPP
