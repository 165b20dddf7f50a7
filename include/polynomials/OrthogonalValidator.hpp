/**
 * @file OrthogonalValidator.hpp
 * @brief Provides utilities for validating domains and parameters of the Hermite machinery.
 *
 * This header defines the structures and classes used to validate the orders handed to the
 * Gauss-Hermite solvers and evaluators, and the exception types raised on violations.
 *
 * It includes:
 *   - Function type alias for recurrence coefficients.
 *   - DomainInterval for interval validation (with floating-point support).
 *   - Exception types for domain violations.
 *   - Parameter base structure and the order parameters of the Hermite solvers.
 *   - PolynomialDomainValidator, which throws ParameterDomainError naming the offending parameter.
 *
 */
#ifndef ORTHOGONAL_VALIDATOR_HPP
#define ORTHOGONAL_VALIDATOR_HPP
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace polynomials {

/**
 * @brief A callable function taking and returning a scalar value.
 *
 * @tparam R Scalar type.
 */
template <typename R>
using Function = std::function<R(R)>;

/**
 * @brief Structure for defining recurrence coefficients of orthogonal polynomials.
 *
 * The monic recurrence takes the form:
 *     P_{k+1}(x) = (x - alpha_k) * P_k(x) - beta_k * P_{k-1}(x)
 * and beta_0 is the total mass of the weight function.
 *
 * @tparam R Scalar type.
 */
template <typename R>
struct RecurrenceCoefficients {
    Function<R> alpha_k;
    Function<R> beta_k;
    Function<R> beta_0;
};

/**
 * @brief Represents a closed numeric interval [lower, upper].
 *
 * @tparam T Type of the interval endpoints.
 */
template<typename T>
struct DomainInterval {
    T lower; ///< Lower bound of the interval
    T upper; ///< Upper bound of the interval

    /**
     * @brief Checks if a value lies within the interval.
     */
    constexpr bool contains(T x) const noexcept {
        return x >= lower && x <= upper;
    }
};

/**
 * @brief Base class for all domain-related exceptions.
 */
class DomainError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception for parameter validation errors (orders out of range).
 */
class ParameterDomainError : public DomainError {
    using DomainError::DomainError;
};

/**
 * @brief Exception for evaluation input errors (table indices, arguments).
 */
class EvaluationDomainError : public DomainError {
    using DomainError::DomainError;
};

/**
 * @brief An integer-like parameter with an admissible closed range.
 *
 * @tparam R Value type.
 */
template<typename R>
struct Parameter {
    R value;                ///< The value handed in by the caller.
    std::pair<R, R> range;  ///< Admissible values, bounds included.
    const char* name;       ///< Name used in error messages.

    Parameter(R val, std::pair<R, R> range, const char* name)
        : value(val), range(range), name(name) {}

    bool isValid() const {
        return value >= range.first && value <= range.second;
    }

    /**
     * @brief The admissible range as text, e.g. "n >= 20".
     */
    std::string getDomain() const {
        if (range.second == std::numeric_limits<R>::max()) {
            return std::string(name) + " >= " + std::to_string(range.first);
        }
        return std::to_string(range.first) + " <= " + name + " <= " + std::to_string(range.second);
    }
};

// -----------------------------------------------------------------------------
// Order parameters of the Gauss-Hermite machinery
// -----------------------------------------------------------------------------

/// @brief Number of quadrature nodes
struct HermiteOrder : Parameter<int> {
    explicit HermiteOrder(int val) : Parameter<int>{val, {0, std::numeric_limits<int>::max()}, "n"} {}
};

/// @brief Degree handed to the polynomial evaluators
struct EvaluationDegree : Parameter<int> {
    explicit EvaluationDegree(int val) : Parameter<int>{val, {1, std::numeric_limits<int>::max()}, "degree"} {}
};

/// @brief Order for which asymptotic initial guesses are available
struct AsymptoticOrder : Parameter<int> {
    explicit AsymptoticOrder(int val) : Parameter<int>{val, {20, std::numeric_limits<int>::max()}, "n"} {}
};

/// @brief Cap on the sweeps of a Newton solver
struct NewtonIterations : Parameter<int> {
    explicit NewtonIterations(int val) : Parameter<int>{val, {1, std::numeric_limits<int>::max()}, "max_iterations"} {}
};

/// @brief Size of a Jacobi matrix
struct GolubWelschOrder : Parameter<int> {
    explicit GolubWelschOrder(int val) : Parameter<int>{val, {1, std::numeric_limits<int>::max()}, "n"} {}
};


// -----------------------------------------------------------------------------
// Validator for parameter tuples
// -----------------------------------------------------------------------------

/**
 * @brief Checks a set of parameters on construction.
 *
 * Constructing a validator at the top of a function is enough to guard it.
 *
 * @tparam R Scalar type of the guarded computation
 * @tparam Params Parameter types derived from Parameter<...>
 */
template<typename R, typename... Params>
class PolynomialDomainValidator {
private:
    std::tuple<Params...> parameters_;

public:
    /**
     * @throws ParameterDomainError if any parameter is out of range.
     */
    explicit PolynomialDomainValidator(Params... params)
        : parameters_(std::move(params)...) {
        validateParameters();
    }

    void validateParameters() const {
        const bool allValid = std::apply([](const auto&... params) {
            return (params.isValid() && ...);
        }, parameters_);

        if (!allValid) {
            throw ParameterDomainError(buildErrorMessage());
        }
    }

private:
    std::string buildErrorMessage() const {
        std::string message = "Invalid argument:";
        std::apply([&message](const auto&... params) {
            ((message += params.isValid()
                  ? std::string()
                  : " " + std::string(params.name) + " = " + std::to_string(params.value)
                        + " (expected " + params.getDomain() + ")"),
             ...);
        }, parameters_);
        return message;
    }
};

} // namespace polynomials

#endif // ORTHOGONAL_VALIDATOR_HPP
