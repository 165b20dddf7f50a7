/**
 * @file HermiteSolvers.hpp
 * @brief The three regime-specific algorithms computing half of a Gauss-Hermite rule.
 *
 * Each solver is a stateless callable returning the nodes x >= 0 in ascending order together with
 * their weights in the unweighted representation (weights times e^{x^2}); the centre node of an odd
 * rule is the first entry. The dispatcher in GaussHermite.hpp mirrors and normalises the result.
 *
 * - GolubWelschSolver: eigendecomposition of the Jacobi matrix (Eigen), used for n <= 20.
 * - RecurrenceSolver: Newton iteration on the scaled three-term recurrence, 21 <= n <= 200.
 * - AsymptoticSolver: Newton iteration in theta-space on the Airy expansion, n > 200.
 *
 * The Newton sweeps update every node from values of the previous sweep only, so the per-node
 * loops run in parallel when OpenMP is enabled and give the same result without it.
 */
#ifndef HERMITE_SOLVERS_HPP
#define HERMITE_SOLVERS_HPP

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <Eigen/Eigenvalues>
#include <boost/math/constants/constants.hpp>
#include "HermiteInitialGuess.hpp"
#include "../polynomials/HermiteEvaluators.hpp"
#include "../polynomials/OrthogonalPolynomials.hpp"
#include "../polynomials/OrthogonalValidator.hpp"
#include "../traits/FGHQ_traits.hpp"
#include "../utils/Utils.hpp"

namespace quadrature {

namespace detail {

/**
 * @brief Newton correction value / derivative; NaN (0/0) becomes 0 and freezes the node.
 *
 * A zero derivative with non-zero value is passed through as +-inf.
 */
inline double newton_step(double value, double derivative) noexcept
{
    const double step = value / derivative;
    return std::isnan(step) ? 0.0 : step;
}

/// Sweep budget of a Newton solver: the caller's cap if set, otherwise the default.
inline int sweep_budget(const traits::HermiteSettings& settings, int default_budget)
{
    if (!settings.max_iterations) {
        return default_budget;
    }
    polynomials::PolynomialDomainValidator<double, polynomials::NewtonIterations> validator{
        polynomials::NewtonIterations(*settings.max_iterations)};
    return *settings.max_iterations;
}

} // namespace detail

/**
 * @brief Non-negative half of a Gauss-Hermite rule.
 */
struct HalfRule {
    traits::DataType::StoringVector nodes;   ///< x >= 0, ascending.
    traits::DataType::StoringVector weights; ///< Unweighted representation (carries e^{x^2}).
};

/**
 * @brief Golub-Welsch: nodes are the eigenvalues of the Jacobi matrix, weights sqrt(pi) v_0^2.
 */
struct GolubWelschSolver {
    HalfRule operator()(int n, const traits::HermiteSettings& settings) const
    {
        const polynomials::HermitePolynomial<> hermite(n);

        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen_solver;
        eigen_solver.computeFromTridiagonal(hermite.getJacobiDiagonal(),
                                            hermite.getJacobiSubDiagonal(),
                                            Eigen::ComputeEigenvectors);
        if (eigen_solver.info() != Eigen::Success) {
            throw std::runtime_error("Golub-Welsch: eigendecomposition of the Jacobi matrix failed for n = "
                                     + std::to_string(n) + ".");
        }

        const Eigen::VectorXd& eigenvalues = eigen_solver.eigenvalues();
        const Eigen::MatrixXd& eigenvectors = eigen_solver.eigenvectors();
        const auto order = Utils::sort_permutation(eigenvalues);

        // Keep the upper half: indices floor(n/2) .. n-1 of the sorted spectrum.
        const int first = n / 2;
        HalfRule half;
        half.nodes.resize(n - first);
        half.weights.resize(n - first);
        for (int i = first; i < n; ++i) {
            const Eigen::Index k = order[static_cast<std::size_t>(i)];
            const double x = eigenvalues[k];
            const double v0 = eigenvectors(0, k);
            half.nodes[i - first] = x;
            half.weights[i - first] = std::exp(x * x) * hermite.getMass() * v0 * v0;
        }

        if (settings.verbose) {
            std::cerr << "Golub-Welsch: n = " << n << ", largest node " << half.nodes[half.nodes.size() - 1] << "\n";
        }
        return half;
    }
};

/**
 * @brief Newton iteration on the recurrence evaluator in the probabilists' variable.
 */
struct RecurrenceSolver {
    HalfRule operator()(int n, const traits::HermiteSettings& settings) const
    {
        using StoringVector = traits::DataType::StoringVector;
        using Constants = traits::HermiteConstants;
        const double sqrt2 = boost::math::constants::root_two<double>();

        StoringVector x = hermite_initial_guesses(n) * sqrt2;
        const Eigen::Index m = x.size();
        StoringVector derivatives(m);
        StoringVector dx(m);

        const int budget = detail::sweep_budget(settings, Constants::recurrence_max_iterations);
        bool converged = false;
        int iterations = 0;
        while (iterations < budget) {
            ++iterations;
#pragma omp parallel for
            for (Eigen::Index i = 0; i < m; ++i) {
                const auto eval = polynomials::hermite_recurrence(n, x[i]);
                derivatives[i] = eval.derivative;
                dx[i] = detail::newton_step(eval.value, eval.derivative);
            }
            x -= dx;
            if (Utils::max_abs(dx) < Constants::recurrence_tolerance()) {
                converged = true;
                break;
            }
        }

        if (!converged && settings.verbose) {
            std::cerr << "Warning: recurrence Newton iteration for n = " << n << " stopped after "
                      << iterations << " sweeps with |dx| = " << Utils::max_abs(dx) << "\n";
        }

        HalfRule half;
        half.nodes = x / sqrt2;
        half.weights = derivatives.array().square().inverse().matrix();
        return half;
    }
};

/**
 * @brief Newton iteration on the Airy expansion in theta, x = sqrt(2n+1) cos(theta).
 */
struct AsymptoticSolver {
    HalfRule operator()(int n, const traits::HermiteSettings& settings) const
    {
        using StoringVector = traits::DataType::StoringVector;
        using Constants = traits::HermiteConstants;
        const double sqrt2 = boost::math::constants::root_two<double>();
        const double mu = std::sqrt(2.0 * n + 1);

        StoringVector theta = (hermite_initial_guesses(n).array() / mu).acos().matrix();
        const Eigen::Index m = theta.size();
        StoringVector values(m);
        StoringVector derivatives(m);
        StoringVector dtheta(m);

        const int budget = detail::sweep_budget(settings, Constants::asymptotic_max_iterations);
        bool converged = false;
        int iterations = 0;
        while (iterations < budget) {
            ++iterations;
#pragma omp parallel for
            for (Eigen::Index i = 0; i < m; ++i) {
                const auto eval = polynomials::hermite_asymptotic(n, theta[i]);
                values[i] = eval.value;
                derivatives[i] = eval.derivative;
                dtheta[i] = -eval.value / (sqrt2 * mu * eval.derivative * std::sin(theta[i]));
            }
            theta -= dtheta;
            if (Utils::max_abs(dtheta) < Constants::asymptotic_tolerance()) {
                converged = true;
                break;
            }
        }

        if (!converged && settings.verbose) {
            std::cerr << "Warning: asymptotic Newton iteration for n = " << n << " stopped after "
                      << iterations << " sweeps with |dtheta| = " << Utils::max_abs(dtheta) << "\n";
        }

        HalfRule half;
        half.nodes = mu * theta.array().cos().matrix();
        half.weights = (half.nodes.array() * values.array() + sqrt2 * derivatives.array()).square().inverse().matrix();
        return half;
    }
};

} // namespace quadrature

#endif // HERMITE_SOLVERS_HPP
