/**
 * @file ReferenceIntegrators.hpp
 * @brief Adaptive integrators the Gauss-Hermite rules are checked against.
 *
 * - quadrature::TanhSinhIntegrator: Boost.Math's double-exponential tanh_sinh rule.
 * - quadrature::QuadpackIntegrator: GSL's QUADPACK family, the routine picked from the bounds
 *   (qagi on (-inf, inf), qagil / qagiu on half lines, qags on finite intervals).
 *
 * Both share the signature integrate(f, a, b) with GaussHermiteQuadrature and return 0 for a >= b.
 * This header needs GSL; it belongs to the optional fghq_reference target.
 *
 * Usage Example:
 * @code
 * const double inf = std::numeric_limits<double>::infinity();
 * auto f = [](double x) { return std::exp(-x * x) * std::cos(x); };
 *
 * quadrature::TanhSinhIntegrator<double> tanh_sinh(1e-12);
 * quadrature::QuadpackIntegrator<double> quadpack;
 * double a = tanh_sinh.integrate(f, -inf, inf);
 * double b = quadpack.integrate(f, -inf, inf);
 * @endcode
 */
#ifndef REFERENCE_INTEGRATORS_HPP
#define REFERENCE_INTEGRATORS_HPP

#include <cmath>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/math/quadrature/tanh_sinh.hpp>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_integration.h>
#include "../traits/FGHQ_traits.hpp"

namespace quadrature {

/**
 * @brief Boost.Math tanh_sinh quadrature on finite, half-infinite or infinite intervals.
 */
template<typename R = traits::DataType::PolynomialField>
class TanhSinhIntegrator {
    R tolerance_;
    std::size_t max_levels_;

public:
    /**
     * @param tolerance Relative error at which refinement stops.
     * @param max_levels Number of refinement levels of the tanh_sinh grid.
     */
    explicit TanhSinhIntegrator(R tolerance = std::sqrt(std::numeric_limits<R>::epsilon()),
                                std::size_t max_levels = 15)
        : tolerance_(tolerance), max_levels_(max_levels) {}

    /**
     * @throws std::runtime_error if Boost rejects the integrand or the interval.
     */
    R integrate(const std::function<R(R)>& integrand, R lower_bound, R upper_bound) const
    {
        if (!(lower_bound < upper_bound)) {
            return R(0);
        }

        const boost::math::quadrature::tanh_sinh<R> rule(max_levels_);
        try {
            return rule.integrate(integrand, lower_bound, upper_bound, tolerance_);
        } catch (const std::domain_error& e) {
            throw std::runtime_error(std::string("tanh_sinh integration failed: ") + e.what());
        } catch (const std::overflow_error& e) {
            throw std::runtime_error(std::string("tanh_sinh integration failed: ") + e.what());
        }
    }
};


namespace detail {

// Trampoline handed to GSL. GSL is C and cannot unwind, so an exception from the integrand is
// stored and the remaining evaluations return NaN until the routine gives up.
template<typename R>
struct QuadpackCallback {
    const std::function<R(R)>& integrand;
    std::exception_ptr failure = nullptr;

    static double call(double x, void* self_ptr)
    {
        auto& self = *static_cast<QuadpackCallback*>(self_ptr);
        if (!self.failure) {
            try {
                return static_cast<double>(self.integrand(static_cast<R>(x)));
            } catch (const std::exception&) {
                self.failure = std::current_exception();
            }
        }
        return std::numeric_limits<double>::quiet_NaN();
    }
};

// Replaces GSL's aborting error handler for one call. The handler is process-wide state.
class ScopedGSLErrorHandler {
    gsl_error_handler_t* saved_;

public:
    ScopedGSLErrorHandler() : saved_(gsl_set_error_handler_off()) {}
    ~ScopedGSLErrorHandler() { gsl_set_error_handler(saved_); }

    ScopedGSLErrorHandler(const ScopedGSLErrorHandler&) = delete;
    ScopedGSLErrorHandler& operator=(const ScopedGSLErrorHandler&) = delete;
};

} // namespace detail


/**
 * @brief GSL QUADPACK adaptive integration.
 *
 * Each call installs and restores GSL's global error handler, so calls must not overlap across
 * threads.
 */
template<typename R = traits::DataType::PolynomialField>
class QuadpackIntegrator {
    double epsabs_;
    double epsrel_;
    std::size_t limit_;

    struct WorkspaceDeleter {
        void operator()(gsl_integration_workspace* w) const { gsl_integration_workspace_free(w); }
    };
    using Workspace = std::unique_ptr<gsl_integration_workspace, WorkspaceDeleter>;

public:
    /**
     * @param epsabs Absolute error target.
     * @param epsrel Relative error target.
     * @param limit Maximum number of subintervals.
     */
    explicit QuadpackIntegrator(double epsabs = 1e-10, double epsrel = 1e-10, std::size_t limit = 1000)
        : epsabs_(epsabs), epsrel_(epsrel), limit_(limit) {}

    /**
     * @throws std::runtime_error with the gsl_strerror text if GSL reports a failure.
     * @throws whatever the integrand threw, after GSL has returned.
     */
    R integrate(const std::function<R(R)>& integrand, R lower_bound, R upper_bound) const
    {
        const double a = static_cast<double>(lower_bound);
        const double b = static_cast<double>(upper_bound);
        if (!(a < b)) {
            return R(0);
        }

        Workspace workspace(gsl_integration_workspace_alloc(limit_));
        if (!workspace) {
            throw std::runtime_error("Could not allocate a GSL integration workspace of size "
                                     + std::to_string(limit_) + ".");
        }

        detail::QuadpackCallback<R> callback{integrand};
        gsl_function function{&detail::QuadpackCallback<R>::call, &callback};

        double result = 0.0;
        double abserr = 0.0;
        int status = GSL_SUCCESS;
        {
            detail::ScopedGSLErrorHandler handler;
            if (std::isinf(a) && std::isinf(b)) {
                status = gsl_integration_qagi(&function, epsabs_, epsrel_, limit_, workspace.get(),
                                              &result, &abserr);
            } else if (std::isinf(a)) {
                status = gsl_integration_qagil(&function, b, epsabs_, epsrel_, limit_, workspace.get(),
                                               &result, &abserr);
            } else if (std::isinf(b)) {
                status = gsl_integration_qagiu(&function, a, epsabs_, epsrel_, limit_, workspace.get(),
                                               &result, &abserr);
            } else {
                status = gsl_integration_qags(&function, a, b, epsabs_, epsrel_, limit_, workspace.get(),
                                              &result, &abserr);
            }
        }

        if (callback.failure) {
            std::rethrow_exception(callback.failure);
        }
        if (status != GSL_SUCCESS) {
            throw std::runtime_error(std::string("GSL integration failed: ") + gsl_strerror(status));
        }
        return static_cast<R>(result);
    }
};

} // namespace quadrature

#endif // REFERENCE_INTEGRATORS_HPP
