#include "quadrature/GaussHermite.hpp"

#include "catch2/catch.hpp"

#include <boost/math/constants/constants.hpp>

#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using quadrature::gauss_hermite;
using quadrature::unweighted_gauss_hermite;

namespace
{
const double root_pi = boost::math::constants::root_pi< double >();

const std::vector< int > orders = [] {
    std::vector< int > retval;
    for (int n = 0; n <= 21; ++n)
        retval.push_back(n);
    retval.insert(retval.end(), {50, 100, 200, 201, 500, 2000});
    return retval;
}();

// e^{-x^2}, and the weighted weight carrying it, stay normal doubles
bool representable(double x)
{
    return std::exp(-x * x) > 1e-280;
}

traits::HermiteSettings forced(traits::HermiteAlgorithm algorithm)
{
    traits::HermiteSettings settings;
    settings.algorithm = algorithm;
    return settings;
}

// Redirects std::cerr into a string for the lifetime of the object.
class CerrCapture
{
public:
    CerrCapture() : saved_{std::cerr.rdbuf(buffer_.rdbuf())} {}
    ~CerrCapture() { std::cerr.rdbuf(saved_); }

    std::string text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf*    saved_;
};
} // namespace

TEST_CASE("Gauss-Hermite rules have consistent structure", "[gauss_hermite]")
{
    for (const int n : orders)
    {
        INFO("n = " << n);
        const auto rule = gauss_hermite(n);
        const auto raw  = unweighted_gauss_hermite(n);

        REQUIRE(rule.n == n);
        REQUIRE(rule.nodes.size() == n);
        REQUIRE(rule.weights.size() == n);
        REQUIRE(raw.nodes.size() == n);
        REQUIRE(raw.weights.size() == n);
        if (n == 0)
            continue;

        for (int i = 1; i < n; ++i)
            CHECK(rule.nodes[i - 1] < rule.nodes[i]);
        for (int i = 0; i < n; ++i)
        {
            CHECK(rule.nodes[i] == -rule.nodes[n - 1 - i]);
            CHECK(rule.weights[i] == rule.weights[n - 1 - i]);
            CHECK(raw.weights[i] == raw.weights[n - 1 - i]);
            CHECK(rule.nodes[i] == raw.nodes[i]);
        }
        if (n % 2 == 1)
            CHECK(rule.nodes[n / 2] == 0.0);

        CHECK(rule.weights.sum() == Approx(root_pi).margin(1e-10));

        for (int i = 0; i < n; ++i)
        {
            CHECK(raw.weights[i] > 0.0);
            if (representable(rule.nodes[i]))
            {
                CHECK(rule.weights[i] > 0.0);
                CHECK(rule.weights[i] / std::exp(-rule.nodes[i] * rule.nodes[i]) == Approx(raw.weights[i]).epsilon(1e-12));
            }
        }
    }
}

TEST_CASE("Gauss-Hermite rules of small order", "[gauss_hermite]")
{
    SECTION("n = 0")
    {
        const auto rule = gauss_hermite(0);
        CHECK(rule.nodes.size() == 0);
        CHECK(rule.weights.size() == 0);
        CHECK(unweighted_gauss_hermite(0).nodes.size() == 0);
    }

    SECTION("n = 1")
    {
        for (const auto& rule : {gauss_hermite(1), unweighted_gauss_hermite(1)})
        {
            REQUIRE(rule.nodes.size() == 1);
            CHECK(rule.nodes[0] == 0.0);
            CHECK(rule.weights[0] == Approx(root_pi));
        }
    }

    SECTION("n = 2")
    {
        const auto rule = gauss_hermite(2);
        REQUIRE(rule.nodes.size() == 2);
        CHECK(rule.nodes[0] == Approx(-1.0 / std::sqrt(2.0)));
        CHECK(rule.nodes[1] == Approx(1.0 / std::sqrt(2.0)));
        CHECK(rule.weights[0] == Approx(root_pi / 2));
        CHECK(rule.weights[1] == Approx(root_pi / 2));
    }

    SECTION("n = 3")
    {
        const auto rule = gauss_hermite(3);
        CHECK(rule.nodes[2] == Approx(std::sqrt(1.5)));
        CHECK(rule.weights[1] == Approx(2.0 * root_pi / 3));
        CHECK(rule.weights[2] == Approx(root_pi / 6));
    }

    SECTION("Negative order")
    {
        CHECK_THROWS_AS(gauss_hermite(-1), polynomials::ParameterDomainError);
        CHECK_THROWS_AS(unweighted_gauss_hermite(-5), polynomials::DomainError);
    }
}

TEST_CASE("Gauss-Hermite rules integrate polynomials exactly", "[gauss_hermite]")
{
    // integral x^{2k} e^{-x^2} dx = Gamma(k + 1/2)
    for (const int n : {5, 12, 20, 21, 50, 100, 200})
    {
        INFO("n = " << n);
        const auto rule = gauss_hermite(n);
        for (int k = 0; k < n && k <= 10; ++k)
        {
            const double moment = rule.apply([k](double x) { return std::pow(x, 2 * k); });
            CHECK(moment == Approx(std::tgamma(k + 0.5)).epsilon(1e-11));
            CHECK(rule.apply([k](double x) { return std::pow(x, 2 * k + 1); }) == Approx(0.0).margin(1e-12 * std::tgamma(k + 1.5)));
        }
    }

    for (const int n : {201, 500, 2000})
    {
        INFO("n = " << n);
        const auto rule = gauss_hermite(n);
        for (int k = 0; k <= 10; ++k)
        {
            const double moment = rule.apply([k](double x) { return std::pow(x, 2 * k); });
            CHECK(moment == Approx(std::tgamma(k + 0.5)).epsilon(1e-10));
        }
    }
}

TEST_CASE("Regimes agree at their boundaries", "[gauss_hermite]")
{
    const auto compare = [](int n, const quadrature::QuadratureRule<>& a, const quadrature::QuadratureRule<>& b) {
        INFO("n = " << n);
        const int smallest_positive = (n + 1) / 2;
        CHECK(a.nodes[n - 1] == Approx(b.nodes[n - 1]).margin(1e-8));
        CHECK(a.nodes[smallest_positive] == Approx(b.nodes[smallest_positive]).margin(1e-8));
        for (int i = 0; i < n; ++i)
        {
            CHECK(a.nodes[i] == Approx(b.nodes[i]).margin(1e-8));
            CHECK(a.weights[i] == Approx(b.weights[i]).epsilon(1e-6));
        }
    };

    using traits::HermiteAlgorithm;
    compare(20,
            unweighted_gauss_hermite(20, forced(HermiteAlgorithm::GolubWelsch)),
            unweighted_gauss_hermite(20, forced(HermiteAlgorithm::Recurrence)));
    compare(21,
            unweighted_gauss_hermite(21, forced(HermiteAlgorithm::GolubWelsch)),
            unweighted_gauss_hermite(21, forced(HermiteAlgorithm::Recurrence)));
    compare(200,
            unweighted_gauss_hermite(200, forced(HermiteAlgorithm::Recurrence)),
            unweighted_gauss_hermite(200, forced(HermiteAlgorithm::Asymptotic)));
    compare(201,
            unweighted_gauss_hermite(201, forced(HermiteAlgorithm::Recurrence)),
            unweighted_gauss_hermite(201, forced(HermiteAlgorithm::Asymptotic)));
}

TEST_CASE("Algorithm selection", "[gauss_hermite]")
{
    using quadrature::resolve_algorithm;
    using traits::HermiteAlgorithm;

    CHECK(resolve_algorithm(2, HermiteAlgorithm::Automatic) == HermiteAlgorithm::GolubWelsch);
    CHECK(resolve_algorithm(20, HermiteAlgorithm::Automatic) == HermiteAlgorithm::GolubWelsch);
    CHECK(resolve_algorithm(21, HermiteAlgorithm::Automatic) == HermiteAlgorithm::Recurrence);
    CHECK(resolve_algorithm(200, HermiteAlgorithm::Automatic) == HermiteAlgorithm::Recurrence);
    CHECK(resolve_algorithm(201, HermiteAlgorithm::Automatic) == HermiteAlgorithm::Asymptotic);
    CHECK(resolve_algorithm(5, HermiteAlgorithm::Asymptotic) == HermiteAlgorithm::Asymptotic);

    CHECK(std::holds_alternative< quadrature::GolubWelschSolver >(quadrature::select_solver(10, HermiteAlgorithm::Automatic)));
    CHECK(std::holds_alternative< quadrature::RecurrenceSolver >(quadrature::select_solver(100, HermiteAlgorithm::Automatic)));
    CHECK(std::holds_alternative< quadrature::AsymptoticSolver >(quadrature::select_solver(300, HermiteAlgorithm::Automatic)));

    SECTION("Newton solvers cannot be forced below order 20")
    {
        CHECK_THROWS_AS(gauss_hermite(19, forced(HermiteAlgorithm::Recurrence)), polynomials::ParameterDomainError);
        CHECK_THROWS_AS(gauss_hermite(5, forced(HermiteAlgorithm::Asymptotic)), polynomials::ParameterDomainError);
    }

    SECTION("Golub-Welsch can be forced for large orders")
    {
        const auto gw  = gauss_hermite(60, forced(HermiteAlgorithm::GolubWelsch));
        const auto rec = gauss_hermite(60);
        for (int i = 0; i < 60; ++i)
            CHECK(gw.nodes[i] == Approx(rec.nodes[i]).margin(1e-10));
    }

    SECTION("Diagnostics do not change the result")
    {
        traits::HermiteSettings verbose;
        verbose.verbose = true;
        const auto loud  = gauss_hermite(30, verbose);
        const auto quiet = gauss_hermite(30);
        CHECK(loud.nodes == quiet.nodes);
        CHECK(loud.weights == quiet.weights);
    }
}

TEST_CASE("Weighted weights are mirror images", "[gauss_hermite]")
{
    for (const int n : {11, 64, 101, 201, 1000})
    {
        INFO("n = " << n);
        const auto rule = gauss_hermite(n);
        for (int i = 0; i < n / 2; ++i)
            REQUIRE(rule.weights[i] == rule.weights[n - 1 - i]);
    }
}

TEST_CASE("Newton step", "[gauss_hermite]")
{
    using quadrature::detail::newton_step;

    CHECK(newton_step(0.5, 2.0) == 0.25);
    CHECK(newton_step(0.0, 0.0) == 0.0);
    CHECK(newton_step(1.0, 0.0) == std::numeric_limits< double >::infinity());
    CHECK(newton_step(-1.0, 0.0) == -std::numeric_limits< double >::infinity());
    CHECK(newton_step(std::numeric_limits< double >::quiet_NaN(), 1.0) == 0.0);
}

TEST_CASE("Newton solvers report running out of sweeps", "[gauss_hermite]")
{
    using traits::HermiteAlgorithm;

    SECTION("Recurrence")
    {
        auto settings           = forced(HermiteAlgorithm::Recurrence);
        settings.max_iterations = 1;

        std::string quiet_output;
        {
            const CerrCapture capture;
            const auto        rule = gauss_hermite(50, settings);
            CHECK(rule.nodes.size() == 50);
            quiet_output = capture.text();
        }
        CHECK(quiet_output.empty());

        settings.verbose = true;
        std::string loud_output;
        {
            const CerrCapture capture;
            gauss_hermite(50, settings);
            loud_output = capture.text();
        }
        CHECK(loud_output.find("Warning: recurrence Newton iteration for n = 50 stopped after 1 sweeps") !=
              std::string::npos);
    }

    SECTION("Asymptotic")
    {
        auto settings           = forced(HermiteAlgorithm::Asymptotic);
        settings.max_iterations = 1;
        settings.verbose        = true;

        std::string output;
        {
            const CerrCapture capture;
            gauss_hermite(300, settings);
            output = capture.text();
        }
        CHECK(output.find("Warning: asymptotic Newton iteration for n = 300 stopped after 1 sweeps") !=
              std::string::npos);
    }

    SECTION("A converged solve stays silent about sweeps")
    {
        traits::HermiteSettings settings;
        settings.verbose = true;

        std::string output;
        {
            const CerrCapture capture;
            gauss_hermite(100, settings);
            output = capture.text();
        }
        CHECK(output.find("Warning:") == std::string::npos);
    }

    SECTION("The sweep cap must be positive")
    {
        auto settings           = forced(HermiteAlgorithm::Recurrence);
        settings.max_iterations = 0;
        CHECK_THROWS_AS(gauss_hermite(50, settings), polynomials::ParameterDomainError);
    }
}
