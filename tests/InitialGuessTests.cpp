#include "quadrature/GaussHermite.hpp"
#include "quadrature/HermiteInitialGuess.hpp"

#include "catch2/catch.hpp"

#include <cmath>

TEST_CASE("Initial guesses have the expected shape", "[initial_guess]")
{
    for (const int n : {20, 21, 22, 57, 100, 201, 1000, 1001})
    {
        const auto guesses = quadrature::hermite_initial_guesses(n);
        REQUIRE(guesses.size() == (n + 1) / 2);

        for (Eigen::Index i = 1; i < guesses.size(); ++i)
            CHECK(guesses[i - 1] < guesses[i]);

        if (n % 2 == 1)
            CHECK(guesses[0] == 0.0);
        else
            CHECK(guesses[0] > 0.0);

        // The largest zero of H_n lies below sqrt(2n+1).
        CHECK(guesses[guesses.size() - 1] < std::sqrt(2.0 * n + 1));
    }
}

TEST_CASE("Initial guesses are close to the converged nodes", "[initial_guess]")
{
    for (const int n : {20, 21, 64, 199, 200, 201, 500})
    {
        const auto guesses = quadrature::hermite_initial_guesses(n);
        const auto rule    = quadrature::gauss_hermite(n);
        const auto half    = rule.nodes.tail(guesses.size());

        CHECK((half - guesses).cwiseAbs().maxCoeff() < 1e-2);
    }
}

TEST_CASE("Initial guesses need order at least 20", "[initial_guess]")
{
    for (const int n : {-1, 0, 1, 2, 10, 19})
        CHECK_THROWS_AS(quadrature::hermite_initial_guesses(n), polynomials::ParameterDomainError);
    CHECK_NOTHROW(quadrature::hermite_initial_guesses(20));
}
