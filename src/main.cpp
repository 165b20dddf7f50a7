#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include "../include/quadrature/GaussHermite.hpp"
#include "../include/traits/FGHQ_traits.hpp"

namespace {

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program
              << " <n> [--unweighted] [--algorithm auto|gw|rec|asy] [--verbose]\n";
}

traits::HermiteAlgorithm parse_algorithm(const std::string& name)
{
    if (name == "auto") return traits::HermiteAlgorithm::Automatic;
    if (name == "gw")   return traits::HermiteAlgorithm::GolubWelsch;
    if (name == "rec")  return traits::HermiteAlgorithm::Recurrence;
    if (name == "asy")  return traits::HermiteAlgorithm::Asymptotic;
    throw std::invalid_argument("unknown algorithm '" + name + "'");
}

int parse_order(const std::string& text)
{
    std::size_t consumed = 0;
    const int n = std::stoi(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("order '" + text + "' is not an integer");
    }
    return n;
}

} // namespace


int main(int argc, char* argv[])
{
    int n = 0;
    bool unweighted = false;
    traits::HermiteSettings settings;

    try {
        if (argc < 2) {
            throw std::invalid_argument("missing order");
        }
        n = parse_order(argv[1]);
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--unweighted") {
                unweighted = true;
            } else if (arg == "--verbose") {
                settings.verbose = true;
            } else if (arg == "--algorithm" && i + 1 < argc) {
                settings.algorithm = parse_algorithm(argv[++i]);
            } else {
                throw std::invalid_argument("unexpected argument '" + arg + "'");
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        const auto rule = unweighted ? quadrature::unweighted_gauss_hermite(n, settings)
                                     : quadrature::gauss_hermite(n, settings);

        std::cout << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (Eigen::Index i = 0; i < rule.nodes.size(); ++i) {
            std::cout << i << " " << rule.nodes[i] << " " << rule.weights[i] << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
