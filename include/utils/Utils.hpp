/*!
 * @file Utils.hpp
 * @brief Utility functions on Eigen vectors used when assembling quadrature rules.
 *
 * This header provides:
 * - `sort_permutation`: the permutation sorting a vector ascending (stable).
 * - `mirror`: the reflection of a non-negative half sequence across zero.
 * - `max_abs`: infinity norm that propagates NaN.
 *
 * Dependencies:
 * - Eigen for vector storage.
 * - FGHQ_traits.hpp for type definitions.
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>
#include "../traits/FGHQ_traits.hpp"

namespace Utils
{

/**
 * @brief Indices that sort v ascending; ties keep their original order.
 *
 * @param v Vector to sort.
 * @return Permutation p with v[p[0]] <= v[p[1]] <= ...
 */
template<typename Derived>
std::vector<Eigen::Index> sort_permutation(const Eigen::MatrixBase<Derived>& v)
{
    std::vector<Eigen::Index> permutation(static_cast<std::size_t>(v.size()));
    std::iota(permutation.begin(), permutation.end(), Eigen::Index{0});
    std::stable_sort(permutation.begin(), permutation.end(),
                     [&v](Eigen::Index i, Eigen::Index j) { return v[i] < v[j]; });
    return permutation;
}

/**
 * @brief Reflects an ascending half sequence across zero.
 *
 * For half = [h_0, h_1, ..., h_{m-1}] the result is
 * [sign*h_{m-1}, ..., sign*h_s, h_0, ..., h_{m-1}] where s = 1 if the first entry is shared
 * (centre of an odd rule) and s = 0 otherwise.
 *
 * @param half Non-negative half, ascending.
 * @param shared_centre Whether half[0] is the centre and appears once.
 * @param sign -1 for nodes, +1 for weights.
 */
inline traits::DataType::StoringVector mirror(const traits::DataType::StoringVector& half,
                                              bool shared_centre,
                                              double sign)
{
    const Eigen::Index m = half.size();
    const Eigen::Index skip = (shared_centre && m > 0) ? 1 : 0;
    const Eigen::Index reflected = m - skip;

    traits::DataType::StoringVector full(reflected + m);
    full.head(reflected) = sign * half.tail(reflected).reverse();
    full.tail(m) = half;
    return full;
}

/**
 * @brief Infinity norm of v; NaN if any entry is NaN.
 */
inline double max_abs(const traits::DataType::StoringVector& v)
{
    double result = 0.0;
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        if (std::isnan(v[i])) {
            return v[i];
        }
        result = std::max(result, std::abs(v[i]));
    }
    return result;
}

} // namespace Utils

#endif // UTILS_HPP
