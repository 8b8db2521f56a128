/**
 * @file weight_transforms.hpp
 * @brief Deterministic post-processing of raw optimizer weights
 *
 * Four policies are derived from one raw weight vector:
 *
 * - normalize_weights_exact:   long-only, sum exactly 1
 * - neutralize_weights_exact:  mean-centered, sum 0, entries in [-1, 1]
 * - normalize_weights_limit:   long-only, sum 1, entries in [0, max_weight]
 * - neutralize_weights_limit:  sum 0, entries in [-max_weight, max_weight]
 *
 * All functions are pure, keep the input ordering, and map an empty input
 * to an empty output.
 */

#pragma once

#include <Eigen/Dense>

namespace cemv
{
    namespace optimizer
    {

        constexpr double DEFAULT_MAX_WEIGHT = 0.15;     ///< Cap of the limited policies
        constexpr int CAPPING_MAX_ITERATIONS = 100;     ///< Redistribution rounds
        constexpr double CAPPING_TOLERANCE = 1e-10;     ///< Bound and balance tolerance
        constexpr double EXACT_SUM_EPSILON = 1e-15;     ///< Residual below which no fix-up is done

        /**
         * @brief Clip negatives and rescale to sum 1
         *
         * The floating-point residual 1 - sum is added to the largest entry,
         * so the result sums to 1 up to one rounding. A vector with no
         * positive mass becomes equal weights.
         */
        Eigen::VectorXd normalize_weights_exact(const Eigen::VectorXd &weights);

        /**
         * @brief Market-neutral weights: subtract the mean, clip to [-1, 1]
         *
         * A non-zero residual sum is removed from the entry of largest
         * magnitude. If that entry leaves [-1, 1] it is clamped and the amount
         * clamped off is spread equally over the other entries (one pass).
         */
        Eigen::VectorXd neutralize_weights_exact(const Eigen::VectorXd &weights);

        /**
         * @brief Long-only weights capped at max_weight
         *
         * Iteratively caps entries above max_weight and hands the excess to
         * uncapped entries in proportion to their headroom. If
         * n * max_weight < 1 no capped vector can sum to 1; equal weights are
         * returned and the cap is not met.
         *
         * @throws std::invalid_argument if max_weight <= 0
         */
        Eigen::VectorXd normalize_weights_limit(const Eigen::VectorXd &weights,
                                                double max_weight = DEFAULT_MAX_WEIGHT);

        /**
         * @brief Market-neutral weights bounded by +/- max_weight
         *
         * Centers at the mean, then alternates clipping with moving the
         * imbalance onto the entries that are not pinned at a bound, in
         * proportion to their room toward the correcting bound.
         *
         * @throws std::invalid_argument if max_weight <= 0
         */
        Eigen::VectorXd neutralize_weights_limit(const Eigen::VectorXd &weights,
                                                 double max_weight = DEFAULT_MAX_WEIGHT);

    } // namespace optimizer
} // namespace cemv
