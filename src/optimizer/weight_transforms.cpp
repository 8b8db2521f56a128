/**
 * @file weight_transforms.cpp
 * @brief Implementation of the weight normalization and capping policies
 */

#include "optimizer/weight_transforms.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace cemv
{
    namespace optimizer
    {

        namespace
        {
            Eigen::VectorXd equal_weights(Eigen::Index n)
            {
                return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
            }

            void check_max_weight(double max_weight)
            {
                if (!(max_weight > 0.0) || !std::isfinite(max_weight))
                {
                    throw std::invalid_argument(
                        "max_weight must be positive, got: " + std::to_string(max_weight));
                }
            }
        } // namespace

        // ============================================================================
        // Exact policies
        // ============================================================================

        Eigen::VectorXd normalize_weights_exact(const Eigen::VectorXd &weights)
        {
            const Eigen::Index n = weights.size();
            if (n == 0)
            {
                return weights;
            }

            Eigen::VectorXd result = weights.cwiseMax(0.0);
            const double total = result.sum();

            if (!(total > EXACT_SUM_EPSILON))
            {
                return equal_weights(n);
            }

            result /= total;

            const double residual = 1.0 - result.sum();
            if (std::abs(residual) > EXACT_SUM_EPSILON)
            {
                Eigen::Index largest = 0;
                result.maxCoeff(&largest);
                result(largest) += residual;
            }

            return result;
        }

        Eigen::VectorXd neutralize_weights_exact(const Eigen::VectorXd &weights)
        {
            const Eigen::Index n = weights.size();
            if (n == 0)
            {
                return weights;
            }

            Eigen::VectorXd result = (weights.array() - weights.mean()).max(-1.0).min(1.0).matrix();

            const double total = result.sum();
            if (std::abs(total) <= EXACT_SUM_EPSILON)
            {
                return result;
            }

            Eigen::Index largest = 0;
            result.cwiseAbs().maxCoeff(&largest);
            result(largest) -= total;

            const double clamped = std::max(-1.0, std::min(1.0, result(largest)));
            if (clamped != result(largest) && n > 1)
            {
                // Amount the clamp removed from the sum goes back to the others
                const double overflow = result(largest) - clamped;
                result(largest) = clamped;
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    if (i != largest)
                    {
                        result(i) += overflow / static_cast<double>(n - 1);
                    }
                }
            }
            else
            {
                result(largest) = clamped;
            }

            return result;
        }

        // ============================================================================
        // Capped policies
        // ============================================================================

        Eigen::VectorXd normalize_weights_limit(const Eigen::VectorXd &weights, double max_weight)
        {
            check_max_weight(max_weight);

            const Eigen::Index n = weights.size();
            if (n == 0)
            {
                return weights;
            }

            if (static_cast<double>(n) * max_weight < 1.0 - CAPPING_TOLERANCE)
            {
                return equal_weights(n);
            }

            Eigen::VectorXd result = weights.cwiseMax(0.0);

            for (int iteration = 0; iteration < CAPPING_MAX_ITERATIONS; ++iteration)
            {
                const double total = result.sum();
                if (!(total > CAPPING_TOLERANCE))
                {
                    result = equal_weights(n);
                    break;
                }
                result /= total;

                double excess = 0.0;
                bool any_over = false;
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    if (result(i) > max_weight)
                    {
                        excess += result(i) - max_weight;
                        result(i) = max_weight;
                        any_over = true;
                    }
                }

                if (!any_over)
                {
                    break;
                }

                double total_headroom = 0.0;
                Eigen::Index uncapped = 0;
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    if (result(i) < max_weight - CAPPING_TOLERANCE)
                    {
                        total_headroom += max_weight - result(i);
                        ++uncapped;
                    }
                }

                if (uncapped == 0)
                {
                    break;
                }

                for (Eigen::Index i = 0; i < n; ++i)
                {
                    if (result(i) < max_weight - CAPPING_TOLERANCE)
                    {
                        if (total_headroom > CAPPING_TOLERANCE)
                        {
                            result(i) += excess * (max_weight - result(i)) / total_headroom;
                        }
                        else
                        {
                            result(i) += excess / static_cast<double>(uncapped);
                        }
                    }
                }
            }

            const double total = result.sum();
            if (total > CAPPING_TOLERANCE)
            {
                result /= total;
            }

            // A surplus comes off the largest entry so zero entries stay at zero
            const double residual = 1.0 - result.sum();
            if (residual > 0.0)
            {
                Eigen::Index roomiest = 0;
                (max_weight - result.array()).maxCoeff(&roomiest);
                result(roomiest) += residual;
            }
            else if (residual < 0.0)
            {
                Eigen::Index largest = 0;
                result.maxCoeff(&largest);
                result(largest) = std::max(0.0, result(largest) + residual);
            }

            return result;
        }

        Eigen::VectorXd neutralize_weights_limit(const Eigen::VectorXd &weights, double max_weight)
        {
            check_max_weight(max_weight);

            const Eigen::Index n = weights.size();
            if (n == 0)
            {
                return weights;
            }

            Eigen::VectorXd result = (weights.array() - weights.mean()).matrix();

            for (int iteration = 0; iteration < CAPPING_MAX_ITERATIONS; ++iteration)
            {
                result = result.cwiseMax(-max_weight).cwiseMin(max_weight);

                const double imbalance = result.sum();
                if (std::abs(imbalance) <= CAPPING_TOLERANCE)
                {
                    break;
                }

                // A positive imbalance is fixed by moving entries toward -max_weight.
                // Only the bound in that direction pins an entry.
                auto pinned = [&](Eigen::Index i) {
                    return imbalance > 0.0 ? result(i) <= -max_weight + CAPPING_TOLERANCE
                                           : result(i) >= max_weight - CAPPING_TOLERANCE;
                };

                Eigen::VectorXd capacity = Eigen::VectorXd::Zero(n);
                Eigen::Index adjustable = 0;
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    if (pinned(i))
                    {
                        continue;
                    }
                    capacity(i) = imbalance > 0.0 ? result(i) + max_weight : max_weight - result(i);
                    ++adjustable;
                }

                if (adjustable == 0)
                {
                    break;
                }

                const double total_capacity = capacity.sum();
                if (total_capacity > CAPPING_TOLERANCE)
                {
                    const double movable = std::min(std::abs(imbalance), total_capacity);
                    const double direction = imbalance > 0.0 ? -1.0 : 1.0;
                    result += direction * movable * (capacity / total_capacity);
                }
                else
                {
                    for (Eigen::Index i = 0; i < n; ++i)
                    {
                        if (!pinned(i))
                        {
                            result(i) -= imbalance / static_cast<double>(adjustable);
                        }
                    }
                }
            }

            result = result.cwiseMax(-max_weight).cwiseMin(max_weight);

            const double imbalance = result.sum();
            if (std::abs(imbalance) > CAPPING_TOLERANCE)
            {
                Eigen::Index roomiest = 0;
                if (imbalance > 0.0)
                {
                    (result.array() + max_weight).maxCoeff(&roomiest);
                }
                else
                {
                    (max_weight - result.array()).maxCoeff(&roomiest);
                }
                result(roomiest) = std::max(-max_weight, std::min(max_weight, result(roomiest) - imbalance));
            }

            return result;
        }

    } // namespace optimizer
} // namespace cemv
