/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer interface and common structures
 */

#include "optimizer/optimizer_interface.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cemv
{
    namespace optimizer
    {

        std::string to_string(SolverKind kind)
        {
            return kind == SolverKind::QP ? "qp" : "fallback";
        }

        nlohmann::json SolveReport::to_json() const
        {
            return nlohmann::json{
                {"solver", to_string(solver)},
                {"message", message},
                {"iterations", iterations}};
        }

        // ============================================================================
        // OptimizationResult Implementation
        // ============================================================================

        OptimizationResult::OptimizationResult()
            : expected_return(0.0),
              volatility(0.0),
              success(false),
              iterations(0),
              objective_value(0.0)
        {
        }

        bool OptimizationResult::is_valid() const
        {
            if (!success)
                return false;
            if (weights.size() == 0)
                return false;
            if (!weights.allFinite())
                return false;

            return std::abs(weights.sum() - 1.0) < 1e-6 && weights.minCoeff() >= 0.0;
        }

        // ============================================================================
        // OptimizerInterface
        // ============================================================================

        OptimizerInterface::OptimizerInterface(double risk_aversion) : risk_aversion_(risk_aversion)
        {
            if (!(risk_aversion_ > 0.0) || !std::isfinite(risk_aversion_))
            {
                throw std::invalid_argument(
                    "Risk aversion must be positive, got: " + std::to_string(risk_aversion_));
            }
        }

        void OptimizerInterface::validate_inputs(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance)
        {
            if (expected_returns.size() == 0)
            {
                throw std::invalid_argument("Expected returns vector is empty");
            }

            if (expected_returns.size() != covariance.rows() ||
                expected_returns.size() != covariance.cols())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: expected returns size (" +
                    std::to_string(expected_returns.size()) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ")");
            }

            if (!expected_returns.allFinite())
            {
                throw std::invalid_argument("Expected returns contain NaN or Inf values");
            }

            if (!covariance.allFinite())
            {
                throw std::invalid_argument("Covariance matrix contains NaN or Inf values");
            }
        }

        OptimizationResult OptimizerInterface::calculate_statistics(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance) const
        {
            OptimizationResult result;
            result.weights = weights;
            result.success = true;

            result.expected_return = weights.dot(expected_returns);

            double variance = weights.dot(covariance * weights);
            result.volatility = std::sqrt(std::max(0.0, variance));

            result.objective_value = result.expected_return - risk_aversion_ * variance;

            return result;
        }

    } // namespace optimizer
} // namespace cemv
