/**
 * @file return_estimator.cpp
 * @brief Implementation of the EWMA return estimator
 */

#include "risk/return_estimator.hpp"
#include <stdexcept>

namespace cemv
{
    namespace risk
    {

        ReturnEstimator::ReturnEstimator(int ewm_span, int return_period)
            : ewm_span_(ewm_span), return_period_(return_period), covariance_model_(true)
        {
            if (ewm_span_ < 1)
            {
                throw std::invalid_argument("EWMA span must be >= 1, got: " + std::to_string(ewm_span_));
            }
            if (return_period_ < 1)
            {
                throw std::invalid_argument("Return period must be >= 1, got: " + std::to_string(return_period_));
            }
        }

        Eigen::MatrixXd ReturnEstimator::ewma(const Eigen::MatrixXd &series, int span)
        {
            if (span < 1)
            {
                throw std::invalid_argument("EWMA span must be >= 1");
            }

            const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
            if (series.rows() == 0 || span == 1)
            {
                return series;
            }

            Eigen::MatrixXd smoothed(series.rows(), series.cols());

            smoothed.row(0) = series.row(0);
            for (Eigen::Index t = 1; t < series.rows(); ++t)
            {
                smoothed.row(t) = (1.0 - alpha) * smoothed.row(t - 1) + alpha * series.row(t);
            }

            return smoothed;
        }

        Eigen::VectorXd ReturnEstimator::expected_returns(const MarketData &panel) const
        {
            Eigen::MatrixXd returns = panel.percent_change(return_period_);

            // Leading rows and undefined ratios count as zero return; Inf is kept
            returns = returns.unaryExpr([](double v)
                                        { return std::isnan(v) ? 0.0 : v; });

            return ewma(returns, ewm_span_).colwise().mean().transpose();
        }

        ReturnEstimate ReturnEstimator::estimate(const MarketData &panel) const
        {
            if (panel.num_assets() == 0)
            {
                throw std::invalid_argument("Price panel has no symbols");
            }
            if (panel.num_dates() < 2)
            {
                throw std::invalid_argument(
                    "Price panel needs at least 2 rows, got: " + std::to_string(panel.num_dates()));
            }

            ReturnEstimate estimate;
            estimate.expected_returns = expected_returns(panel);
            estimate.covariance = covariance_model_.estimate_covariance(panel.get_prices());

            sanitize(estimate.expected_returns);
            sanitize(estimate.covariance);

            return estimate;
        }

    } // namespace risk
} // namespace cemv
