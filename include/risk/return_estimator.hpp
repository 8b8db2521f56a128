/**
 * @file return_estimator.hpp
 * @brief Expected returns and covariance from a price panel
 *
 * Expected returns are the column means of an exponentially weighted
 * moving average of k-period percentage changes:
 *
 *     r_t   = p_t / p_{t-k} - 1          (missing values -> 0)
 *     y_0   = r_0
 *     y_t   = (1 - alpha) * y_{t-1} + alpha * r_t,   alpha = 2 / (span + 1)
 *     mu    = mean_t(y_t)
 *
 * The covariance is the pairwise-complete sample covariance of the raw
 * prices. Both outputs are sanitized: NaN -> 0, +Inf -> 1e6, -Inf -> -1e6.
 */

#pragma once

#include "risk/sample_covariance.hpp"
#include "data/market_data.hpp"
#include <Eigen/Dense>
#include <cmath>

namespace cemv
{
    namespace risk
    {

        constexpr double SANITIZED_POS_INF = 1e6;  ///< Replacement for +Inf
        constexpr double SANITIZED_NEG_INF = -1e6; ///< Replacement for -Inf

        /**
         * @brief Replace NaN with 0 and +/-Inf with +/-1e6 in place
         */
        template <typename Derived>
        void sanitize(Eigen::MatrixBase<Derived> &values)
        {
            values = values.unaryExpr([](double v)
                                      {
                                          if (std::isnan(v))
                                              return 0.0;
                                          if (std::isinf(v))
                                              return v > 0 ? SANITIZED_POS_INF : SANITIZED_NEG_INF;
                                          return v;
                                      });
        }

        /**
         * @struct ReturnEstimate
         * @brief Inputs of the mean-variance program
         */
        struct ReturnEstimate
        {
            Eigen::VectorXd expected_returns; ///< mu (N x 1)
            Eigen::MatrixXd covariance;       ///< Q (N x N)
        };

        /**
         * @class ReturnEstimator
         * @brief Builds (mu, Q) from a dates x symbols price panel
         *
         * Usage Example:
         * @code
         * ReturnEstimator estimator(21, 2);
         * ReturnEstimate estimate = estimator.estimate(panel);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class ReturnEstimator
        {
        public:
            /**
             * @param ewm_span EWMA span (>= 1)
             * @param return_period Lag of the percentage change (>= 1)
             * @throws std::invalid_argument if a parameter is out of range
             */
            explicit ReturnEstimator(int ewm_span = 21, int return_period = 2);

            /**
             * @brief Estimate expected returns and covariance
             * @throws std::invalid_argument if the panel has fewer than 2 rows or no symbols
             */
            ReturnEstimate estimate(const MarketData &panel) const;

            /**
             * @brief Expected returns only (not sanitized)
             */
            Eigen::VectorXd expected_returns(const MarketData &panel) const;

            /**
             * @brief Column-wise EWMA without bias adjustment
             * @param series Observations (T x N), must be free of NaN
             * @param span EWMA span
             * @return Smoothed series (T x N)
             */
            static Eigen::MatrixXd ewma(const Eigen::MatrixXd &series, int span);

            int get_ewm_span() const { return ewm_span_; }
            int get_return_period() const { return return_period_; }

        private:
            int ewm_span_;
            int return_period_;
            SampleCovariance covariance_model_;
        };

    } // namespace risk
} // namespace cemv
