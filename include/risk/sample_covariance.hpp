/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator with pairwise-complete data
 *
 * Formula (with bias correction):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 *
 * When the input contains missing values (NaN) each pair of columns is
 * estimated over the rows where both are present, so a symbol listed late
 * still contributes to the matrix over its available history.
 */

#pragma once

#include "risk_model.hpp"

namespace cemv
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Properties:
         * - Unbiased estimator (with bias_correction = true)
         * - Positive semi-definite when no data is missing
         * - Pairwise estimates with missing data may be indefinite; run
         *   RiskModel::make_psd before handing the matrix to a solver
         * - A pair with fewer than 2 common observations is NaN
         *
         * Usage Example:
         * @code
         * SampleCovariance estimator;
         * Eigen::MatrixXd cov = estimator.estimate_covariance(panel.get_prices());
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @brief Construct sample covariance estimator
             * @param bias_correction Apply Bessel's correction (divide by n-1 vs n)
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            /**
             * @brief Estimate covariance matrix
             * @param observations Matrix (T x N), NaN marks a missing value
             * @return Covariance matrix (N x N)
             * @throws std::invalid_argument if empty or fewer than 2 rows
             *
             * Time complexity: O(N^2 * T)
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &observations) const override;

            /**
             * @brief Get model name
             * @return "SampleCovariance"
             */
            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_; ///< Whether to apply Bessel's correction

            Eigen::MatrixXd estimate_complete(const Eigen::MatrixXd &observations) const;
            Eigen::MatrixXd estimate_pairwise(const Eigen::MatrixXd &observations) const;
        };

    } // namespace risk
} // namespace cemv
