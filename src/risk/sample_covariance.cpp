/**
 * @file sample_covariance.cpp
 * @brief Implementation of sample covariance estimator
 */

#include "risk/sample_covariance.hpp"
#include <cmath>
#include <limits>

namespace cemv
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction) : bias_correction_(bias_correction)
        {
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &observations) const
        {
            validate_observations(observations);

            if (observations.array().isNaN().any())
            {
                return estimate_pairwise(observations);
            }

            return estimate_complete(observations);
        }

        Eigen::MatrixXd SampleCovariance::estimate_complete(const Eigen::MatrixXd &observations) const
        {
            const Eigen::Index n_obs = observations.rows();

            Eigen::RowVectorXd means = observations.colwise().mean();
            Eigen::MatrixXd centered = observations.rowwise() - means;

            Eigen::MatrixXd covariance = centered.transpose() * centered;

            double normalization = bias_correction_
                                       ? static_cast<double>(n_obs - 1)
                                       : static_cast<double>(n_obs);
            covariance /= normalization;

            return ensure_symmetric(covariance);
        }

        Eigen::MatrixXd SampleCovariance::estimate_pairwise(const Eigen::MatrixXd &observations) const
        {
            const Eigen::Index n_obs = observations.rows();
            const Eigen::Index n_assets = observations.cols();
            const double nan = std::numeric_limits<double>::quiet_NaN();

            Eigen::MatrixXd covariance(n_assets, n_assets);

            for (Eigen::Index a = 0; a < n_assets; ++a)
            {
                for (Eigen::Index b = a; b < n_assets; ++b)
                {
                    // Means over the rows where both columns are present
                    double sum_a = 0.0;
                    double sum_b = 0.0;
                    Eigen::Index count = 0;

                    for (Eigen::Index t = 0; t < n_obs; ++t)
                    {
                        double x = observations(t, a);
                        double y = observations(t, b);
                        if (std::isnan(x) || std::isnan(y))
                            continue;
                        sum_a += x;
                        sum_b += y;
                        ++count;
                    }

                    const Eigen::Index dof = bias_correction_ ? count - 1 : count;
                    if (count < 2 || dof <= 0)
                    {
                        covariance(a, b) = nan;
                        covariance(b, a) = nan;
                        continue;
                    }

                    const double mean_a = sum_a / static_cast<double>(count);
                    const double mean_b = sum_b / static_cast<double>(count);

                    double cross = 0.0;
                    for (Eigen::Index t = 0; t < n_obs; ++t)
                    {
                        double x = observations(t, a);
                        double y = observations(t, b);
                        if (std::isnan(x) || std::isnan(y))
                            continue;
                        cross += (x - mean_a) * (y - mean_b);
                    }

                    const double value = cross / static_cast<double>(dof);
                    covariance(a, b) = value;
                    covariance(b, a) = value;
                }
            }

            return covariance;
        }

        std::string SampleCovariance::get_name() const
        {
            return "SampleCovariance";
        }

    } // namespace risk
} // namespace cemv
