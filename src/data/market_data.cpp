/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "data/market_data.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>
#include <limits>

namespace cemv
{

    // ============================================================================
    // Constructors
    // ============================================================================

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }

        build_index_maps();

        if (ticker_index_.size() != tickers_.size())
        {
            throw std::invalid_argument("Duplicate symbol in price panel");
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    Eigen::VectorXd MarketData::get_prices(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return prices_.col(idx);
    }

    double MarketData::get_price(const std::string &ticker, const std::string &date) const
    {
        int ticker_idx = find_ticker_index(ticker);
        int date_idx = find_date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        return prices_(date_idx, ticker_idx);
    }

    Eigen::VectorXd MarketData::last_valid_prices() const
    {
        Eigen::VectorXd last = Eigen::VectorXd::Constant(
            prices_.cols(), std::numeric_limits<double>::quiet_NaN());

        for (Eigen::Index j = 0; j < prices_.cols(); ++j)
        {
            for (Eigen::Index i = prices_.rows() - 1; i >= 0; --i)
            {
                if (std::isfinite(prices_(i, j)))
                {
                    last(j) = prices_(i, j);
                    break;
                }
            }
        }

        return last;
    }

    // ===========================
    // Return Calculation
    // ===========================

    Eigen::MatrixXd MarketData::percent_change(int periods) const
    {
        if (periods < 1)
        {
            throw std::invalid_argument(
                "percent_change periods must be >= 1, got: " + std::to_string(periods));
        }

        Eigen::MatrixXd changes = Eigen::MatrixXd::Constant(
            prices_.rows(), prices_.cols(), std::numeric_limits<double>::quiet_NaN());

        for (Eigen::Index i = periods; i < prices_.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double p_t = prices_(i, j);
                double p_base = prices_(i - periods, j);

                // NaN propagates; a zero base yields +/-Inf or NaN as plain division does
                changes(i, j) = p_t / p_base - 1.0;
            }
        }

        return changes;
    }

    // ================================
    // Slicing
    // ================================

    MarketData MarketData::slice_rows(size_t start, size_t count) const
    {
        if (start + count > static_cast<size_t>(prices_.rows()))
        {
            throw std::out_of_range(
                "Row slice [" + std::to_string(start) + ", " + std::to_string(start + count) +
                ") exceeds panel of " + std::to_string(prices_.rows()) + " rows");
        }

        Eigen::MatrixXd block = prices_.block(
            static_cast<Eigen::Index>(start), 0,
            static_cast<Eigen::Index>(count), prices_.cols());

        std::vector<std::string> sliced_dates(dates_.begin() + start,
                                              dates_.begin() + start + count);

        return MarketData(block, sliced_dates, tickers_);
    }

    MarketData MarketData::filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const
    {
        int start_idx = find_date_index(start_date);
        int end_idx = find_date_index(end_date);

        if (start_idx < 0)
        {
            throw std::invalid_argument("Start date not found: " + start_date);
        }
        if (end_idx < 0)
        {
            throw std::invalid_argument("End date not found: " + end_date);
        }
        if (start_idx > end_idx)
        {
            throw std::invalid_argument("Start date must be before end date");
        }

        return slice_rows(static_cast<size_t>(start_idx),
                          static_cast<size_t>(end_idx - start_idx + 1));
    }

    MarketData MarketData::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        std::vector<int> indices;
        indices.reserve(selected_tickers.size());

        for (const auto &ticker : selected_tickers)
        {
            int idx = find_ticker_index(ticker);
            if (idx < 0)
            {
                throw std::invalid_argument("Ticker not found: " + ticker);
            }
            indices.push_back(idx);
        }

        Eigen::MatrixXd selected_prices(prices_.rows(), static_cast<Eigen::Index>(indices.size()));
        for (size_t i = 0; i < indices.size(); ++i)
        {
            selected_prices.col(static_cast<Eigen::Index>(i)) = prices_.col(indices[i]);
        }

        return MarketData(selected_prices, dates_, selected_tickers);
    }

    // ===================
    // Validation Methods
    // ===================

    bool MarketData::is_valid() const
    {
        if (prices_.rows() == 0 || prices_.cols() == 0)
        {
            return false;
        }
        if (dates_.size() != static_cast<size_t>(prices_.rows()))
        {
            return false;
        }
        if (tickers_.size() != static_cast<size_t>(prices_.cols()))
        {
            return false;
        }
        return std::is_sorted(dates_.begin(), dates_.end());
    }

    size_t MarketData::count_missing() const
    {
        return static_cast<size_t>(prices_.array().isNaN().count());
    }

    void MarketData::print_summary() const
    {
        std::cout << "\n=== Price Panel Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " symbols\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Symbols: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "==========================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    int MarketData::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it != ticker_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    int MarketData::find_date_index(const std::string &date) const
    {
        auto it = date_index_.find(date);
        if (it != date_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    void MarketData::build_index_maps()
    {
        date_index_.clear();
        ticker_index_.clear();

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            date_index_[dates_[i]] = i;
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            ticker_index_[tickers_[i]] = i;
        }
    }

} // namespace cemv
