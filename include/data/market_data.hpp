/*
 * @file market_data.hpp
 * @brief Dated price panel storage and slicing.
 *
 * Holds adjusted close prices as an Eigen matrix (dates x symbols) with the
 * date and symbol labels that give the matrix its meaning. Every weight
 * vector produced downstream is aligned to the symbol order stored here.
 */

#ifndef CEMV_MARKET_DATA_HPP
#define CEMV_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace cemv
{
    /**
     * @class MarketData
     * @brief Container for a multi-asset adjusted price panel.
     *
     * @note Rows are trading dates in ascending order, columns are symbols.
     * @note Missing prices are represented as NaN values.
     */
    class MarketData
    {
    public:
        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x symbols).
         * @param dates Vector of date strings (YYYY-MM-DD).
         * @param tickers Vector of symbols.
         * @throws std::invalid_argument if label sizes do not match the matrix.
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        ~MarketData() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        /**
         * @brief Get the full price matrix (dates x symbols).
         */
        const Eigen::MatrixXd &get_prices() const
        {
            return prices_;
        }

        /**
         * @brief Get the price column of one symbol.
         * @throws std::invalid_argument if the symbol is unknown.
         */
        Eigen::VectorXd get_prices(const std::string &ticker) const;

        /**
         * @brief Get price for specific symbol and date.
         * @throws std::invalid_argument if symbol or date is unknown.
         */
        double get_price(const std::string &ticker, const std::string &date) const;

        /**
         * @brief Last finite price of every symbol (NaN if a column has none).
         */
        Eigen::VectorXd last_valid_prices() const;

        const std::vector<std::string> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return prices_.rows();
        }

        size_t num_assets() const
        {
            return prices_.cols();
        }

        bool has_ticker(const std::string &ticker) const
        {
            return find_ticker_index(ticker) >= 0;
        }

        /** ===========================================
         *  Return Calculation
         *  ===========================================
         */

        /**
         * @brief Percentage change over a fixed number of rows.
         *
         * r(t) = p(t) / p(t - periods) - 1. The first `periods` rows and any
         * row with a missing price are NaN. A zero base price gives +/-Inf
         * (NaN for 0/0), matching a plain element-wise division.
         *
         * @param periods Row lag (>= 1)
         * @return Matrix with the same shape as the price panel
         * @throws std::invalid_argument if periods < 1
         */
        Eigen::MatrixXd percent_change(int periods = 1) const;

        /** ===========================================
         *  Slicing
         *  ===========================================
         */

        /**
         * @brief Contiguous block of rows.
         * @param start First row index
         * @param count Number of rows
         * @throws std::out_of_range if the block exceeds the panel
         */
        MarketData slice_rows(size_t start, size_t count) const;

        /**
         * @brief Filter data by date range (both ends inclusive, must exist)
         */
        MarketData filter_by_date(const std::string &start_date,
                                  const std::string &end_date) const;

        /**
         * @brief Select a subset of symbols, in the order given.
         * @throws std::invalid_argument if a symbol is unknown.
         */
        MarketData select_assets(const std::vector<std::string> &selected_tickers) const;

        /** ===========================================
         *  Validation Methods
         *  ===========================================
         */
        bool is_valid() const;

        /**
         * @brief Number of NaN entries in the price matrix
         */
        size_t count_missing() const;

        void print_summary() const;

    private:
        int find_ticker_index(const std::string &ticker) const;
        int find_date_index(const std::string &date) const;
        void build_index_maps();

        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x symbols)
        std::vector<std::string> dates_;             ///< Date strings
        std::vector<std::string> tickers_;           ///< Symbols
        std::map<std::string, size_t> date_index_;   ///< Date to row
        std::map<std::string, size_t> ticker_index_; ///< Symbol to column
    };

}
#endif // CEMV_MARKET_DATA_HPP
