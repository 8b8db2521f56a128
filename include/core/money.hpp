/**
 * @file money.hpp
 * @brief Immutable monetary amount with currency
 *
 * Money is a value type: every operation returns a new instance. Arithmetic
 * between two amounts requires equal currency codes; a mismatch is a
 * contract violation reported as CurrencyMismatchError.
 */

#pragma once

#include "core/decimal.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace cemv
{
    namespace core
    {

        /**
         * @brief Raised when two Money values with different currencies are combined
         */
        class CurrencyMismatchError : public std::invalid_argument
        {
        public:
            CurrencyMismatchError(const std::string &operation,
                                  const std::string &lhs,
                                  const std::string &rhs);
        };

        /**
         * @class Money
         * @brief Exact decimal amount tagged with an ISO-like currency code
         *
         * Usage Example:
         * @code
         * Money cash = Money::from_double(1500000.0);
         * Money fee = Money(Decimal("2500"));
         * Money net = cash.minus(fee);
         * Money lot = Money::from_double(25300.0).times(100);
         * @endcode
         */
        class Money
        {
        public:
            static const char *const DEFAULT_CURRENCY;

            /**
             * @brief Construct from an exact decimal amount
             * @param amount Amount
             * @param currency Currency code (default "VND")
             * @throws std::invalid_argument if currency is empty
             */
            explicit Money(const Decimal &amount = Decimal(0),
                           const std::string &currency = DEFAULT_CURRENCY);

            /**
             * @brief Construct from a double (via its 15-digit decimal form)
             * @throws std::invalid_argument if amount is not finite
             */
            static Money from_double(double amount,
                                     const std::string &currency = DEFAULT_CURRENCY);

            const Decimal &amount() const { return amount_; }
            const std::string &currency() const { return currency_; }

            /**
             * @brief Sum of two amounts
             * @throws CurrencyMismatchError if currencies differ
             */
            Money plus(const Money &other) const;

            /**
             * @brief Difference of two amounts
             * @throws CurrencyMismatchError if currencies differ
             */
            Money minus(const Money &other) const;

            /**
             * @brief Scale by a decimal factor
             */
            Money times(const Decimal &factor) const;

            /**
             * @brief Scale by a double factor (converted through decimal text)
             */
            Money times(double factor) const;

            /**
             * @brief Scale by an integer quantity (exact)
             */
            Money times(long long quantity) const;

            bool is_positive() const { return amount_ > 0; }
            bool is_zero() const { return amount_ == 0; }

            /**
             * @brief Equal amount and currency
             */
            bool equals(const Money &other) const;

            double to_double() const;

            nlohmann::json to_json() const;

        private:
            Decimal amount_;
            std::string currency_;

            void require_same_currency(const Money &other, const std::string &operation) const;
        };

    } // namespace core
} // namespace cemv
