/**
 * @file money.cpp
 * @brief Implementation of Money value type
 */

#include "core/money.hpp"

namespace cemv
{
    namespace core
    {

        CurrencyMismatchError::CurrencyMismatchError(const std::string &operation,
                                                     const std::string &lhs,
                                                     const std::string &rhs)
            : std::invalid_argument("Cannot " + operation + " different currencies: " +
                                    lhs + " vs " + rhs)
        {
        }

        const char *const Money::DEFAULT_CURRENCY = "VND";

        Money::Money(const Decimal &amount, const std::string &currency)
            : amount_(amount), currency_(currency)
        {
            if (currency_.empty())
            {
                throw std::invalid_argument("Currency code must not be empty");
            }
        }

        Money Money::from_double(double amount, const std::string &currency)
        {
            return Money(decimal_from_double(amount), currency);
        }

        void Money::require_same_currency(const Money &other, const std::string &operation) const
        {
            if (currency_ != other.currency_)
            {
                throw CurrencyMismatchError(operation, currency_, other.currency_);
            }
        }

        Money Money::plus(const Money &other) const
        {
            require_same_currency(other, "add");
            return Money(amount_ + other.amount_, currency_);
        }

        Money Money::minus(const Money &other) const
        {
            require_same_currency(other, "subtract");
            return Money(amount_ - other.amount_, currency_);
        }

        Money Money::times(const Decimal &factor) const
        {
            return Money(amount_ * factor, currency_);
        }

        Money Money::times(double factor) const
        {
            return times(decimal_from_double(factor));
        }

        Money Money::times(long long quantity) const
        {
            return Money(amount_ * Decimal(quantity), currency_);
        }

        bool Money::equals(const Money &other) const
        {
            return currency_ == other.currency_ && amount_ == other.amount_;
        }

        double Money::to_double() const
        {
            return decimal_to_double(amount_);
        }

        nlohmann::json Money::to_json() const
        {
            return nlohmann::json{
                {"amount", to_double()},
                {"currency", currency_}};
        }

    } // namespace core
} // namespace cemv
