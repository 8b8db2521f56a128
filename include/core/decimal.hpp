/**
 * @file decimal.hpp
 * @brief Exact decimal arithmetic used for cash amounts and percentages
 *
 * Cash and weight percentages are carried as 50-digit decimal floats so that
 * sums of broker amounts do not pick up binary rounding noise. Conversions
 * from double go through the shortest 15-significant-digit text form, which
 * turns 0.1 into exactly 0.1 instead of its binary expansion.
 */

#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <string>

namespace cemv
{
    namespace core
    {

        using Decimal = boost::multiprecision::cpp_dec_float_50;

        /**
         * @brief Convert a double to Decimal via its 15-digit text form
         * @throws std::invalid_argument if value is NaN or infinite
         */
        Decimal decimal_from_double(double value);

        /**
         * @brief Convert a Decimal back to double (nearest representable)
         */
        double decimal_to_double(const Decimal &value);

        /**
         * @brief Largest integer not greater than value
         * @throws std::overflow_error if the result does not fit in long long
         */
        long long decimal_floor(const Decimal &value);

        /**
         * @brief Fixed-point text with the given number of decimals
         */
        std::string decimal_to_string(const Decimal &value, int decimals = 2);

    } // namespace core
} // namespace cemv
