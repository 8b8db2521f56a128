/**
 * @file decimal.cpp
 * @brief Decimal conversion helpers
 */

#include "core/decimal.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace cemv
{
    namespace core
    {

        Decimal decimal_from_double(double value)
        {
            if (!std::isfinite(value))
            {
                throw std::invalid_argument("Cannot convert non-finite value to decimal");
            }

            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<double>::digits10) << value;
            return Decimal(oss.str());
        }

        double decimal_to_double(const Decimal &value)
        {
            return value.convert_to<double>();
        }

        long long decimal_floor(const Decimal &value)
        {
            Decimal floored = boost::multiprecision::floor(value);

            if (floored > Decimal(std::numeric_limits<long long>::max()) ||
                floored < Decimal(std::numeric_limits<long long>::min()))
            {
                throw std::overflow_error("Decimal value out of integer range: " + floored.str());
            }

            return floored.convert_to<long long>();
        }

        std::string decimal_to_string(const Decimal &value, int decimals)
        {
            return value.str(decimals, std::ios_base::fixed);
        }

    } // namespace core
} // namespace cemv
