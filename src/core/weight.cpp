/**
 * @file weight.cpp
 * @brief Implementation of Weight value type
 */

#include "core/weight.hpp"
#include <stdexcept>

namespace cemv
{
    namespace core
    {

        Weight::Weight(const Decimal &percentage)
            : percentage_(percentage)
        {
            if (percentage_ < 0 || percentage_ > 100)
            {
                throw std::invalid_argument(
                    "Weight must be between 0 and 100, got: " + decimal_to_string(percentage_, 6));
            }
        }

        Weight Weight::from_double(double percentage)
        {
            return Weight(decimal_from_double(percentage));
        }

        double Weight::to_double() const
        {
            return decimal_to_double(percentage_);
        }

        nlohmann::json Weight::to_json() const
        {
            return nlohmann::json{{"percentage", to_double()}};
        }

    } // namespace core
} // namespace cemv
