/**
 * @file weight.hpp
 * @brief Bounded percentage weight (0 to 100)
 */

#pragma once

#include "core/decimal.hpp"
#include <nlohmann/json.hpp>

namespace cemv
{
    namespace core
    {

        /**
         * @class Weight
         * @brief Portfolio weight expressed in percent, validated at construction
         */
        class Weight
        {
        public:
            /**
             * @brief Construct from a percentage
             * @param percentage Value in [0, 100]
             * @throws std::invalid_argument if percentage is outside [0, 100]
             */
            explicit Weight(const Decimal &percentage = Decimal(0));

            /**
             * @brief Construct from a double percentage
             * @throws std::invalid_argument if value is not finite or out of range
             */
            static Weight from_double(double percentage);

            const Decimal &percentage() const { return percentage_; }

            double to_double() const;

            nlohmann::json to_json() const;

        private:
            Decimal percentage_;
        };

    } // namespace core
} // namespace cemv
