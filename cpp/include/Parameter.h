#pragma once
/**
 * @file Parameter.h
 * @brief One uncertain model input, sampled uniformly over [min,max] for PSA.
 */
#include <cctype>
#include <string>

#include "Errors.h"

namespace ipsim {
    /**
     * @brief One PSA dimension, fixed or ranged.
     *
     * The name becomes a variable usable in transition and state-value expressions.
     */
    struct Parameter {
        std::string name; /**< variable name in expressions */
        double min; /**< lower bound */
        double max; /**< upper bound */

        /**
         * @brief Construct one parameter.
         * @param name_  identifier: letter first, then letters, digits or '_'
         * @param min_   minimum permitted value
         * @param max_   maximum permitted value
         * @throws ConfigurationError if the name is not an identifier or min_ > max_
         */
        Parameter(const std::string& name_, const double min_, const double max_): name(name_), min(min_), max(max_) {
            if (name.empty() || !std::isalpha(static_cast<unsigned char>(name.front())))
                throw ConfigurationError("Parameter: '" + name + "' is not a valid identifier");
            for (const char c : name)
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
                    throw ConfigurationError("Parameter: '" + name + "' is not a valid identifier");
            if (min > max) throw ConfigurationError("Parameter: min must be <= max for " + name);
        }

        /** @brief Is this parameter “fixed” (min == max)? */
        bool isFixed() const noexcept { return min == max; }

        /** @brief Map a unit-interval coordinate onto [min, max]. */
        double at(const double u) const noexcept { return min + u * (max - min); }
    };
}
