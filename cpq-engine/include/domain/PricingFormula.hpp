// include/domain/PricingFormula.hpp
#pragma once

#include <string>

namespace cpq::domain {

/**
 * @brief Хранимое выражение цены строки
 *
 * Переменные: unit_price, list_price, quantity, term_months, segment_factor.
 */
struct PricingFormula {
    std::string id;
    std::string name;
    std::string expression;
    int version = 1;
};

} // namespace cpq::domain
