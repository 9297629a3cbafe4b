// include/domain/Product.hpp
#pragma once

#include <string>
#include <map>
#include <stdexcept>

namespace cpq::domain {

enum class ProductType {
    SIMPLE,
    CONFIGURABLE,
    BUNDLE
};

inline std::string toString(ProductType type) {
    switch (type) {
        case ProductType::SIMPLE: return "simple";
        case ProductType::CONFIGURABLE: return "configurable";
        case ProductType::BUNDLE: return "bundle";
        default: return "unknown";
    }
}

inline ProductType productTypeFromString(const std::string& str) {
    if (str == "simple") return ProductType::SIMPLE;
    if (str == "configurable") return ProductType::CONFIGURABLE;
    if (str == "bundle") return ProductType::BUNDLE;
    throw std::invalid_argument("Unknown product type: " + str);
}

/**
 * @brief Товар каталога (справочные данные, только чтение)
 */
struct Product {
    std::string id;
    std::string sku;
    std::string name;
    std::string category;
    ProductType type = ProductType::SIMPLE;
    int revision = 1;                               ///< Ревизия, закрепляемая в строке котировки
    bool active = true;
    std::map<std::string, std::string> attributes;  ///< Значения атрибутов по умолчанию
};

} // namespace cpq::domain
