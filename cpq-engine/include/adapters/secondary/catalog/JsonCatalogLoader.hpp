// include/adapters/secondary/catalog/JsonCatalogLoader.hpp
#pragma once

#include "adapters/secondary/catalog/InMemoryCatalogRepository.hpp"
#include "adapters/secondary/catalog/InMemoryPolicyRepository.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace cpq::adapters::secondary {

/**
 * @brief Загрузка справочных данных (каталог и политики) из JSON
 *
 * Разделы документа: products, price_books, price_book_entries, formulas,
 * bundles, constraint_rules, discount_policies, approval_thresholds,
 * approver_authorities. Все разделы необязательны.
 * Ступени цен проверяются при загрузке (validateTiers).
 *
 * Условия правил и порогов хранятся как JSON-текст и разбираются только
 * при оценке: испорченное условие загружается и даёт ошибку данных позже.
 */
class JsonCatalogLoader {
public:
    JsonCatalogLoader(std::shared_ptr<InMemoryCatalogRepository> catalog,
                      std::shared_ptr<InMemoryPolicyRepository> policies);

    /**
     * @throws std::runtime_error если файл не открывается или не является JSON
     * @throws std::invalid_argument при неверной структуре записи
     * @throws domain::InvariantViolationException при неверных ступенях цен
     */
    void loadFile(const std::string& path);

    void load(const nlohmann::json& document);

private:
    std::shared_ptr<InMemoryCatalogRepository> catalog_;
    std::shared_ptr<InMemoryPolicyRepository> policies_;
};

} // namespace cpq::adapters::secondary
