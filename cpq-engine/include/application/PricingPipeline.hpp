// include/application/PricingPipeline.hpp
#pragma once

#include "ports/output/ICatalogRepository.hpp"
#include "settings/EngineSettings.hpp"
#include "domain/Quote.hpp"
#include "domain/QuotePricingSnapshot.hpp"
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::application {

/**
 * @brief Входные данные одного прохода ценообразования
 */
struct PricingRequest {
    std::string snapshotId;
    int64_t quoteVersion = 0;
    domain::Timestamp at;
    std::string actor;
    std::optional<domain::Decimal> discountCapPct;      ///< Потолок автоскидки от PolicyEvaluator
    std::vector<std::string> authorizedByApprovals;     ///< Непусто - потолок снят согласованием
};

/**
 * @brief Конвейер ценообразования
 *
 * Этапы идут строго по порядку, каждый пишет шаг трассы до начала следующего:
 * выбор прайс-листа, базовая цена, ступени объёма, скидка пакета, формула,
 * запрошенная скидка, налог, итоги. Любая ошибка прерывает проход целиком
 * (PricingDataMissingException), частичный снимок не создаётся.
 * Округление half-even один раз на границе строки.
 */
class PricingPipeline {
public:
    PricingPipeline(std::shared_ptr<ports::output::ICatalogRepository> catalog,
                    std::shared_ptr<settings::EngineSettings> settings)
        : catalog_(std::move(catalog))
        , settings_(std::move(settings)) {}

    domain::QuotePricingSnapshot price(const domain::Quote& quote, const PricingRequest& request);

private:
    struct LineWork;

    domain::PriceBook selectPriceBook(const domain::Quote& quote, const PricingRequest& request,
                                      domain::PricingTrace& trace);
    void lookupBasePrices(const domain::PriceBook& book, std::vector<LineWork>& work, domain::PricingTrace& trace);
    void applyVolumeTiers(std::vector<LineWork>& work, domain::PricingTrace& trace);
    void applyBundleDiscounts(const domain::Quote& quote, std::vector<LineWork>& work, domain::PricingTrace& trace);
    void applyFormulas(const domain::Quote& quote, std::vector<LineWork>& work, domain::PricingTrace& trace);
    void applyRequestedDiscounts(const domain::Quote& quote, const PricingRequest& request,
                                 std::vector<LineWork>& work, domain::PricingTrace& trace);
    void applyTax(const domain::Quote& quote, std::vector<LineWork>& work, domain::PricingTrace& trace);

    std::shared_ptr<ports::output::ICatalogRepository> catalog_;
    std::shared_ptr<settings::EngineSettings> settings_;
};

} // namespace cpq::application
