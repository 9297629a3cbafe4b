#include "application/PricingPipeline.hpp"
#include "application/FormulaEvaluator.hpp"
#include "domain/Bundle.hpp"
#include "domain/Errors.hpp"
#include "domain/JsonConversions.hpp"
#include "utils/Sha256.hpp"
#include <algorithm>

namespace cpq::application {

using domain::Decimal;
using domain::PricingErrorCode;
using domain::PricingDataMissingException;
using domain::PricingTrace;
using domain::Quote;
using nlohmann::json;

struct PricingPipeline::LineWork {
    const domain::QuoteLine* line = nullptr;
    domain::Product product;
    domain::PriceBookEntry entry;
    domain::LinePricing pricing;
};

namespace {

// Наименьший шаг при данной точности: 0.01 для scale = 2
Decimal stepAtScale(int scale) {
    int32_t nano = 1;
    for (int i = scale; i < Decimal::MAX_SCALE; ++i) nano *= 10;
    return nano == Decimal::NANO_FACTOR ? Decimal::fromInt(1) : Decimal(0, nano);
}

} // namespace

domain::QuotePricingSnapshot PricingPipeline::price(const Quote& quote, const PricingRequest& request) {
    if (quote.lines().empty()) {
        throw PricingDataMissingException(PricingErrorCode::NO_LINES,
                                          "Quote " + quote.id() + " has no lines to price");
    }

    PricingTrace trace;

    // 1. Выбор прайс-листа
    domain::PriceBook book = selectPriceBook(quote, request, trace);

    std::vector<LineWork> work;
    for (const auto& line : quote.lines()) {
        LineWork w;
        w.line = &line;
        w.pricing.lineId = line.id;
        w.pricing.productId = line.productId;
        w.pricing.quantity = line.quantity;
        w.pricing.bundleId = line.bundleId;
        work.push_back(std::move(w));
    }
    std::stable_sort(work.begin(), work.end(), [](const LineWork& a, const LineWork& b) {
        return a.line->sortOrder < b.line->sortOrder;
    });

    // 2-7. Этапы по строкам
    lookupBasePrices(book, work, trace);
    applyVolumeTiers(work, trace);
    applyBundleDiscounts(quote, work, trace);
    applyFormulas(quote, work, trace);
    applyRequestedDiscounts(quote, request, work, trace);
    applyTax(quote, work, trace);

    domain::QuotePricingSnapshot snapshot;
    snapshot.id = request.snapshotId;
    snapshot.quoteId = quote.id();
    snapshot.quoteVersion = request.quoteVersion;
    snapshot.priceBookId = book.id;
    snapshot.currency = quote.currency();
    snapshot.discountCapPct = request.discountCapPct;
    snapshot.authorizedByApprovals = request.authorizedByApprovals;
    snapshot.taxFinal = false;
    snapshot.pricedAt = request.at;
    snapshot.pricedBy = request.actor;

    // Итоги: точные суммы округлённых значений строк
    for (auto& w : work) {
        snapshot.subtotal += w.pricing.subtotal;
        snapshot.discountTotal += w.pricing.discountAmount;
        snapshot.taxTotal += w.pricing.taxAmount;
        snapshot.lines.push_back(w.pricing);
    }
    snapshot.total = snapshot.subtotal - snapshot.discountTotal + snapshot.taxTotal;

    trace.append("totals", "",
                 {{"line_count", snapshot.lines.size()}},
                 {{"subtotal", snapshot.subtotal},
                  {"discount_total", snapshot.discountTotal},
                  {"tax_total", snapshot.taxTotal},
                  {"total", snapshot.total},
                  {"formula", "subtotal - discount_total + tax_total"}});

    // 8. Трасса сериализуется один раз
    snapshot.trace = trace;
    snapshot.traceJson = trace.toJson().dump();
    snapshot.traceDigest = utils::sha256Hex(snapshot.traceJson);
    return snapshot;
}

domain::PriceBook PricingPipeline::selectPriceBook(const Quote& quote, const PricingRequest& request,
                                                   PricingTrace& trace) {
    auto book = catalog_->selectPriceBook(quote.segment(), quote.region(), quote.currency(), request.at);
    if (!book) {
        throw PricingDataMissingException(
            PricingErrorCode::NO_APPLICABLE_PRICE_BOOK,
            "No applicable price book for segment=" + quote.segment() + " region=" + quote.region() +
            " currency=" + quote.currency(),
            "", "",
            quote.segment() + "/" + quote.region() + "/" + quote.currency() + "@" + request.at.toString());
    }

    trace.append("price_book_selection", "",
                 {{"segment", quote.segment()}, {"region", quote.region()},
                  {"currency", quote.currency()}, {"at", request.at}},
                 {{"price_book_id", book->id}, {"priority", book->priority}});
    return *book;
}

void PricingPipeline::lookupBasePrices(const domain::PriceBook& book, std::vector<LineWork>& work,
                                       PricingTrace& trace) {
    for (auto& w : work) {
        const auto& line = *w.line;

        auto product = catalog_->getProduct(line.productId);
        if (!product) {
            throw PricingDataMissingException(PricingErrorCode::MISSING_PRODUCT,
                                              "Product " + line.productId + " not found for line " + line.id,
                                              line.id, line.productId, line.productId);
        }
        auto entry = catalog_->getPriceBookEntry(book.id, line.productId);
        if (!entry) {
            throw PricingDataMissingException(PricingErrorCode::MISSING_PRICE_BOOK_ENTRY,
                                              "No price book entry in " + book.id + " for product " +
                                              line.productId + " (line " + line.id + ")",
                                              line.id, line.productId, book.id + "/" + line.productId);
        }

        w.product = *product;
        w.entry = *entry;
        w.pricing.category = product->category;
        w.pricing.listPrice = entry->listPrice;
        w.pricing.unitCost = entry->unitCost;
        w.pricing.formulaId = entry->formulaId;

        trace.append("base_price", line.id,
                     {{"product_id", line.productId}, {"price_book_id", book.id},
                      {"product_revision", line.productRevision}},
                     {{"list_price", entry->listPrice}});
    }
}

void PricingPipeline::applyVolumeTiers(std::vector<LineWork>& work, PricingTrace& trace) {
    for (auto& w : work) {
        const auto& line = *w.line;

        if (w.entry.tiers.empty()) {
            w.pricing.tierUnitPrice = w.entry.listPrice;
            trace.append("volume_tier", line.id,
                         {{"quantity", line.quantity}, {"tiers", 0}},
                         {{"unit_price", w.pricing.tierUnitPrice}, {"tier", "none"}});
            continue;
        }

        const domain::VolumeTier* tier = w.entry.findTier(line.quantity);
        if (!tier) {
            // Ступени проверены при загрузке, разрыв здесь - дефект данных
            throw PricingDataMissingException(PricingErrorCode::TIER_GAP,
                                              "No volume tier covers quantity " + std::to_string(line.quantity) +
                                              " for product " + line.productId + " (line " + line.id + ")",
                                              line.id, line.productId,
                                              w.entry.priceBookId + "/" + line.productId);
        }

        w.pricing.tierUnitPrice = tier->unitPrice;
        trace.append("volume_tier", line.id,
                     {{"quantity", line.quantity}, {"tiers", w.entry.tiers.size()}},
                     {{"unit_price", tier->unitPrice}, {"tier", tier->rangeString()}});
    }
}

void PricingPipeline::applyBundleDiscounts(const Quote& quote, std::vector<LineWork>& work,
                                           PricingTrace& trace) {
    for (auto& w : work) {
        const auto& line = *w.line;
        w.pricing.unitPrice = w.pricing.tierUnitPrice;
        if (!line.bundleId) continue;

        auto bundle = catalog_->getBundle(*line.bundleId);
        if (!bundle) {
            throw PricingDataMissingException(PricingErrorCode::MISSING_BUNDLE,
                                              "Bundle " + *line.bundleId + " not found for line " + line.id,
                                              line.id, line.productId, *line.bundleId);
        }

        // Состав проверяется заново: предпросмотр может идти без проверки конфигурации
        bool satisfied = domain::checkComposition(*bundle, quote.lines()).empty();
        if (satisfied) {
            w.pricing.unitPrice = w.pricing.tierUnitPrice - w.pricing.tierUnitPrice.percentOf(bundle->discountPct);
        }

        trace.append("bundle_discount", line.id,
                     {{"bundle_id", bundle->id}, {"discount_pct", bundle->discountPct},
                      {"unit_price", w.pricing.tierUnitPrice}},
                     {{"composition_satisfied", satisfied}, {"applied", satisfied},
                      {"unit_price", w.pricing.unitPrice}});
    }
}

void PricingPipeline::applyFormulas(const Quote& quote, std::vector<LineWork>& work, PricingTrace& trace) {
    const int scale = settings_->getCurrencyScale();

    for (auto& w : work) {
        const auto& line = *w.line;
        Decimal quantity = Decimal::fromInt(line.quantity);

        json inputs = {{"unit_price", w.pricing.unitPrice}, {"quantity", line.quantity}};
        if (!w.entry.formulaId) {
            w.pricing.lineAmount = w.pricing.unitPrice * quantity;
            inputs["expression"] = "unit_price * quantity";
        } else {
            auto formula = catalog_->getFormula(*w.entry.formulaId);
            if (!formula) {
                throw PricingDataMissingException(PricingErrorCode::MISSING_FORMULA,
                                                  "Formula " + *w.entry.formulaId + " not found for line " + line.id,
                                                  line.id, line.productId, *w.entry.formulaId);
            }

            std::optional<Decimal> termMonths;
            if (quote.termMonths()) termMonths = Decimal::fromInt(*quote.termMonths());

            FormulaEvaluator::Variables variables = {
                {"unit_price", w.pricing.unitPrice},
                {"list_price", w.pricing.listPrice},
                {"quantity", quantity},
                {"term_months", termMonths},
                {"segment_factor", settings_->getSegmentFactor(quote.segment())}
            };

            try {
                w.pricing.lineAmount = FormulaEvaluator::evaluate(formula->expression, variables);
            } catch (const FormulaException& e) {
                auto code = e.reason() == FormulaException::Reason::MISSING_VALUE
                    ? PricingErrorCode::MISSING_INPUT
                    : PricingErrorCode::FORMULA_ERROR;
                throw PricingDataMissingException(code, e.what() + std::string(" (line ") + line.id + ")",
                                                  line.id, line.productId,
                                                  e.symbol().empty() ? formula->id : e.symbol());
            }

            if (w.pricing.lineAmount.isNegative()) {
                throw PricingDataMissingException(PricingErrorCode::FORMULA_ERROR,
                                                  "Formula " + formula->id + " produced a negative amount for line " + line.id,
                                                  line.id, line.productId, formula->id);
            }

            inputs["formula_id"] = formula->id;
            inputs["expression"] = formula->expression;
            json vars = json::object();
            for (const auto& [name, value] : variables) {
                vars[name] = value ? json(*value) : json(nullptr);
            }
            inputs["variables"] = vars;
        }

        // Единственная точка округления суммы строки
        w.pricing.subtotal = w.pricing.lineAmount.roundHalfEven(scale);

        trace.append("formula", line.id, inputs,
                     {{"pre_rounding", w.pricing.lineAmount},
                      {"subtotal", w.pricing.subtotal},
                      {"rounding", "half_even"}, {"scale", scale}});
    }
}

void PricingPipeline::applyRequestedDiscounts(const Quote& quote, const PricingRequest& request,
                                              std::vector<LineWork>& work, PricingTrace& trace) {
    const int scale = settings_->getCurrencyScale();
    const bool authorized = !request.authorizedByApprovals.empty();

    for (auto& w : work) {
        const auto& line = *w.line;

        Decimal requestedPct = line.discountPct ? *line.discountPct
                             : quote.requestedDiscountPct() ? *quote.requestedDiscountPct()
                             : Decimal::zero();
        Decimal fixedAmount = line.discountAmount ? *line.discountAmount : Decimal::zero();

        Decimal appliedPct = requestedPct;
        bool capped = false;
        std::optional<Decimal> maxAllowed;
        if (request.discountCapPct && !authorized) {
            if (appliedPct > *request.discountCapPct) {
                appliedPct = *request.discountCapPct;
                capped = true;
            }
            maxAllowed = w.pricing.subtotal.percentOf(*request.discountCapPct);
        }

        Decimal preRounding = w.pricing.subtotal.percentOf(appliedPct) + fixedAmount;
        if (maxAllowed && preRounding > *maxAllowed) {
            preRounding = *maxAllowed;
            capped = true;
        }
        if (preRounding > w.pricing.subtotal) {
            preRounding = w.pricing.subtotal;
            capped = true;
        }

        Decimal discount = preRounding.roundHalfEven(scale);
        if (maxAllowed && discount > *maxAllowed) {
            discount = discount - stepAtScale(scale);
        }

        w.pricing.discountPct = appliedPct;
        w.pricing.discountAmount = discount;

        json inputs = {{"requested_pct", requestedPct}, {"fixed_amount", fixedAmount},
                       {"subtotal", w.pricing.subtotal}};
        if (request.discountCapPct) inputs["cap_pct"] = *request.discountCapPct;
        if (authorized) inputs["authorized_by"] = request.authorizedByApprovals;

        trace.append("requested_discount", line.id, inputs,
                     {{"applied_pct", appliedPct}, {"pre_rounding", preRounding},
                      {"discount_amount", discount}, {"capped", capped}});
    }
}

void PricingPipeline::applyTax(const Quote& quote, std::vector<LineWork>& work, PricingTrace& trace) {
    const int scale = settings_->getCurrencyScale();
    const Decimal rate = settings_->getTaxRate(quote.region());

    json lines = json::array();
    for (auto& w : work) {
        Decimal taxable = w.pricing.subtotal - w.pricing.discountAmount;
        Decimal preRounding = taxable.percentOf(rate);
        w.pricing.taxAmount = preRounding.roundHalfEven(scale);
        lines.push_back({{"line_id", w.pricing.lineId}, {"taxable", taxable},
                         {"pre_rounding", preRounding}, {"tax_amount", w.pricing.taxAmount}});
    }

    trace.append("tax", "",
                 {{"region", quote.region()}, {"rate_pct", rate}},
                 {{"lines", lines}, {"final", false}, {"method", "fixed_rate_stub"}});
}

} // namespace cpq::application
