#include "domain/PriceBook.hpp"
#include "domain/Errors.hpp"

namespace cpq::domain {

void validateTiers(const PriceBookEntry& entry) {
    const std::string where = "price book " + entry.priceBookId + ", product " + entry.productId;

    if (entry.tiers.empty()) {
        return;
    }
    if (entry.tiers.front().minQuantity != 1) {
        throw InvariantViolationException("First volume tier must start at 1 (" + where + ")");
    }

    for (size_t i = 0; i < entry.tiers.size(); ++i) {
        const auto& tier = entry.tiers[i];
        bool last = i + 1 == entry.tiers.size();

        if (tier.unitPrice.isNegative()) {
            throw InvariantViolationException("Negative tier price " + tier.rangeString() + " (" + where + ")");
        }
        if (!tier.maxQuantity) {
            if (!last) {
                throw InvariantViolationException("Open-ended tier " + tier.rangeString() +
                                                  " must be last (" + where + ")");
            }
            continue;
        }
        if (*tier.maxQuantity <= tier.minQuantity) {
            throw InvariantViolationException("Empty tier " + tier.rangeString() + " (" + where + ")");
        }
        if (last) {
            throw InvariantViolationException("Last tier " + tier.rangeString() +
                                              " must be open-ended (" + where + ")");
        }

        const auto& next = entry.tiers[i + 1];
        if (next.minQuantity != *tier.maxQuantity) {
            throw InvariantViolationException("Tiers " + tier.rangeString() + " and " + next.rangeString() +
                                              " are not contiguous (" + where + ")");
        }
        if (next.unitPrice > tier.unitPrice) {
            throw InvariantViolationException("Tier " + next.rangeString() +
                                              " is more expensive than " + tier.rangeString() +
                                              " (" + where + ")");
        }
    }
}

} // namespace cpq::domain
