#include "domain/Bundle.hpp"
#include <map>

namespace cpq::domain {

std::vector<BundleMismatch> checkComposition(const Bundle& bundle, const std::vector<QuoteLine>& lines) {
    std::map<std::string, int64_t> quantities;
    for (const auto& line : lines) {
        if (line.bundleId && *line.bundleId == bundle.id) {
            quantities[line.productId] += line.quantity;
        }
    }

    std::vector<BundleMismatch> mismatches;
    for (const auto& component : bundle.components) {
        auto it = quantities.find(component.productId);
        int64_t actual = it == quantities.end() ? 0 : it->second;

        BundleMismatch m{bundle.id, component.productId, BundleMismatchKind::MISSING_REQUIRED,
                         actual, component.minQuantity, component.maxQuantity};
        if (actual == 0) {
            if (component.required) {
                mismatches.push_back(m);
            }
            continue;
        }
        if (actual < component.minQuantity) {
            m.kind = BundleMismatchKind::BELOW_MIN;
            mismatches.push_back(m);
        } else if (component.maxQuantity && actual > *component.maxQuantity) {
            m.kind = BundleMismatchKind::ABOVE_MAX;
            mismatches.push_back(m);
        }
    }

    for (const auto& [productId, quantity] : quantities) {
        bool declared = false;
        for (const auto& component : bundle.components) {
            if (component.productId == productId) {
                declared = true;
                break;
            }
        }
        if (!declared) {
            mismatches.push_back({bundle.id, productId, BundleMismatchKind::UNEXPECTED_COMPONENT,
                                  quantity, 0, std::nullopt});
        }
    }
    return mismatches;
}

} // namespace cpq::domain
