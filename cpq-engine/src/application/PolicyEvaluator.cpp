#include "application/PolicyEvaluator.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <map>
#include <ctime>

namespace cpq::application {

using domain::ApprovalThreshold;
using domain::Decimal;
using domain::PolicyDataMalformedException;
using domain::PolicyDecision;
using domain::PolicyStatus;
using domain::PolicyType;
using domain::PolicyViolation;
using domain::Quote;
using domain::QuotePricingSnapshot;
using domain::Timestamp;
using nlohmann::json;

namespace {

std::optional<Decimal> optionalDecimal(const json& condition, const char* key, const std::string& policyId) {
    auto it = condition.find(key);
    if (it == condition.end()) return std::nullopt;
    if (it->is_number_integer()) return Decimal::fromInt(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return Decimal::fromString(it->get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw PolicyDataMalformedException(policyId, std::string("'") + key + "': " + e.what());
        }
    }
    throw PolicyDataMalformedException(policyId, std::string("'") + key + "' must be a decimal string");
}

Decimal requireDecimal(const json& condition, const char* key, const std::string& policyId) {
    auto value = optionalDecimal(condition, key, policyId);
    if (!value) {
        throw PolicyDataMalformedException(policyId, std::string("'") + key + "' is required");
    }
    return *value;
}

std::optional<int64_t> optionalInt(const json& condition, const char* key, const std::string& policyId) {
    auto it = condition.find(key);
    if (it == condition.end()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw PolicyDataMalformedException(policyId, std::string("'") + key + "' must be an integer");
    }
    return it->get<int64_t>();
}

// Запрошенная скидка строки: процент строки (иначе котировки) плюс фиксированная сумма в процентах
Decimal lineRequestedPct(const Quote& quote, const domain::QuoteLine& line, const QuotePricingSnapshot& snapshot) {
    Decimal pct = line.discountPct ? *line.discountPct
                : quote.requestedDiscountPct() ? *quote.requestedDiscountPct()
                : Decimal::zero();
    if (line.discountAmount) {
        const auto* priced = snapshot.findLine(line.id);
        if (priced && !priced->subtotal.isZero()) {
            pct += *line.discountAmount * Decimal::hundred() / priced->subtotal;
        }
    }
    return pct;
}

Decimal requestedPctForCategory(const Quote& quote, const QuotePricingSnapshot& snapshot,
                                const std::string& category) {
    Decimal result = Decimal::zero();
    for (const auto& line : quote.lines()) {
        const auto* priced = snapshot.findLine(line.id);
        if (category != "*" && (!priced || priced->category != category)) continue;
        result = domain::max(result, lineRequestedPct(quote, line, snapshot));
    }
    return result;
}

/// Первый момент следующего календарного квартала (UTC)
Timestamp quarterEnd(const Timestamp& at) {
    std::time_t t = static_cast<std::time_t>(at.toUnixSeconds());
    std::tm tm = {};
    gmtime_r(&t, &tm);

    std::tm next = {};
    int quarterStartMonth = (tm.tm_mon / 3) * 3;
    next.tm_year = tm.tm_year;
    next.tm_mon = quarterStartMonth + 3;
    if (next.tm_mon >= 12) {
        next.tm_mon -= 12;
        next.tm_year += 1;
    }
    next.tm_mday = 1;
    return Timestamp::fromUnixSeconds(static_cast<int64_t>(timegm(&next)));
}

int familyRank(PolicyType type) {
    return static_cast<int>(type);
}

} // namespace

Decimal PolicyEvaluator::requestedDiscountPct(const Quote& quote, const QuotePricingSnapshot& snapshot) {
    return requestedPctForCategory(quote, snapshot, "*");
}

std::optional<Decimal> PolicyEvaluator::discountCapFor(const Quote& quote, const std::set<std::string>& categories) {
    std::optional<Decimal> cap;
    for (const auto& category : categories) {
        for (const auto& policy : policies_->activeDiscountPolicies(quote.segment(), category)) {
            if (!policy.active) continue;
            if (!cap || policy.maxAutoDiscountPct < *cap) {
                cap = policy.maxAutoDiscountPct;
            }
        }
    }
    return cap;
}

PolicyDecision PolicyEvaluator::evaluate(const Quote& quote, const QuotePricingSnapshot& snapshot,
                                         const Timestamp& at) {
    PolicyDecision decision;
    decision.snapshotId = snapshot.id;

    std::vector<Candidate> candidates;
    evaluateDiscountPolicies(quote, snapshot, decision, candidates);

    auto thresholds = policies_->activeApprovalThresholds(quote.segment());
    std::sort(thresholds.begin(), thresholds.end(), [](const ApprovalThreshold& a, const ApprovalThreshold& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.id < b.id;
    });

    for (const auto& threshold : thresholds) {
        if (!threshold.active) continue;

        json condition;
        try {
            condition = json::parse(threshold.condition);
        } catch (const json::parse_error& e) {
            throw PolicyDataMalformedException(threshold.id, e.what());
        }
        if (!condition.is_object()) {
            throw PolicyDataMalformedException(threshold.id, "condition must be a JSON object");
        }

        try {
            evaluateThreshold(threshold, condition, quote, snapshot, at, decision, candidates);
        } catch (const json::exception& e) {
            throw PolicyDataMalformedException(threshold.id, e.what());
        }
    }

    // Котировка с истёкшим сроком не может быть согласована
    if (quote.validUntil() && at > *quote.validUntil()) {
        Candidate expired;
        expired.violation.policyId = "builtin:quote_expired";
        expired.violation.policyType = PolicyType::TEMPORAL;
        expired.violation.code = "quote_expired";
        expired.violation.thresholdValue = Decimal::fromInt(quote.validUntil()->toUnixSeconds());
        expired.violation.actualValue = Decimal::fromInt(at.toUnixSeconds());
        expired.violation.blocking = true;
        candidates.push_back(std::move(expired));
    }

    resolveConflicts(candidates, decision);

    bool blocking = std::any_of(decision.violations.begin(), decision.violations.end(),
                                [](const PolicyViolation& v) { return v.blocking; });
    if (blocking) {
        decision.status = PolicyStatus::BLOCKED;
    } else if (!decision.violations.empty()) {
        decision.status = PolicyStatus::APPROVAL_REQUIRED;
    } else {
        decision.status = PolicyStatus::AUTO_APPROVED;
    }
    return decision;
}

void PolicyEvaluator::evaluateDiscountPolicies(const Quote& quote, const QuotePricingSnapshot& snapshot,
                                               PolicyDecision& decision, std::vector<Candidate>& candidates) {
    std::set<std::string> categories;
    for (const auto& line : snapshot.lines) {
        categories.insert(line.category);
    }

    std::map<std::string, domain::DiscountPolicy> applicable;
    for (const auto& category : categories) {
        for (const auto& policy : policies_->activeDiscountPolicies(quote.segment(), category)) {
            if (policy.active) applicable.emplace(policy.id, policy);
        }
    }

    for (const auto& [id, policy] : applicable) {
        if (!decision.discountCapPct || policy.maxAutoDiscountPct < *decision.discountCapPct) {
            decision.discountCapPct = policy.maxAutoDiscountPct;
        }

        Decimal actual = requestedPctForCategory(quote, snapshot, policy.category);
        if (actual <= policy.maxAutoDiscountPct) {
            decision.autoApprovedPolicies.push_back(id);
            continue;
        }
        if (policy.approverRole.empty()) {
            throw PolicyDataMalformedException(id, "discount policy has no approver role");
        }

        Candidate c;
        c.violation.policyId = id;
        c.violation.policyVersion = policy.version;
        c.violation.policyType = PolicyType::DISCOUNT_CAP;
        c.violation.code = "discount_above_cap";
        c.violation.thresholdValue = policy.maxAutoDiscountPct;
        c.violation.actualValue = actual;
        c.violation.requiredApproverRole = policy.approverRole;
        c.violation.approverLevel = policy.approverLevel;
        c.ceiling = policy.maxAutoDiscountPct;
        candidates.push_back(std::move(c));
    }
}

void PolicyEvaluator::evaluateThreshold(const ApprovalThreshold& threshold, const json& condition,
                                        const Quote& quote, const QuotePricingSnapshot& snapshot,
                                        const Timestamp& at, PolicyDecision& decision,
                                        std::vector<Candidate>& candidates) {
    auto trigger = [&](const std::string& code, const Decimal& limit, const Decimal& actual,
                       bool blocking, const Decimal& ceiling) {
        if (!blocking && threshold.approverRole.empty()) {
            throw PolicyDataMalformedException(threshold.id, "threshold has no approver role");
        }
        Candidate c;
        c.violation.policyId = threshold.id;
        c.violation.policyVersion = threshold.version;
        c.violation.policyType = threshold.type;
        c.violation.code = code;
        c.violation.thresholdValue = limit;
        c.violation.actualValue = actual;
        c.violation.blocking = blocking;
        if (!blocking) {
            c.violation.requiredApproverRole = threshold.approverRole;
            c.violation.approverLevel = threshold.approverLevel;
        }
        c.ceiling = ceiling;
        candidates.push_back(std::move(c));
        return &candidates.back();
    };

    switch (threshold.type) {
        case PolicyType::DEAL_SIZE: {
            Decimal minTotal = requireDecimal(condition, "min_total", threshold.id);
            if (snapshot.total >= minTotal) {
                trigger("deal_size_exceeded", minTotal, snapshot.total, false, minTotal);
            } else {
                decision.autoApprovedPolicies.push_back(threshold.id);
            }
            break;
        }

        case PolicyType::MARGIN_FLOOR: {
            Decimal minMargin = requireDecimal(condition, "min_margin_pct", threshold.id);
            auto blockBelow = optionalDecimal(condition, "block_below_pct", threshold.id);

            Decimal cost;
            bool complete = !snapshot.lines.empty();
            for (const auto& line : snapshot.lines) {
                if (!line.unitCost) {
                    complete = false;
                    break;
                }
                // Себестоимость масштабируется так же, как формула масштабирует цену ступени
                if (line.tierUnitPrice.isZero()) {
                    cost += *line.unitCost * Decimal::fromInt(line.quantity);
                } else {
                    cost += line.lineAmount * *line.unitCost / line.tierUnitPrice;
                }
            }
            if (!complete) {
                decision.notApplicablePolicies.push_back(threshold.id);
                break;
            }

            Decimal revenue = snapshot.subtotal - snapshot.discountTotal;
            Decimal margin = revenue.isZero()
                ? (cost.isZero() ? Decimal::zero() : -Decimal::hundred())
                : ((revenue - cost) * Decimal::hundred() / revenue).roundHalfEven(2);

            if (blockBelow && margin < *blockBelow) {
                trigger("margin_below_block", *blockBelow, margin, true, -*blockBelow);
            } else if (margin < minMargin) {
                trigger("margin_below_floor", minMargin, margin, false, -minMargin);
            } else {
                decision.autoApprovedPolicies.push_back(threshold.id);
            }
            break;
        }

        case PolicyType::PRODUCT: {
            auto productIt = condition.find("product_id");
            if (productIt == condition.end() || !productIt->is_string()) {
                throw PolicyDataMalformedException(threshold.id, "'product_id' must be a string");
            }
            std::string productId = productIt->get<std::string>();
            int64_t minQuantity = optionalInt(condition, "min_quantity", threshold.id).value_or(1);

            int64_t quantity = 0;
            for (const auto& line : quote.lines()) {
                if (line.productId == productId) quantity += line.quantity;
            }
            if (quantity == 0) {
                decision.notApplicablePolicies.push_back(threshold.id);
            } else if (quantity >= minQuantity) {
                auto* c = trigger("product_requires_approval", Decimal::fromInt(minQuantity),
                                  Decimal::fromInt(quantity), false, Decimal::fromInt(minQuantity));
                c->violation.productId = productId;
            } else {
                decision.autoApprovedPolicies.push_back(threshold.id);
            }
            break;
        }

        case PolicyType::TEMPORAL: {
            auto maxValidity = optionalInt(condition, "max_validity_days", threshold.id);
            auto periodEnd = optionalInt(condition, "period_end_days", threshold.id);
            if (!maxValidity && !periodEnd) {
                throw PolicyDataMalformedException(threshold.id,
                                                   "temporal threshold needs 'max_validity_days' or 'period_end_days'");
            }

            bool triggered = false;
            if (maxValidity && quote.validUntil()) {
                int64_t days = at.daysUntil(*quote.validUntil());
                if (days > *maxValidity) {
                    trigger("validity_too_long", Decimal::fromInt(*maxValidity), Decimal::fromInt(days),
                            false, Decimal::fromInt(*maxValidity));
                    triggered = true;
                }
            }
            if (!triggered && periodEnd) {
                int64_t days = at.daysUntil(quarterEnd(at));
                if (days <= *periodEnd) {
                    trigger("period_end_scrutiny", Decimal::fromInt(*periodEnd), Decimal::fromInt(days),
                            false, Decimal::fromInt(*periodEnd));
                    triggered = true;
                }
            }
            if (!triggered) {
                if (maxValidity && !periodEnd && !quote.validUntil()) {
                    decision.notApplicablePolicies.push_back(threshold.id);
                } else {
                    decision.autoApprovedPolicies.push_back(threshold.id);
                }
            }
            break;
        }

        case PolicyType::DISCOUNT_CAP: {
            auto blockAbove = optionalDecimal(condition, "block_above_pct", threshold.id);
            auto maxPct = optionalDecimal(condition, "max_pct", threshold.id);
            if (!blockAbove && !maxPct) {
                throw PolicyDataMalformedException(threshold.id, "discount threshold needs 'block_above_pct' or 'max_pct'");
            }

            Decimal actual = requestedDiscountPct(quote, snapshot);
            if (blockAbove && actual > *blockAbove) {
                trigger("discount_above_hard_limit", *blockAbove, actual, true, *blockAbove);
            } else if (maxPct && actual > *maxPct) {
                trigger("discount_above_cap", *maxPct, actual, false, *maxPct);
            } else {
                decision.autoApprovedPolicies.push_back(threshold.id);
            }
            break;
        }

        default:
            throw PolicyDataMalformedException(threshold.id, "unsupported threshold type");
    }
}

void PolicyEvaluator::resolveConflicts(std::vector<Candidate>& candidates, PolicyDecision& decision) {
    std::map<int, std::vector<Candidate>> families;
    for (auto& c : candidates) {
        families[familyRank(c.violation.policyType)].push_back(std::move(c));
    }

    for (auto& [rank, family] : families) {
        const bool discountFamily = rank == familyRank(PolicyType::DISCOUNT_CAP);
        std::sort(family.begin(), family.end(), [discountFamily](const Candidate& a, const Candidate& b) {
            if (a.violation.blocking != b.violation.blocking) return a.violation.blocking;
            if (discountFamily && a.ceiling != b.ceiling) return a.ceiling < b.ceiling;
            if (a.violation.approverLevel != b.violation.approverLevel) {
                return a.violation.approverLevel > b.violation.approverLevel;
            }
            if (a.ceiling != b.ceiling) return a.ceiling < b.ceiling;
            return a.violation.policyId < b.violation.policyId;
        });

        PolicyViolation winner = family.front().violation;
        for (size_t i = 1; i < family.size(); ++i) {
            // Потолок берётся у победителя, уровень согласования - наивысший из сработавших
            const auto& other = family[i].violation;
            if (!winner.blocking && !other.blocking && other.approverLevel > winner.approverLevel) {
                winner.approverLevel = other.approverLevel;
                winner.requiredApproverRole = other.requiredApproverRole;
            }
            const auto& loser = other.policyId;
            if (loser != winner.policyId &&
                std::find(winner.supersededPolicyIds.begin(), winner.supersededPolicyIds.end(), loser) ==
                    winner.supersededPolicyIds.end()) {
                winner.supersededPolicyIds.push_back(loser);
            }
        }
        std::sort(winner.supersededPolicyIds.begin(), winner.supersededPolicyIds.end());
        decision.violations.push_back(std::move(winner));
    }
}

} // namespace cpq::application
