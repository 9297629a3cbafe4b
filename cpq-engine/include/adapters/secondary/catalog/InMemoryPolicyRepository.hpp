// include/adapters/secondary/catalog/InMemoryPolicyRepository.hpp
#pragma once

#include "ports/output/IPolicyRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <memory>

namespace cpq::adapters::secondary {

/**
 * @brief In-memory политики: потолки скидок, пороги согласования, полномочия
 */
class InMemoryPolicyRepository : public ports::output::IPolicyRepository {
public:
    InMemoryPolicyRepository() = default;

    void addDiscountPolicy(const domain::DiscountPolicy& policy) {
        discountPolicies_.insert(policy.id, std::make_shared<domain::DiscountPolicy>(policy));
    }

    void addApprovalThreshold(const domain::ApprovalThreshold& threshold) {
        thresholds_.insert(threshold.id, std::make_shared<domain::ApprovalThreshold>(threshold));
    }

    void addApproverAuthority(const domain::ApproverAuthority& authority) {
        authorities_.insert(authority.role, std::make_shared<domain::ApproverAuthority>(authority));
    }

    std::vector<domain::DiscountPolicy> activeDiscountPolicies(const std::string& segment,
                                                               const std::string& category) override {
        auto found = discountPolicies_.values([&](const domain::DiscountPolicy& p) {
            return p.active &&
                   (p.segment == "*" || p.segment == segment) &&
                   (p.category == "*" || p.category == category);
        });
        return sorted(found, [](const domain::DiscountPolicy& a, const domain::DiscountPolicy& b) {
            if (a.priority != b.priority) return a.priority < b.priority;
            return a.id < b.id;
        });
    }

    std::vector<domain::ApprovalThreshold> activeApprovalThresholds(const std::string& segment) override {
        auto found = thresholds_.values([&](const domain::ApprovalThreshold& t) {
            return t.active && (t.segment == "*" || t.segment == segment);
        });
        return sorted(found, [](const domain::ApprovalThreshold& a, const domain::ApprovalThreshold& b) {
            if (a.priority != b.priority) return a.priority < b.priority;
            return a.id < b.id;
        });
    }

    std::optional<domain::ApproverAuthority> findApproverAuthority(const std::string& role) override {
        auto authority = authorities_.find(role);
        return authority ? std::optional(*authority) : std::nullopt;
    }

private:
    template <typename T, typename Less>
    static std::vector<T> sorted(const std::vector<std::shared_ptr<T>>& items, Less less) {
        std::vector<T> out;
        out.reserve(items.size());
        for (const auto& item : items) {
            out.push_back(*item);
        }
        std::sort(out.begin(), out.end(), less);
        return out;
    }

    common::ThreadSafeMap<std::string, domain::DiscountPolicy> discountPolicies_;
    common::ThreadSafeMap<std::string, domain::ApprovalThreshold> thresholds_;
    common::ThreadSafeMap<std::string, domain::ApproverAuthority> authorities_;
};

} // namespace cpq::adapters::secondary
