// include/adapters/secondary/persistence/InMemoryAuditLog.hpp
#pragma once

#include "ports/output/IAuditLog.hpp"
#include "domain/AuditChain.hpp"
#include <map>
#include <mutex>

namespace cpq::adapters::secondary {

/**
 * @brief In-memory журнал аудита с цепочкой хешей по котировке
 */
class InMemoryAuditLog : public ports::output::IAuditLog {
public:
    InMemoryAuditLog() = default;

    domain::AuditEvent append(domain::AuditEvent event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& trail = trails_[event.quoteId];
        std::optional<domain::AuditEvent> previous;
        if (!trail.empty()) previous = trail.back();

        auto sealed = domain::AuditChain::seal(std::move(event), previous);
        trail.push_back(sealed);
        return sealed;
    }

    std::vector<domain::AuditEvent> eventsForQuote(const std::string& quoteId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trails_.find(quoteId);
        return it == trails_.end() ? std::vector<domain::AuditEvent>{} : it->second;
    }

    std::vector<domain::AuditEvent> query(const std::string& quoteId, domain::AuditCategory category) override {
        std::vector<domain::AuditEvent> result;
        for (auto& event : eventsForQuote(quoteId)) {
            if (event.category == category) result.push_back(std::move(event));
        }
        return result;
    }

    std::optional<domain::AuditEvent> lastEvent(const std::string& quoteId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trails_.find(quoteId);
        if (it == trails_.end() || it->second.empty()) return std::nullopt;
        return it->second.back();
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<domain::AuditEvent>> trails_;
};

} // namespace cpq::adapters::secondary
