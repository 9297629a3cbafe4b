// include/adapters/secondary/persistence/PostgresAuditLog.hpp
#pragma once

#include "ports/output/IAuditLog.hpp"
#include "domain/AuditChain.hpp"
#include "domain/Errors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace cpq::adapters::secondary
{

    /**
     * @brief Журнал аудита в PostgreSQL (таблица audit_events)
     *
     * Уникальность (quote_id, sequence) не даёт двум писателям продолжить
     * цепочку от одной и той же записи.
     */
    class PostgresAuditLog : public ports::output::IAuditLog
    {
    public:
        explicit PostgresAuditLog(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
        {
            pqxx::connection c(settings_->getConnectionString());
            std::cout << "[PostgresAuditLog] Connected to " << settings_->getName() << std::endl;
        }

        domain::AuditEvent append(domain::AuditEvent event) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto sealed = appendIn(t, std::move(event));
                t.commit();
                return sealed;
            }
            catch (const pqxx::unique_violation &e)
            {
                std::cerr << "[PostgresAuditLog] Concurrent append: " << e.what() << std::endl;
                throw domain::StorageException(std::string("audit append raced: ") + e.what());
            }
        }

        std::vector<domain::AuditEvent> eventsForQuote(const std::string &quoteId) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT document FROM audit_events WHERE quote_id=$1 ORDER BY sequence", quoteId);
            return toEvents(r);
        }

        std::vector<domain::AuditEvent> query(const std::string &quoteId, domain::AuditCategory category) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT document FROM audit_events WHERE quote_id=$1 AND category=$2 ORDER BY sequence",
                quoteId, domain::toString(category));
            return toEvents(r);
        }

        std::optional<domain::AuditEvent> lastEvent(const std::string &quoteId) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            return lastIn(t, quoteId);
        }

        /**
         * @brief Запечатать и вставить запись в рамках чужой транзакции
         *
         * Используется PostgresQuoteStore, чтобы аудит попадал в тот же коммит.
         */
        static domain::AuditEvent appendIn(pqxx::work &t, domain::AuditEvent event)
        {
            auto previous = lastIn(t, event.quoteId);
            auto sealed = domain::AuditChain::seal(std::move(event), previous);
            t.exec_params(
                "INSERT INTO audit_events (quote_id, sequence, id, event_type, category, outcome, "
                "occurred_at, prev_hash, hash, document) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10::jsonb)",
                sealed.quoteId,
                sealed.sequence,
                sealed.id,
                sealed.eventType,
                domain::toString(sealed.category),
                domain::toString(sealed.outcome),
                sealed.occurredAt.toString(),
                sealed.prevHash,
                sealed.hash,
                sealed.toJson().dump());
            return sealed;
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;

        static std::optional<domain::AuditEvent> lastIn(pqxx::work &t, const std::string &quoteId)
        {
            auto r = t.exec_params(
                "SELECT document FROM audit_events WHERE quote_id=$1 ORDER BY sequence DESC LIMIT 1",
                quoteId);
            if (r.empty())
                return std::nullopt;
            return domain::AuditEvent::fromJson(nlohmann::json::parse(r[0][0].as<std::string>()));
        }

        static std::vector<domain::AuditEvent> toEvents(const pqxx::result &r)
        {
            std::vector<domain::AuditEvent> events;
            events.reserve(r.size());
            for (const auto &row : r)
            {
                events.push_back(domain::AuditEvent::fromJson(nlohmann::json::parse(row[0].as<std::string>())));
            }
            return events;
        }
    };

} // namespace cpq::adapters::secondary
