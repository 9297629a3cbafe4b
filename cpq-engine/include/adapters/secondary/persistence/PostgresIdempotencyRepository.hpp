// include/adapters/secondary/persistence/PostgresIdempotencyRepository.hpp
#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace cpq::adapters::secondary
{

    class PostgresIdempotencyRepository : public ports::output::IIdempotencyRepository
    {
    public:
        explicit PostgresIdempotencyRepository(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
        {
            // Проверяем соединение, но не создаём таблицу
            pqxx::connection c(settings_->getConnectionString());
            std::cout << "[IdempotencyRepo] Connected to " << settings_->getName() << std::endl;
        }

        std::optional<domain::IdempotencyRecord> find(const std::string &key) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT key, quote_id, operation, state, result_json, outbox, created_at, updated_at "
                "FROM idempotency_keys WHERE key=$1",
                key);
            if (r.empty())
                return std::nullopt;

            domain::IdempotencyRecord record;
            record.key = r[0][0].as<std::string>();
            record.quoteId = r[0][1].as<std::string>();
            record.operation = r[0][2].as<std::string>();
            record.state = domain::idempotencyStateFromString(r[0][3].as<std::string>());
            record.resultJson = r[0][4].as<std::string>();
            record.outbox = outboxFromJson(nlohmann::json::parse(r[0][5].as<std::string>()));
            record.createdAt = domain::Timestamp::fromString(r[0][6].as<std::string>());
            record.updatedAt = domain::Timestamp::fromString(r[0][7].as<std::string>());
            return record;
        }

        bool reserve(const domain::IdempotencyRecord &record) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "INSERT INTO idempotency_keys (key, quote_id, operation, state, result_json, outbox, "
                "created_at, updated_at) VALUES ($1, $2, $3, $4, '', '[]'::jsonb, $5, $5) "
                "ON CONFLICT (key) DO NOTHING",
                record.key,
                record.quoteId,
                record.operation,
                domain::toString(domain::IdempotencyState::RESERVED),
                record.createdAt.toString());
            t.commit();
            return r.affected_rows() == 1;
        }

        void complete(const std::string &key, const domain::Timestamp &at) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec_params(
                "UPDATE idempotency_keys SET state=$2, updated_at=$3 WHERE key=$1 AND state=$4",
                key,
                domain::toString(domain::IdempotencyState::COMPLETED),
                at.toString(),
                domain::toString(domain::IdempotencyState::COMMITTED));
            t.commit();
            std::cout << "[IdempotencyRepo] Completed key: " << key << std::endl;
        }

        void release(const std::string &key) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec_params(
                "DELETE FROM idempotency_keys WHERE key=$1 AND state=$2",
                key, domain::toString(domain::IdempotencyState::RESERVED));
            t.commit();
        }

        /**
         * @brief Перевести ключ в COMMITTED в рамках транзакции коммита котировки
         */
        static void saveIn(pqxx::work &t, const domain::IdempotencyRecord &record)
        {
            t.exec_params(
                "INSERT INTO idempotency_keys (key, quote_id, operation, state, result_json, outbox, "
                "created_at, updated_at) VALUES ($1, $2, $3, $4, $5, $6::jsonb, $7, $8) "
                "ON CONFLICT (key) DO UPDATE SET state=EXCLUDED.state, result_json=EXCLUDED.result_json, "
                "outbox=EXCLUDED.outbox, updated_at=EXCLUDED.updated_at",
                record.key,
                record.quoteId,
                record.operation,
                domain::toString(record.state),
                record.resultJson,
                outboxToJson(record.outbox).dump(),
                record.createdAt.toString(),
                record.updatedAt.toString());
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;

        static nlohmann::json outboxToJson(const std::vector<domain::OutboxMessage> &outbox)
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &m : outbox)
            {
                arr.push_back({{"routing_key", m.routingKey}, {"message", m.message}});
            }
            return arr;
        }

        static std::vector<domain::OutboxMessage> outboxFromJson(const nlohmann::json &arr)
        {
            std::vector<domain::OutboxMessage> outbox;
            for (const auto &m : arr)
            {
                outbox.push_back({m.at("routing_key").get<std::string>(), m.at("message").get<std::string>()});
            }
            return outbox;
        }
    };

} // namespace cpq::adapters::secondary
