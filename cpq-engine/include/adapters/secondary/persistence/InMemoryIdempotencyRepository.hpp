// include/adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp
#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <iostream>

namespace cpq::adapters::secondary {

class InMemoryIdempotencyRepository : public ports::output::IIdempotencyRepository {
public:
    InMemoryIdempotencyRepository() = default;

    std::optional<domain::IdempotencyRecord> find(const std::string& key) override {
        auto record = records_.find(key);
        return record ? std::optional(*record) : std::nullopt;
    }

    bool reserve(const domain::IdempotencyRecord& record) override {
        return records_.insertIfAbsent(record.key, std::make_shared<domain::IdempotencyRecord>(record));
    }

    void complete(const std::string& key, const domain::Timestamp& at) override {
        auto record = records_.find(key);
        if (!record || record->state != domain::IdempotencyState::COMMITTED) {
            return;
        }
        auto updated = std::make_shared<domain::IdempotencyRecord>(*record);
        updated->state = domain::IdempotencyState::COMPLETED;
        updated->updatedAt = at;
        records_.insert(key, updated);
    }

    void release(const std::string& key) override {
        auto record = records_.find(key);
        if (record && record->state == domain::IdempotencyState::RESERVED) {
            records_.remove(key);
        }
    }

    /// Запись результата в составе коммита InMemoryQuoteStore
    void save(const domain::IdempotencyRecord& record) {
        records_.insert(record.key, std::make_shared<domain::IdempotencyRecord>(record));
    }

    size_t size() const { return records_.size(); }

private:
    common::ThreadSafeMap<std::string, domain::IdempotencyRecord> records_;
};

} // namespace cpq::adapters::secondary
