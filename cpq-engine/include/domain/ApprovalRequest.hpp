// include/domain/ApprovalRequest.hpp
#pragma once

#include "domain/Timestamp.hpp"
#include "domain/JsonConversions.hpp"
#include "domain/enums/ApprovalStatus.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace cpq::domain {

/**
 * @brief Запрос на согласование одной роли
 *
 * approved/rejected/expired окончательны; следующий шаг цепочки
 * создаётся новым запросом.
 */
struct ApprovalRequest {
    std::string id;
    std::string quoteId;
    std::string chainId;
    int sequence = 1;
    std::string snapshotId;
    std::string approverRole;
    int approverLevel = 0;
    std::vector<std::string> policyIds;
    ApprovalStatus status = ApprovalStatus::PENDING;
    std::string requestedBy;
    std::string decidedBy;
    std::string comment;
    Timestamp createdAt;
    std::optional<Timestamp> decidedAt;
    std::optional<Timestamp> expiresAt;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["id"] = id;
        j["quote_id"] = quoteId;
        j["chain_id"] = chainId;
        j["sequence"] = sequence;
        j["snapshot_id"] = snapshotId;
        j["approver_role"] = approverRole;
        j["approver_level"] = approverLevel;
        j["policy_ids"] = policyIds;
        j["status"] = toString(status);
        j["requested_by"] = requestedBy;
        j["decided_by"] = decidedBy;
        j["comment"] = comment;
        j["created_at"] = createdAt;
        putOptional(j, "decided_at", decidedAt);
        putOptional(j, "expires_at", expiresAt);
        return j;
    }

    static ApprovalRequest fromJson(const nlohmann::json& j) {
        ApprovalRequest r;
        r.id = j.at("id").get<std::string>();
        r.quoteId = j.at("quote_id").get<std::string>();
        r.chainId = j.at("chain_id").get<std::string>();
        r.sequence = j.at("sequence").get<int>();
        r.snapshotId = j.value("snapshot_id", "");
        r.approverRole = j.at("approver_role").get<std::string>();
        r.approverLevel = j.value("approver_level", 0);
        r.policyIds = j.value("policy_ids", std::vector<std::string>{});
        r.status = approvalStatusFromString(j.at("status").get<std::string>());
        r.requestedBy = j.value("requested_by", "");
        r.decidedBy = j.value("decided_by", "");
        r.comment = j.value("comment", "");
        r.createdAt = j.at("created_at").get<Timestamp>();
        r.decidedAt = getOptional<Timestamp>(j, "decided_at");
        r.expiresAt = getOptional<Timestamp>(j, "expires_at");
        return r;
    }
};

/// Шаг цепочки: роль и политики, которые она покрывает
struct ApprovalStep {
    std::string role;
    int level = 0;
    std::vector<std::string> policyIds;
};

/**
 * @brief Последовательная цепочка согласований по возрастанию уровня
 *
 * Одновременно ожидает решения не более одного запроса.
 */
class ApprovalChain {
public:
    ApprovalChain() = default;

    /**
     * @brief Открыть цепочку и создать первый запрос
     * @throws InvariantViolationException для пустого списка шагов
     */
    static ApprovalChain start(const std::string& chainId, const std::string& quoteId,
                               const std::string& snapshotId, std::vector<ApprovalStep> steps,
                               const std::string& requestedBy, const Timestamp& at, int ttlHours);

    const std::string& id() const { return id_; }
    const std::string& quoteId() const { return quoteId_; }
    const std::string& snapshotId() const { return snapshotId_; }
    const std::vector<ApprovalStep>& steps() const { return steps_; }
    const std::vector<ApprovalRequest>& requests() const { return requests_; }

    const ApprovalRequest* pending() const;
    const ApprovalRequest* findRequest(const std::string& requestId) const;

    bool isComplete() const;
    bool isRejected() const;
    bool isOpen() const { return pending() != nullptr; }
    bool hasNextStep() const { return requests_.size() < steps_.size(); }
    const ApprovalStep* nextStep() const;

    /**
     * @brief Записать решение по ожидающему запросу
     * @throws InvariantViolationException если запрос не ожидает решения
     */
    void recordDecision(const std::string& requestId, bool approved, const std::string& approverId,
                        const std::string& comment, const Timestamp& at);

    /// Создать запрос для следующего шага
    const ApprovalRequest& spawnNext(const std::string& requestedBy, const Timestamp& at, int ttlHours);

    /// Перевести ожидающие запросы в expired
    std::vector<std::string> expirePending(const Timestamp& at);

    std::vector<std::string> approvedRequestIds() const;

    nlohmann::json toJson() const;
    static ApprovalChain fromJson(const nlohmann::json& j);

private:
    ApprovalRequest makeRequest(const ApprovalStep& step, const std::string& requestedBy,
                                const Timestamp& at, int ttlHours) const;

    std::string id_;
    std::string quoteId_;
    std::string snapshotId_;
    std::vector<ApprovalStep> steps_;
    std::vector<ApprovalRequest> requests_;
};

} // namespace cpq::domain
