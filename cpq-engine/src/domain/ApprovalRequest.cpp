#include "domain/ApprovalRequest.hpp"
#include "domain/Errors.hpp"

namespace cpq::domain {

ApprovalChain ApprovalChain::start(const std::string& chainId, const std::string& quoteId,
                                   const std::string& snapshotId, std::vector<ApprovalStep> steps,
                                   const std::string& requestedBy, const Timestamp& at, int ttlHours) {
    if (steps.empty()) {
        throw InvariantViolationException("Approval chain for quote " + quoteId + " has no steps");
    }
    ApprovalChain chain;
    chain.id_ = chainId;
    chain.quoteId_ = quoteId;
    chain.snapshotId_ = snapshotId;
    chain.steps_ = std::move(steps);
    chain.requests_.push_back(chain.makeRequest(chain.steps_.front(), requestedBy, at, ttlHours));
    return chain;
}

const ApprovalRequest* ApprovalChain::pending() const {
    for (const auto& r : requests_) {
        if (r.status == ApprovalStatus::PENDING) return &r;
    }
    return nullptr;
}

const ApprovalRequest* ApprovalChain::findRequest(const std::string& requestId) const {
    for (const auto& r : requests_) {
        if (r.id == requestId) return &r;
    }
    return nullptr;
}

bool ApprovalChain::isComplete() const {
    if (requests_.size() != steps_.size()) return false;
    for (const auto& r : requests_) {
        if (r.status != ApprovalStatus::APPROVED) return false;
    }
    return true;
}

bool ApprovalChain::isRejected() const {
    for (const auto& r : requests_) {
        if (r.status == ApprovalStatus::REJECTED) return true;
    }
    return false;
}

const ApprovalStep* ApprovalChain::nextStep() const {
    if (!hasNextStep()) return nullptr;
    return &steps_[requests_.size()];
}

void ApprovalChain::recordDecision(const std::string& requestId, bool approved, const std::string& approverId,
                                   const std::string& comment, const Timestamp& at) {
    for (auto& r : requests_) {
        if (r.id != requestId) continue;
        if (isFinal(r.status)) {
            throw InvariantViolationException("Approval request " + requestId + " is already " +
                                              toString(r.status));
        }
        r.status = approved ? ApprovalStatus::APPROVED : ApprovalStatus::REJECTED;
        r.decidedBy = approverId;
        r.comment = comment;
        r.decidedAt = at;
        return;
    }
    throw InvariantViolationException("Unknown approval request " + requestId + " in chain " + id_);
}

const ApprovalRequest& ApprovalChain::spawnNext(const std::string& requestedBy, const Timestamp& at, int ttlHours) {
    const ApprovalStep* step = nextStep();
    if (!step) {
        throw InvariantViolationException("Approval chain " + id_ + " has no further steps");
    }
    if (pending()) {
        throw InvariantViolationException("Approval chain " + id_ + " still has a pending request");
    }
    requests_.push_back(makeRequest(*step, requestedBy, at, ttlHours));
    return requests_.back();
}

std::vector<std::string> ApprovalChain::expirePending(const Timestamp& at) {
    std::vector<std::string> expired;
    for (auto& r : requests_) {
        if (r.status == ApprovalStatus::PENDING) {
            r.status = ApprovalStatus::EXPIRED;
            r.decidedAt = at;
            expired.push_back(r.id);
        }
    }
    return expired;
}

std::vector<std::string> ApprovalChain::approvedRequestIds() const {
    std::vector<std::string> ids;
    for (const auto& r : requests_) {
        if (r.status == ApprovalStatus::APPROVED) ids.push_back(r.id);
    }
    return ids;
}

ApprovalRequest ApprovalChain::makeRequest(const ApprovalStep& step, const std::string& requestedBy,
                                           const Timestamp& at, int ttlHours) const {
    ApprovalRequest r;
    r.sequence = static_cast<int>(requests_.size()) + 1;
    r.id = id_ + "-R" + std::to_string(r.sequence);
    r.quoteId = quoteId_;
    r.chainId = id_;
    r.snapshotId = snapshotId_;
    r.approverRole = step.role;
    r.approverLevel = step.level;
    r.policyIds = step.policyIds;
    r.requestedBy = requestedBy;
    r.createdAt = at;
    if (ttlHours > 0) {
        r.expiresAt = at.addHours(ttlHours);
    }
    return r;
}

nlohmann::json ApprovalChain::toJson() const {
    nlohmann::json j;
    j["id"] = id_;
    j["quote_id"] = quoteId_;
    j["snapshot_id"] = snapshotId_;
    j["steps"] = nlohmann::json::array();
    for (const auto& s : steps_) {
        j["steps"].push_back({{"role", s.role}, {"level", s.level}, {"policy_ids", s.policyIds}});
    }
    j["requests"] = nlohmann::json::array();
    for (const auto& r : requests_) j["requests"].push_back(r.toJson());
    return j;
}

ApprovalChain ApprovalChain::fromJson(const nlohmann::json& j) {
    ApprovalChain chain;
    chain.id_ = j.at("id").get<std::string>();
    chain.quoteId_ = j.at("quote_id").get<std::string>();
    chain.snapshotId_ = j.value("snapshot_id", "");
    for (const auto& s : j.at("steps")) {
        chain.steps_.push_back({s.at("role").get<std::string>(), s.at("level").get<int>(),
                                s.value("policy_ids", std::vector<std::string>{})});
    }
    for (const auto& r : j.at("requests")) chain.requests_.push_back(ApprovalRequest::fromJson(r));
    return chain;
}

} // namespace cpq::domain
