#include "application/QuoteService.hpp"
#include "application/EventCodec.hpp"
#include "domain/AuditChain.hpp"
#include "domain/Errors.hpp"
#include "domain/JsonConversions.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace cpq::application {

using domain::ApplyResult;
using domain::ApplyStatus;
using domain::AuditCategory;
using domain::AuditEvent;
using domain::AuditOutcome;
using domain::FlowEffect;
using domain::FlowEvent;
using domain::FlowEventType;
using domain::FlowState;
using domain::IdempotencyRecord;
using domain::IdempotencyState;
using domain::OutboxMessage;
using domain::Quote;
using domain::QuotePricingSnapshot;
using domain::QuoteStatus;
using domain::Timestamp;
using domain::TransitionErrorCode;
using nlohmann::json;

namespace {

bool hasEffect(const std::vector<FlowEffect>& effects, FlowEffect effect) {
    return std::find(effects.begin(), effects.end(), effect) != effects.end();
}

json effectsJson(const std::vector<FlowEffect>& effects) {
    json arr = json::array();
    for (auto effect : effects) arr.push_back(domain::toString(effect));
    return arr;
}

ApplyStatus statusFor(TransitionErrorCode code) {
    switch (code) {
        case TransitionErrorCode::CONFIGURATION_INVALID: return ApplyStatus::CONFIGURATION_INVALID;
        case TransitionErrorCode::POLICY_BLOCKED: return ApplyStatus::POLICY_BLOCKED;
        default: return ApplyStatus::TRANSITION_ILLEGAL;
    }
}

void checkPercentField(const std::optional<domain::Decimal>& pct, const std::string& field) {
    if (pct && (pct->isNegative() || *pct > domain::Decimal::hundred())) {
        throw EventDecodeException(field, "'" + field + "' must be within [0, 100]: " + pct->toString());
    }
}

void checkAmountField(const std::optional<domain::Decimal>& amount, const std::string& field) {
    if (amount && amount->isNegative()) {
        throw EventDecodeException(field, "'" + field + "' must not be negative: " + amount->toString());
    }
}

} // namespace

QuoteService::QuoteService(
    std::shared_ptr<ports::output::IQuoteStore> store,
    std::shared_ptr<ports::output::IAuditLog> auditLog,
    std::shared_ptr<ports::output::IIdempotencyRepository> idempotency,
    std::shared_ptr<ports::output::IEventPublisher> publisher,
    std::shared_ptr<ports::output::ICatalogRepository> catalog,
    std::shared_ptr<ports::output::IPolicyRepository> policies,
    std::shared_ptr<settings::EngineSettings> settings)
    : store_(std::move(store))
    , auditLog_(std::move(auditLog))
    , idempotency_(std::move(idempotency))
    , publisher_(std::move(publisher))
    , catalog_(std::move(catalog))
    , policies_(std::move(policies))
    , settings_(std::move(settings))
    , constraints_(catalog_)
    , pricing_(catalog_, settings_)
    , policyEvaluator_(policies_)
{
    std::cout << "[QuoteService] Created" << std::endl;
}

// ============================================
// Создание
// ============================================

ApplyResult QuoteService::createQuote(const std::string& quoteId, const std::string& actor,
                                      const Timestamp& at) {
    ApplyResult result;
    result.quoteId = quoteId;

    if (auto existing = store_->findQuote(quoteId)) {
        result.status = ApplyStatus::VERSION_CONFLICT;
        result.actualVersion = existing->version();
        result.version = existing->version();
        result.detail = "Quote already exists";
        return result;
    }

    Quote quote(quoteId, actor, at);
    quote.incrementVersion();

    FlowState flow;
    flow.quoteId = quoteId;
    flow.state = QuoteStatus::DRAFT;
    flow.version = quote.version();
    flow.requiredFields = settings_->getRequiredFields();
    flow.missingFields = quote.missingFields(flow.requiredFields);
    flow.lastEventType = "QuoteCreated";
    flow.updatedAt = at;

    AuditEvent created;
    created.quoteId = quoteId;
    created.eventType = "flow.quote_created";
    created.category = AuditCategory::FLOW;
    created.actor = actor;
    created.payload = {{"state", domain::toString(QuoteStatus::DRAFT)}, {"version", quote.version()}};
    created.occurredAt = at;

    ports::output::QuoteCommit commit{quote, flow};
    commit.auditEvents.push_back(created);

    try {
        store_->commit(commit);
    } catch (const domain::VersionConflictException& e) {
        result.status = ApplyStatus::VERSION_CONFLICT;
        result.actualVersion = e.actual();
        result.detail = e.what();
        return result;
    }

    std::cout << "[QuoteService] Created quote " << quoteId << " by " << actor << std::endl;

    result.status = ApplyStatus::APPLIED;
    result.toState = QuoteStatus::DRAFT;
    result.version = quote.version();
    result.missingFields = flow.missingFields;
    return result;
}

// ============================================
// apply()
// ============================================

ApplyResult QuoteService::apply(const std::string& quoteId, int64_t expectedVersion, const FlowEvent& event) {
    const std::string key = EventCodec::idempotencyKey(quoteId, event);

    if (auto existing = idempotency_->find(key)) {
        if (existing->state == IdempotencyState::RESERVED) {
            ApplyResult busy;
            busy.status = ApplyStatus::IN_PROGRESS;
            busy.quoteId = quoteId;
            busy.idempotencyKey = key;
            busy.detail = "Event is being processed";
            return busy;
        }

        ApplyResult cached = ApplyResult::fromJson(json::parse(existing->resultJson));
        cached.replayed = true;

        if (existing->state == IdempotencyState::COMMITTED) {
            std::cout << "[QuoteService] Re-dispatching " << existing->outbox.size()
                      << " message(s) for " << key << std::endl;
            try {
                dispatch(existing->outbox);
                idempotency_->complete(key, event.occurredAt);
            } catch (const std::exception& e) {
                std::cerr << "[QuoteService] Re-dispatch failed for " << key << ": " << e.what() << std::endl;
            }
        }

        std::cout << "[QuoteService] Replayed " << domain::toString(event.type) << " "
                  << event.eventId << " for " << quoteId << std::endl;
        return cached;
    }

    IdempotencyRecord reservation;
    reservation.key = key;
    reservation.quoteId = quoteId;
    reservation.operation = domain::toString(event.type);
    reservation.state = IdempotencyState::RESERVED;
    reservation.createdAt = event.occurredAt;
    reservation.updatedAt = event.occurredAt;

    if (!idempotency_->reserve(reservation)) {
        ApplyResult busy;
        busy.status = ApplyStatus::IN_PROGRESS;
        busy.quoteId = quoteId;
        busy.idempotencyKey = key;
        busy.detail = "Event is being processed";
        return busy;
    }

    ApplyResult result;
    try {
        result = execute(quoteId, expectedVersion, event, key);
    } catch (const std::exception& e) {
        std::cerr << "[QuoteService] Failed to apply " << domain::toString(event.type)
                  << " to " << quoteId << ": " << e.what() << std::endl;
        idempotency_->release(key);
        throw;
    }

    if (!result.ok()) {
        idempotency_->release(key);
    }
    return result;
}

ApplyResult QuoteService::execute(const std::string& quoteId, int64_t expectedVersion,
                                  const FlowEvent& event, const std::string& key) {
    ApplyResult result;
    result.quoteId = quoteId;
    result.idempotencyKey = key;

    auto quote = store_->findQuote(quoteId);
    auto flow = store_->findFlowState(quoteId);
    if (!quote || !flow) {
        result.status = ApplyStatus::NOT_FOUND;
        result.detail = "Quote " + quoteId + " not found";
        std::cout << "[QuoteService] Quote not found: " << quoteId << std::endl;
        return result;
    }

    result.fromState = flow->state;
    result.version = flow->version;

    if (flow->version != expectedVersion) {
        result.status = ApplyStatus::VERSION_CONFLICT;
        result.expectedVersion = expectedVersion;
        result.actualVersion = flow->version;
        std::cout << "[QuoteService] Version conflict on " << quoteId << ": expected "
                  << expectedVersion << ", actual " << flow->version << std::endl;
        return result;
    }

    try {
        Work work{*quote, *flow};
        if (quote->latestSnapshotId()) {
            work.latestSnapshot = store_->findSnapshot(*quote->latestSnapshotId());
        }
        work.chain = store_->findApprovalChain(quoteId);

        FlowContext context = buildContext(*quote, *flow, event, work.latestSnapshot, work.chain);
        TransitionResult transition = FlowEngine::apply(flow->state, event, context);

        if (!transition.ok()) {
            const auto& error = *transition.error;
            result.status = statusFor(error.code);
            result.transitionError = error.code;
            result.missingFields = error.missingFields;
            result.detail = error.detail;
            if (error.code == TransitionErrorCode::CONFIGURATION_INVALID) {
                result.constraintResult = context.constraintResult;
            }
            if (error.code == TransitionErrorCode::POLICY_BLOCKED) {
                result.policyDecision = context.policyDecision;
            }

            std::cout << "[QuoteService] Rejected " << domain::toString(event.type) << " on " << quoteId
                      << " in state " << domain::toString(flow->state) << ": "
                      << domain::toString(error.code) << std::endl;

            json payload = error.toJson();
            if (result.constraintResult) payload["constraint_result"] = result.constraintResult->toJson();
            auditRejection(quoteId, event, key, AuditCategory::FLOW, AuditOutcome::REJECTED, payload);
            return result;
        }

        if (event.draftChanges) {
            checkDraftChanges(*quote, *event.draftChanges);
        }

        const TransitionOutcome& outcome = *transition.outcome;
        runEffects(work, outcome, event, key, result);

        if (work.quote.status() != outcome.to) {
            work.quote.transition(outcome.from, outcome.to, event.occurredAt);
        }
        work.quote.incrementVersion();

        work.flow.state = outcome.to;
        work.flow.version = work.quote.version();
        work.flow.missingFields = work.quote.missingFields(work.flow.requiredFields);
        work.flow.lastEventType = domain::toString(event.type);
        work.flow.lastEventId = event.eventId;
        work.flow.updatedAt = event.occurredAt;

        result.status = ApplyStatus::APPLIED;
        result.toState = outcome.to;
        result.version = work.quote.version();
        result.effects = outcome.effects;
        if (result.missingFields.empty() && outcome.to == QuoteStatus::DRAFT) {
            result.missingFields = work.flow.missingFields;
        }

        AuditEvent applied = makeAudit(quoteId, "flow.transition_applied", AuditCategory::FLOW, event, key,
                                       {{"event_type", domain::toString(event.type)},
                                        {"from", domain::toString(outcome.from)},
                                        {"to", domain::toString(outcome.to)},
                                        {"effects", effectsJson(outcome.effects)},
                                        {"version", work.quote.version()}});
        work.commit.auditEvents.insert(work.commit.auditEvents.begin(), applied);

        IdempotencyRecord record;
        record.key = key;
        record.quoteId = quoteId;
        record.operation = domain::toString(event.type);
        record.state = IdempotencyState::COMMITTED;
        record.resultJson = result.toJson().dump();
        record.outbox = work.outbox;
        record.createdAt = event.occurredAt;
        record.updatedAt = event.occurredAt;

        work.commit.quote = work.quote;
        work.commit.flowState = work.flow;
        work.commit.expectedVersion = expectedVersion;
        work.commit.idempotency = record;

        store_->commit(work.commit);

        std::cout << "[QuoteService] Applied " << domain::toString(event.type) << " to " << quoteId
                  << " (" << domain::toString(outcome.from) << " -> " << domain::toString(outcome.to)
                  << ", v" << expectedVersion << " -> v" << work.quote.version() << ")" << std::endl;

        try {
            dispatch(work.outbox);
            idempotency_->complete(key, event.occurredAt);
        } catch (const std::exception& e) {
            // Ключ остаётся COMMITTED: повтор события переотправит сообщения
            std::cerr << "[QuoteService] Failed to dispatch effects for " << quoteId << ": " << e.what()
                      << std::endl;
        }
        return result;

    } catch (const domain::VersionConflictException& e) {
        result.status = ApplyStatus::VERSION_CONFLICT;
        result.expectedVersion = e.expected();
        result.actualVersion = e.actual();
        result.detail = e.what();
        std::cout << "[QuoteService] " << e.what() << std::endl;
        return result;

    } catch (const domain::PricingDataMissingException& e) {
        result.status = ApplyStatus::PRICING_DATA_MISSING;
        result.pricingFailure = domain::PricingFailure{e.code(), e.lineId(), e.productId(), e.reference(),
                                                       e.internalConsistency()};
        result.offendingId = e.lineId();
        result.detail = e.what();
        if (e.internalConsistency()) {
            std::cerr << "[QuoteService] Pricing consistency defect on " << quoteId << ": " << e.what()
                      << std::endl;
        } else {
            std::cout << "[QuoteService] Pricing data missing on " << quoteId << ": " << e.what() << std::endl;
        }
        auditRejection(quoteId, event, key, AuditCategory::PRICING, AuditOutcome::FAILED,
                       {{"code", domain::toString(e.code())}, {"line_id", e.lineId()},
                        {"product_id", e.productId()}, {"reference", e.reference()},
                        {"internal_consistency", e.internalConsistency()}});
        return result;

    } catch (const domain::PolicyDataMalformedException& e) {
        result.status = ApplyStatus::POLICY_DATA_MALFORMED;
        result.offendingId = e.policyId();
        result.detail = e.what();
        std::cerr << "[QuoteService] " << e.what() << " (quote " << quoteId << ")" << std::endl;
        auditRejection(quoteId, event, key, AuditCategory::POLICY, AuditOutcome::FAILED,
                       {{"policy_id", e.policyId()}, {"detail", e.what()}});
        return result;

    } catch (const domain::ConstraintDataMalformedException& e) {
        result.status = ApplyStatus::CONSTRAINT_DATA_MALFORMED;
        result.offendingId = e.ruleId();
        result.detail = e.what();
        std::cerr << "[QuoteService] " << e.what() << " (quote " << quoteId << ")" << std::endl;
        auditRejection(quoteId, event, key, AuditCategory::CONSTRAINT, AuditOutcome::FAILED,
                       {{"rule_id", e.ruleId()}, {"detail", e.what()}});
        return result;

    } catch (const domain::InvariantViolationException& e) {
        result.status = ApplyStatus::INVARIANT_VIOLATION;
        result.detail = e.what();
        std::cerr << "[QuoteService] Invariant violation on " << quoteId << ": " << e.what() << std::endl;
        auditRejection(quoteId, event, key, AuditCategory::FLOW, AuditOutcome::FAILED,
                       {{"event_type", domain::toString(event.type)}, {"detail", e.what()}});
        return result;

    } catch (const EventDecodeException& e) {
        result.status = ApplyStatus::INVALID_EVENT;
        result.offendingId = e.field();
        result.detail = e.what();
        std::cout << "[QuoteService] Invalid event " << event.eventId << " (" << e.field() << "): "
                  << e.what() << std::endl;
        auditRejection(quoteId, event, key, AuditCategory::INGRESS, AuditOutcome::REJECTED,
                       {{"event_type", domain::toString(event.type)}, {"field", e.field()},
                        {"detail", e.what()}});
        return result;

    } catch (const std::invalid_argument& e) {
        result.status = ApplyStatus::INVALID_EVENT;
        result.detail = e.what();
        std::cout << "[QuoteService] Invalid event " << event.eventId << ": " << e.what() << std::endl;
        auditRejection(quoteId, event, key, AuditCategory::INGRESS, AuditOutcome::REJECTED,
                       {{"event_type", domain::toString(event.type)}, {"detail", e.what()}});
        return result;
    }
}

void QuoteService::checkDraftChanges(const Quote& quote, const domain::DraftChanges& changes) {
    checkPercentField(changes.requestedDiscountPct, "payload.requested_discount_pct");

    // Порядок как в Quote::applyDraftChanges: удаление, затем изменение
    std::set<std::string> lineIds;
    for (const auto& line : quote.lines()) {
        lineIds.insert(line.id);
    }
    for (size_t i = 0; i < changes.removeLineIds.size(); ++i) {
        const std::string& lineId = changes.removeLineIds[i];
        if (lineIds.erase(lineId) == 0) {
            throw EventDecodeException("payload.remove_line_ids[" + std::to_string(i) + "]",
                                       "Unknown line " + lineId + " on quote " + quote.id());
        }
    }
    for (size_t i = 0; i < changes.updateLines.size(); ++i) {
        const auto& update = changes.updateLines[i];
        const std::string where = "payload.update_lines[" + std::to_string(i) + "].";
        if (lineIds.count(update.lineId) == 0) {
            throw EventDecodeException(where + "line_id", "Unknown line " + update.lineId + " on quote " + quote.id());
        }
        if (update.quantity && *update.quantity <= 0) {
            throw EventDecodeException(where + "quantity", "'" + where + "quantity' must be a positive integer");
        }
        checkPercentField(update.discountPct, where + "discount_pct");
        checkAmountField(update.discountAmount, where + "discount_amount");
    }
    for (size_t i = 0; i < changes.addLines.size(); ++i) {
        const auto& input = changes.addLines[i];
        const std::string where = "payload.add_lines[" + std::to_string(i) + "].";
        if (input.quantity <= 0) {
            throw EventDecodeException(where + "quantity", "'" + where + "quantity' must be a positive integer");
        }
        checkPercentField(input.discountPct, where + "discount_pct");
        checkAmountField(input.discountAmount, where + "discount_amount");
    }
}

FlowContext QuoteService::buildContext(const Quote& quote, const FlowState& flow, const FlowEvent& event,
                                       const std::optional<QuotePricingSnapshot>& latestSnapshot,
                                       const std::optional<domain::ApprovalChain>& chain) {
    FlowContext context;
    context.missingFields = quote.missingFields(flow.requiredFields);

    if (event.type == FlowEventType::REQUIRED_FIELDS_COLLECTED ||
        event.type == FlowEventType::PRICING_REQUESTED) {
        context.constraintResult = constraints_.evaluate(quote);
    }

    // Решение действительно только для последнего снимка
    if (flow.policyDecision && latestSnapshot && flow.policyDecision->snapshotId == latestSnapshot->id) {
        context.policyDecision = flow.policyDecision;
    }

    if (chain && chain->snapshotId() == (latestSnapshot ? latestSnapshot->id : std::string())) {
        context.approvalChain = chain;
    }

    if (event.type == FlowEventType::APPROVAL_DECIDED && event.approvalDecision) {
        context.approverAuthority = policies_->findApproverAuthority(event.approvalDecision->approverRole);
    }

    if (latestSnapshot) {
        context.requestedDiscountPct = PolicyEvaluator::requestedDiscountPct(quote, *latestSnapshot);
    }
    return context;
}

void QuoteService::runEffects(Work& work, const TransitionOutcome& outcome, const FlowEvent& event,
                              const std::string& key, ApplyResult& result) {
    const Timestamp& at = event.occurredAt;
    const int64_t newVersion = work.quote.version() + 1;
    const std::string& quoteId = work.quote.id();

    if (hasEffect(outcome.effects, FlowEffect::INVALIDATE_PRICING)) {
        work.quote.invalidatePricing();
        work.flow.policyDecision.reset();
        work.commit.auditEvents.push_back(makeAudit(quoteId, "pricing.invalidated", AuditCategory::PRICING,
                                                    event, key, {{"from", domain::toString(outcome.from)}}));
    }

    // Правка черновика возможна только в DRAFT
    if (outcome.to == QuoteStatus::DRAFT && work.quote.status() != QuoteStatus::DRAFT) {
        work.quote.transition(outcome.from, QuoteStatus::DRAFT, at);
    }

    for (auto effect : outcome.effects) {
        switch (effect) {
            case FlowEffect::APPLY_DRAFT_CHANGES: {
                if (!event.draftChanges) break;
                auto revisionOf = [this](const std::string& productId) {
                    auto product = catalog_->getProduct(productId);
                    return product ? product->revision : 0;
                };
                work.quote.applyDraftChanges(*event.draftChanges, revisionOf, at);
                work.commit.auditEvents.push_back(makeAudit(quoteId, "flow.draft_updated", AuditCategory::FLOW,
                                                            event, key, EventCodec::encode(event).at("payload")));
                break;
            }

            case FlowEffect::INVALIDATE_PRICING:
                break;

            case FlowEffect::RECORD_VALIDATION:
                work.commit.auditEvents.push_back(makeAudit(quoteId, "constraint.validated",
                                                            AuditCategory::CONSTRAINT, event, key,
                                                            {{"valid", true},
                                                             {"line_count", work.quote.lines().size()}}));
                break;

            case FlowEffect::RUN_PRICING: {
                std::vector<std::string> authorizedBy;
                if (outcome.from == QuoteStatus::APPROVED && work.chain) {
                    authorizedBy = work.chain->approvedRequestIds();
                }
                auto snapshot = runPricing(work.quote, quoteId + "-S" + std::to_string(newVersion), newVersion,
                                           at, event.actor, authorizedBy);
                work.quote.applyPricing(snapshot);
                work.latestSnapshot = snapshot;
                work.commit.snapshot = snapshot;
                result.snapshotId = snapshot.id;
                work.commit.auditEvents.push_back(makeAudit(quoteId, "pricing.snapshot_created",
                                                            AuditCategory::PRICING, event, key,
                                                            {{"snapshot_id", snapshot.id},
                                                             {"price_book_id", snapshot.priceBookId},
                                                             {"subtotal", snapshot.subtotal},
                                                             {"discount_total", snapshot.discountTotal},
                                                             {"tax_total", snapshot.taxTotal},
                                                             {"total", snapshot.total},
                                                             {"trace_digest", snapshot.traceDigest},
                                                             {"authorized_by_approvals", authorizedBy}}));
                break;
            }

            case FlowEffect::EVALUATE_POLICY: {
                if (!work.latestSnapshot) {
                    throw domain::InvariantViolationException("Policy evaluation without a snapshot for " + quoteId);
                }
                auto decision = policyEvaluator_.evaluate(work.quote, *work.latestSnapshot, at);
                work.flow.policyDecision = decision;
                result.policyDecision = decision;
                work.commit.auditEvents.push_back(makeAudit(quoteId, "policy.evaluated", AuditCategory::POLICY,
                                                            event, key, decision.toJson()));
                break;
            }

            case FlowEffect::FINALIZE_QUOTE:
                work.commit.auditEvents.push_back(makeAudit(quoteId, "flow.quote_finalized", AuditCategory::FLOW,
                                                            event, key,
                                                            {{"snapshot_id", work.latestSnapshot
                                                                  ? work.latestSnapshot->id : std::string()}}));
                break;

            case FlowEffect::PUBLISH_QUOTE: {
                if (!work.latestSnapshot) {
                    throw domain::InvariantViolationException("Cannot publish quote " + quoteId + " without pricing");
                }
                const auto& snapshot = *work.latestSnapshot;
                json message = {
                    {"quote_id", quoteId},
                    {"version", newVersion},
                    {"snapshot_id", snapshot.id},
                    {"currency", snapshot.currency},
                    {"subtotal", snapshot.subtotal},
                    {"discount_total", snapshot.discountTotal},
                    {"tax_total", snapshot.taxTotal},
                    {"total", snapshot.total},
                    {"finalized_at", at}
                };
                work.outbox.push_back(OutboxMessage{"quote.published", message.dump()});
                break;
            }

            case FlowEffect::REQUEST_APPROVAL: {
                const auto& decision = work.flow.policyDecision;
                if (!decision) {
                    throw domain::InvariantViolationException("Approval requested without a policy decision for " +
                                                              quoteId);
                }
                std::vector<domain::ApprovalStep> steps;
                for (const auto& [role, level] : decision->requiredRoles()) {
                    domain::ApprovalStep step{role, level, {}};
                    for (const auto& v : decision->violations) {
                        if (v.requiredApproverRole == role) step.policyIds.push_back(v.policyId);
                    }
                    steps.push_back(std::move(step));
                }
                work.chain = domain::ApprovalChain::start(quoteId + "-C" + std::to_string(newVersion), quoteId,
                                                          decision->snapshotId, steps, event.actor, at,
                                                          settings_->getApprovalTtlHours());
                work.commit.approvalChain = work.chain;
                result.approvalRequestIds.push_back(work.chain->pending()->id);
                work.commit.auditEvents.push_back(makeAudit(quoteId, "approval.requested", AuditCategory::APPROVAL,
                                                            event, key, work.chain->toJson()));
                break;
            }

            case FlowEffect::RECORD_APPROVAL_DECISION: {
                const auto& decision = *event.approvalDecision;
                work.chain->recordDecision(decision.requestId, decision.approve, decision.approverId,
                                           decision.comment, at);
                work.commit.approvalChain = work.chain;
                result.approvalRequestIds.push_back(decision.requestId);
                work.commit.auditEvents.push_back(makeAudit(quoteId, "approval.decided", AuditCategory::APPROVAL,
                                                            event, key,
                                                            {{"request_id", decision.requestId},
                                                             {"decision", decision.approve ? "approve" : "reject"},
                                                             {"approver_id", decision.approverId},
                                                             {"approver_role", decision.approverRole},
                                                             {"comment", decision.comment}}));
                break;
            }

            case FlowEffect::REQUEST_NEXT_APPROVAL: {
                const auto& next = work.chain->spawnNext(event.actor, at, settings_->getApprovalTtlHours());
                result.approvalRequestIds.push_back(next.id);
                work.commit.approvalChain = work.chain;
                work.commit.auditEvents.push_back(makeAudit(quoteId, "approval.requested", AuditCategory::APPROVAL,
                                                            event, key, next.toJson()));
                break;
            }

            case FlowEffect::NOTIFY_APPROVERS: {
                const auto* pending = work.chain ? work.chain->pending() : nullptr;
                if (!pending) {
                    throw domain::InvariantViolationException("No pending approval request to notify for " + quoteId);
                }
                json message = {
                    {"quote_id", quoteId},
                    {"request_id", pending->id},
                    {"approver_role", pending->approverRole},
                    {"approver_level", pending->approverLevel},
                    {"snapshot_id", pending->snapshotId},
                    {"policy_ids", pending->policyIds}
                };
                domain::putOptional(message, "expires_at", pending->expiresAt);
                work.outbox.push_back(OutboxMessage{"approval.requested", message.dump()});
                break;
            }

            case FlowEffect::MARK_QUOTE_SENT: {
                json message = {{"quote_id", quoteId}, {"version", newVersion}, {"sent_at", at},
                                {"actor", event.actor}};
                work.outbox.push_back(OutboxMessage{"quote.sent", message.dump()});
                break;
            }

            case FlowEffect::CREATE_AMENDMENT: {
                const std::string& newId = *event.amendmentQuoteId;
                if (store_->findQuote(newId)) {
                    throw domain::InvariantViolationException("Amendment quote " + newId + " already exists");
                }
                Quote amendment = work.quote.amend(newId, event.actor, at);
                amendment.incrementVersion();

                FlowState amendmentFlow;
                amendmentFlow.quoteId = newId;
                amendmentFlow.state = QuoteStatus::DRAFT;
                amendmentFlow.version = amendment.version();
                amendmentFlow.requiredFields = work.flow.requiredFields;
                amendmentFlow.missingFields = amendment.missingFields(amendmentFlow.requiredFields);
                amendmentFlow.metadata["parent_quote_id"] = quoteId;
                amendmentFlow.lastEventType = domain::toString(event.type);
                amendmentFlow.lastEventId = event.eventId;
                amendmentFlow.updatedAt = at;

                work.commit.amendment = amendment;
                work.commit.amendmentFlowState = amendmentFlow;
                result.amendmentQuoteId = newId;

                work.commit.auditEvents.push_back(makeAudit(quoteId, "flow.amendment_requested", AuditCategory::FLOW,
                                                            event, key,
                                                            {{"amendment_quote_id", newId},
                                                             {"reason", event.reason}}));
                work.commit.auditEvents.push_back(makeAudit(newId, "flow.quote_created", AuditCategory::FLOW,
                                                            event, key,
                                                            {{"state", domain::toString(QuoteStatus::DRAFT)},
                                                             {"version", amendment.version()},
                                                             {"parent_quote_id", quoteId}}));
                break;
            }

            case FlowEffect::EXPIRE_PENDING_APPROVALS: {
                if (!work.chain) break;
                auto expired = work.chain->expirePending(at);
                if (expired.empty()) break;
                work.commit.approvalChain = work.chain;
                work.commit.auditEvents.push_back(makeAudit(quoteId, "approval.expired", AuditCategory::APPROVAL,
                                                            event, key, {{"request_ids", expired}}));
                break;
            }

            default:
                break;
        }
    }
}

QuotePricingSnapshot QuoteService::runPricing(const Quote& quote, const std::string& snapshotId, int64_t version,
                                              const Timestamp& at, const std::string& actor,
                                              std::vector<std::string> authorizedBy) {
    std::set<std::string> categories;
    for (const auto& line : quote.lines()) {
        if (auto product = catalog_->getProduct(line.productId)) {
            categories.insert(product->category);
        }
    }

    PricingRequest request;
    request.snapshotId = snapshotId;
    request.quoteVersion = version;
    request.at = at;
    request.actor = actor;
    request.discountCapPct = policyEvaluator_.discountCapFor(quote, categories);
    request.authorizedByApprovals = std::move(authorizedBy);
    return pricing_.price(quote, request);
}

void QuoteService::dispatch(const std::vector<OutboxMessage>& outbox) {
    for (const auto& message : outbox) {
        publisher_->publish(message.routingKey, message.message);
        std::cout << "[QuoteService] Published " << message.routingKey << std::endl;
    }
}

AuditEvent QuoteService::makeAudit(const std::string& quoteId, const std::string& eventType,
                                   AuditCategory category, const FlowEvent& event,
                                   const std::string& key, json payload) {
    AuditEvent audit;
    audit.quoteId = quoteId;
    audit.eventType = eventType;
    audit.category = category;
    audit.outcome = AuditOutcome::SUCCESS;
    audit.actor = event.actor;
    audit.correlationId = key;
    audit.causationId = event.eventId;
    audit.payload = std::move(payload);
    audit.occurredAt = event.occurredAt;
    return audit;
}

void QuoteService::auditRejection(const std::string& quoteId, const FlowEvent& event, const std::string& key,
                                  AuditCategory category, AuditOutcome outcome, const json& payload) {
    AuditEvent audit = makeAudit(quoteId,
                                 toString(category) + (outcome == AuditOutcome::FAILED ? ".failed" : ".rejected"),
                                 category, event, key, payload);
    audit.outcome = outcome;
    try {
        auditLog_->append(audit);
    } catch (const std::exception& e) {
        std::cerr << "[QuoteService] Failed to audit rejection on " << quoteId << ": " << e.what() << std::endl;
    }
}

// ============================================
// Чтение
// ============================================

std::optional<QuotePricingSnapshot> QuoteService::previewPricing(const std::string& quoteId, const Timestamp& at) {
    auto quote = store_->findQuote(quoteId);
    if (!quote) {
        std::cout << "[QuoteService] Quote not found: " << quoteId << std::endl;
        return std::nullopt;
    }
    auto result = constraints_.evaluate(*quote);
    if (!result.valid) {
        std::cout << "[QuoteService] Preview skipped, configuration invalid: " << quoteId << std::endl;
        return std::nullopt;
    }
    return runPricing(*quote, quoteId + "-preview", quote->version(), at, "preview", {});
}

std::optional<Quote> QuoteService::getQuote(const std::string& quoteId) {
    return store_->findQuote(quoteId);
}

std::optional<FlowState> QuoteService::getFlowState(const std::string& quoteId) {
    return store_->findFlowState(quoteId);
}

std::vector<QuotePricingSnapshot> QuoteService::getSnapshots(const std::string& quoteId) {
    return store_->findSnapshots(quoteId);
}

std::optional<domain::ApprovalChain> QuoteService::getApprovalChain(const std::string& quoteId) {
    return store_->findApprovalChain(quoteId);
}

std::vector<AuditEvent> QuoteService::getAuditTrail(const std::string& quoteId) {
    return auditLog_->eventsForQuote(quoteId);
}

domain::AuditVerification QuoteService::verifyAuditTrail(const std::string& quoteId) {
    auto verification = domain::AuditChain::verify(auditLog_->eventsForQuote(quoteId));
    if (!verification.valid) {
        std::cerr << "[QuoteService] Audit chain broken for " << quoteId << " at sequence "
                  << verification.brokenAtSequence.value_or(0) << ": " << verification.reason << std::endl;
    }
    return verification;
}

} // namespace cpq::application
