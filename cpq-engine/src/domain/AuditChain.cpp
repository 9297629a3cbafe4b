#include "domain/AuditChain.hpp"
#include "utils/Sha256.hpp"

namespace cpq::domain {

std::string AuditChain::canonicalMaterial(const AuditEvent& event) {
    nlohmann::json j = event.toJson();
    j.erase("hash");
    // nlohmann::json хранит объекты в std::map: dump() детерминирован
    return j.dump();
}

AuditEvent AuditChain::seal(AuditEvent event, const std::optional<AuditEvent>& previous) {
    event.sequence = previous ? previous->sequence + 1 : 1;
    event.id = event.quoteId + "-A" + std::to_string(event.sequence);
    event.prevHash = previous ? previous->hash : std::string();
    event.hash = utils::sha256Hex(event.prevHash + canonicalMaterial(event));
    return event;
}

AuditVerification AuditChain::verify(const std::vector<AuditEvent>& events) {
    AuditVerification result;
    result.eventCount = events.size();

    std::string expectedPrev;
    int64_t expectedSequence = 1;
    for (const auto& event : events) {
        if (event.sequence != expectedSequence) {
            result.valid = false;
            result.brokenAtSequence = event.sequence;
            result.reason = "sequence gap: expected " + std::to_string(expectedSequence);
            return result;
        }
        if (event.prevHash != expectedPrev) {
            result.valid = false;
            result.brokenAtSequence = event.sequence;
            result.reason = "prev_hash does not match the previous record";
            return result;
        }
        if (event.hash != utils::sha256Hex(event.prevHash + canonicalMaterial(event))) {
            result.valid = false;
            result.brokenAtSequence = event.sequence;
            result.reason = "hash does not match record contents";
            return result;
        }
        expectedPrev = event.hash;
        ++expectedSequence;
    }
    return result;
}

} // namespace cpq::domain
