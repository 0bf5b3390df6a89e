#include "domain/EventLogEntry.hpp"
#include <nlohmann/json.hpp>

namespace arena::domain {

std::string EventLogEntry::toJson() const {
    nlohmann::json j;
    j["offset"] = offset;
    j["sequenceNumber"] = sequenceNumber;
    j["accountId"] = accountId;
    j["kind"] = toString(kind);
    j["referenceId"] = referenceId;
    // payload уже JSON: вкладываем объектом, а не строкой
    j["payload"] = payload.empty() ? nlohmann::json::object() : nlohmann::json::parse(payload);
    j["timestamp"] = timestamp.toString();
    return j.dump();
}

} // namespace arena::domain
