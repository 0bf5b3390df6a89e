#include "application/EventLog.hpp"
#include <exception>
#include <iostream>

namespace arena::application {

domain::EventLogEntry EventLog::append(
    const std::string& accountId,
    domain::EventKind kind,
    const std::string& referenceId,
    const std::string& payload,
    const domain::Timestamp& timestamp
) {
    domain::EventLogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.offset = entries_.size();
        entry.sequenceNumber = ++sequences_[accountId];
        entry.accountId = accountId;
        entry.kind = kind;
        entry.referenceId = referenceId;
        entry.payload = payload;
        entry.timestamp = timestamp;

        byAccount_[accountId].push_back(entries_.size());
        entries_.push_back(entry);
    }

    if (publisher_) {
        try {
            publisher_->publish(domain::routingKeyFor(kind), entry.toJson());
        } catch (const std::exception& e) {
            std::cerr << "[EventLog] Failed to publish offset " << entry.offset
                      << " (" << domain::routingKeyFor(kind) << "): " << e.what() << std::endl;
        }
    }
    return entry;
}

std::vector<domain::EventLogEntry> EventLog::entriesFor(const std::string& accountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::EventLogEntry> result;
    auto it = byAccount_.find(accountId);
    if (it == byAccount_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (auto index : it->second) {
        result.push_back(entries_[index]);
    }
    return result;
}

std::vector<domain::EventLogEntry> EventLog::entriesSince(uint64_t fromOffset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fromOffset >= entries_.size()) {
        return {};
    }
    return std::vector<domain::EventLogEntry>(
        entries_.begin() + static_cast<std::ptrdiff_t>(fromOffset), entries_.end());
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace arena::application
