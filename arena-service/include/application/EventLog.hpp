#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "domain/EventLogEntry.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena::application {

/**
 * @brief Журнал событий только на добавление
 *
 * Глобальный порядок задаётся offset, внутри аккаунта - sequenceNumber
 * (строго возрастает с 1). Записи не меняются и не переупорядочиваются.
 *
 * После добавления запись отправляется в IEventPublisher. Ошибка публикации
 * логируется и не откатывает транзакцию: потребитель перечитает журнал
 * по offset.
 */
class EventLog {
public:
    explicit EventLog(std::shared_ptr<ports::output::IEventPublisher> publisher)
        : publisher_(std::move(publisher)) {}

    /**
     * @brief Добавить запись и опубликовать её
     *
     * Вызывается последним шагом закоммиченной транзакции.
     */
    domain::EventLogEntry append(
        const std::string& accountId,
        domain::EventKind kind,
        const std::string& referenceId,
        const std::string& payload,
        const domain::Timestamp& timestamp
    );

    std::vector<domain::EventLogEntry> entriesFor(const std::string& accountId) const;

    /**
     * @brief Записи с offset >= fromOffset в порядке offset
     */
    std::vector<domain::EventLogEntry> entriesSince(uint64_t fromOffset) const;

    std::size_t size() const;

private:
    std::shared_ptr<ports::output::IEventPublisher> publisher_;

    mutable std::mutex mutex_;
    std::vector<domain::EventLogEntry> entries_;    ///< Индекс = offset
    std::unordered_map<std::string, uint64_t> sequences_;
    std::unordered_map<std::string, std::vector<std::size_t>> byAccount_;
};

} // namespace arena::application
