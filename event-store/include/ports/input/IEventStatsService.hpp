#pragma once

#include "domain/EventStoreStatistics.hpp"
#include "domain/events/StoredEvent.hpp"
#include <cstddef>
#include <vector>

namespace eventstore::ports::input {

/**
 * @brief Интерфейс сервиса статистики журнала событий
 */
class IEventStatsService {
public:
    virtual ~IEventStatsService() = default;

    /**
     * @brief Собрать статистику полным проходом по журналу
     *
     * @param topTypes Сколько самых частых типов вернуть (0 - все)
     */
    virtual domain::EventStoreStatistics collect(size_t topTypes) = 0;

    /**
     * @brief Последние limit конвертов, по возрастанию sequence
     */
    virtual std::vector<domain::StoredEvent> listEvents(size_t limit) = 0;
};

} // namespace eventstore::ports::input
