#pragma once

#include "ports/input/IEventStatsService.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/ISnapshotStore.hpp"
#include "settings/EventStoreSettings.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <unordered_set>

namespace eventstore::application {

/**
 * @brief Статистика и просмотр журнала событий
 *
 * collect() читает журнал постранично, так же как перестроение проекций;
 * listEvents() берёт хвост журнала одним запросом.
 */
class EventStatsService : public ports::input::IEventStatsService {
public:
    EventStatsService(
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<ports::output::ISnapshotStore> snapshotStore,
        std::shared_ptr<settings::EventStoreSettings> settings
    ) : eventStore_(std::move(eventStore))
      , snapshotStore_(std::move(snapshotStore))
      , batchSize_(settings->getProjectionBatchSize())
    {}

    domain::EventStoreStatistics collect(size_t topTypes) override {
        domain::EventStoreStatistics stats;
        std::map<std::string, size_t> byType;
        std::unordered_set<std::string> aggregates;

        scan([&](const domain::StoredEvent& stored) {
            ++stats.totalEvents;
            ++byType[stored.getEventType()];
            if (stored.event->hasAggregateId()) {
                aggregates.insert(*stored.event->aggregateId);
            }
        });

        stats.uniqueAggregates = aggregates.size();
        stats.eventsByType.assign(byType.begin(), byType.end());
        // stable_sort сохраняет алфавитный порядок при равных количествах
        std::stable_sort(stats.eventsByType.begin(), stats.eventsByType.end(),
            [](const auto& a, const auto& b) { return a.second > b.second; });
        if (topTypes > 0 && stats.eventsByType.size() > topTypes) {
            stats.eventsByType.resize(topTypes);
        }

        if (snapshotStore_) {
            stats.snapshotCount = snapshotStore_->count();
        }

        std::cout << "[EventStatsService] " << stats.totalEvents << " event(s), "
                  << stats.uniqueAggregates << " aggregate(s)" << std::endl;
        return stats;
    }

    std::vector<domain::StoredEvent> listEvents(size_t limit) override {
        if (limit == 0) {
            return {};
        }
        return eventStore_->getLatestEvents(limit);
    }

private:
    template <typename Visitor>
    void scan(Visitor visit) {
        int64_t lastSequence = 0;
        while (true) {
            auto page = eventStore_->getAllEvents(lastSequence, batchSize_);
            for (const auto& stored : page) {
                visit(stored);
                lastSequence = stored.sequenceNumber;
            }
            if (page.size() < batchSize_) {
                break;
            }
        }
    }

    std::shared_ptr<ports::output::IEventStore> eventStore_;
    std::shared_ptr<ports::output::ISnapshotStore> snapshotStore_;
    size_t batchSize_;
};

} // namespace eventstore::application
