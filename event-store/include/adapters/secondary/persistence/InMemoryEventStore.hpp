#pragma once

#include "ports/output/IEventStore.hpp"
#include "domain/Exceptions.hpp"
#include <algorithm>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace eventstore::adapters::secondary {

/**
 * @brief In-memory реализация журнала событий
 *
 * Назначение версии и вставка выполняются под одной эксклюзивной
 * блокировкой, поэтому конкурентные append для одного агрегата
 * получают последовательные версии без пропусков.
 */
class InMemoryEventStore : public ports::output::IEventStore {
public:
    InMemoryEventStore() {
        std::cout << "[InMemoryEventStore] Initialized" << std::endl;
    }

    domain::StoredEvent append(domain::EventPtr event) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return appendLocked({std::move(event)}).front();
    }

    std::vector<domain::StoredEvent> appendAll(
        const std::vector<domain::EventPtr>& events
    ) override {
        if (events.empty()) {
            return {};
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return appendLocked(events);
    }

    std::vector<domain::StoredEvent> appendAll(
        const std::vector<domain::EventPtr>& events,
        int64_t expectedVersion
    ) override {
        if (events.empty()) {
            return {};
        }
        const std::string aggregateId = requireSingleAggregate(events);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t actual = versionLocked(aggregateId);
        if (actual != expectedVersion) {
            std::cerr << "[InMemoryEventStore] Version conflict on " << aggregateId
                      << ": expected " << expectedVersion << ", actual " << actual << std::endl;
            throw domain::ConcurrencyConflictException(aggregateId, expectedVersion, actual);
        }
        return appendLocked(events);
    }

    std::vector<domain::EventPtr> getEventsForAggregate(const std::string& aggregateId) override {
        return getEventsForAggregateFromVersion(aggregateId, 0);
    }

    std::vector<domain::EventPtr> getEventsForAggregateFromVersion(
        const std::string& aggregateId,
        int64_t fromVersion
    ) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::EventPtr> result;

        auto it = byAggregate_.find(aggregateId);
        if (it == byAggregate_.end()) {
            return result;
        }
        // Индексы в log_ лежат в порядке версий
        for (size_t index : it->second) {
            const auto& stored = log_[index];
            if (stored.aggregateVersion > fromVersion) {
                result.push_back(stored.event);
            }
        }
        return result;
    }

    std::vector<domain::EventPtr> getEventsByType(const std::string& eventType) override {
        return filter([&eventType](const domain::StoredEvent& s) {
            return s.event->eventType == eventType;
        });
    }

    std::vector<domain::EventPtr> getEventsAfter(const domain::Timestamp& date) override {
        return filter([&date](const domain::StoredEvent& s) {
            return s.event->occurredOn > date;
        });
    }

    std::vector<domain::EventPtr> getEventsBetween(
        const domain::Timestamp& from,
        const domain::Timestamp& to
    ) override {
        return filter([&from, &to](const domain::StoredEvent& s) {
            return s.event->occurredOn >= from && s.event->occurredOn <= to;
        });
    }

    std::vector<domain::StoredEvent> getAllEvents(int64_t afterSequence, size_t limit) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto begin = std::upper_bound(
            log_.begin(), log_.end(), afterSequence,
            [](int64_t sequence, const domain::StoredEvent& s) {
                return sequence < s.sequenceNumber;
            });

        std::vector<domain::StoredEvent> page;
        for (auto it = begin; it != log_.end() && page.size() < limit; ++it) {
            page.push_back(*it);
        }
        return page;
    }

    std::vector<domain::StoredEvent> getLatestEvents(size_t limit) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const size_t skip = log_.size() > limit ? log_.size() - limit : 0;
        return {log_.begin() + static_cast<std::ptrdiff_t>(skip), log_.end()};
    }

    int64_t getAggregateVersion(const std::string& aggregateId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return versionLocked(aggregateId);
    }

    size_t count() override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return log_.size();
    }

    size_t countForAggregate(const std::string& aggregateId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = byAggregate_.find(aggregateId);
        return it == byAggregate_.end() ? 0 : it->second.size();
    }

private:
    /**
     * @brief Проверить пачку целиком и только потом записать (всё или ничего)
     *
     * Вызывается под unique_lock.
     */
    std::vector<domain::StoredEvent> appendLocked(const std::vector<domain::EventPtr>& events) {
        std::unordered_set<std::string> batchIds;
        std::unordered_map<std::string, int64_t> nextVersions;

        for (const auto& event : events) {
            if (!event) {
                throw std::invalid_argument("Cannot append null event");
            }
            if (eventIds_.count(event->eventId) || !batchIds.insert(event->eventId).second) {
                throw domain::DuplicateEventException(event->eventId);
            }
        }

        std::vector<domain::StoredEvent> stored;
        stored.reserve(events.size());
        int64_t sequence = nextSequence_;

        for (const auto& event : events) {
            domain::StoredEvent envelope;
            envelope.sequenceNumber = sequence++;
            envelope.event = event;
            envelope.storedAt = domain::Timestamp::now();

            if (event->hasAggregateId()) {
                auto [it, inserted] = nextVersions.try_emplace(*event->aggregateId, 0);
                if (inserted) {
                    it->second = versionLocked(*event->aggregateId);
                }
                envelope.aggregateVersion = ++it->second;
            } else {
                envelope.aggregateVersion = 1;
            }
            stored.push_back(std::move(envelope));
        }

        // Ошибок дальше быть не может, фиксируем
        for (const auto& envelope : stored) {
            eventIds_.insert(envelope.event->eventId);
            if (envelope.event->hasAggregateId()) {
                byAggregate_[*envelope.event->aggregateId].push_back(log_.size());
            }
            log_.push_back(envelope);
        }
        nextSequence_ = sequence;
        return stored;
    }

    int64_t versionLocked(const std::string& aggregateId) const {
        auto it = byAggregate_.find(aggregateId);
        if (it == byAggregate_.end() || it->second.empty()) {
            return 0;
        }
        return log_[it->second.back()].aggregateVersion;
    }

    static std::string requireSingleAggregate(const std::vector<domain::EventPtr>& events) {
        const auto& first = events.front();
        if (!first || !first->hasAggregateId()) {
            throw std::invalid_argument("Expected-version append requires aggregate events");
        }
        for (const auto& event : events) {
            if (!event || !event->hasAggregateId() || *event->aggregateId != *first->aggregateId) {
                throw std::invalid_argument("Expected-version append requires events of one aggregate");
            }
        }
        return *first->aggregateId;
    }

    template <typename Predicate>
    std::vector<domain::EventPtr> filter(Predicate predicate) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::EventPtr> result;
        for (const auto& stored : log_) {
            if (predicate(stored)) {
                result.push_back(stored.event);
            }
        }
        return result;
    }

    mutable std::shared_mutex mutex_;
    std::vector<domain::StoredEvent> log_;
    std::unordered_map<std::string, std::vector<size_t>> byAggregate_;
    std::unordered_set<std::string> eventIds_;
    int64_t nextSequence_ = 1;
};

} // namespace eventstore::adapters::secondary
