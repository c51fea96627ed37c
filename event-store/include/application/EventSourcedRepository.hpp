#pragma once

#include "application/SnapshotPolicy.hpp"
#include "domain/Exceptions.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/ISnapshotStore.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace eventstore::application {

/**
 * @brief Репозиторий агрегатов, хранящих состояние в виде событий
 *
 * Загрузка: последний снимок + хвост событий после него, либо полная
 * история. Снимок - только кэш: любая проблема с ним логируется и
 * приводит к полному replay. Ошибки журнала событий пробрасываются
 * всегда и никогда не превращаются в "не найдено".
 *
 * Сохранение: pending-события пишутся атомарно с проверкой
 * getPersistedVersion(); буфер очищается только после успешной записи.
 *
 * @tparam A агрегат, наследник domain::EventSourcedAggregate<A>
 */
template <typename A>
class EventSourcedRepository {
public:
    /**
     * @param snapshotStore может быть nullptr - тогда всегда полный replay
     */
    EventSourcedRepository(
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<ports::output::ISnapshotStore> snapshotStore,
        std::shared_ptr<ISnapshotPolicy> snapshotPolicy
    ) : eventStore_(std::move(eventStore))
      , snapshotStore_(std::move(snapshotStore))
      , snapshotPolicy_(std::move(snapshotPolicy))
    {
        if (!eventStore_) {
            throw std::invalid_argument("EventSourcedRepository requires an event store");
        }
        if (!snapshotPolicy_) {
            snapshotPolicy_ = std::make_shared<NeverSnapshotPolicy>();
        }
    }

    /**
     * @brief Загрузить агрегат
     *
     * @return std::nullopt если у агрегата нет ни одного события
     * @throws StorageUnavailableException, CorruptEventException из журнала
     */
    std::optional<A> findById(const std::string& id) {
        if (auto aggregate = restoreFromSnapshot(id, std::nullopt)) {
            auto tail = eventStore_->getEventsForAggregateFromVersion(id, aggregate->getVersion());
            for (const auto& event : tail) {
                aggregate->replay(*event);
            }
            return aggregate;
        }

        auto events = eventStore_->getEventsForAggregate(id);
        if (events.empty()) {
            return std::nullopt;
        }
        return A::reconstituteFromEvents(events);
    }

    /**
     * @throws AggregateNotFoundException
     */
    A getById(const std::string& id) {
        auto aggregate = findById(id);
        if (!aggregate) {
            throw domain::AggregateNotFoundException(A::aggregateTypeName(), id);
        }
        return std::move(*aggregate);
    }

    /**
     * @brief Состояние агрегата на момент версии version
     *
     * @return std::nullopt если агрегат не дошёл до этой версии
     */
    std::optional<A> findByIdAtVersion(const std::string& id, int64_t version) {
        if (version <= 0) {
            throw std::invalid_argument("Version must be positive: " + std::to_string(version));
        }
        if (auto aggregate = restoreFromSnapshot(id, version)) {
            return aggregate;
        }

        auto events = eventStore_->getEventsForAggregate(id);
        if (static_cast<int64_t>(events.size()) < version) {
            return std::nullopt;
        }
        events.resize(static_cast<size_t>(version));
        return A::reconstituteFromEvents(events);
    }

    bool exists(const std::string& id) {
        return eventStore_->getAggregateVersion(id) > 0;
    }

    /**
     * @brief Сохранить несохранённые события агрегата
     *
     * @return Записанные конверты (для ProjectionManager::projectStoredEvents),
     *         пусто если сохранять нечего
     * @throws ConcurrencyConflictException агрегат изменён другим writer'ом
     */
    std::vector<domain::StoredEvent> save(A& aggregate) {
        if (!aggregate.hasPendingEvents()) {
            return {};
        }

        const int64_t persistedVersion = aggregate.getPersistedVersion();
        auto stored = eventStore_->appendAll(aggregate.getPendingEvents(), persistedVersion);
        aggregate.pullPendingEvents();

        std::cout << "[EventSourcedRepository] Saved " << stored.size() << " event(s) for "
                  << A::aggregateTypeName() << " " << aggregate.getId()
                  << " (v" << aggregate.getVersion() << ")" << std::endl;

        if (snapshotStore_ && snapshotPolicy_->shouldSnapshot(persistedVersion, aggregate.getVersion())) {
            writeSnapshot(aggregate);
        }
        return stored;
    }

private:
    /**
     * @param version std::nullopt - последний снимок, иначе ровно на версии
     */
    std::optional<A> restoreFromSnapshot(const std::string& id, std::optional<int64_t> version) {
        if (!snapshotStore_) {
            return std::nullopt;
        }
        try {
            auto snapshot = version ? snapshotStore_->getSnapshotAtVersion(id, *version)
                                    : snapshotStore_->getSnapshot(id);
            if (!snapshot) {
                return std::nullopt;
            }
            return A::fromSnapshot(*snapshot);
        } catch (const domain::StorageUnavailableException& e) {
            std::cerr << "[EventSourcedRepository] Snapshot store unavailable for " << id
                      << ", falling back to full replay: " << e.what() << std::endl;
        } catch (const domain::CorruptSnapshotException& e) {
            std::cerr << "[EventSourcedRepository] " << e.what()
                      << ", falling back to full replay" << std::endl;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[EventSourcedRepository] Unusable snapshot for " << id
                      << ", falling back to full replay: " << e.what() << std::endl;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[EventSourcedRepository] Unreadable snapshot state for " << id
                      << ", falling back to full replay: " << e.what() << std::endl;
        }
        return std::nullopt;
    }

    /**
     * @brief События уже записаны, поэтому сбой снимка не пробрасывается
     */
    void writeSnapshot(const A& aggregate) {
        try {
            auto snapshot = aggregate.takeSnapshot();
            snapshotStore_->saveSnapshot(snapshot.aggregateId, snapshot.aggregateType,
                                         snapshot.state, snapshot.version);
        } catch (const std::exception& e) {
            std::cerr << "[EventSourcedRepository] Snapshot of " << aggregate.getId()
                      << " v" << aggregate.getVersion() << " not written: " << e.what() << std::endl;
        }
    }

    std::shared_ptr<ports::output::IEventStore> eventStore_;
    std::shared_ptr<ports::output::ISnapshotStore> snapshotStore_;
    std::shared_ptr<ISnapshotPolicy> snapshotPolicy_;
};

} // namespace eventstore::application
