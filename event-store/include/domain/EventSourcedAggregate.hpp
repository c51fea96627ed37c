#pragma once

#include "domain/Exceptions.hpp"
#include "domain/Snapshot.hpp"
#include "domain/events/DomainEvent.hpp"
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eventstore::domain {

/**
 * @brief Базовый класс агрегата с состоянием из событий
 *
 * Единственный способ изменить состояние - применить одно событие,
 * увеличив версию ровно на единицу. Живая мутация (recordEvent) и
 * replay (reconstituteFromEvents, replay) проходят через applyEvent,
 * поэтому версия вычисляется одинаково в обоих путях.
 *
 * Требования к Derived:
 * - explicit Derived(const std::string& id)
 * - static const ApplierTable& appliers() - таблица "тип события → обработчик",
 *   строится один раз (function-local static)
 * - static std::string aggregateTypeName()
 * - nlohmann::json snapshotState() const и void restoreState(const nlohmann::json&)
 *
 * @example
 * ```cpp
 * const BankAccount::ApplierTable& BankAccount::appliers() {
 *     static const ApplierTable table = {
 *         on<AccountOpenedEvent>(AccountOpenedEvent::TYPE, &BankAccount::applyOpened),
 *     };
 *     return table;
 * }
 * ```
 */
template <typename Derived>
class EventSourcedAggregate {
public:
    using Applier = std::function<void(Derived&, const DomainEvent&)>;
    using ApplierTable = std::unordered_map<std::string, Applier>;

    virtual ~EventSourcedAggregate() = default;

    const std::string& getId() const { return id_; }

    /**
     * @brief Количество применённых событий, включая ещё не сохранённые
     */
    int64_t getVersion() const { return version_; }

    /**
     * @brief Версия, на которой агрегат был загружен из хранилища
     */
    int64_t getPersistedVersion() const {
        return version_ - static_cast<int64_t>(pendingEvents_.size());
    }

    const std::vector<EventPtr>& getPendingEvents() const { return pendingEvents_; }

    bool hasPendingEvents() const { return !pendingEvents_.empty(); }

    /**
     * @brief Забрать и очистить буфер несохранённых событий
     */
    std::vector<EventPtr> pullPendingEvents() {
        std::vector<EventPtr> events;
        events.swap(pendingEvents_);
        return events;
    }

    /**
     * @brief Применить уже сохранённое событие (догонка после снимка)
     */
    void replay(const DomainEvent& event) {
        if (!event.hasAggregateId() || *event.aggregateId != id_) {
            throw ReconstitutionException("event " + event.eventId +
                                          " does not belong to aggregate " + id_);
        }
        applyEvent(event);
    }

    /**
     * @brief Восстановить агрегат из упорядоченного потока его событий
     *
     * @throws ReconstitutionException пустой поток, у первого события нет
     *         aggregateId, в потоке есть null или событие чужого агрегата
     */
    static Derived reconstituteFromEvents(const std::vector<EventPtr>& events) {
        if (events.empty()) {
            throw ReconstitutionException("empty event stream");
        }
        const auto& first = events.front();
        if (!first || !first->hasAggregateId()) {
            throw ReconstitutionException("first event has no aggregate ID");
        }

        Derived aggregate(*first->aggregateId);
        for (const auto& event : events) {
            if (!event) {
                throw ReconstitutionException("null event in stream of " + aggregate.getId() +
                                              " after version " + std::to_string(aggregate.getVersion()));
            }
            aggregate.replay(*event);
        }
        return aggregate;
    }

    /**
     * @brief Восстановить агрегат из снимка (без догонки)
     *
     * @throws std::invalid_argument если снимок другого типа агрегата
     * @throws nlohmann::json::exception если state не читается
     */
    static Derived fromSnapshot(const Snapshot& snapshot) {
        if (snapshot.aggregateType != Derived::aggregateTypeName()) {
            throw std::invalid_argument("snapshot of " + snapshot.aggregateType +
                                        " cannot restore " + Derived::aggregateTypeName());
        }
        Derived aggregate(snapshot.aggregateId);
        aggregate.restoreState(snapshot.state);
        static_cast<EventSourcedAggregate&>(aggregate).version_ = snapshot.version;
        return aggregate;
    }

    /**
     * @brief Снимок текущего состояния (версия включает несохранённые события)
     */
    Snapshot takeSnapshot() const {
        Snapshot snapshot;
        snapshot.aggregateId = id_;
        snapshot.aggregateType = Derived::aggregateTypeName();
        snapshot.state = static_cast<const Derived&>(*this).snapshotState();
        snapshot.version = version_;
        snapshot.createdAt = Timestamp::now();
        return snapshot;
    }

protected:
    explicit EventSourcedAggregate(std::string id) : id_(std::move(id)) {
        if (id_.empty()) {
            throw std::invalid_argument("Aggregate ID must not be empty");
        }
    }

    EventSourcedAggregate(const EventSourcedAggregate&) = default;
    EventSourcedAggregate(EventSourcedAggregate&&) noexcept = default;
    EventSourcedAggregate& operator=(const EventSourcedAggregate&) = default;
    EventSourcedAggregate& operator=(EventSourcedAggregate&&) noexcept = default;

    /**
     * @brief Записать новое событие: в буфер + применить + версия++
     *
     * Вызывается бизнес-методом после проверки инвариантов.
     */
    void recordEvent(EventPtr event) {
        if (!event) {
            throw std::invalid_argument("Cannot record null event");
        }
        if (!event->hasAggregateId() || *event->aggregateId != id_) {
            throw std::invalid_argument("Event " + event->eventType +
                                        " does not belong to aggregate " + id_);
        }
        applyEvent(*event);
        pendingEvents_.push_back(std::move(event));
    }

    /**
     * @brief Элемент таблицы обработчиков для конкретного типа события
     */
    template <typename E>
    static std::pair<const std::string, Applier> on(const std::string& eventType,
                                                    void (Derived::*handler)(const E&)) {
        return {eventType, [eventType, handler](Derived& self, const DomainEvent& event) {
            const auto* typed = dynamic_cast<const E*>(&event);
            if (!typed) {
                throw CorruptEventException(eventType,
                    std::string("decoded as ") + typeid(event).name() +
                    ", expected " + typeid(E).name());
            }
            (self.*handler)(*typed);
        }};
    }

private:
    /**
     * @brief Диспетчеризация по таблице; неизвестный тип - no-op для состояния
     */
    void applyEvent(const DomainEvent& event) {
        const ApplierTable& table = Derived::appliers();
        auto it = table.find(event.eventType);
        if (it != table.end()) {
            it->second(static_cast<Derived&>(*this), event);
        }
        ++version_;
    }

    std::string id_;
    int64_t version_ = 0;
    std::vector<EventPtr> pendingEvents_;
};

} // namespace eventstore::domain
