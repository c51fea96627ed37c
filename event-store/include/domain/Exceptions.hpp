#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

/**
 * @file Exceptions.hpp
 * @brief Иерархия исключений подсистемы event sourcing
 *
 * "Не найдено" для findById возвращается как std::nullopt,
 * все остальные ошибки - исключения из этого файла.
 */

namespace eventstore::domain {

/**
 * @brief Базовое исключение подсистемы
 */
class EventSourcingException : public std::runtime_error {
public:
    explicit EventSourcingException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Агрегат не имеет ни одного события
 */
class AggregateNotFoundException : public EventSourcingException {
public:
    AggregateNotFoundException(const std::string& aggregateType, const std::string& aggregateId)
        : EventSourcingException(aggregateType + " with ID \"" + aggregateId + "\" was not found")
        , aggregateType_(aggregateType)
        , aggregateId_(aggregateId) {}

    const std::string& aggregateType() const { return aggregateType_; }
    const std::string& aggregateId() const { return aggregateId_; }

private:
    std::string aggregateType_;
    std::string aggregateId_;
};

/**
 * @brief Гонка при назначении версии агрегата
 *
 * Вызывающий должен перечитать агрегат и повторить всю бизнес-операцию,
 * а не только запись событий.
 */
class ConcurrencyConflictException : public EventSourcingException {
public:
    ConcurrencyConflictException(const std::string& aggregateId,
                                 int64_t expectedVersion,
                                 int64_t actualVersion)
        : EventSourcingException("Concurrency conflict on aggregate " + aggregateId +
                                 ": expected version " + std::to_string(expectedVersion) +
                                 ", actual " + std::to_string(actualVersion))
        , aggregateId_(aggregateId)
        , expectedVersion_(expectedVersion)
        , actualVersion_(actualVersion) {}

    ConcurrencyConflictException(const std::string& aggregateId, const std::string& reason)
        : EventSourcingException("Concurrency conflict on aggregate " + aggregateId + ": " + reason)
        , aggregateId_(aggregateId) {}

    const std::string& aggregateId() const { return aggregateId_; }
    int64_t expectedVersion() const { return expectedVersion_; }
    int64_t actualVersion() const { return actualVersion_; }

private:
    std::string aggregateId_;
    int64_t expectedVersion_ = -1;
    int64_t actualVersion_ = -1;
};

/**
 * @brief Событие с таким eventId уже сохранено
 */
class DuplicateEventException : public EventSourcingException {
public:
    explicit DuplicateEventException(const std::string& eventId)
        : EventSourcingException("Event already stored: " + eventId)
        , eventId_(eventId) {}

    const std::string& eventId() const { return eventId_; }

private:
    std::string eventId_;
};

/**
 * @brief Хранилище недоступно (I/O, соединение, SQL)
 */
class StorageUnavailableException : public EventSourcingException {
public:
    explicit StorageUnavailableException(const std::string& message)
        : EventSourcingException("Storage unavailable: " + message) {}
};

/**
 * @brief Событие не декодируется в объявленный тип
 */
class CorruptEventException : public EventSourcingException {
public:
    CorruptEventException(const std::string& eventType, const std::string& reason)
        : EventSourcingException("Corrupt event '" + eventType + "': " + reason)
        , eventType_(eventType) {}

    const std::string& eventType() const { return eventType_; }

private:
    std::string eventType_;
};

/**
 * @brief Снимок прочитан, но его state не разбирается
 */
class CorruptSnapshotException : public EventSourcingException {
public:
    CorruptSnapshotException(const std::string& aggregateId, const std::string& reason)
        : EventSourcingException("Corrupt snapshot of " + aggregateId + ": " + reason) {}
};

/**
 * @brief Невозможно восстановить агрегат из потока событий
 */
class ReconstitutionException : public EventSourcingException {
public:
    explicit ReconstitutionException(const std::string& message)
        : EventSourcingException("Cannot reconstitute aggregate: " + message) {}
};

/**
 * @brief Бизнес-операция нарушает инвариант агрегата
 */
class InvariantViolationException : public EventSourcingException {
public:
    explicit InvariantViolationException(const std::string& message)
        : EventSourcingException(message) {}
};

class ProjectorNotFoundException : public EventSourcingException {
public:
    explicit ProjectorNotFoundException(const std::string& name)
        : EventSourcingException("Projector not found: " + name) {}
};

/**
 * @brief Проектор упал при доставке события
 */
class ProjectionFailedException : public EventSourcingException {
public:
    ProjectionFailedException(const std::string& projectorName,
                              int64_t sequenceNumber,
                              const std::string& reason)
        : EventSourcingException("Projector " + projectorName + " failed at sequence " +
                                 std::to_string(sequenceNumber) + ": " + reason)
        , projectorName_(projectorName)
        , sequenceNumber_(sequenceNumber) {}

    const std::string& projectorName() const { return projectorName_; }

    /// 0, если событие доставлялось без конверта (projectEvent)
    int64_t sequenceNumber() const { return sequenceNumber_; }

private:
    std::string projectorName_;
    int64_t sequenceNumber_;
};

class RebuildCancelledException : public EventSourcingException {
public:
    RebuildCancelledException(const std::string& target, int64_t lastSequence)
        : EventSourcingException("Rebuild of " + target + " cancelled after sequence " +
                                 std::to_string(lastSequence))
        , lastSequence_(lastSequence) {}

    int64_t lastSequence() const { return lastSequence_; }

private:
    int64_t lastSequence_;
};

} // namespace eventstore::domain
