#include "adapters/secondary/persistence/PostgresEventStore.hpp"
#include "domain/Exceptions.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace eventstore::adapters::secondary {

namespace {

const char* const EVENT_ID_CONSTRAINT = "uq_domain_events_event_id";

const char* const SELECT_STORED = R"(
    SELECT sequence, event_id, event_type, aggregate_id, aggregate_type, version,
           payload::text AS payload, metadata::text AS metadata,
           (EXTRACT(EPOCH FROM occurred_on) * 1000)::BIGINT AS occurred_on_ms,
           (EXTRACT(EPOCH FROM stored_at) * 1000)::BIGINT AS stored_at_ms
    FROM domain_events
)";

/**
 * @brief Выполнить функцию в транзакции на новом соединении
 *
 * Доменные исключения проходят как есть, ошибки libpqxx
 * (кроме unique_violation) превращаются в StorageUnavailableException.
 */
template <typename F>
auto inTransaction(const settings::DbSettings& db, const char* operation, F&& body)
{
    try {
        pqxx::connection connection(db.getConnectionString());
        pqxx::work txn(connection);
        return body(txn);
    } catch (const pqxx::unique_violation&) {
        throw;
    } catch (const pqxx::failure& e) {
        std::cerr << "[PostgresEventStore] " << operation << "() failed: " << e.what() << std::endl;
        throw domain::StorageUnavailableException(std::string(operation) + ": " + e.what());
    }
}

nlohmann::json parseJsonColumn(const pqxx::row& row, const char* column, const std::string& eventType)
{
    if (row[column].is_null()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(row[column].as<std::string>());
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::CorruptEventException(eventType, std::string(column) + ": " + e.what());
    }
}

} // namespace

PostgresEventStore::PostgresEventStore(
    std::shared_ptr<settings::DbSettings> dbSettings,
    std::shared_ptr<settings::EventStoreSettings> storeSettings,
    std::shared_ptr<domain::DomainEventFactory> decoder)
    : dbSettings_(std::move(dbSettings))
    , decoder_(std::move(decoder))
    , appendRetries_(storeSettings->getAppendRetries())
{
    std::cout << "[PostgresEventStore] Connecting to " << dbSettings_->getHost()
              << ":" << dbSettings_->getPort() << "/" << dbSettings_->getName() << std::endl;
    try {
        pqxx::connection connection(dbSettings_->getConnectionString());
        std::cout << "[PostgresEventStore] Connected successfully" << std::endl;
    } catch (const pqxx::failure& e) {
        std::cerr << "[PostgresEventStore] Connection failed: " << e.what() << std::endl;
        throw domain::StorageUnavailableException(e.what());
    }
}

// ============================================================================
// WRITES
// ============================================================================

domain::StoredEvent PostgresEventStore::append(domain::EventPtr event)
{
    return appendWithRetry({std::move(event)}, -1).front();
}

std::vector<domain::StoredEvent> PostgresEventStore::appendAll(
    const std::vector<domain::EventPtr>& events)
{
    if (events.empty()) {
        return {};
    }
    return appendWithRetry(events, -1);
}

std::vector<domain::StoredEvent> PostgresEventStore::appendAll(
    const std::vector<domain::EventPtr>& events,
    int64_t expectedVersion)
{
    if (events.empty()) {
        return {};
    }
    const auto& first = events.front();
    if (!first || !first->hasAggregateId()) {
        throw std::invalid_argument("Expected-version append requires aggregate events");
    }
    for (const auto& event : events) {
        if (!event || !event->hasAggregateId() || *event->aggregateId != *first->aggregateId) {
            throw std::invalid_argument("Expected-version append requires events of one aggregate");
        }
    }
    return appendWithRetry(events, expectedVersion);
}

std::vector<domain::StoredEvent> PostgresEventStore::appendWithRetry(
    const std::vector<domain::EventPtr>& events,
    int64_t expectedVersion)
{
    std::unordered_set<std::string> batchIds;
    for (const auto& event : events) {
        if (!event) {
            throw std::invalid_argument("Cannot append null event");
        }
        if (!batchIds.insert(event->eventId).second) {
            throw domain::DuplicateEventException(event->eventId);
        }
    }

    std::string conflictAggregate;
    for (int attempt = 1; attempt <= appendRetries_; ++attempt) {
        try {
            auto stored = inTransaction(*dbSettings_, "append", [&](pqxx::work& txn) {
                auto result = insertBatch(txn, events, expectedVersion);
                txn.commit();
                return result;
            });
            std::cout << "[PostgresEventStore] Appended " << stored.size() << " event(s), last sequence "
                      << stored.back().sequenceNumber << std::endl;
            return stored;
        } catch (const pqxx::unique_violation& e) {
            conflictAggregate = events.front()->aggregateId.value_or("<none>");
            std::cerr << "[PostgresEventStore] Version race on " << conflictAggregate
                      << " (attempt " << attempt << "/" << appendRetries_ << "): " << e.what() << std::endl;
        }
    }
    throw domain::ConcurrencyConflictException(
        conflictAggregate,
        "version assignment failed after " + std::to_string(appendRetries_) + " attempts");
}

std::vector<domain::StoredEvent> PostgresEventStore::insertBatch(
    pqxx::work& txn,
    const std::vector<domain::EventPtr>& events,
    int64_t expectedVersion)
{
    // Блокировки берутся в порядке id, чтобы две пачки не зациклились
    std::set<std::string> aggregateIds;
    for (const auto& event : events) {
        if (event->hasAggregateId()) {
            aggregateIds.insert(*event->aggregateId);
        }
    }

    std::unordered_map<std::string, int64_t> versions;
    for (const auto& aggregateId : aggregateIds) {
        txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", aggregateId);
        auto r = txn.exec_params(
            "SELECT COALESCE(MAX(version), 0) FROM domain_events WHERE aggregate_id = $1",
            aggregateId);
        versions[aggregateId] = r[0][0].as<int64_t>();
    }

    if (expectedVersion >= 0) {
        const std::string& aggregateId = *events.front()->aggregateId;
        int64_t actual = versions[aggregateId];
        if (actual != expectedVersion) {
            std::cerr << "[PostgresEventStore] Version conflict on " << aggregateId
                      << ": expected " << expectedVersion << ", actual " << actual << std::endl;
            throw domain::ConcurrencyConflictException(aggregateId, expectedVersion, actual);
        }
    }

    std::vector<domain::StoredEvent> stored;
    stored.reserve(events.size());

    for (const auto& event : events) {
        int64_t version = 1;
        std::optional<std::string> aggregateId;
        if (event->hasAggregateId()) {
            aggregateId = event->aggregateId;
            version = ++versions[*aggregateId];
        }

        pqxx::result r;
        try {
            r = txn.exec_params(
                R"(
                    INSERT INTO domain_events (
                        event_id, event_type, aggregate_id, aggregate_type, version,
                        payload, metadata, occurred_on
                    )
                    VALUES ($1, $2, $3, $4, $5, $6::jsonb, $7::jsonb, to_timestamp($8::bigint / 1000.0))
                    RETURNING sequence, (EXTRACT(EPOCH FROM stored_at) * 1000)::BIGINT AS stored_at_ms
                )",
                event->eventId,
                event->eventType,
                aggregateId,
                event->aggregateType,
                version,
                event->payload().dump(),
                event->metadata.dump(),
                event->occurredOn.toUnixMillis()
            );
        } catch (const pqxx::unique_violation& e) {
            if (std::string(e.what()).find(EVENT_ID_CONSTRAINT) != std::string::npos) {
                throw domain::DuplicateEventException(event->eventId);
            }
            throw;
        }

        domain::StoredEvent envelope;
        envelope.sequenceNumber = r[0]["sequence"].as<int64_t>();
        envelope.aggregateVersion = version;
        envelope.event = event;
        envelope.storedAt = domain::Timestamp::fromUnixMillis(r[0]["stored_at_ms"].as<int64_t>());
        stored.push_back(std::move(envelope));
    }
    return stored;
}

// ============================================================================
// READS
// ============================================================================

template <typename... Args>
std::vector<domain::StoredEvent> PostgresEventStore::queryStored(
    const char* operation,
    const std::string& sql,
    Args&&... args)
{
    auto result = inTransaction(*dbSettings_, operation, [&](pqxx::work& txn) {
        auto r = txn.exec_params(sql, std::forward<Args>(args)...);
        txn.commit();
        return r;
    });

    std::vector<domain::StoredEvent> stored;
    stored.reserve(result.size());
    for (const auto& row : result) {
        stored.push_back(rowToStoredEvent(row));
    }
    return stored;
}

template <typename... Args>
std::vector<domain::EventPtr> PostgresEventStore::queryEvents(
    const char* operation,
    const std::string& sql,
    Args&&... args)
{
    auto stored = queryStored(operation, sql, std::forward<Args>(args)...);
    std::vector<domain::EventPtr> events;
    events.reserve(stored.size());
    for (auto& envelope : stored) {
        events.push_back(std::move(envelope.event));
    }
    return events;
}

std::vector<domain::EventPtr> PostgresEventStore::getEventsForAggregate(const std::string& aggregateId)
{
    return getEventsForAggregateFromVersion(aggregateId, 0);
}

std::vector<domain::EventPtr> PostgresEventStore::getEventsForAggregateFromVersion(
    const std::string& aggregateId,
    int64_t fromVersion)
{
    return queryEvents("getEventsForAggregate",
        std::string(SELECT_STORED) + " WHERE aggregate_id = $1 AND version > $2 ORDER BY version ASC",
        aggregateId, fromVersion);
}

std::vector<domain::EventPtr> PostgresEventStore::getEventsByType(const std::string& eventType)
{
    return queryEvents("getEventsByType",
        std::string(SELECT_STORED) + " WHERE event_type = $1 ORDER BY sequence ASC",
        eventType);
}

std::vector<domain::EventPtr> PostgresEventStore::getEventsAfter(const domain::Timestamp& date)
{
    return queryEvents("getEventsAfter",
        std::string(SELECT_STORED) +
            " WHERE occurred_on > to_timestamp($1::bigint / 1000.0) ORDER BY sequence ASC",
        date.toUnixMillis());
}

std::vector<domain::EventPtr> PostgresEventStore::getEventsBetween(
    const domain::Timestamp& from,
    const domain::Timestamp& to)
{
    return queryEvents("getEventsBetween",
        std::string(SELECT_STORED) +
            " WHERE occurred_on >= to_timestamp($1::bigint / 1000.0)"
            " AND occurred_on <= to_timestamp($2::bigint / 1000.0) ORDER BY sequence ASC",
        from.toUnixMillis(), to.toUnixMillis());
}

std::vector<domain::StoredEvent> PostgresEventStore::getAllEvents(int64_t afterSequence, size_t limit)
{
    return queryStored("getAllEvents",
        std::string(SELECT_STORED) + " WHERE sequence > $1 ORDER BY sequence ASC LIMIT $2",
        afterSequence, static_cast<int64_t>(limit));
}

std::vector<domain::StoredEvent> PostgresEventStore::getLatestEvents(size_t limit)
{
    auto stored = queryStored("getLatestEvents",
        std::string(SELECT_STORED) + " ORDER BY sequence DESC LIMIT $1",
        static_cast<int64_t>(limit));
    std::reverse(stored.begin(), stored.end());
    return stored;
}

int64_t PostgresEventStore::getAggregateVersion(const std::string& aggregateId)
{
    return inTransaction(*dbSettings_, "getAggregateVersion", [&](pqxx::work& txn) {
        auto r = txn.exec_params(
            "SELECT COALESCE(MAX(version), 0) FROM domain_events WHERE aggregate_id = $1",
            aggregateId);
        txn.commit();
        return r[0][0].as<int64_t>();
    });
}

size_t PostgresEventStore::count()
{
    return inTransaction(*dbSettings_, "count", [&](pqxx::work& txn) {
        auto r = txn.exec("SELECT COUNT(*) FROM domain_events");
        txn.commit();
        return static_cast<size_t>(r[0][0].as<int64_t>());
    });
}

size_t PostgresEventStore::countForAggregate(const std::string& aggregateId)
{
    return inTransaction(*dbSettings_, "countForAggregate", [&](pqxx::work& txn) {
        auto r = txn.exec_params(
            "SELECT COUNT(*) FROM domain_events WHERE aggregate_id = $1", aggregateId);
        txn.commit();
        return static_cast<size_t>(r[0][0].as<int64_t>());
    });
}

domain::StoredEvent PostgresEventStore::rowToStoredEvent(const pqxx::row& row) const
{
    domain::EventData data;
    data.eventId = row["event_id"].as<std::string>();
    data.eventType = row["event_type"].as<std::string>();
    if (!row["aggregate_id"].is_null()) {
        data.aggregateId = row["aggregate_id"].as<std::string>();
    }
    if (!row["aggregate_type"].is_null()) {
        data.aggregateType = row["aggregate_type"].as<std::string>();
    }
    data.occurredOn = domain::Timestamp::fromUnixMillis(row["occurred_on_ms"].as<int64_t>());
    data.payload = parseJsonColumn(row, "payload", data.eventType);
    data.metadata = parseJsonColumn(row, "metadata", data.eventType);

    domain::StoredEvent envelope;
    envelope.sequenceNumber = row["sequence"].as<int64_t>();
    envelope.aggregateVersion = row["version"].as<int64_t>();
    envelope.storedAt = domain::Timestamp::fromUnixMillis(row["stored_at_ms"].as<int64_t>());
    envelope.event = decoder_->create(data);
    return envelope;
}

} // namespace eventstore::adapters::secondary
