#pragma once

#include "ports/output/ISnapshotStore.hpp"
#include "domain/Exceptions.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace eventstore::adapters::secondary
{

    /**
     * @brief PostgreSQL реализация хранилища снимков (таблица snapshots)
     *
     * Снимки разных версий сосуществуют; запись - upsert по
     * (aggregate_id, version).
     */
    class PostgresSnapshotStore : public ports::output::ISnapshotStore
    {
    public:
        explicit PostgresSnapshotStore(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                std::cout << "[PostgresSnapshotStore] Connected to " << settings_->getName() << std::endl;
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresSnapshotStore] Connection failed: " << e.what() << std::endl;
                throw domain::StorageUnavailableException(e.what());
            }
        }

        void saveSnapshot(const std::string &aggregateId,
                          const std::string &aggregateType,
                          const nlohmann::json &state,
                          int64_t version) override
        {
            run("saveSnapshot", [&](pqxx::work &t) {
                t.exec_params(
                    "INSERT INTO snapshots (aggregate_id, aggregate_type, state, version) "
                    "VALUES ($1, $2, $3::jsonb, $4) "
                    "ON CONFLICT (aggregate_id, version) DO UPDATE SET "
                    "aggregate_type = EXCLUDED.aggregate_type, state = EXCLUDED.state, created_at = NOW()",
                    aggregateId, aggregateType, state.dump(), version);
                t.commit();
                return 0;
            });
            std::cout << "[PostgresSnapshotStore] Saved snapshot " << aggregateId << " v" << version << std::endl;
        }

        std::optional<domain::Snapshot> getSnapshot(const std::string &aggregateId) override
        {
            return fetchOne("getSnapshot",
                            std::string(SELECT_SNAPSHOT) + " WHERE aggregate_id = $1 ORDER BY version DESC LIMIT 1",
                            aggregateId, int64_t{0}, false);
        }

        std::optional<domain::Snapshot> getSnapshotAtVersion(const std::string &aggregateId,
                                                             int64_t version) override
        {
            return fetchOne("getSnapshotAtVersion",
                            std::string(SELECT_SNAPSHOT) + " WHERE aggregate_id = $1 AND version = $2",
                            aggregateId, version, true);
        }

        void deleteSnapshots(const std::string &aggregateId) override
        {
            run("deleteSnapshots", [&](pqxx::work &t) {
                t.exec_params("DELETE FROM snapshots WHERE aggregate_id = $1", aggregateId);
                t.commit();
                return 0;
            });
        }

        void deleteSnapshotsOlderThan(const std::string &aggregateId, int64_t version) override
        {
            run("deleteSnapshotsOlderThan", [&](pqxx::work &t) {
                t.exec_params("DELETE FROM snapshots WHERE aggregate_id = $1 AND version < $2",
                              aggregateId, version);
                t.commit();
                return 0;
            });
        }

        size_t count() override
        {
            return run("count", [&](pqxx::work &t) {
                auto r = t.exec("SELECT COUNT(*) FROM snapshots");
                t.commit();
                return static_cast<size_t>(r[0][0].as<int64_t>());
            });
        }

    private:
        static constexpr const char *SELECT_SNAPSHOT =
            "SELECT aggregate_id, aggregate_type, state::text AS state, version, "
            "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms FROM snapshots";

        template <typename F>
        auto run(const char *operation, F &&body)
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                return body(t);
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresSnapshotStore] " << operation << "() failed: " << e.what() << std::endl;
                throw domain::StorageUnavailableException(std::string(operation) + ": " + e.what());
            }
        }

        std::optional<domain::Snapshot> fetchOne(const char *operation,
                                                 const std::string &sql,
                                                 const std::string &aggregateId,
                                                 int64_t version,
                                                 bool withVersion)
        {
            auto r = run(operation, [&](pqxx::work &t) {
                auto result = withVersion ? t.exec_params(sql, aggregateId, version)
                                          : t.exec_params(sql, aggregateId);
                t.commit();
                return result;
            });
            if (r.empty())
                return std::nullopt;

            domain::Snapshot snapshot;
            snapshot.aggregateId = r[0]["aggregate_id"].as<std::string>();
            snapshot.aggregateType = r[0]["aggregate_type"].as<std::string>();
            snapshot.version = r[0]["version"].as<int64_t>();
            snapshot.createdAt = domain::Timestamp::fromUnixMillis(r[0]["created_at_ms"].as<int64_t>());
            try
            {
                snapshot.state = nlohmann::json::parse(r[0]["state"].as<std::string>());
            }
            catch (const nlohmann::json::parse_error &e)
            {
                std::cerr << "[PostgresSnapshotStore] Unreadable state of " << aggregateId << std::endl;
                throw domain::CorruptSnapshotException(aggregateId, e.what());
            }
            return snapshot;
        }

        std::shared_ptr<settings::DbSettings> settings_;
    };

} // namespace eventstore::adapters::secondary
