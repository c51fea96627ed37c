#pragma once

#include "domain/Snapshot.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace eventstore::ports::output {

/**
 * @brief Интерфейс хранилища снимков агрегатов
 *
 * Кэш (aggregateId, version) → состояние. Ни один метод не трогает
 * журнал событий.
 */
class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    /**
     * @brief Сохранить снимок (upsert по aggregateId + version)
     *
     * @param aggregateId ID агрегата
     * @param aggregateType Тип агрегата (bank_account)
     * @param state Сериализованное состояние
     * @param version Версия, на которой снят снимок
     */
    virtual void saveSnapshot(
        const std::string& aggregateId,
        const std::string& aggregateType,
        const nlohmann::json& state,
        int64_t version
    ) = 0;

    /**
     * @brief Снимок с максимальной версией или nullopt
     */
    virtual std::optional<domain::Snapshot> getSnapshot(const std::string& aggregateId) = 0;

    /**
     * @brief Снимок ровно на версии version или nullopt
     */
    virtual std::optional<domain::Snapshot> getSnapshotAtVersion(
        const std::string& aggregateId,
        int64_t version
    ) = 0;

    virtual void deleteSnapshots(const std::string& aggregateId) = 0;

    /**
     * @brief Удалить снимки с версией < version
     */
    virtual void deleteSnapshotsOlderThan(const std::string& aggregateId, int64_t version) = 0;

    /**
     * @brief Общее количество снимков
     */
    virtual size_t count() = 0;
};

} // namespace eventstore::ports::output
