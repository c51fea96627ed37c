#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace eventstore::settings {

enum class StorageDriver {
    MEMORY,
    DATABASE
};

/**
 * @brief Настройки журнала событий, снимков и проекций
 *
 * Читает из ENV:
 * - EVENT_STORE_DRIVER (memory|database, default: memory)
 * - EVENT_SNAPSHOTS_ENABLED (default: true)
 * - EVENT_SNAPSHOTS_THRESHOLD (default: 10) - снимок на каждой N-й версии
 * - EVENT_SNAPSHOTS_DRIVER (memory|database, default: как EVENT_STORE_DRIVER)
 * - EVENT_PROJECTIONS_BATCH_SIZE (default: 100)
 * - EVENT_STORE_APPEND_RETRIES (default: 3)
 * - EVENT_STORE_TOLERATE_UNKNOWN_TYPES (default: false)
 *
 * @throws std::invalid_argument при некорректных значениях
 */
class EventStoreSettings {
public:
    EventStoreSettings() {
        if (const char* val = std::getenv("EVENT_STORE_DRIVER")) {
            storeDriver_ = parseDriver("EVENT_STORE_DRIVER", val);
        }
        snapshotDriver_ = storeDriver_;
        if (const char* val = std::getenv("EVENT_SNAPSHOTS_DRIVER")) {
            snapshotDriver_ = parseDriver("EVENT_SNAPSHOTS_DRIVER", val);
        }
        if (const char* val = std::getenv("EVENT_SNAPSHOTS_ENABLED")) {
            snapshotsEnabled_ = parseBool("EVENT_SNAPSHOTS_ENABLED", val);
        }
        if (const char* val = std::getenv("EVENT_SNAPSHOTS_THRESHOLD")) {
            snapshotThreshold_ = parsePositive("EVENT_SNAPSHOTS_THRESHOLD", val);
        }
        if (const char* val = std::getenv("EVENT_PROJECTIONS_BATCH_SIZE")) {
            projectionBatchSize_ = static_cast<size_t>(parsePositive("EVENT_PROJECTIONS_BATCH_SIZE", val));
        }
        if (const char* val = std::getenv("EVENT_STORE_APPEND_RETRIES")) {
            appendRetries_ = parsePositive("EVENT_STORE_APPEND_RETRIES", val);
        }
        if (const char* val = std::getenv("EVENT_STORE_TOLERATE_UNKNOWN_TYPES")) {
            tolerateUnknownTypes_ = parseBool("EVENT_STORE_TOLERATE_UNKNOWN_TYPES", val);
        }
    }

    StorageDriver getStoreDriver() const { return storeDriver_; }
    StorageDriver getSnapshotDriver() const { return snapshotDriver_; }
    bool areSnapshotsEnabled() const { return snapshotsEnabled_; }
    int getSnapshotThreshold() const { return snapshotThreshold_; }
    size_t getProjectionBatchSize() const { return projectionBatchSize_; }
    int getAppendRetries() const { return appendRetries_; }
    bool tolerateUnknownTypes() const { return tolerateUnknownTypes_; }

    static std::string toString(StorageDriver driver) {
        return driver == StorageDriver::DATABASE ? "database" : "memory";
    }

private:
    static StorageDriver parseDriver(const char* name, const std::string& value) {
        if (value == "memory") return StorageDriver::MEMORY;
        if (value == "database") return StorageDriver::DATABASE;
        throw std::invalid_argument(std::string(name) + " must be 'memory' or 'database': " + value);
    }

    static bool parseBool(const char* name, const std::string& value) {
        if (value == "true" || value == "1" || value == "yes") return true;
        if (value == "false" || value == "0" || value == "no") return false;
        throw std::invalid_argument(std::string(name) + " must be a boolean: " + value);
    }

    static int parsePositive(const char* name, const std::string& value) {
        int parsed = 0;
        try {
            parsed = std::stoi(value);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not a number: " + value);
        }
        if (parsed <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive: " + value);
        }
        return parsed;
    }

    StorageDriver storeDriver_ = StorageDriver::MEMORY;
    StorageDriver snapshotDriver_ = StorageDriver::MEMORY;
    bool snapshotsEnabled_ = true;
    int snapshotThreshold_ = 10;
    size_t projectionBatchSize_ = 100;
    int appendRetries_ = 3;
    bool tolerateUnknownTypes_ = false;
};

} // namespace eventstore::settings
