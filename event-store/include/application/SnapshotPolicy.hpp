#pragma once

#include <cstdint>
#include <stdexcept>

namespace eventstore::application {

/**
 * @brief Стратегия: снимать ли снимок после сохранения
 */
class ISnapshotPolicy {
public:
    virtual ~ISnapshotPolicy() = default;

    /**
     * @param previousVersion Версия до записи пачки
     * @param currentVersion Версия после записи
     */
    virtual bool shouldSnapshot(int64_t previousVersion, int64_t currentVersion) const = 0;
};

/**
 * @brief Снимок каждый раз, когда версия пересекает кратное N
 *
 * Пачка 9 → 12 при N = 10 тоже даёт снимок (на версии 12).
 */
class EveryNthVersionPolicy : public ISnapshotPolicy {
public:
    explicit EveryNthVersionPolicy(int64_t threshold) : threshold_(threshold) {
        if (threshold_ <= 0) {
            throw std::invalid_argument("Snapshot threshold must be positive");
        }
    }

    bool shouldSnapshot(int64_t previousVersion, int64_t currentVersion) const override {
        return currentVersion / threshold_ > previousVersion / threshold_;
    }

    int64_t getThreshold() const { return threshold_; }

private:
    int64_t threshold_;
};

class NeverSnapshotPolicy : public ISnapshotPolicy {
public:
    bool shouldSnapshot(int64_t, int64_t) const override { return false; }
};

} // namespace eventstore::application
