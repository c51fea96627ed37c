#pragma once

#include "ports/output/ISnapshotStore.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace eventstore::adapters::secondary {

/**
 * @brief In-memory реализация хранилища снимков
 */
class InMemorySnapshotStore : public ports::output::ISnapshotStore {
public:
    void saveSnapshot(
        const std::string& aggregateId,
        const std::string& aggregateType,
        const nlohmann::json& state,
        int64_t version
    ) override {
        domain::Snapshot snapshot;
        snapshot.aggregateId = aggregateId;
        snapshot.aggregateType = aggregateType;
        snapshot.state = state;
        snapshot.version = version;
        snapshot.createdAt = domain::Timestamp::now();

        std::unique_lock<std::shared_mutex> lock(mutex_);
        snapshots_[aggregateId][version] = std::move(snapshot);
        std::cout << "[InMemorySnapshotStore] Saved snapshot " << aggregateId
                  << " v" << version << std::endl;
    }

    std::optional<domain::Snapshot> getSnapshot(const std::string& aggregateId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = snapshots_.find(aggregateId);
        if (it == snapshots_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.rbegin()->second;
    }

    std::optional<domain::Snapshot> getSnapshotAtVersion(
        const std::string& aggregateId,
        int64_t version
    ) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = snapshots_.find(aggregateId);
        if (it == snapshots_.end()) {
            return std::nullopt;
        }
        auto versionIt = it->second.find(version);
        if (versionIt == it->second.end()) {
            return std::nullopt;
        }
        return versionIt->second;
    }

    void deleteSnapshots(const std::string& aggregateId) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        snapshots_.erase(aggregateId);
    }

    void deleteSnapshotsOlderThan(const std::string& aggregateId, int64_t version) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = snapshots_.find(aggregateId);
        if (it == snapshots_.end()) {
            return;
        }
        auto& versions = it->second;
        versions.erase(versions.begin(), versions.lower_bound(version));
        if (versions.empty()) {
            snapshots_.erase(it);
        }
    }

    size_t count() override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& [id, versions] : snapshots_) {
            total += versions.size();
        }
        return total;
    }

private:
    mutable std::shared_mutex mutex_;
    // aggregateId -> (version -> snapshot), версии по возрастанию
    std::unordered_map<std::string, std::map<int64_t, domain::Snapshot>> snapshots_;
};

} // namespace eventstore::adapters::secondary
