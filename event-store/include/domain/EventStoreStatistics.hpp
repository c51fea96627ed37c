#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace eventstore::domain {

/**
 * @brief Сводка по журналу событий (консольная команда stats)
 */
struct EventStoreStatistics {
    size_t totalEvents = 0;
    size_t uniqueAggregates = 0;
    size_t snapshotCount = 0;
    std::vector<std::pair<std::string, size_t>> eventsByType;  ///< по убыванию количества

    nlohmann::json toJson() const {
        nlohmann::json byType = nlohmann::json::array();
        for (const auto& [type, count] : eventsByType) {
            byType.push_back({{"eventType", type}, {"count", count}});
        }
        return {
            {"totalEvents", totalEvents},
            {"uniqueAggregates", uniqueAggregates},
            {"snapshotCount", snapshotCount},
            {"eventsByType", byType}
        };
    }
};

} // namespace eventstore::domain
