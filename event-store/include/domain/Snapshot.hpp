#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace eventstore::domain {

/**
 * @brief Снимок состояния агрегата на версии version
 *
 * Утверждает: применение событий 1..version к пустому агрегату даёт state.
 * Это кэш, журнал событий остаётся источником истины.
 */
struct Snapshot {
    std::string aggregateId;
    std::string aggregateType;
    nlohmann::json state;
    int64_t version = 0;
    Timestamp createdAt;
};

} // namespace eventstore::domain
