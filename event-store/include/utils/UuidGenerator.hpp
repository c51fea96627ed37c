#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace eventstore::utils {

/**
 * @brief Идентификаторы событий и агрегатов
 *
 * Движок свой у каждого потока, поэтому вызовы не синхронизируются.
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y из [8, 9, a, b]
     */
    static std::string generate() {
        std::uniform_int_distribution<uint64_t> dist;
        const uint64_t high = dist(engine());
        const uint64_t low = dist(engine());

        std::ostringstream out;
        out << std::hex << std::setfill('0')
            << std::setw(8) << (high >> 32) << '-'
            << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
            << std::setw(4) << (0x4000 | (high & 0x0FFF)) << '-'
            << std::setw(4) << (0x8000 | ((low >> 48) & 0x3FFF)) << '-'
            << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return out.str();
    }

    /**
     * @return "prefix-" и 8 hex-символов, например "acc-1f03a9c2"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::uniform_int_distribution<uint32_t> dist;
        std::ostringstream out;
        out << prefix << '-' << std::hex << std::setfill('0') << std::setw(8) << dist(engine());
        return out.str();
    }

private:
    static std::mt19937_64& engine() {
        thread_local std::mt19937_64 gen{std::random_device{}()};
        return gen;
    }
};

} // namespace eventstore::utils
