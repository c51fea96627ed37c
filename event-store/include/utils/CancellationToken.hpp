#pragma once

#include <atomic>

namespace eventstore::utils {

/**
 * @brief Флаг отмены долгой операции (перестроение проекций)
 *
 * Взводится из другого потока или из обработчика сигнала.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }

    bool isCancelled() const noexcept { return cancelled_.load(); }

    void reset() noexcept { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace eventstore::utils
