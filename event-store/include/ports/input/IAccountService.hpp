#pragma once

#include "domain/account/BankAccount.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace eventstore::ports::input {

/**
 * @brief Интерфейс сервиса банковских счетов
 *
 * Input Port. Каждая команда загружает агрегат, выполняет бизнес-метод,
 * сохраняет события и доставляет их в проекции.
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @return ID нового счёта
     */
    virtual std::string openAccount(const std::string& holderName, const std::string& currency) = 0;

    virtual void renameAccount(const std::string& accountId, const std::string& holderName) = 0;

    /**
     * @throws AggregateNotFoundException счёта нет
     * @throws InvariantViolationException счёт закрыт или сумма <= 0
     */
    virtual void deposit(const std::string& accountId, int64_t amount, const std::string& reference) = 0;

    /**
     * @throws InvariantViolationException недостаточно средств
     */
    virtual void withdraw(const std::string& accountId, int64_t amount, const std::string& reference) = 0;

    virtual void closeAccount(const std::string& accountId, const std::string& reason) = 0;

    virtual std::optional<domain::BankAccount> getAccount(const std::string& accountId) = 0;
};

} // namespace eventstore::ports::input
