#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/input/IProjectionService.hpp"
#include "application/EventSourcedRepository.hpp"
#include "settings/EventStoreSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <functional>
#include <iostream>
#include <memory>

namespace eventstore::application {

using BankAccountRepository = EventSourcedRepository<domain::BankAccount>;

/**
 * @brief Сервис банковских счетов
 *
 * Координирует:
 * - BankAccountRepository (загрузка и сохранение агрегата)
 * - IProjectionService (обновление read-моделей после записи)
 *
 * При ConcurrencyConflictException вся операция повторяется на свежей
 * копии агрегата, до EVENT_STORE_APPEND_RETRIES раз.
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<BankAccountRepository> repository,
        std::shared_ptr<ports::input::IProjectionService> projections,
        std::shared_ptr<settings::EventStoreSettings> settings
    ) : repository_(std::move(repository))
      , projections_(std::move(projections))
      , maxAttempts_(settings->getAppendRetries())
    {}

    std::string openAccount(const std::string& holderName, const std::string& currency) override {
        std::string id = utils::UuidGenerator::generateWithPrefix("acc");
        auto account = domain::BankAccount::open(id, holderName, currency);
        commit(account);
        std::cout << "[AccountService] Opened account " << id << " for " << holderName << std::endl;
        return id;
    }

    void renameAccount(const std::string& accountId, const std::string& holderName) override {
        execute(accountId, [&](domain::BankAccount& account) { account.rename(holderName); });
    }

    void deposit(const std::string& accountId, int64_t amount, const std::string& reference) override {
        execute(accountId, [&](domain::BankAccount& account) { account.deposit(amount, reference); });
    }

    void withdraw(const std::string& accountId, int64_t amount, const std::string& reference) override {
        execute(accountId, [&](domain::BankAccount& account) { account.withdraw(amount, reference); });
    }

    void closeAccount(const std::string& accountId, const std::string& reason) override {
        execute(accountId, [&](domain::BankAccount& account) { account.close(reason); });
    }

    std::optional<domain::BankAccount> getAccount(const std::string& accountId) override {
        return repository_->findById(accountId);
    }

private:
    void execute(const std::string& accountId, const std::function<void(domain::BankAccount&)>& command) {
        for (int attempt = 1;; ++attempt) {
            auto account = repository_->getById(accountId);
            command(account);
            try {
                commit(account);
                return;
            } catch (const domain::ConcurrencyConflictException& e) {
                if (attempt >= maxAttempts_) {
                    throw;
                }
                std::cerr << "[AccountService] " << e.what() << ", retrying ("
                          << attempt << "/" << maxAttempts_ << ")" << std::endl;
            }
        }
    }

    void commit(domain::BankAccount& account) {
        auto stored = repository_->save(account);
        projections_->projectStoredEvents(stored);
    }

    std::shared_ptr<BankAccountRepository> repository_;
    std::shared_ptr<ports::input::IProjectionService> projections_;
    int maxAttempts_;
};

} // namespace eventstore::application
