#pragma once

#include "application/events/EventCodecRegistry.hpp"
#include "domain/account/events/AccountOpenedEvent.hpp"
#include "domain/account/events/AccountRenamedEvent.hpp"
#include "domain/account/events/MoneyDepositedEvent.hpp"
#include "domain/account/events/MoneyWithdrawnEvent.hpp"
#include "domain/account/events/AccountClosedEvent.hpp"

namespace eventstore::application {

/**
 * @brief Зарегистрировать декодеры событий банковского счёта
 */
inline void registerBankAccountEvents(EventCodecRegistry& registry) {
    registry.registerEvent<domain::AccountOpenedEvent>();
    registry.registerEvent<domain::AccountRenamedEvent>();
    registry.registerEvent<domain::MoneyDepositedEvent>();
    registry.registerEvent<domain::MoneyWithdrawnEvent>();
    registry.registerEvent<domain::AccountClosedEvent>();
}

} // namespace eventstore::application
