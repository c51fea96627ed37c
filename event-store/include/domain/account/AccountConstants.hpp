#pragma once

namespace eventstore::domain {

/// Тег типа агрегата BankAccount в событиях и снимках
inline constexpr const char* BANK_ACCOUNT_TYPE = "bank_account";

} // namespace eventstore::domain
