#pragma once

#include "Account.hpp"
#include "Transaction.hpp"
#include "Money.hpp"
#include <vector>
#include <cstddef>

namespace ledger::domain {

/**
 * @brief Сводка по счёту для дашборда
 *
 * Все поля получены из одного чтения истории, поэтому согласованы
 * между собой.
 */
struct AccountSummary {
    Account account;
    Money balance;
    size_t transactionCount = 0;
    std::vector<Transaction> recent;    ///< Последние N транзакций, новые первыми
};

} // namespace ledger::domain
