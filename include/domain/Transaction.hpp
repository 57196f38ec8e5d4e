#pragma once

#include "TransactionType.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Строка леджера (неизменяема после коммита)
 *
 * Сумма всегда положительная, направление задаёт только type.
 * id и timestamp назначает хранилище при коммите; у ещё не
 * закоммиченной строки id == 0.
 */
struct Transaction {
    int64_t id = 0;                 ///< Монотонно растущий ключ порядка
    std::string accountNumber;      ///< Счёт-владелец строки
    TransactionType type;
    Money amount;                   ///< > 0
    Timestamp timestamp;
    std::string description;

    Transaction() = default;

    Transaction(const std::string& accountNumber,
                const TransactionType& type,
                const Money& amount,
                const std::string& description)
        : accountNumber(accountNumber)
        , type(type)
        , amount(amount)
        , description(description)
    {}
};

/**
 * @brief Баланс = сумма приходов - сумма расходов
 *
 * @throws LedgerException(INVALID_AMOUNT) если промежуточная сумма выходит за int64_t
 */
inline Money deriveBalance(const std::vector<Transaction>& transactions) {
    Money balance;
    for (const auto& txn : transactions) {
        if (txn.type.isInflow()) {
            balance += txn.amount;
        } else {
            balance -= txn.amount;
        }
    }
    return balance;
}

} // namespace ledger::domain
