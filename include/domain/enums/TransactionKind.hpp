#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Закрытый набор видов транзакций
 *
 * Направление движения средств определяется только видом:
 * DEPOSIT - приход, всё остальное - расход.
 */
enum class TransactionKind {
    DEPOSIT,            ///< Пополнение (в т.ч. входящий перевод)
    WITHDRAWAL,         ///< Снятие наличных
    TRANSFER,           ///< Исходящий перевод
    CATEGORY_FUNDING    ///< Оплата по категории (ставки, интернет и т.п.)
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::DEPOSIT:          return "DEPOSIT";
        case TransactionKind::WITHDRAWAL:       return "WITHDRAWAL";
        case TransactionKind::TRANSFER:         return "TRANSFER";
        case TransactionKind::CATEGORY_FUNDING: return "CATEGORY_FUNDING";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionKind parseTransactionKind(const std::string& str) {
    if (str == "DEPOSIT")          return TransactionKind::DEPOSIT;
    if (str == "WITHDRAWAL")       return TransactionKind::WITHDRAWAL;
    if (str == "TRANSFER")         return TransactionKind::TRANSFER;
    if (str == "CATEGORY_FUNDING") return TransactionKind::CATEGORY_FUNDING;
    throw std::invalid_argument("Unknown transaction kind: " + str);
}

} // namespace ledger::domain
