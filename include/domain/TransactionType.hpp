#pragma once

#include "enums/TransactionKind.hpp"
#include <string>
#include <utility>

namespace ledger::domain {

/**
 * @brief Тип транзакции: вид + метка категории
 *
 * Метка категории есть только у CATEGORY_FUNDING ("Betting Funding",
 * "Data Purchase", ...). Новые категории расходов не требуют новых
 * видов: они всегда CATEGORY_FUNDING и всегда расход.
 *
 * @example
 * ```cpp
 * auto t = TransactionType::categoryFunding("Betting Funding");
 * t.isInflow();  // false
 * t.label();     // "Betting Funding"
 * ```
 */
class TransactionType {
public:
    TransactionType() = default;

    static TransactionType deposit() { return TransactionType(TransactionKind::DEPOSIT, ""); }
    static TransactionType withdrawal() { return TransactionType(TransactionKind::WITHDRAWAL, ""); }
    static TransactionType transfer() { return TransactionType(TransactionKind::TRANSFER, ""); }

    /**
     * @throws std::invalid_argument если метка пустая или совпадает
     *         с названием фиксированного вида
     */
    static TransactionType categoryFunding(const std::string& category);

    /**
     * @brief Собрать тип из сохранённых полей (kind + category)
     * @throws std::invalid_argument при несогласованных полях
     */
    static TransactionType restore(TransactionKind kind, const std::string& category);

    /**
     * @brief Тип по отображаемому названию
     *
     * "Deposit", "Withdrawal", "Transfer" -> фиксированный вид,
     * любая другая непустая метка -> CATEGORY_FUNDING.
     *
     * @throws std::invalid_argument если метка пустая
     */
    static TransactionType fromLabel(const std::string& label);

    /**
     * @brief Является ли метка зарезервированной ("Deposit", "Withdrawal", "Transfer")
     */
    static bool isReservedLabel(const std::string& label);

    TransactionKind kind() const { return kind_; }
    const std::string& category() const { return category_; }

    bool isInflow() const;

    /**
     * @brief Отображаемое название ("Deposit", "Transfer", метка категории)
     */
    std::string label() const;

    bool operator==(const TransactionType& other) const {
        return kind_ == other.kind_ && category_ == other.category_;
    }

    bool operator!=(const TransactionType& other) const {
        return !(*this == other);
    }

private:
    TransactionType(TransactionKind kind, std::string category)
        : kind_(kind), category_(std::move(category)) {}

    TransactionKind kind_ = TransactionKind::DEPOSIT;
    std::string category_;
};

} // namespace ledger::domain
