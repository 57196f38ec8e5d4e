#pragma once

#include "domain/Account.hpp"
#include "domain/AccountSummary.hpp"
#include "domain/Transaction.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace ledger::ports::input {

/**
 * @brief Порядок выдачи истории
 */
enum class TransactionOrder {
    ASCENDING,  ///< Порядок хранения (старые первыми)
    DESCENDING  ///< Для экрана истории (новые первыми)
};

/**
 * @brief Результат перевода: обе строки закоммичены вместе
 */
struct TransferResult {
    domain::Transaction debit;      ///< TRANSFER на счёте отправителя
    domain::Transaction credit;     ///< DEPOSIT на счёте получателя
};

/**
 * @brief Интерфейс движка леджера
 *
 * Input Port для UI/CLI. Личность вызывающего уже проверена,
 * значения формы уже разобраны; движок всё равно перепроверяет суммы.
 *
 * Все отказы - LedgerException с кодом; после отказа леджер не изменён.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Открыть счёт с приветственным депозитом
     *
     * Счёт и депозит "Welcome bonus" коммитятся одной единицей.
     *
     * @throws LedgerException(DUPLICATE_ACCOUNT_NUMBER) если исчерпан лимит попыток
     */
    virtual domain::Account openAccount(
        domain::AccountKind kind,
        const domain::IdentityFields& identity
    ) = 0;

    /**
     * @brief Пополнить счёт (без проверки баланса)
     */
    virtual domain::Transaction deposit(
        const std::string& accountNumber,
        const domain::Money& amount,
        const std::string& description
    ) = 0;

    /**
     * @brief Снять средства
     * @throws LedgerException(INSUFFICIENT_FUNDS) если amount > баланса
     */
    virtual domain::Transaction withdraw(
        const std::string& accountNumber,
        const domain::Money& amount,
        const std::string& description
    ) = 0;

    /**
     * @brief Перевести средства на другой счёт
     * @throws LedgerException(RECIPIENT_NOT_FOUND) если получателя нет
     * @throws LedgerException(INSUFFICIENT_FUNDS) если amount > баланса отправителя
     */
    virtual TransferResult transfer(
        const std::string& senderAccountNumber,
        const std::string& recipientAccountNumber,
        const domain::Money& amount,
        const std::string& description
    ) = 0;

    /**
     * @brief Оплата по категории ("Betting Funding", "Data Purchase", ...)
     * @throws LedgerException(CONSTRAINT_VIOLATION) если метка пустая или зарезервирована
     * @throws LedgerException(INSUFFICIENT_FUNDS) если amount > баланса
     */
    virtual domain::Transaction fundCategory(
        const std::string& accountNumber,
        const std::string& category,
        const domain::Money& amount,
        const std::string& description
    ) = 0;

    /**
     * @brief Баланс, выведенный из истории на момент вызова
     */
    virtual domain::Money computeBalance(const std::string& accountNumber) = 0;

    virtual std::vector<domain::Transaction> listTransactions(
        const std::string& accountNumber,
        TransactionOrder order
    ) = 0;

    virtual domain::AccountSummary getSummary(const std::string& accountNumber, size_t recentLimit) = 0;

    virtual domain::Account getAccount(const std::string& accountNumber) = 0;

    virtual std::vector<domain::Account> getAccountsByOwner(const std::string& ownerId) = 0;

    /**
     * @brief Обновить профиль (ownerId, номер и тип не меняются)
     */
    virtual domain::Account updateProfile(
        const std::string& accountNumber,
        const domain::IdentityFields& identity
    ) = 0;
};

} // namespace ledger::ports::input
