#pragma once

#include "ports/output/ILedgerUnit.hpp"
#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include <memory>
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Интерфейс хранилища леджера
 *
 * Output Port: счета + журнал транзакций только на добавление.
 * Баланс здесь не хранится и не кэшируется.
 *
 * Все методы могут блокироваться на I/O. Отказ хранилища -
 * LedgerException(STORAGE_UNAVAILABLE).
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Найти счёт по номеру
     */
    virtual std::optional<domain::Account> getAccount(const std::string& accountNumber) = 0;

    /**
     * @brief Все счета владельца, по дате открытия
     */
    virtual std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) = 0;

    /**
     * @brief Транзакции счёта по возрастанию id
     *
     * Повторный вызов без новых записей возвращает ту же последовательность.
     */
    virtual std::vector<domain::Transaction> listTransactions(const std::string& accountNumber) = 0;

    /**
     * @brief Атомарно дописать пакет строк (все или ни одной)
     *
     * Блокирует все счета пакета на время записи.
     *
     * @return Закоммиченные строки с id и timestamp
     */
    virtual std::vector<domain::Transaction> append(const std::vector<domain::Transaction>& rows) = 0;

    /**
     * @brief Обновить поля профиля (не влияют на леджер)
     *
     * Номер, тип и ownerId счёта не меняются.
     *
     * @return Обновлённый счёт или nullopt если счёта нет
     */
    virtual std::optional<domain::Account> updateProfile(
        const std::string& accountNumber,
        const domain::IdentityFields& identity
    ) = 0;

    /**
     * @brief Открыть атомарную единицу работы
     *
     * Блокирует каждый счёт из lockSet (существующий или ещё нет)
     * строго по возрастанию номера, чтобы встречные переводы
     * не вставали в deadlock.
     *
     * @throws LedgerException(STORAGE_UNAVAILABLE) если блокировку не
     *         удалось получить за lock timeout
     */
    virtual std::unique_ptr<ILedgerUnit> beginUnit(const std::vector<std::string>& lockSet) = 0;
};

} // namespace ledger::ports::output
