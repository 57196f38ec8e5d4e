#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Атомарная единица работы с леджером
 *
 * Создаётся через ILedgerStore::beginUnit(). На всё время жизни держит
 * эксклюзивные блокировки счетов из lock set, поэтому последовательность
 * "прочитать баланс -> проверить -> дописать строку" сериализуема
 * относительно любых других операций по этим счетам.
 *
 * Записи (insertAccount, append) только накапливаются и становятся
 * видимы другим читателям все сразу в commit(). Уничтожение
 * незакоммиченной единицы = abort: ничего не применяется.
 *
 * @example
 * ```cpp
 * auto unit = store->beginUnit({"100000000001"});
 * auto balance = domain::deriveBalance(unit->listTransactions("100000000001"));
 * if (balance >= amount) {
 *     unit->append({withdrawal});
 *     auto committed = unit->commit();
 * }
 * // иначе unit просто уходит из scope -> abort
 * ```
 */
class ILedgerUnit {
public:
    virtual ~ILedgerUnit() = default;

    /**
     * @brief Найти счёт (учитывает счета, добавленные в этой единице)
     */
    virtual std::optional<domain::Account> findAccount(const std::string& accountNumber) = 0;

    /**
     * @brief Транзакции счёта по возрастанию id (включая добавленные в этой единице)
     */
    virtual std::vector<domain::Transaction> listTransactions(const std::string& accountNumber) = 0;

    /**
     * @brief Добавить новый счёт
     * @throws LedgerException(DUPLICATE_ACCOUNT_NUMBER) если номер уже занят
     */
    virtual void insertAccount(const domain::Account& account) = 0;

    /**
     * @brief Добавить строки в пакет
     * @throws LedgerException(CONSTRAINT_VIOLATION) если сумма не положительная
     *         или счёт строки не существует
     */
    virtual void append(const std::vector<domain::Transaction>& rows) = 0;

    /**
     * @brief Применить все накопленные записи атомарно
     *
     * @return Закоммиченные строки с назначенными id и timestamp,
     *         в порядке добавления
     * @throws LedgerException при отказе; в этом случае ничего не применено
     */
    virtual std::vector<domain::Transaction> commit() = 0;
};

} // namespace ledger::ports::output
