// include/adapters/secondary/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реализация хранилища леджера
 *
 * Используется в тестах и в CLI при LEDGER_STORE=memory.
 *
 * Блокировки:
 * - accountLocks_: по одному timed_mutex на номер счёта, держит
 *   InMemoryLedgerUnit на всё время своей жизни. Запись живёт, пока
 *   мьютекс нужен хотя бы одной единице, затем удаляется;
 * - logMutex_: короткая блокировка журнала на чтение/коммит.
 *
 * Порядок захвата всегда: счета (по возрастанию номера) -> logMutex_.
 *
 * Единица работы ссылается на хранилище по ссылке и не должна
 * его переживать.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    explicit InMemoryLedgerStore(std::shared_ptr<settings::ILedgerSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[InMemoryLedgerStore] Created, lock timeout "
                  << settings_->getLockTimeout().count() << "ms" << std::endl;
    }

    std::optional<domain::Account> getAccount(const std::string& accountNumber) override {
        auto account = accounts_.find(accountNumber);
        return account ? std::optional(*account) : std::nullopt;
    }

    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override {
        std::vector<domain::Account> result;
        for (const auto& account : accounts_.values()) {
            if (account->identity.ownerId == ownerId) {
                result.push_back(*account);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
            return a.accountNumber < b.accountNumber;
        });
        return result;
    }

    std::vector<domain::Transaction> listTransactions(const std::string& accountNumber) override {
        std::shared_lock<std::shared_mutex> lock(logMutex_);
        return readCommitted(accountNumber);
    }

    std::vector<domain::Transaction> append(const std::vector<domain::Transaction>& rows) override {
        if (rows.empty()) {
            return {};
        }

        std::vector<std::string> lockSet;
        for (const auto& row : rows) {
            lockSet.push_back(row.accountNumber);
        }

        auto unit = beginUnit(lockSet);
        unit->append(rows);
        return unit->commit();
    }

    std::optional<domain::Account> updateProfile(
        const std::string& accountNumber,
        const domain::IdentityFields& identity
    ) override {
        std::unique_lock<std::shared_mutex> lock(logMutex_);

        auto existing = accounts_.find(accountNumber);
        if (!existing) {
            return std::nullopt;
        }

        auto updated = std::make_shared<domain::Account>(*existing);
        updated->identity = domain::normalizeForKind(identity, updated->kind);
        updated->identity.ownerId = existing->identity.ownerId;
        accounts_.insert(accountNumber, updated);
        return *updated;
    }

    std::unique_ptr<ports::output::ILedgerUnit> beginUnit(const std::vector<std::string>& lockSet) override {
        return std::make_unique<InMemoryLedgerUnit>(*this, lockSet, settings_->getLockTimeout());
    }

    // Test helpers
    size_t accountCount() const {
        return accounts_.size();
    }

    size_t transactionCount() const {
        std::shared_lock<std::shared_mutex> lock(logMutex_);
        return log_.size();
    }

    size_t lockTableSize() {
        std::lock_guard<std::mutex> lock(locksMutex_);
        return accountLocks_.size();
    }

private:
    class InMemoryLedgerUnit : public ports::output::ILedgerUnit {
    public:
        InMemoryLedgerUnit(InMemoryLedgerStore& store,
                           std::vector<std::string> lockSet,
                           std::chrono::milliseconds timeout)
            : store_(store)
        {
            std::sort(lockSet.begin(), lockSet.end());
            lockSet.erase(std::unique(lockSet.begin(), lockSet.end()), lockSet.end());

            for (const auto& accountNumber : lockSet) {
                mutexes_.push_back(store_.lockFor(accountNumber));
                lockedAccounts_.push_back(accountNumber);

                std::unique_lock<std::timed_mutex> lock(*mutexes_.back(), std::defer_lock);
                if (!lock.try_lock_for(timeout)) {
                    std::cerr << "[InMemoryLedgerStore] Lock timeout on account " << accountNumber << std::endl;
                    releaseLocks();
                    throw domain::LedgerException(
                        domain::LedgerErrorCode::STORAGE_UNAVAILABLE,
                        "Timed out waiting for lock on account " + accountNumber);
                }
                locks_.push_back(std::move(lock));
            }
        }

        ~InMemoryLedgerUnit() override {
            if (!committed_ && (!stagedAccounts_.empty() || !stagedRows_.empty())) {
                std::cout << "[InMemoryLedgerStore] Unit aborted, discarded "
                          << stagedAccounts_.size() << " account(s) and "
                          << stagedRows_.size() << " row(s)" << std::endl;
            }
            releaseLocks();
        }

        std::optional<domain::Account> findAccount(const std::string& accountNumber) override {
            for (const auto& account : stagedAccounts_) {
                if (account.accountNumber == accountNumber) {
                    return account;
                }
            }
            return store_.getAccount(accountNumber);
        }

        std::vector<domain::Transaction> listTransactions(const std::string& accountNumber) override {
            auto rows = store_.listTransactions(accountNumber);
            for (const auto& row : stagedRows_) {
                if (row.accountNumber == accountNumber) {
                    rows.push_back(row);
                }
            }
            return rows;
        }

        void insertAccount(const domain::Account& account) override {
            requireOpen();
            if (findAccount(account.accountNumber)) {
                throw domain::LedgerException(
                    domain::LedgerErrorCode::DUPLICATE_ACCOUNT_NUMBER,
                    "Account number already exists: " + account.accountNumber);
            }
            stagedAccounts_.push_back(account);
        }

        void append(const std::vector<domain::Transaction>& rows) override {
            requireOpen();
            for (const auto& row : rows) {
                if (!row.amount.isPositive()) {
                    throw domain::LedgerException(
                        domain::LedgerErrorCode::CONSTRAINT_VIOLATION,
                        "Transaction amount must be positive, got " + row.amount.toString());
                }
                if (!findAccount(row.accountNumber)) {
                    throw domain::LedgerException(
                        domain::LedgerErrorCode::CONSTRAINT_VIOLATION,
                        "Transaction references unknown account " + row.accountNumber);
                }
            }
            stagedRows_.insert(stagedRows_.end(), rows.begin(), rows.end());
        }

        std::vector<domain::Transaction> commit() override {
            requireOpen();

            std::vector<domain::Transaction> committed;
            {
                std::unique_lock<std::shared_mutex> lock(store_.logMutex_);

                // Сначала проверяем всё, потом применяем: иначе возможен частичный коммит
                for (const auto& account : stagedAccounts_) {
                    if (store_.accounts_.contains(account.accountNumber)) {
                        throw domain::LedgerException(
                            domain::LedgerErrorCode::DUPLICATE_ACCOUNT_NUMBER,
                            "Account number already exists: " + account.accountNumber);
                    }
                }

                for (const auto& account : stagedAccounts_) {
                    store_.accounts_.insertIfAbsent(account.accountNumber, std::make_shared<domain::Account>(account));
                }

                auto now = domain::Timestamp::now();
                committed.reserve(stagedRows_.size());
                for (auto row : stagedRows_) {
                    row.id = store_.nextId_++;
                    row.timestamp = now;
                    store_.byAccount_[row.accountNumber].push_back(store_.log_.size());
                    store_.log_.push_back(row);
                    committed.push_back(std::move(row));
                }
            }

            committed_ = true;
            stagedAccounts_.clear();
            stagedRows_.clear();
            releaseLocks();
            return committed;
        }

    private:
        InMemoryLedgerStore& store_;
        std::vector<std::shared_ptr<std::timed_mutex>> mutexes_;
        std::vector<std::unique_lock<std::timed_mutex>> locks_;
        std::vector<std::string> lockedAccounts_;
        std::vector<domain::Account> stagedAccounts_;
        std::vector<domain::Transaction> stagedRows_;
        bool committed_ = false;

        void requireOpen() const {
            if (committed_) {
                throw std::logic_error("Ledger unit already committed");
            }
        }

        void releaseLocks() {
            locks_.clear();
            mutexes_.clear();
            for (const auto& accountNumber : lockedAccounts_) {
                store_.forgetLock(accountNumber);
            }
            lockedAccounts_.clear();
        }
    };

    std::shared_ptr<settings::ILedgerSettings> settings_;

    ThreadSafeMap<std::string, domain::Account> accounts_;

    std::mutex locksMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> accountLocks_;

    mutable std::shared_mutex logMutex_;
    std::vector<domain::Transaction> log_;
    std::unordered_map<std::string, std::vector<size_t>> byAccount_;  // accountNumber -> индексы в log_
    int64_t nextId_ = 1;

    std::shared_ptr<std::timed_mutex> lockFor(const std::string& accountNumber) {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto& mutex = accountLocks_[accountNumber];
        if (!mutex) {
            mutex = std::make_shared<std::timed_mutex>();
        }
        return mutex;
    }

    // Ссылку на мьютекс можно получить только под locksMutex_, поэтому
    // use_count() == 1 значит, что его больше никто не держит и не ждёт
    void forgetLock(const std::string& accountNumber) {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto it = accountLocks_.find(accountNumber);
        if (it != accountLocks_.end() && it->second.use_count() == 1) {
            accountLocks_.erase(it);
        }
    }

    // Вызывать под logMutex_
    std::vector<domain::Transaction> readCommitted(const std::string& accountNumber) const {
        std::vector<domain::Transaction> rows;
        auto it = byAccount_.find(accountNumber);
        if (it == byAccount_.end()) {
            return rows;
        }
        rows.reserve(it->second.size());
        for (size_t index : it->second) {
            rows.push_back(log_[index]);
        }
        return rows;
    }
};

} // namespace ledger::adapters::secondary
