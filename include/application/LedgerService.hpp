#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IAccountNumberGenerator.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Движок леджера
 *
 * Своего изменяемого состояния не держит: всё состояние в хранилище,
 * поэтому один экземпляр безопасно вызывать из многих потоков.
 *
 * Любая операция, меняющая счёт, идёт через ILedgerUnit, которая
 * блокирует затронутые счета. Проверка баланса и запись строки
 * происходят внутри одной единицы, так что два конкурентных списания
 * не могут пройти по балансу, которого хватает только на одно.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    static constexpr const char* WELCOME_DESCRIPTION = "Welcome bonus";

    LedgerService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IAccountNumberGenerator> numberGenerator,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : store_(std::move(store))
      , numberGenerator_(std::move(numberGenerator))
      , settings_(std::move(settings))
    {
        std::cout << "[LedgerService] Created, welcome bonus "
                  << settings_->getWelcomeBonus().toString() << std::endl;
    }

    domain::Account openAccount(
        domain::AccountKind kind,
        const domain::IdentityFields& identity
    ) override {
        const int attempts = settings_->getAccountNumberRetries();

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            domain::Account account(numberGenerator_->next(), kind, identity);

            try {
                auto unit = store_->beginUnit({account.accountNumber});
                unit->insertAccount(account);
                unit->append({domain::Transaction(
                    account.accountNumber,
                    domain::TransactionType::deposit(),
                    settings_->getWelcomeBonus(),
                    WELCOME_DESCRIPTION)});
                unit->commit();

                std::cout << "[LedgerService] Opened " << domain::toString(kind)
                          << " account " << account.accountNumber
                          << " for owner " << account.identity.ownerId << std::endl;
                return account;

            } catch (const domain::LedgerException& e) {
                if (e.code() != domain::LedgerErrorCode::DUPLICATE_ACCOUNT_NUMBER) {
                    throw;
                }
                std::cerr << "[LedgerService] Account number collision on attempt "
                          << attempt << "/" << attempts << ": " << account.accountNumber << std::endl;
            }
        }

        throw domain::LedgerException(
            domain::LedgerErrorCode::DUPLICATE_ACCOUNT_NUMBER,
            "Could not allocate a unique account number after " + std::to_string(attempts) + " attempts");
    }

    domain::Transaction deposit(
        const std::string& accountNumber,
        const domain::Money& amount,
        const std::string& description
    ) override {
        requirePositive(amount);

        auto unit = store_->beginUnit({accountNumber});
        requireAccount(*unit, accountNumber);
        requireHeadroom(*unit, accountNumber, amount);

        unit->append({domain::Transaction(
            accountNumber,
            domain::TransactionType::deposit(),
            amount,
            description.empty() ? "Manual deposit" : description)});
        auto committed = unit->commit();

        std::cout << "[LedgerService] Deposit " << amount.toString() << " to " << accountNumber << std::endl;
        return committed.front();
    }

    domain::Transaction withdraw(
        const std::string& accountNumber,
        const domain::Money& amount,
        const std::string& description
    ) override {
        return debit(
            accountNumber,
            domain::TransactionType::withdrawal(),
            amount,
            description.empty() ? "Cash withdrawal" : description);
    }

    ports::input::TransferResult transfer(
        const std::string& senderAccountNumber,
        const std::string& recipientAccountNumber,
        const domain::Money& amount,
        const std::string& description
    ) override {
        requirePositive(amount);

        // Оба счёта блокируются одной единицей, порядок захвата задаёт хранилище
        auto unit = store_->beginUnit({senderAccountNumber, recipientAccountNumber});
        requireAccount(*unit, senderAccountNumber);

        if (!unit->findAccount(recipientAccountNumber)) {
            std::cerr << "[LedgerService] Transfer rejected: recipient "
                      << recipientAccountNumber << " not found" << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::RECIPIENT_NOT_FOUND,
                "Recipient account not found: " + recipientAccountNumber);
        }

        requireFunds(*unit, senderAccountNumber, amount);
        if (recipientAccountNumber != senderAccountNumber) {
            requireHeadroom(*unit, recipientAccountNumber, amount);
        }

        std::string suffix = description.empty() ? "" : ": " + description;
        unit->append({
            domain::Transaction(
                senderAccountNumber,
                domain::TransactionType::transfer(),
                amount,
                "Transfer to " + recipientAccountNumber + suffix),
            domain::Transaction(
                recipientAccountNumber,
                domain::TransactionType::deposit(),
                amount,
                "Transfer from " + senderAccountNumber + suffix)
        });
        auto committed = unit->commit();

        std::cout << "[LedgerService] Transfer " << amount.toString() << " from "
                  << senderAccountNumber << " to " << recipientAccountNumber << std::endl;
        return ports::input::TransferResult{committed.at(0), committed.at(1)};
    }

    domain::Transaction fundCategory(
        const std::string& accountNumber,
        const std::string& category,
        const domain::Money& amount,
        const std::string& description
    ) override {
        if (category.empty() || domain::TransactionType::isReservedLabel(category)) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::CONSTRAINT_VIOLATION,
                "Invalid funding category: '" + category + "'");
        }

        return debit(
            accountNumber,
            domain::TransactionType::categoryFunding(category),
            amount,
            description.empty() ? category + " payment" : description);
    }

    domain::Money computeBalance(const std::string& accountNumber) override {
        requireExisting(accountNumber);
        return domain::deriveBalance(store_->listTransactions(accountNumber));
    }

    std::vector<domain::Transaction> listTransactions(
        const std::string& accountNumber,
        ports::input::TransactionOrder order
    ) override {
        requireExisting(accountNumber);

        auto rows = store_->listTransactions(accountNumber);
        if (order == ports::input::TransactionOrder::DESCENDING) {
            std::reverse(rows.begin(), rows.end());
        }
        return rows;
    }

    domain::AccountSummary getSummary(const std::string& accountNumber, size_t recentLimit) override {
        domain::AccountSummary summary;
        summary.account = requireExisting(accountNumber);

        auto rows = store_->listTransactions(accountNumber);
        summary.balance = domain::deriveBalance(rows);
        summary.transactionCount = rows.size();

        size_t take = std::min(recentLimit, rows.size());
        summary.recent.assign(rows.rbegin(), rows.rbegin() + static_cast<std::ptrdiff_t>(take));
        return summary;
    }

    domain::Account getAccount(const std::string& accountNumber) override {
        return requireExisting(accountNumber);
    }

    std::vector<domain::Account> getAccountsByOwner(const std::string& ownerId) override {
        return store_->findAccountsByOwner(ownerId);
    }

    domain::Account updateProfile(
        const std::string& accountNumber,
        const domain::IdentityFields& identity
    ) override {
        auto updated = store_->updateProfile(accountNumber, identity);
        if (!updated) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::ACCOUNT_NOT_FOUND,
                "Account not found: " + accountNumber);
        }
        return *updated;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IAccountNumberGenerator> numberGenerator_;
    std::shared_ptr<settings::ILedgerSettings> settings_;

    /**
     * @brief Общая часть withdraw и fundCategory: проверка баланса + одна строка расхода
     */
    domain::Transaction debit(
        const std::string& accountNumber,
        const domain::TransactionType& type,
        const domain::Money& amount,
        const std::string& description
    ) {
        requirePositive(amount);

        auto unit = store_->beginUnit({accountNumber});
        requireAccount(*unit, accountNumber);
        requireFunds(*unit, accountNumber, amount);

        unit->append({domain::Transaction(accountNumber, type, amount, description)});
        auto committed = unit->commit();

        std::cout << "[LedgerService] " << type.label() << " " << amount.toString()
                  << " from " << accountNumber << std::endl;
        return committed.front();
    }

    static void requirePositive(const domain::Money& amount) {
        if (!amount.isPositive()) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::INVALID_AMOUNT,
                "Amount must be positive, got " + amount.toString());
        }
    }

    static domain::Account requireAccount(ports::output::ILedgerUnit& unit, const std::string& accountNumber) {
        auto account = unit.findAccount(accountNumber);
        if (!account) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::ACCOUNT_NOT_FOUND,
                "Account not found: " + accountNumber);
        }
        return *account;
    }

    static void requireFunds(
        ports::output::ILedgerUnit& unit,
        const std::string& accountNumber,
        const domain::Money& amount
    ) {
        auto balance = domain::deriveBalance(unit.listTransactions(accountNumber));
        if (amount > balance) {
            std::cerr << "[LedgerService] Insufficient funds on " << accountNumber
                      << ": balance " << balance.toString()
                      << ", requested " << amount.toString() << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::INSUFFICIENT_FUNDS,
                "Insufficient funds: balance " + balance.toString() + ", requested " + amount.toString());
        }
    }

    /**
     * @brief Приход не должен переполнить баланс получателя
     */
    static void requireHeadroom(
        ports::output::ILedgerUnit& unit,
        const std::string& accountNumber,
        const domain::Money& amount
    ) {
        auto balance = domain::deriveBalance(unit.listTransactions(accountNumber));
        try {
            balance += amount;
        } catch (const domain::LedgerException&) {
            std::cerr << "[LedgerService] Balance overflow on " << accountNumber
                      << ": balance " << balance.toString()
                      << ", incoming " << amount.toString() << std::endl;
            throw;
        }
    }

    domain::Account requireExisting(const std::string& accountNumber) {
        auto account = store_->getAccount(accountNumber);
        if (!account) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::ACCOUNT_NOT_FOUND,
                "Account not found: " + accountNumber);
        }
        return *account;
    }
};

} // namespace ledger::application
