// include/adapters/secondary/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/DbSettings.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища леджера
 *
 * Таблица: accounts
 * - account_number VARCHAR(12) PRIMARY KEY (ровно 12 цифр)
 * - kind VARCHAR(16) NOT NULL ('individual' / 'merchant')
 * - owner_id, username, email, first_name, last_name, dob, bvn, company_name
 * - created_at TIMESTAMPTZ NOT NULL
 *
 * Таблица: transactions (только INSERT, UPDATE/DELETE запрещены триггером)
 * - id BIGSERIAL PRIMARY KEY
 * - account_number VARCHAR(12) NOT NULL REFERENCES accounts
 * - kind VARCHAR(32) NOT NULL, category TEXT (только для CATEGORY_FUNDING)
 * - amount BIGINT NOT NULL CHECK (amount > 0)  (в минорных единицах)
 * - description TEXT
 * - created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
 *
 * Каждая единица работы - своё соединение и своя pqxx::work.
 * Блокировки счетов: SELECT ... FOR UPDATE по возрастанию номера,
 * ограничены SET LOCAL lock_timeout. Каждый запрос ограничен statement_timeout,
 * подключение - connect_timeout из DbSettings.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    PostgresLedgerStore(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::ILedgerSettings> ledgerSettings
    ) : dbSettings_(std::move(dbSettings))
      , ledgerSettings_(std::move(ledgerSettings))
    {
        initSchema();
    }

    std::optional<domain::Account> getAccount(const std::string& accountNumber) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setStatementTimeout(txn, dbSettings_->getStatementTimeout());
            auto account = selectAccount(txn, accountNumber);
            txn.commit();
            return account;
        } catch (const domain::LedgerException&) {
            throw;
        } catch (const std::exception& e) {
            rethrowAsLedgerError("getAccount", e);
        }
    }

    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setStatementTimeout(txn, dbSettings_->getStatementTimeout());

            auto result = txn.exec_params(
                std::string(ACCOUNT_COLUMNS) +
                " FROM accounts WHERE owner_id = $1 ORDER BY created_at ASC, account_number ASC",
                ownerId
            );
            txn.commit();

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;

        } catch (const domain::LedgerException&) {
            throw;
        } catch (const std::exception& e) {
            rethrowAsLedgerError("findAccountsByOwner", e);
        }
    }

    std::vector<domain::Transaction> listTransactions(const std::string& accountNumber) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setStatementTimeout(txn, dbSettings_->getStatementTimeout());
            auto rows = selectTransactions(txn, accountNumber);
            txn.commit();
            return rows;
        } catch (const domain::LedgerException&) {
            throw;
        } catch (const std::exception& e) {
            rethrowAsLedgerError("listTransactions", e);
        }
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
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setStatementTimeout(txn, dbSettings_->getStatementTimeout());

            auto existing = selectAccount(txn, accountNumber);
            if (!existing) {
                return std::nullopt;
            }

            auto fields = domain::normalizeForKind(identity, existing->kind);

            txn.exec_params(
                R"(
                    UPDATE accounts SET
                        username = $2, email = $3, first_name = $4, last_name = $5,
                        dob = $6, bvn = $7, company_name = $8
                    WHERE account_number = $1
                )",
                accountNumber,
                fields.username,
                fields.email,
                fields.firstName,
                fields.lastName,
                fields.dateOfBirth,
                fields.bvn,
                fields.companyName
            );
            txn.commit();

            fields.ownerId = existing->identity.ownerId;
            existing->identity = fields;
            std::cout << "[PostgresLedgerStore] Updated profile of " << accountNumber << std::endl;
            return existing;

        } catch (const domain::LedgerException&) {
            throw;
        } catch (const std::exception& e) {
            rethrowAsLedgerError("updateProfile", e);
        }
    }

    /// Свободный текст (профиль, категория, описание) хранится как TEXT без ограничения длины
    static constexpr const char* ACCOUNTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS accounts (
            account_number VARCHAR(12) PRIMARY KEY CHECK (account_number ~ '^[0-9]{12}$'),
            kind VARCHAR(16) NOT NULL,
            owner_id VARCHAR(64) NOT NULL,
            username TEXT,
            email TEXT,
            first_name TEXT,
            last_name TEXT,
            dob TEXT,
            bvn TEXT,
            company_name TEXT,
            created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
        )
    )";

    static constexpr const char* TRANSACTIONS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS transactions (
            id BIGSERIAL PRIMARY KEY,
            account_number VARCHAR(12) NOT NULL REFERENCES accounts (account_number),
            kind VARCHAR(32) NOT NULL,
            category TEXT,
            amount BIGINT NOT NULL CHECK (amount > 0),
            description TEXT,
            created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
        )
    )";

    std::unique_ptr<ports::output::ILedgerUnit> beginUnit(const std::vector<std::string>& lockSet) override {
        return std::make_unique<PostgresLedgerUnit>(
            dbSettings_->getConnectionString(),
            lockSet,
            ledgerSettings_->getLockTimeout(),
            dbSettings_->getStatementTimeout());
    }

private:
    static constexpr const char* ACCOUNT_COLUMNS =
        "SELECT account_number, kind, owner_id, username, email, first_name, last_name, "
        "dob, bvn, company_name, (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms";

    static constexpr const char* TRANSACTION_COLUMNS =
        "SELECT id, account_number, kind, category, amount, description, "
        "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms";

    class PostgresLedgerUnit : public ports::output::ILedgerUnit {
    public:
        PostgresLedgerUnit(const std::string& connectionString,
                           std::vector<std::string> lockSet,
                           std::chrono::milliseconds lockTimeout,
                           std::chrono::milliseconds statementTimeout)
        {
            std::sort(lockSet.begin(), lockSet.end());
            lockSet.erase(std::unique(lockSet.begin(), lockSet.end()), lockSet.end());

            try {
                conn_ = std::make_unique<pqxx::connection>(connectionString);
                txn_ = std::make_unique<pqxx::work>(*conn_);

                txn_->exec("SET LOCAL lock_timeout = '" + std::to_string(lockTimeout.count()) + "ms'");
                setStatementTimeout(*txn_, statementTimeout);

                for (const auto& accountNumber : lockSet) {
                    txn_->exec_params(
                        "SELECT account_number FROM accounts WHERE account_number = $1 FOR UPDATE",
                        accountNumber
                    );
                }
            } catch (const std::exception& e) {
                rethrowAsLedgerError("beginUnit", e);
            }
        }

        // pqxx::work без commit() откатывается в своём деструкторе
        ~PostgresLedgerUnit() override = default;

        std::optional<domain::Account> findAccount(const std::string& accountNumber) override {
            requireOpen();
            try {
                return selectAccount(*txn_, accountNumber);
            } catch (const std::exception& e) {
                rethrowAsLedgerError("findAccount", e);
            }
        }

        std::vector<domain::Transaction> listTransactions(const std::string& accountNumber) override {
            requireOpen();
            try {
                return selectTransactions(*txn_, accountNumber);
            } catch (const std::exception& e) {
                rethrowAsLedgerError("listTransactions", e);
            }
        }

        void insertAccount(const domain::Account& account) override {
            requireOpen();
            pqxx::result result;
            try {
                const auto& id = account.identity;
                result = txn_->exec_params(
                    R"(
                        INSERT INTO accounts (account_number, kind, owner_id, username, email,
                                              first_name, last_name, dob, bvn, company_name, created_at)
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, to_timestamp($11::BIGINT / 1000.0))
                        ON CONFLICT (account_number) DO NOTHING
                        RETURNING account_number
                    )",
                    account.accountNumber,
                    domain::toString(account.kind),
                    id.ownerId,
                    id.username,
                    id.email,
                    id.firstName,
                    id.lastName,
                    id.dateOfBirth,
                    id.bvn,
                    id.companyName,
                    account.createdAt.toMillis()
                );
            } catch (const std::exception& e) {
                rethrowAsLedgerError("insertAccount", e);
            }

            if (result.empty()) {
                throw domain::LedgerException(
                    domain::LedgerErrorCode::DUPLICATE_ACCOUNT_NUMBER,
                    "Account number already exists: " + account.accountNumber);
            }
        }

        void append(const std::vector<domain::Transaction>& rows) override {
            requireOpen();
            try {
                for (const auto& row : rows) {
                    std::optional<std::string> category;
                    if (!row.type.category().empty()) {
                        category = row.type.category();
                    }

                    auto result = txn_->exec_params(
                        R"(
                            INSERT INTO transactions (account_number, kind, category, amount, description)
                            VALUES ($1, $2, $3, $4, $5)
                            RETURNING id, (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms
                        )",
                        row.accountNumber,
                        domain::toString(row.type.kind()),
                        category,
                        row.amount.minor,
                        row.description
                    );

                    domain::Transaction inserted = row;
                    inserted.id = result[0]["id"].as<int64_t>();
                    inserted.timestamp = domain::Timestamp::fromMillis(result[0]["created_ms"].as<int64_t>());
                    inserted_.push_back(std::move(inserted));
                }
            } catch (const std::exception& e) {
                rethrowAsLedgerError("append", e);
            }
        }

        std::vector<domain::Transaction> commit() override {
            requireOpen();
            try {
                txn_->commit();
            } catch (const std::exception& e) {
                rethrowAsLedgerError("commit", e);
            }
            committed_ = true;
            return std::move(inserted_);
        }

    private:
        std::unique_ptr<pqxx::connection> conn_;
        std::unique_ptr<pqxx::work> txn_;
        std::vector<domain::Transaction> inserted_;
        bool committed_ = false;

        void requireOpen() const {
            if (committed_) {
                throw std::logic_error("Ledger unit already committed");
            }
        }
    };

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::ILedgerSettings> ledgerSettings_;

    static std::optional<domain::Account> selectAccount(pqxx::work& txn, const std::string& accountNumber) {
        auto result = txn.exec_params(
            std::string(ACCOUNT_COLUMNS) + " FROM accounts WHERE account_number = $1",
            accountNumber
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return rowToAccount(result[0]);
    }

    static std::vector<domain::Transaction> selectTransactions(pqxx::work& txn, const std::string& accountNumber) {
        auto result = txn.exec_params(
            std::string(TRANSACTION_COLUMNS) + " FROM transactions WHERE account_number = $1 ORDER BY id ASC",
            accountNumber
        );

        std::vector<domain::Transaction> rows;
        rows.reserve(result.size());
        for (const auto& row : result) {
            rows.push_back(rowToTransaction(row));
        }
        return rows;
    }

    static std::string optionalText(const pqxx::row& row, const char* column) {
        return row[column].is_null() ? "" : row[column].as<std::string>();
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.accountNumber = row["account_number"].as<std::string>();
        account.kind = domain::parseAccountKind(row["kind"].as<std::string>());
        account.identity.ownerId = row["owner_id"].as<std::string>();
        account.identity.username = optionalText(row, "username");
        account.identity.email = optionalText(row, "email");
        account.identity.firstName = optionalText(row, "first_name");
        account.identity.lastName = optionalText(row, "last_name");
        account.identity.dateOfBirth = optionalText(row, "dob");
        account.identity.bvn = optionalText(row, "bvn");
        account.identity.companyName = optionalText(row, "company_name");
        account.createdAt = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        return account;
    }

    static domain::Transaction rowToTransaction(const pqxx::row& row) {
        domain::Transaction txn;
        txn.id = row["id"].as<int64_t>();
        txn.accountNumber = row["account_number"].as<std::string>();
        txn.type = domain::TransactionType::restore(
            domain::parseTransactionKind(row["kind"].as<std::string>()),
            optionalText(row, "category"));
        txn.amount = domain::Money(row["amount"].as<int64_t>());
        txn.description = optionalText(row, "description");
        txn.timestamp = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        return txn;
    }

    void initSchema() {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(ACCOUNTS_TABLE);

            txn.exec("CREATE INDEX IF NOT EXISTS idx_accounts_owner ON accounts (owner_id)");

            txn.exec(TRANSACTIONS_TABLE);

            // Базы, созданные со старыми ограничениями длины
            for (const char* column : {"username", "email", "first_name", "last_name",
                                       "dob", "bvn", "company_name"}) {
                txn.exec(std::string("ALTER TABLE accounts ALTER COLUMN ") + column + " TYPE TEXT");
            }
            txn.exec("ALTER TABLE transactions ALTER COLUMN category TYPE TEXT");
            txn.exec("ALTER TABLE transactions ALTER COLUMN description TYPE TEXT");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_account ON transactions (account_number, id)");

            txn.exec(R"(
                CREATE OR REPLACE FUNCTION ledger_forbid_mutation() RETURNS trigger AS $$
                BEGIN
                    RAISE EXCEPTION 'transactions table is append-only';
                END;
                $$ LANGUAGE plpgsql
            )");

            txn.exec("DROP TRIGGER IF EXISTS transactions_append_only ON transactions");
            txn.exec(R"(
                CREATE TRIGGER transactions_append_only
                BEFORE UPDATE OR DELETE ON transactions
                FOR EACH ROW EXECUTE FUNCTION ledger_forbid_mutation()
            )");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::STORAGE_UNAVAILABLE,
                std::string("Schema initialization failed: ") + e.what());
        }
    }
};

} // namespace ledger::adapters::secondary
