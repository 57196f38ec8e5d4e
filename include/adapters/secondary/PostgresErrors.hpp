// include/adapters/secondary/PostgresErrors.hpp
#pragma once

#include "domain/LedgerError.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <iostream>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Перевести ошибку pqxx в LedgerException
 *
 * 23505 (unique) -> DUPLICATE_ACCOUNT_NUMBER.
 * Прочие 23xxx и ошибки данных 22xxx (длина, кодировка) -> CONSTRAINT_VIOLATION.
 * Всё остальное (обрыв соединения, lock_timeout 55P03, statement_timeout 57014) -> STORAGE_UNAVAILABLE.
 */
[[noreturn]] inline void rethrowAsLedgerError(const char* operation, const std::exception& e) {
    std::cerr << "[PostgresLedgerStore] " << operation << "() failed: " << e.what() << std::endl;

    if (const auto* ledgerError = dynamic_cast<const domain::LedgerException*>(&e)) {
        throw *ledgerError;
    }
    if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
        throw domain::LedgerException(domain::LedgerErrorCode::DUPLICATE_ACCOUNT_NUMBER, e.what());
    }
    if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e) ||
        dynamic_cast<const pqxx::data_exception*>(&e)) {
        throw domain::LedgerException(domain::LedgerErrorCode::CONSTRAINT_VIOLATION, e.what());
    }
    throw domain::LedgerException(
        domain::LedgerErrorCode::STORAGE_UNAVAILABLE,
        std::string(operation) + ": " + e.what());
}

/**
 * @brief Ограничить время каждого запроса текущей транзакции
 */
inline void setStatementTimeout(pqxx::work& txn, std::chrono::milliseconds timeout) {
    txn.exec("SET LOCAL statement_timeout = '" + std::to_string(timeout.count()) + "ms'");
}

} // namespace ledger::adapters::secondary
