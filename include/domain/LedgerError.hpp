#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Коды ошибок операций леджера
 *
 * Каждый отказ операции имеет свой код, чтобы вызывающая сторона
 * (UI, CLI) могла отличить их друг от друга и показать своё сообщение.
 */
enum class LedgerErrorCode {
    INVALID_AMOUNT,             ///< Сумма не положительная или не число
    INSUFFICIENT_FUNDS,         ///< Сумма больше текущего баланса
    RECIPIENT_NOT_FOUND,        ///< Счёт получателя перевода не существует
    ACCOUNT_NOT_FOUND,          ///< Счёт не существует
    DUPLICATE_ACCOUNT_NUMBER,   ///< Номер счёта уже занят
    STORAGE_UNAVAILABLE,        ///< Хранилище недоступно или не ответило вовремя
    CONSTRAINT_VIOLATION        ///< Нарушено ограничение хранилища
};

inline std::string toString(LedgerErrorCode code) {
    switch (code) {
        case LedgerErrorCode::INVALID_AMOUNT:           return "INVALID_AMOUNT";
        case LedgerErrorCode::INSUFFICIENT_FUNDS:       return "INSUFFICIENT_FUNDS";
        case LedgerErrorCode::RECIPIENT_NOT_FOUND:      return "RECIPIENT_NOT_FOUND";
        case LedgerErrorCode::ACCOUNT_NOT_FOUND:        return "ACCOUNT_NOT_FOUND";
        case LedgerErrorCode::DUPLICATE_ACCOUNT_NUMBER: return "DUPLICATE_ACCOUNT_NUMBER";
        case LedgerErrorCode::STORAGE_UNAVAILABLE:      return "STORAGE_UNAVAILABLE";
        case LedgerErrorCode::CONSTRAINT_VIOLATION:     return "CONSTRAINT_VIOLATION";
    }
    return "UNKNOWN";
}

/**
 * @brief Исключение, выбрасываемое при отказе операции леджера
 *
 * Если исключение вылетело из операции, состояние леджера не изменилось.
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(LedgerErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    LedgerErrorCode code() const { return code_; }

private:
    LedgerErrorCode code_;
};

} // namespace ledger::domain
