#pragma once

#include "enums/AccountKind.hpp"
#include "Timestamp.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Данные владельца и профиля счёта
 *
 * Для леджера это непрозрачные метаданные (в т.ч. KYC-поля вроде BVN):
 * сохраняются и возвращаются как есть, в расчётах не участвуют.
 */
struct IdentityFields {
    std::string ownerId;        ///< Ссылка на владельца (пользователь в auth-слое)
    std::string username;
    std::string email;
    std::string firstName;      ///< Только для INDIVIDUAL
    std::string lastName;       ///< Только для INDIVIDUAL
    std::string dateOfBirth;    ///< Только для INDIVIDUAL
    std::string bvn;            ///< Только для INDIVIDUAL
    std::string companyName;    ///< Только для MERCHANT

    bool operator==(const IdentityFields& other) const = default;
};

/**
 * @brief Оставить только поля, которые имеют смысл для типа счёта
 */
inline IdentityFields normalizeForKind(IdentityFields fields, AccountKind kind) {
    switch (kind) {
        case AccountKind::INDIVIDUAL:
            fields.companyName.clear();
            break;
        case AccountKind::MERCHANT:
            fields.firstName.clear();
            fields.lastName.clear();
            fields.dateOfBirth.clear();
            fields.bvn.clear();
            break;
    }
    return fields;
}

/**
 * @brief Счёт клиента
 *
 * Номер счёта (12 цифр) уникален и не меняется.
 * Баланса здесь нет: он всегда выводится из истории транзакций.
 */
struct Account {
    std::string accountNumber;  ///< 12-значный номер
    AccountKind kind = AccountKind::INDIVIDUAL;
    IdentityFields identity;
    Timestamp createdAt;

    Account() = default;

    Account(const std::string& accountNumber,
            AccountKind kind,
            const IdentityFields& identity)
        : accountNumber(accountNumber)
        , kind(kind)
        , identity(normalizeForKind(identity, kind))
        , createdAt(Timestamp::now())
    {}
};

} // namespace ledger::domain
