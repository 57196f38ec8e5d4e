#pragma once

#include <string>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace ledger::domain {

/**
 * @brief Тип счёта
 *
 * Влияет только на заполняемые поля профиля, не на расчёт баланса.
 */
enum class AccountKind {
    INDIVIDUAL, ///< Физическое лицо
    MERCHANT    ///< Мерчант (компания)
};

inline std::string toString(AccountKind kind) {
    switch (kind) {
        case AccountKind::INDIVIDUAL: return "individual";
        case AccountKind::MERCHANT:   return "merchant";
    }
    return "unknown";
}

/**
 * @brief Преобразовать строку в AccountKind
 *
 * "user" принимается как синоним "individual".
 *
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountKind parseAccountKind(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "individual" || lower == "user") return AccountKind::INDIVIDUAL;
    if (lower == "merchant")                      return AccountKind::MERCHANT;
    throw std::invalid_argument("Unknown account kind: " + str);
}

} // namespace ledger::domain
