#pragma once

#include <string>

namespace ledger::ports::output {

/**
 * @brief Источник кандидатов в номера счетов
 *
 * Уникальность не гарантирует: коллизии ловит хранилище,
 * а LedgerService повторяет попытку с новым номером.
 */
class IAccountNumberGenerator {
public:
    virtual ~IAccountNumberGenerator() = default;

    /**
     * @return 12-значная строка из цифр
     */
    virtual std::string next() = 0;
};

} // namespace ledger::ports::output
