#pragma once

#include "domain/Money.hpp"
#include <chrono>
#include <string>

namespace ledger::settings {

class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /// Сумма приветственного депозита при открытии счёта
    virtual domain::Money getWelcomeBonus() const = 0;

    /// Сколько раз пробовать новый номер при коллизии
    virtual int getAccountNumberRetries() const = 0;

    /// Сколько ждать блокировку счёта до STORAGE_UNAVAILABLE
    virtual std::chrono::milliseconds getLockTimeout() const = 0;

    /// "postgres" или "memory"
    virtual std::string getStoreBackend() const = 0;
};

} // namespace ledger::settings
