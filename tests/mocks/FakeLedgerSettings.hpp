#pragma once

#include "settings/ILedgerSettings.hpp"

namespace ledger::tests::mocks {

/**
 * @brief Настройки леджера для тестов (без ENV)
 */
class FakeLedgerSettings : public settings::ILedgerSettings {
public:
    domain::Money getWelcomeBonus() const override { return welcomeBonus_; }
    int getAccountNumberRetries() const override { return retries_; }
    std::chrono::milliseconds getLockTimeout() const override { return lockTimeout_; }
    std::string getStoreBackend() const override { return "memory"; }

    void setWelcomeBonus(const domain::Money& amount) { welcomeBonus_ = amount; }
    void setAccountNumberRetries(int retries) { retries_ = retries; }
    void setLockTimeout(std::chrono::milliseconds timeout) { lockTimeout_ = timeout; }

private:
    domain::Money welcomeBonus_ = domain::Money::fromUnits(1000);
    int retries_ = 5;
    std::chrono::milliseconds lockTimeout_{2000};
};

} // namespace ledger::tests::mocks
