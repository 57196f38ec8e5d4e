#pragma once

#include "settings/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки леджера из ENV
 *
 * Все значения проверяются в конструкторе: кривой конфиг должен
 * ронять процесс на старте, а не на первой операции.
 */
class LedgerSettings : public ILedgerSettings {
public:
    LedgerSettings() {
        try {
            welcomeBonus_ = domain::Money::parse(getEnvOrDefault("LEDGER_WELCOME_BONUS", "1000.00"));
        } catch (const domain::LedgerException& e) {
            throw std::runtime_error(std::string("LEDGER_WELCOME_BONUS: ") + e.what());
        }
        if (!welcomeBonus_.isPositive()) {
            throw std::runtime_error("LEDGER_WELCOME_BONUS must be positive");
        }

        accountNumberRetries_ = parsePositiveInt("LEDGER_ACCOUNT_NUMBER_RETRIES", "5");
        lockTimeout_ = std::chrono::milliseconds(parsePositiveInt("LEDGER_LOCK_TIMEOUT_MS", "5000"));

        storeBackend_ = getEnvOrDefault("LEDGER_STORE", "postgres");
        if (storeBackend_ != "postgres" && storeBackend_ != "memory") {
            throw std::runtime_error("LEDGER_STORE must be 'postgres' or 'memory', got: " + storeBackend_);
        }
    }

    domain::Money getWelcomeBonus() const override { return welcomeBonus_; }
    int getAccountNumberRetries() const override { return accountNumberRetries_; }
    std::chrono::milliseconds getLockTimeout() const override { return lockTimeout_; }
    std::string getStoreBackend() const override { return storeBackend_; }

private:
    domain::Money welcomeBonus_;
    int accountNumberRetries_;
    std::chrono::milliseconds lockTimeout_;
    std::string storeBackend_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static int parsePositiveInt(const char* name, const std::string& defaultValue) {
        std::string raw = getEnvOrDefault(name, defaultValue);
        int value = 0;
        try {
            size_t consumed = 0;
            value = std::stoi(raw, &consumed);
            if (consumed != raw.size()) {
                throw std::invalid_argument(raw);
            }
        } catch (const std::exception&) {
            throw std::runtime_error(std::string(name) + " is not an integer: " + raw);
        }
        if (value <= 0) {
            throw std::runtime_error(std::string(name) + " must be positive, got: " + raw);
        }
        return value;
    }
};

} // namespace ledger::settings
