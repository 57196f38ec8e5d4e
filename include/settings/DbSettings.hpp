#pragma once

#include <chrono>
#include <string>
#include <cstdlib>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Настройки подключения к PostgreSQL из ENV
 *
 * LEDGER_DB_CONNECT_TIMEOUT_S (по умолчанию 5) - connect_timeout libpq, секунды.
 * LEDGER_DB_STATEMENT_TIMEOUT_MS (по умолчанию 10000) - statement_timeout
 * для каждой транзакции хранилища.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("LEDGER_DB_HOST", "localhost");
        port_ = std::stoi(getEnvOrDefault("LEDGER_DB_PORT", "5432"));
        name_ = getEnvOrDefault("LEDGER_DB_NAME", "ledger_db");
        user_ = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
        password_ = getEnvOrThrow("LEDGER_DB_PASSWORD");
        connectTimeoutSeconds_ = parsePositiveInt("LEDGER_DB_CONNECT_TIMEOUT_S", "5");
        statementTimeout_ = std::chrono::milliseconds(parsePositiveInt("LEDGER_DB_STATEMENT_TIMEOUT_MS", "10000"));
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }
    std::chrono::milliseconds getStatementTimeout() const { return statementTimeout_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeoutSeconds_);
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeoutSeconds_;
    std::chrono::milliseconds statementTimeout_;

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

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace ledger::settings
