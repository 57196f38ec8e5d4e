#pragma once

#include "ports/input/ILedgerService.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "domain/LedgerError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Ответ на одну команду
 */
struct CommandResponse {
    static constexpr int OK = 0;
    static constexpr int USAGE_ERROR = 1;
    static constexpr int LEDGER_ERROR = 2;

    int status = OK;
    nlohmann::json body;

    /**
     * @brief Тело ответа как текст
     *
     * Описания и аргументы приходят как есть, без проверки кодировки:
     * байты, не являющиеся UTF-8, заменяются на U+FFFD.
     */
    std::string render() const {
        return body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

/**
 * @brief Первичный адаптер: команда CLI -> вызов ILedgerService -> JSON
 *
 * Команды:
 *   open <individual|merchant> <owner-id> [key=value ...]
 *   deposit  <acct> <amount> [description]
 *   withdraw <acct> <amount> [description]
 *   transfer <from> <to> <amount> [description]
 *   fund     <acct> <category> <amount> [description]
 *   balance  <acct>
 *   history  <acct> [asc|desc]
 *   summary  <acct> [limit]
 *   accounts <owner-id>
 *   profile  <acct> key=value ...
 *
 * Ключи профиля: username, email, first_name, last_name, dob, bvn, company_name.
 */
class LedgerCommandHandler {
public:
    explicit LedgerCommandHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService))
    {
        std::cout << "[LedgerCommandHandler] Created" << std::endl;
    }

    CommandResponse handle(const std::vector<std::string>& args) {
        if (args.empty()) {
            return usageError("No command given");
        }

        const std::string& command = args[0];

        try {
            if (command == "open")     return handleOpen(args);
            if (command == "deposit")  return handleDeposit(args);
            if (command == "withdraw") return handleWithdraw(args);
            if (command == "transfer") return handleTransfer(args);
            if (command == "fund")     return handleFund(args);
            if (command == "balance")  return handleBalance(args);
            if (command == "history")  return handleHistory(args);
            if (command == "summary")  return handleSummary(args);
            if (command == "accounts") return handleAccounts(args);
            if (command == "profile")  return handleProfile(args);

            return usageError("Unknown command: " + command);

        } catch (const domain::LedgerException& e) {
            std::cerr << "[LedgerCommandHandler] " << command << " failed: " << e.what() << std::endl;
            CommandResponse response;
            response.status = CommandResponse::LEDGER_ERROR;
            response.body["error"] = domain::toString(e.code());
            response.body["message"] = e.what();
            return response;

        } catch (const std::invalid_argument& e) {
            return usageError(e.what());
        }
    }

    /**
     * @brief Разбить строку на аргументы; "..." - один аргумент
     */
    static std::vector<std::string> tokenize(const std::string& line) {
        std::vector<std::string> tokens;
        std::string current;
        bool inQuotes = false;
        bool hasToken = false;

        for (char c : line) {
            if (c == '"') {
                inQuotes = !inQuotes;
                hasToken = true;
            } else if (!inQuotes && (c == ' ' || c == '\t')) {
                if (hasToken) {
                    tokens.push_back(current);
                    current.clear();
                    hasToken = false;
                }
            } else {
                current += c;
                hasToken = true;
            }
        }

        if (inQuotes) {
            throw std::invalid_argument("Unterminated quote in: " + line);
        }
        if (hasToken) {
            tokens.push_back(current);
        }
        return tokens;
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;

    CommandResponse handleOpen(const std::vector<std::string>& args) {
        requireArgs(args, 3, "open <individual|merchant> <owner-id> [key=value ...]");

        auto kind = domain::parseAccountKind(args[1]);
        domain::IdentityFields identity;
        identity.ownerId = args[2];
        applyProfileArgs(identity, args, 3);

        auto account = ledgerService_->openAccount(kind, identity);
        return ok(JsonMapper::toJson(account));
    }

    CommandResponse handleDeposit(const std::vector<std::string>& args) {
        requireArgs(args, 3, "deposit <account> <amount> [description]");
        auto txn = ledgerService_->deposit(args[1], domain::Money::parse(args[2]), joinFrom(args, 3));
        return ok(JsonMapper::toJson(txn));
    }

    CommandResponse handleWithdraw(const std::vector<std::string>& args) {
        requireArgs(args, 3, "withdraw <account> <amount> [description]");
        auto txn = ledgerService_->withdraw(args[1], domain::Money::parse(args[2]), joinFrom(args, 3));
        return ok(JsonMapper::toJson(txn));
    }

    CommandResponse handleTransfer(const std::vector<std::string>& args) {
        requireArgs(args, 4, "transfer <from> <to> <amount> [description]");
        auto result = ledgerService_->transfer(args[1], args[2], domain::Money::parse(args[3]), joinFrom(args, 4));

        nlohmann::json body;
        body["debit"] = JsonMapper::toJson(result.debit);
        body["credit"] = JsonMapper::toJson(result.credit);
        return ok(body);
    }

    CommandResponse handleFund(const std::vector<std::string>& args) {
        requireArgs(args, 4, "fund <account> <category> <amount> [description]");
        auto txn = ledgerService_->fundCategory(args[1], args[2], domain::Money::parse(args[3]), joinFrom(args, 4));
        return ok(JsonMapper::toJson(txn));
    }

    CommandResponse handleBalance(const std::vector<std::string>& args) {
        requireArgs(args, 2, "balance <account>");

        nlohmann::json body;
        body["account_number"] = args[1];
        body["balance"] = ledgerService_->computeBalance(args[1]).toString();
        return ok(body);
    }

    CommandResponse handleHistory(const std::vector<std::string>& args) {
        requireArgs(args, 2, "history <account> [asc|desc]");

        auto order = ports::input::TransactionOrder::DESCENDING;
        if (args.size() > 2) {
            if (args[2] == "asc") {
                order = ports::input::TransactionOrder::ASCENDING;
            } else if (args[2] != "desc") {
                throw std::invalid_argument("Order must be 'asc' or 'desc', got: " + args[2]);
            }
        }

        return ok(JsonMapper::toJson(ledgerService_->listTransactions(args[1], order)));
    }

    CommandResponse handleSummary(const std::vector<std::string>& args) {
        requireArgs(args, 2, "summary <account> [limit]");

        size_t limit = 5;
        if (args.size() > 2) {
            const std::string& text = args[2];
            if (text.empty() || !std::all_of(text.begin(), text.end(),
                                              [](unsigned char c) { return std::isdigit(c); })) {
                throw std::invalid_argument("Limit must be a non-negative integer, got: " + text);
            }
            try {
                limit = std::stoul(args[2]);
            } catch (const std::exception&) {
                throw std::invalid_argument("Limit must be a non-negative integer, got: " + args[2]);
            }
        }

        return ok(JsonMapper::toJson(ledgerService_->getSummary(args[1], limit)));
    }

    CommandResponse handleAccounts(const std::vector<std::string>& args) {
        requireArgs(args, 2, "accounts <owner-id>");

        nlohmann::json body = nlohmann::json::array();
        for (const auto& account : ledgerService_->getAccountsByOwner(args[1])) {
            body.push_back(JsonMapper::toJson(account));
        }
        return ok(body);
    }

    CommandResponse handleProfile(const std::vector<std::string>& args) {
        requireArgs(args, 3, "profile <account> key=value ...");

        // Незаданные ключи сохраняют текущие значения
        auto identity = ledgerService_->getAccount(args[1]).identity;
        applyProfileArgs(identity, args, 2);

        return ok(JsonMapper::toJson(ledgerService_->updateProfile(args[1], identity)));
    }

    static void applyProfileArgs(domain::IdentityFields& identity, const std::vector<std::string>& args, size_t from) {
        for (size_t i = from; i < args.size(); ++i) {
            auto eq = args[i].find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("Expected key=value, got: " + args[i]);
            }

            std::string key = args[i].substr(0, eq);
            std::string value = args[i].substr(eq + 1);

            if (key == "username")          identity.username = value;
            else if (key == "email")        identity.email = value;
            else if (key == "first_name")   identity.firstName = value;
            else if (key == "last_name")    identity.lastName = value;
            else if (key == "dob")          identity.dateOfBirth = value;
            else if (key == "bvn")          identity.bvn = value;
            else if (key == "company_name") identity.companyName = value;
            else throw std::invalid_argument("Unknown profile key: " + key);
        }
    }

    static std::string joinFrom(const std::vector<std::string>& args, size_t from) {
        std::string result;
        for (size_t i = from; i < args.size(); ++i) {
            if (!result.empty()) result += ' ';
            result += args[i];
        }
        return result;
    }

    static void requireArgs(const std::vector<std::string>& args, size_t count, const std::string& usage) {
        if (args.size() < count) {
            throw std::invalid_argument("Usage: " + usage);
        }
    }

    static CommandResponse ok(nlohmann::json body) {
        CommandResponse response;
        response.body = std::move(body);
        return response;
    }

    static CommandResponse usageError(const std::string& message) {
        CommandResponse response;
        response.status = CommandResponse::USAGE_ERROR;
        response.body["error"] = "USAGE";
        response.body["message"] = message;
        return response;
    }
};

} // namespace ledger::adapters::primary
