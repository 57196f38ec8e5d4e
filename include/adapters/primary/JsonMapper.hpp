#pragma once

#include "domain/Account.hpp"
#include "domain/AccountSummary.hpp"
#include "domain/Transaction.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Сериализация доменных объектов в JSON для CLI
 *
 * Суммы отдаются строкой с двумя знаками ("1500.50"), чтобы
 * не терять точность на double.
 */
class JsonMapper {
public:
    static nlohmann::json toJson(const domain::Account& account) {
        const auto& id = account.identity;

        nlohmann::json json;
        json["account_number"] = account.accountNumber;
        json["kind"] = domain::toString(account.kind);
        json["owner_id"] = id.ownerId;
        json["username"] = id.username;
        json["email"] = id.email;
        json["created_at"] = account.createdAt.toString();

        if (account.kind == domain::AccountKind::MERCHANT) {
            json["company_name"] = id.companyName;
        } else {
            json["first_name"] = id.firstName;
            json["last_name"] = id.lastName;
            json["dob"] = id.dateOfBirth;
            json["bvn"] = id.bvn;
        }
        return json;
    }

    static nlohmann::json toJson(const domain::Transaction& txn) {
        nlohmann::json json;
        json["id"] = txn.id;
        json["account_number"] = txn.accountNumber;
        json["type"] = txn.type.label();
        json["kind"] = domain::toString(txn.type.kind());
        json["direction"] = txn.type.isInflow() ? "inflow" : "outflow";
        json["amount"] = txn.amount.toString();
        json["timestamp"] = txn.timestamp.toString();
        json["description"] = txn.description;
        return json;
    }

    static nlohmann::json toJson(const std::vector<domain::Transaction>& rows) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& row : rows) {
            array.push_back(toJson(row));
        }
        return array;
    }

    static nlohmann::json toJson(const domain::AccountSummary& summary) {
        nlohmann::json json;
        json["account"] = toJson(summary.account);
        json["balance"] = summary.balance.toString();
        json["transactions_count"] = summary.transactionCount;
        json["recent"] = toJson(summary.recent);
        return json;
    }
};

} // namespace ledger::adapters::primary
