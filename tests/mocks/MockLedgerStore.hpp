#pragma once

#include "ports/output/ILedgerStore.hpp"
#include <gmock/gmock.h>

namespace ledger::tests::mocks {

class MockLedgerStore : public ports::output::ILedgerStore {
public:
    MOCK_METHOD(std::optional<domain::Account>, getAccount, (const std::string& accountNumber), (override));
    MOCK_METHOD(std::vector<domain::Account>, findAccountsByOwner, (const std::string& ownerId), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, listTransactions, (const std::string& accountNumber), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, append, (const std::vector<domain::Transaction>& rows), (override));
    MOCK_METHOD(std::optional<domain::Account>, updateProfile,
                (const std::string& accountNumber, const domain::IdentityFields& identity), (override));
    MOCK_METHOD(std::unique_ptr<ports::output::ILedgerUnit>, beginUnit,
                (const std::vector<std::string>& lockSet), (override));
};

class MockLedgerUnit : public ports::output::ILedgerUnit {
public:
    MOCK_METHOD(std::optional<domain::Account>, findAccount, (const std::string& accountNumber), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, listTransactions, (const std::string& accountNumber), (override));
    MOCK_METHOD(void, insertAccount, (const domain::Account& account), (override));
    MOCK_METHOD(void, append, (const std::vector<domain::Transaction>& rows), (override));
    MOCK_METHOD(std::vector<domain::Transaction>, commit, (), (override));
};

} // namespace ledger::tests::mocks
