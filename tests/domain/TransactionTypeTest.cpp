#include <gtest/gtest.h>

#include "domain/Transaction.hpp"
#include "domain/Account.hpp"

using namespace ledger::domain;

TEST(TransactionTypeTest, OnlyDepositIsInflow) {
    EXPECT_TRUE(TransactionType::deposit().isInflow());
    EXPECT_FALSE(TransactionType::withdrawal().isInflow());
    EXPECT_FALSE(TransactionType::transfer().isInflow());
    EXPECT_FALSE(TransactionType::categoryFunding("Betting Funding").isInflow());
    EXPECT_FALSE(TransactionType::categoryFunding("Data Purchase").isInflow());
}

TEST(TransactionTypeTest, Labels) {
    EXPECT_EQ(TransactionType::deposit().label(), "Deposit");
    EXPECT_EQ(TransactionType::withdrawal().label(), "Withdrawal");
    EXPECT_EQ(TransactionType::transfer().label(), "Transfer");
    EXPECT_EQ(TransactionType::categoryFunding("Betting Funding").label(), "Betting Funding");
}

TEST(TransactionTypeTest, CategoryFunding_RejectsEmptyAndReservedLabels) {
    EXPECT_THROW(TransactionType::categoryFunding(""), std::invalid_argument);
    EXPECT_THROW(TransactionType::categoryFunding("Deposit"), std::invalid_argument);
    EXPECT_THROW(TransactionType::categoryFunding("Transfer"), std::invalid_argument);
}

TEST(TransactionTypeTest, Restore_MatchesFactories) {
    EXPECT_EQ(TransactionType::restore(TransactionKind::WITHDRAWAL, ""), TransactionType::withdrawal());
    EXPECT_EQ(TransactionType::restore(TransactionKind::CATEGORY_FUNDING, "Data Purchase"),
              TransactionType::categoryFunding("Data Purchase"));
    EXPECT_THROW(TransactionType::restore(TransactionKind::DEPOSIT, "Betting Funding"), std::invalid_argument);
    EXPECT_THROW(TransactionType::restore(TransactionKind::CATEGORY_FUNDING, ""), std::invalid_argument);
}

TEST(TransactionTypeTest, FromLabel) {
    EXPECT_EQ(TransactionType::fromLabel("Deposit"), TransactionType::deposit());
    EXPECT_EQ(TransactionType::fromLabel("Withdrawal"), TransactionType::withdrawal());
    EXPECT_EQ(TransactionType::fromLabel("Transfer"), TransactionType::transfer());
    EXPECT_EQ(TransactionType::fromLabel("Betting Funding").kind(), TransactionKind::CATEGORY_FUNDING);
    EXPECT_THROW(TransactionType::fromLabel(""), std::invalid_argument);
}

TEST(TransactionTypeTest, KindStringsRoundTrip) {
    for (auto kind : {TransactionKind::DEPOSIT, TransactionKind::WITHDRAWAL,
                      TransactionKind::TRANSFER, TransactionKind::CATEGORY_FUNDING}) {
        EXPECT_EQ(parseTransactionKind(toString(kind)), kind);
    }
    EXPECT_THROW(parseTransactionKind("Deposit"), std::invalid_argument);
}

TEST(TransactionTypeTest, DeriveBalance_InflowMinusOutflow) {
    std::vector<Transaction> history = {
        Transaction("100000000001", TransactionType::deposit(), Money::fromUnits(1000), "Welcome bonus"),
        Transaction("100000000001", TransactionType::withdrawal(), Money::fromUnits(200), ""),
        Transaction("100000000001", TransactionType::transfer(), Money::parse("50.50"), ""),
        Transaction("100000000001", TransactionType::categoryFunding("Betting Funding"), Money::fromUnits(100), ""),
        Transaction("100000000001", TransactionType::deposit(), Money::parse("0.50"), ""),
    };

    EXPECT_EQ(deriveBalance(history), Money::fromUnits(650));
    EXPECT_TRUE(deriveBalance({}).isZero());
}

// ============================================
// ACCOUNT KIND
// ============================================

TEST(AccountKindTest, Parse) {
    EXPECT_EQ(parseAccountKind("individual"), AccountKind::INDIVIDUAL);
    EXPECT_EQ(parseAccountKind("user"), AccountKind::INDIVIDUAL);
    EXPECT_EQ(parseAccountKind("Merchant"), AccountKind::MERCHANT);
    EXPECT_THROW(parseAccountKind("bank"), std::invalid_argument);
}

TEST(AccountKindTest, NormalizeForKind_DropsFieldsOfOtherKind) {
    IdentityFields fields;
    fields.ownerId = "user-1";
    fields.firstName = "Ada";
    fields.bvn = "22222222222";
    fields.companyName = "Grina Ltd";

    auto individual = normalizeForKind(fields, AccountKind::INDIVIDUAL);
    EXPECT_EQ(individual.firstName, "Ada");
    EXPECT_EQ(individual.bvn, "22222222222");
    EXPECT_TRUE(individual.companyName.empty());

    auto merchant = normalizeForKind(fields, AccountKind::MERCHANT);
    EXPECT_EQ(merchant.companyName, "Grina Ltd");
    EXPECT_TRUE(merchant.firstName.empty());
    EXPECT_TRUE(merchant.bvn.empty());
    EXPECT_EQ(merchant.ownerId, "user-1");
}
