/**
 * @file LedgerCommandHandlerTest.cpp
 * @brief Unit tests for LedgerCommandHandler
 */

#include <gtest/gtest.h>
#include "adapters/primary/LedgerCommandHandler.hpp"
#include "application/LedgerService.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "mocks/FakeLedgerSettings.hpp"
#include "mocks/ScriptedAccountNumberGenerator.hpp"

using namespace ledger;
using namespace ledger::adapters::primary;
using namespace ledger::tests::mocks;

class LedgerCommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto settings = std::make_shared<FakeLedgerSettings>();
        auto store = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings);
        generator_ = std::make_shared<ScriptedAccountNumberGenerator>();
        auto service = std::make_shared<application::LedgerService>(store, generator_, settings);
        handler_ = std::make_shared<LedgerCommandHandler>(service);
    }

    CommandResponse run(const std::string& line) {
        return handler_->handle(LedgerCommandHandler::tokenize(line));
    }

    std::string openAccount(const std::string& ownerId = "owner-1") {
        auto response = run("open individual " + ownerId + " username=ada first_name=Ada");
        EXPECT_EQ(response.status, CommandResponse::OK);
        return response.body["account_number"].get<std::string>();
    }

    std::shared_ptr<ScriptedAccountNumberGenerator> generator_;
    std::shared_ptr<LedgerCommandHandler> handler_;
};

// ============================================================================
// TOKENIZE
// ============================================================================

TEST_F(LedgerCommandHandlerTest, Tokenize_QuotedArgumentIsOneToken) {
    auto tokens = LedgerCommandHandler::tokenize("fund 100000000001 \"Betting Funding\"  300 ");

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1], "100000000001");
    EXPECT_EQ(tokens[2], "Betting Funding");
    EXPECT_EQ(tokens[3], "300");
}

TEST_F(LedgerCommandHandlerTest, Tokenize_EmptyQuotesGiveEmptyToken) {
    auto tokens = LedgerCommandHandler::tokenize("fund 1 \"\" 5");

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(tokens[2].empty());
}

TEST_F(LedgerCommandHandlerTest, Tokenize_UnterminatedQuote_Throws) {
    EXPECT_THROW(LedgerCommandHandler::tokenize("deposit 1 \"oops"), std::invalid_argument);
}

// ============================================================================
// COMMANDS
// ============================================================================

TEST_F(LedgerCommandHandlerTest, Open_ReturnsAccountJson) {
    generator_->enqueue("100000000001");

    auto response = run("open individual owner-1 username=ada email=ada@example.com bvn=22222222222");

    ASSERT_EQ(response.status, CommandResponse::OK);
    EXPECT_EQ(response.body["account_number"], "100000000001");
    EXPECT_EQ(response.body["kind"], "individual");
    EXPECT_EQ(response.body["owner_id"], "owner-1");
    EXPECT_EQ(response.body["email"], "ada@example.com");
    EXPECT_EQ(response.body["bvn"], "22222222222");
    EXPECT_FALSE(response.body.contains("company_name"));
}

TEST_F(LedgerCommandHandlerTest, Open_Merchant) {
    auto response = run("open merchant owner-9 \"company_name=Grina Ltd\"");

    ASSERT_EQ(response.status, CommandResponse::OK);
    EXPECT_EQ(response.body["kind"], "merchant");
    EXPECT_EQ(response.body["company_name"], "Grina Ltd");
}

TEST_F(LedgerCommandHandlerTest, Balance_AfterWelcomeBonus) {
    auto acct = openAccount();

    auto response = run("balance " + acct);

    ASSERT_EQ(response.status, CommandResponse::OK);
    EXPECT_EQ(response.body["balance"], "1000.00");
}

TEST_F(LedgerCommandHandlerTest, DepositAndWithdraw_ReturnTransactions) {
    auto acct = openAccount();

    auto deposit = run("deposit " + acct + " 500.5");
    auto withdraw = run("withdraw " + acct + " 0.50 ATM Lekki");

    ASSERT_EQ(deposit.status, CommandResponse::OK);
    EXPECT_EQ(deposit.body["type"], "Deposit");
    EXPECT_EQ(deposit.body["direction"], "inflow");
    EXPECT_EQ(deposit.body["amount"], "500.50");
    EXPECT_EQ(deposit.body["description"], "Manual deposit");

    ASSERT_EQ(withdraw.status, CommandResponse::OK);
    EXPECT_EQ(withdraw.body["type"], "Withdrawal");
    EXPECT_EQ(withdraw.body["description"], "ATM Lekki");

    EXPECT_EQ(run("balance " + acct).body["balance"], "1500.00");
}

TEST_F(LedgerCommandHandlerTest, Withdraw_InsufficientFunds_LedgerError) {
    auto acct = openAccount();

    auto response = run("withdraw " + acct + " 2000");

    EXPECT_EQ(response.status, CommandResponse::LEDGER_ERROR);
    EXPECT_EQ(response.body["error"], "INSUFFICIENT_FUNDS");
    EXPECT_FALSE(response.body["message"].get<std::string>().empty());
}

TEST_F(LedgerCommandHandlerTest, Deposit_BadAmount_InvalidAmount) {
    auto acct = openAccount();

    EXPECT_EQ(run("deposit " + acct + " 12,50").body["error"], "INVALID_AMOUNT");
    EXPECT_EQ(run("deposit " + acct + " -5").body["error"], "INVALID_AMOUNT");
    EXPECT_EQ(run("deposit " + acct + " 0").status, CommandResponse::LEDGER_ERROR);
}

TEST_F(LedgerCommandHandlerTest, Transfer_ReturnsBothRows) {
    auto from = openAccount("owner-1");
    auto to = openAccount("owner-2");

    auto response = run("transfer " + from + " " + to + " 250 rent");

    ASSERT_EQ(response.status, CommandResponse::OK);
    EXPECT_EQ(response.body["debit"]["type"], "Transfer");
    EXPECT_EQ(response.body["debit"]["description"].get<std::string>(), "Transfer to " + to + ": rent");
    EXPECT_EQ(response.body["credit"]["type"], "Deposit");
    EXPECT_EQ(response.body["credit"]["account_number"].get<std::string>(), to);
}

TEST_F(LedgerCommandHandlerTest, Transfer_UnknownRecipient) {
    auto from = openAccount();

    auto response = run("transfer " + from + " 999999999999 10");

    EXPECT_EQ(response.status, CommandResponse::LEDGER_ERROR);
    EXPECT_EQ(response.body["error"], "RECIPIENT_NOT_FOUND");
}

TEST_F(LedgerCommandHandlerTest, Fund_CategoryLabelAndDefaultDescription) {
    auto acct = openAccount();

    auto response = run("fund " + acct + " \"Data Purchase\" 100");

    ASSERT_EQ(response.status, CommandResponse::OK);
    EXPECT_EQ(response.body["type"], "Data Purchase");
    EXPECT_EQ(response.body["kind"], "CATEGORY_FUNDING");
    EXPECT_EQ(response.body["direction"], "outflow");
    EXPECT_EQ(response.body["description"], "Data Purchase payment");
}

TEST_F(LedgerCommandHandlerTest, History_DefaultsToNewestFirst) {
    auto acct = openAccount();
    run("deposit " + acct + " 1");

    auto desc = run("history " + acct);
    auto asc = run("history " + acct + " asc");

    ASSERT_EQ(desc.body.size(), 2u);
    EXPECT_EQ(desc.body[0]["description"], "Manual deposit");
    EXPECT_EQ(asc.body[0]["description"], "Welcome bonus");

    EXPECT_EQ(run("history " + acct + " sideways").status, CommandResponse::USAGE_ERROR);
}

TEST_F(LedgerCommandHandlerTest, Summary_WithLimit) {
    auto acct = openAccount();
    for (int i = 0; i < 4; ++i) {
        run("deposit " + acct + " 10");
    }

    auto response = run("summary " + acct + " 2");

    ASSERT_EQ(response.status, CommandResponse::OK);
    EXPECT_EQ(response.body["balance"], "1040.00");
    EXPECT_EQ(response.body["transactions_count"], 5);
    EXPECT_EQ(response.body["recent"].size(), 2u);
    EXPECT_EQ(response.body["account"]["account_number"].get<std::string>(), acct);

    EXPECT_EQ(run("summary " + acct + " many").status, CommandResponse::USAGE_ERROR);
}

TEST_F(LedgerCommandHandlerTest, Summary_NegativeOrSignedLimit_UsageError) {
    auto acct = openAccount();

    auto negative = run("summary " + acct + " -1");
    EXPECT_EQ(negative.status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(negative.body["error"], "USAGE");

    EXPECT_EQ(run("summary " + acct + " +2").status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(run("summary " + acct + " \"\"").status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(run("summary " + acct + " 99999999999999999999999").status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(run("summary " + acct + " 0").body["recent"].size(), 0u);
}

TEST_F(LedgerCommandHandlerTest, Accounts_ListsOwnersAccounts) {
    openAccount("owner-1");
    openAccount("owner-1");
    openAccount("owner-2");

    auto response = run("accounts owner-1");

    ASSERT_EQ(response.status, CommandResponse::OK);
    ASSERT_TRUE(response.body.is_array());
    EXPECT_EQ(response.body.size(), 2u);
}

TEST_F(LedgerCommandHandlerTest, Profile_MergesGivenKeys) {
    auto acct = openAccount();

    auto response = run("profile " + acct + " email=ada@example.com");

    ASSERT_EQ(response.status, CommandResponse::OK);
    EXPECT_EQ(response.body["email"], "ada@example.com");
    EXPECT_EQ(response.body["username"], "ada");
    EXPECT_EQ(response.body["first_name"], "Ada");
}

TEST_F(LedgerCommandHandlerTest, Profile_UnknownAccount) {
    auto response = run("profile 999999999999 email=x@example.com");

    EXPECT_EQ(response.status, CommandResponse::LEDGER_ERROR);
    EXPECT_EQ(response.body["error"], "ACCOUNT_NOT_FOUND");
}

// ============================================================================
// RENDER
// ============================================================================

TEST_F(LedgerCommandHandlerTest, Render_InvalidUtf8Description_ReplacedNotThrown) {
    auto acct = openAccount();

    auto response = run("deposit " + acct + " 5 caf\xe9");
    ASSERT_EQ(response.status, CommandResponse::OK);

    std::string text;
    EXPECT_NO_THROW(text = response.render());
    EXPECT_NE(text.find("caf\xEF\xBF\xBD"), std::string::npos);

    // Запись сохранена, последующие команды работают
    EXPECT_EQ(run("balance " + acct).body["balance"], "1005.00");
}

TEST_F(LedgerCommandHandlerTest, Render_LedgerErrorWithInvalidUtf8Argument) {
    auto response = run("balance 1\xff");

    ASSERT_EQ(response.status, CommandResponse::LEDGER_ERROR);
    EXPECT_NO_THROW(response.render());
}

// ============================================================================
// USAGE ERRORS
// ============================================================================

TEST_F(LedgerCommandHandlerTest, UsageErrors) {
    EXPECT_EQ(handler_->handle({}).status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(run("launch rockets").status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(run("deposit 100000000001").status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(run("open bank owner-1").status, CommandResponse::USAGE_ERROR);
    EXPECT_EQ(run("open individual owner-1 nickname=ada").status, CommandResponse::USAGE_ERROR);

    auto response = run("balance");
    EXPECT_EQ(response.body["error"], "USAGE");
}
