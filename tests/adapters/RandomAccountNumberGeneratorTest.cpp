/**
 * @file RandomAccountNumberGeneratorTest.cpp
 * @brief Unit tests for RandomAccountNumberGenerator
 */

#include <gtest/gtest.h>
#include "adapters/secondary/RandomAccountNumberGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <set>

using namespace ledger::adapters::secondary;

namespace {

bool isAccountNumber(const std::string& number) {
    return number.size() == 12
        && number[0] != '0'
        && std::all_of(number.begin(), number.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

TEST(RandomAccountNumberGeneratorTest, Next_AlwaysTwelveDigitsWithoutLeadingZero) {
    RandomAccountNumberGenerator generator;

    std::set<std::string> seen;
    for (int i = 0; i < 10000; ++i) {
        auto number = generator.next();
        ASSERT_TRUE(isAccountNumber(number)) << "Bad account number: " << number;
        seen.insert(number);
    }

    // 10^4 из 9*10^11: совпадения практически невозможны
    EXPECT_GT(seen.size(), 9990u);
}

TEST(RandomAccountNumberGeneratorTest, Next_FromManyThreads) {
    RandomAccountNumberGenerator generator;

    std::vector<std::future<bool>> workers;
    for (int t = 0; t < 4; ++t) {
        workers.push_back(std::async(std::launch::async, [&generator]() {
            for (int i = 0; i < 1000; ++i) {
                if (!isAccountNumber(generator.next())) {
                    return false;
                }
            }
            return true;
        }));
    }

    for (auto& worker : workers) {
        EXPECT_TRUE(worker.get());
    }
}
