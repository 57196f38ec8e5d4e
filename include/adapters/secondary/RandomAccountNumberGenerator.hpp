#pragma once

#include "ports/output/IAccountNumberGenerator.hpp"
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Случайные 12-значные номера из [100000000000, 999999999999]
 *
 * Первая цифра никогда не 0, поэтому длина всегда ровно 12.
 */
class RandomAccountNumberGenerator : public ports::output::IAccountNumberGenerator {
public:
    RandomAccountNumberGenerator()
        : rng_(std::random_device{}())
        , dist_(100000000000ULL, 999999999999ULL)
    {}

    std::string next() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::to_string(dist_(rng_));
    }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<uint64_t> dist_;
};

} // namespace ledger::adapters::secondary
