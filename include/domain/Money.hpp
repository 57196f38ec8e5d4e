#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Денежная сумма в минорных единицах (копейки/кобо)
 *
 * Хранится как int64_t для точных вычислений, без double.
 * Валюта одна, поэтому код валюты не хранится.
 *
 * Пример: 1500.50 = {minor: 150050}
 */
struct Money {
    int64_t minor = 0;  ///< Сумма в минорных единицах (1/100)

    Money() = default;

    explicit Money(int64_t minorUnits) : minor(minorUnits) {}

    /**
     * @brief Разобрать десятичную строку ("1500", "1500.5", "1500.50")
     *
     * Допускается знак, не более двух знаков после точки.
     *
     * @throws LedgerException(INVALID_AMOUNT) если строка не число
     *         или значение не помещается в int64_t
     */
    static Money parse(const std::string& text);

    /**
     * @brief Сумма из целых единиц (1000 -> 1000.00)
     */
    static Money fromUnits(int64_t units);

    /**
     * @brief Строка с двумя знаками после точки ("1500.50", "-3.05")
     */
    std::string toString() const;

    double toDouble() const {
        return static_cast<double>(minor) / 100.0;
    }

    bool isPositive() const { return minor > 0; }
    bool isZero() const { return minor == 0; }

    /**
     * @brief Арифметика с проверкой переполнения int64_t
     * @throws LedgerException(INVALID_AMOUNT) если результат не помещается
     */
    Money operator+(const Money& other) const;
    Money operator-(const Money& other) const;

    Money& operator+=(const Money& other) {
        return *this = *this + other;
    }

    Money& operator-=(const Money& other) {
        return *this = *this - other;
    }

    bool operator==(const Money& other) const { return minor == other.minor; }
    bool operator!=(const Money& other) const { return minor != other.minor; }
    bool operator<(const Money& other) const { return minor < other.minor; }
    bool operator>(const Money& other) const { return minor > other.minor; }
    bool operator<=(const Money& other) const { return minor <= other.minor; }
    bool operator>=(const Money& other) const { return minor >= other.minor; }
};

} // namespace ledger::domain
